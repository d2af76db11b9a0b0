// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>

#include "core/symbolmarker.h"

using namespace XKalamine;

/**
 * @brief Unit tests for SymbolMarker
 *
 * Tests cover:
 * - Recognition of current and legacy begin lines
 * - Case normalization of block names
 * - Closing rules (a block is only closed by its own end line)
 */
class TestSymbolMarker : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Begin line recognition
    // ═══════════════════════════════════════════════════════════════════════════

    void testParseBegin_data()
    {
        QTest::addColumn<QString>("line");
        QTest::addColumn<bool>("recognized");
        QTest::addColumn<QString>("name");

        QTest::newRow("current") << QStringLiteral("// KALAMINE::BEPO::BEGIN") << true << QStringLiteral("bepo");
        QTest::newRow("current mixed case") << QStringLiteral("// KALAMINE::Ergol::BEGIN") << true
                                            << QStringLiteral("ergol");
        QTest::newRow("current non-ascii") << QStringLiteral("// KALAMINE::BÉPO::BEGIN") << true
                                           << QStringLiteral("bépo");
        QTest::newRow("legacy") << QStringLiteral("// LAFAYETTE::BEGIN") << true << QStringLiteral("lafayette");
        QTest::newRow("end line") << QStringLiteral("// KALAMINE::BEPO::END") << false << QString();
        QTest::newRow("no name") << QStringLiteral("// KALAMINE::BEGIN") << false << QString();
        QTest::newRow("foreign tag") << QStringLiteral("// OTHER::BEGIN") << false << QString();
        QTest::newRow("plain text") << QStringLiteral("xkb_symbols \"bepo\" {") << false << QString();
        QTest::newRow("empty") << QString() << false << QString();
    }

    void testParseBegin()
    {
        QFETCH(QString, line);
        QFETCH(bool, recognized);
        QFETCH(QString, name);

        const auto marker = SymbolMarker::parseBegin(line);
        QCOMPARE(marker.has_value(), recognized);
        if (marker) {
            QCOMPARE(marker->name(), name);
        }
    }

    void testParseBegin_formats()
    {
        QCOMPARE(SymbolMarker::parseBegin(QStringLiteral("// KALAMINE::BEPO::BEGIN"))->format(),
                 SymbolMarker::Format::Current);
        QCOMPARE(SymbolMarker::parseBegin(QStringLiteral("// LAFAYETTE::BEGIN"))->format(),
                 SymbolMarker::Format::Legacy);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Written lines
    // ═══════════════════════════════════════════════════════════════════════════

    void testMarkerLines_upperCaseName()
    {
        QCOMPARE(SymbolMarker::beginLine(QStringLiteral("bepo")), QStringLiteral("// KALAMINE::BEPO::BEGIN"));
        QCOMPARE(SymbolMarker::endLine(QStringLiteral("bepo")), QStringLiteral("// KALAMINE::BEPO::END"));
        QCOMPARE(SymbolMarker::beginLine(QStringLiteral("bépo")), QStringLiteral("// KALAMINE::BÉPO::BEGIN"));
    }

    void testMarkerLines_roundTripName()
    {
        const auto marker = SymbolMarker::parseBegin(SymbolMarker::beginLine(QStringLiteral("ergol")));
        QVERIFY(marker.has_value());
        QCOMPARE(marker->name(), QStringLiteral("ergol"));
        QVERIFY(marker->closes(SymbolMarker::endLine(QStringLiteral("ergol"))));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Closing rules
    // ═══════════════════════════════════════════════════════════════════════════

    void testCloses_ownEndLineOnly()
    {
        const auto marker = SymbolMarker::parseBegin(QStringLiteral("// KALAMINE::BEPO::BEGIN"));
        QVERIFY(marker.has_value());

        QVERIFY(marker->closes(QStringLiteral("// KALAMINE::BEPO::END")));
        QVERIFY(!marker->closes(QStringLiteral("// KALAMINE::ERGOL::END")));
        QVERIFY(!marker->closes(QStringLiteral("// LAFAYETTE::END")));
        QVERIFY(!marker->closes(QStringLiteral("// SOMETHING::END")));
        QVERIFY(!marker->closes(QStringLiteral("xkb_symbols \"bepo\" {")));
    }

    void testCloses_legacyBlock()
    {
        const auto marker = SymbolMarker::parseBegin(QStringLiteral("// LAFAYETTE::BEGIN"));
        QVERIFY(marker.has_value());

        QVERIFY(marker->closes(QStringLiteral("// LAFAYETTE::END")));
        QVERIFY(!marker->closes(QStringLiteral("// KALAMINE::LAFAYETTE::END")));
    }

    void testLookupKey_matchesWrittenMarker()
    {
        for (const QString& name : {QStringLiteral("bepo"), QStringLiteral("Ergol"), QStringLiteral("bépo"),
                                    QStringLiteral("straße")}) {
            const auto marker = SymbolMarker::parseBegin(SymbolMarker::beginLine(name));
            QVERIFY2(marker.has_value(), qPrintable(name));
            QCOMPARE(marker->name(), SymbolMarker::lookupKey(name));
        }
        QCOMPARE(SymbolMarker::lookupKey(QStringLiteral("straße")), QStringLiteral("strasse"));
        QCOMPARE(SymbolMarker::lookupKey(QStringLiteral("BÉPO")), QStringLiteral("bépo"));
    }

    void testIsEndLine()
    {
        QVERIFY(SymbolMarker::isEndLine(QStringLiteral("// KALAMINE::BEPO::END")));
        QVERIFY(SymbolMarker::isEndLine(QStringLiteral("// LAFAYETTE::END")));
        QVERIFY(!SymbolMarker::isEndLine(QStringLiteral("// KALAMINE::BEPO::BEGIN")));
        QVERIFY(!SymbolMarker::isEndLine(QStringLiteral("};")));
    }
};

QTEST_MAIN(TestSymbolMarker)
#include "test_symbol_marker.moc"
