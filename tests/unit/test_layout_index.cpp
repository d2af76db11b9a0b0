// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>

#include "core/layoutindex.h"
#include "core/layoutmask.h"

using namespace XKalamine;

namespace {

LayoutDefinition layout(const QString& locale, const QString& name, const QString& body = QString())
{
    LayoutDefinition definition;
    definition.locale = locale;
    definition.name = name;
    definition.description = name;
    definition.body = body;
    return definition;
}

QStringList variantNames(const LocaleChanges* changes)
{
    QStringList names;
    if (changes) {
        for (const VariantChange& change : changes->variants) {
            names.append(change.name);
        }
    }
    return names;
}

} // namespace

/**
 * @brief Unit tests for LayoutIndex and LayoutMask
 */
class TestLayoutIndex : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // LayoutIndex
    // ═══════════════════════════════════════════════════════════════════════════

    void testEmpty()
    {
        LayoutIndex index;
        QVERIFY(index.isEmpty());
        QCOMPARE(index.size(), 0);
        QVERIFY(index.locale(QStringLiteral("fr")) == nullptr);
    }

    void testAdd_groupsByLocaleInDeclarationOrder()
    {
        LayoutIndex index;
        index.add(layout(QStringLiteral("us"), QStringLiteral("colemak")));
        index.add(layout(QStringLiteral("fr"), QStringLiteral("bepo")));
        index.add(layout(QStringLiteral("us"), QStringLiteral("dvorak")));

        QCOMPARE(index.size(), 3);
        QCOMPARE(index.locales().size(), 2);
        QCOMPARE(index.locales().at(0).locale, QStringLiteral("us"));
        QCOMPARE(index.locales().at(1).locale, QStringLiteral("fr"));
        QCOMPARE(variantNames(index.locale(QStringLiteral("us"))),
                 (QStringList{QStringLiteral("colemak"), QStringLiteral("dvorak")}));
    }

    void testAdd_lastWriteWins()
    {
        LayoutIndex index;
        index.add(layout(QStringLiteral("fr"), QStringLiteral("bepo"), QStringLiteral("first")));
        index.add(layout(QStringLiteral("fr"), QStringLiteral("ergol")));
        index.add(layout(QStringLiteral("fr"), QStringLiteral("bepo"), QStringLiteral("second")));

        QCOMPARE(index.size(), 2);
        const LocaleChanges* changes = index.locale(QStringLiteral("fr"));
        QVERIFY(changes != nullptr);
        QCOMPARE(variantNames(changes), (QStringList{QStringLiteral("bepo"), QStringLiteral("ergol")}));

        const VariantChange* bepo = changes->find(QStringLiteral("bepo"));
        QVERIFY(bepo != nullptr);
        QVERIFY(!bepo->isRemoval());
        QCOMPARE(bepo->definition->body, QStringLiteral("second"));
    }

    void testRemove_overridesEarlierAdd()
    {
        LayoutIndex index;
        index.add(layout(QStringLiteral("fr"), QStringLiteral("bepo")));
        index.remove(QStringLiteral("fr"), QStringLiteral("bepo"));

        QCOMPARE(index.size(), 1);
        const VariantChange* bepo = index.locale(QStringLiteral("fr"))->find(QStringLiteral("bepo"));
        QVERIFY(bepo != nullptr);
        QVERIFY(bepo->isRemoval());
    }

    void testAdd_overridesEarlierRemove()
    {
        LayoutIndex index;
        index.remove(QStringLiteral("fr"), QStringLiteral("bepo"));
        index.add(layout(QStringLiteral("fr"), QStringLiteral("bepo"), QStringLiteral("body")));

        const VariantChange* bepo = index.locale(QStringLiteral("fr"))->find(QStringLiteral("bepo"));
        QVERIFY(bepo != nullptr);
        QVERIFY(!bepo->isRemoval());
        QCOMPARE(bepo->definition->locale, QStringLiteral("fr"));
    }

    void testFind_unknownVariant()
    {
        LayoutIndex index;
        index.add(layout(QStringLiteral("fr"), QStringLiteral("bepo")));
        QVERIFY(index.locale(QStringLiteral("fr"))->find(QStringLiteral("ergol")) == nullptr);
        QVERIFY(index.locale(QStringLiteral("de")) == nullptr);
    }

    void testEmptyNamesAreRefused()
    {
        LayoutIndex index;
        QVERIFY(!index.add(layout(QStringLiteral("fr"), QString())));
        QVERIFY(!index.add(layout(QString(), QStringLiteral("bepo"))));
        QVERIFY(!index.remove(QStringLiteral("fr"), QString()));
        QVERIFY(!index.remove(QString(), QStringLiteral("bepo")));
        QVERIFY(index.isEmpty());

        QVERIFY(index.add(layout(QStringLiteral("fr"), QStringLiteral("bepo"))));
        QVERIFY(index.remove(QStringLiteral("fr"), QStringLiteral("ergol")));
        QCOMPARE(index.size(), 2);
    }

    void testClear()
    {
        LayoutIndex index;
        index.add(layout(QStringLiteral("fr"), QStringLiteral("bepo")));
        index.remove(QStringLiteral("us"), QStringLiteral("intl"));
        QVERIFY(!index.isEmpty());

        index.clear();
        QVERIFY(index.isEmpty());
        QCOMPARE(index.size(), 0);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // LayoutMask
    // ═══════════════════════════════════════════════════════════════════════════

    void testMask_data()
    {
        QTest::addColumn<QString>("mask");
        QTest::addColumn<QString>("locale");
        QTest::addColumn<QString>("variant");
        QTest::addColumn<bool>("matches");

        QTest::newRow("empty") << QString() << QStringLiteral("fr") << QStringLiteral("bepo") << true;
        QTest::newRow("star") << QStringLiteral("*") << QStringLiteral("us") << QStringLiteral("intl") << true;
        QTest::newRow("locale") << QStringLiteral("fr") << QStringLiteral("fr") << QStringLiteral("bepo") << true;
        QTest::newRow("other locale") << QStringLiteral("fr") << QStringLiteral("us") << QStringLiteral("intl")
                                      << false;
        QTest::newRow("exact") << QStringLiteral("fr/azerty") << QStringLiteral("fr") << QStringLiteral("azerty")
                               << true;
        QTest::newRow("other variant") << QStringLiteral("fr/azerty") << QStringLiteral("fr")
                                       << QStringLiteral("bepo") << false;
        QTest::newRow("locale star") << QStringLiteral("fr/*") << QStringLiteral("fr") << QStringLiteral("bepo")
                                     << true;
        QTest::newRow("star variant") << QStringLiteral("*/bepo") << QStringLiteral("ch") << QStringLiteral("bepo")
                                      << true;
        QTest::newRow("empty variant") << QStringLiteral("fr/") << QStringLiteral("fr") << QStringLiteral("ergol")
                                       << true;
        QTest::newRow("case sensitive") << QStringLiteral("FR") << QStringLiteral("fr") << QStringLiteral("bepo")
                                        << false;
    }

    void testMask()
    {
        QFETCH(QString, mask);
        QFETCH(QString, locale);
        QFETCH(QString, variant);
        QFETCH(bool, matches);

        QCOMPARE(LayoutMask::parse(mask).matches(locale, variant), matches);
    }

    void testMask_segments()
    {
        const LayoutMask any = LayoutMask::parse(QStringLiteral("*"));
        QVERIFY(any.matchesAnyLocale());
        QVERIFY(any.variant().isEmpty());

        const LayoutMask exact = LayoutMask::parse(QStringLiteral("fr/bepo"));
        QVERIFY(!exact.matchesAnyLocale());
        QCOMPARE(exact.locale(), QStringLiteral("fr"));
        QCOMPARE(exact.variant(), QStringLiteral("bepo"));
    }
};

QTEST_MAIN(TestLayoutIndex)
#include "test_layout_index.moc"
