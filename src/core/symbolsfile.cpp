// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "symbolsfile.h"
#include "constants.h"
#include "logging.h"
#include "symbolmarker.h"
#include "utils.h"
#include <QFileInfo>
#include <optional>

namespace XKalamine {

namespace {

// Blank lines directly above a dropped block belong to it
void dropTrailingBlankLines(QStringList& lines)
{
    while (!lines.isEmpty() && lines.constLast().trimmed().isEmpty()) {
        lines.removeLast();
    }
}

} // namespace

SymbolsFile::SymbolsFile(const QString& filePath)
    : m_filePath(filePath)
{
}

QString SymbolsFile::sanitizedBody(const QString& body)
{
    QStringList lines;
    for (const QString& line : Utils::splitLines(body)) {
        if (!line.startsWith(Markers::IgnoredLinePrefix)) {
            lines.append(line);
        }
    }
    return Utils::chopTrailingWhitespace(lines.join(QLatin1Char('\n')));
}

QString SymbolsFile::applyChanges(const QString& text, const QList<VariantChange>& changes)
{
    // Block names are case-insensitive. A nameless block could not be found again.
    QList<VariantChange> applicable;
    QSet<QString> touched;
    for (const VariantChange& change : changes) {
        if (change.name.isEmpty()) {
            qCWarning(lcSymbols) << "Ignoring layout change without a variant name";
            continue;
        }
        applicable.append(change);
        touched.insert(SymbolMarker::lookupKey(change.name));
    }

    QStringList kept;
    std::optional<SymbolMarker> openBlock;
    bool dropping = false;

    for (const QString& line : Utils::splitLines(text)) {
        if (openBlock) {
            // Inside a block only its own end line matters
            if (openBlock->closes(line)) {
                if (!dropping) {
                    kept.append(line);
                }
                openBlock.reset();
                dropping = false;
            } else if (!dropping) {
                kept.append(line);
            }
            continue;
        }

        openBlock = SymbolMarker::parseBegin(line);
        if (!openBlock) {
            kept.append(line);
            continue;
        }

        dropping = touched.contains(openBlock->name());
        if (dropping) {
            qCDebug(lcSymbols) << "Dropping block" << openBlock->name();
            dropTrailingBlankLines(kept);
        } else {
            kept.append(line);
        }
    }

    if (openBlock) {
        qCWarning(lcSymbols) << "Unterminated layout block" << openBlock->name();
    }

    QString result = Utils::chopTrailingWhitespace(kept.join(QLatin1Char('\n')));
    if (!result.isEmpty()) {
        result += QLatin1Char('\n');
    }

    for (const VariantChange& change : applicable) {
        if (change.isRemoval()) {
            continue;
        }
        if (!result.isEmpty()) {
            result += QLatin1Char('\n');
        }
        result += SymbolMarker::beginLine(change.name) + QLatin1Char('\n');
        result += sanitizedBody(change.definition->body) + QLatin1Char('\n');
        result += SymbolMarker::endLine(change.name) + QLatin1Char('\n');
    }

    return result;
}

QSet<QString> SymbolsFile::blockNames(const QString& text)
{
    QSet<QString> names;
    std::optional<SymbolMarker> openBlock;

    for (const QString& line : Utils::splitLines(text)) {
        if (openBlock) {
            if (openBlock->closes(line)) {
                openBlock.reset();
            }
            continue;
        }
        openBlock = SymbolMarker::parseBegin(line);
        if (openBlock) {
            names.insert(openBlock->name());
        }
    }

    return names;
}

FileError SymbolsFile::update(const QList<VariantChange>& changes) const
{
    if (changes.isEmpty()) {
        return FileError::ok();
    }

    const bool exists = QFileInfo::exists(m_filePath);
    QString original;
    if (exists) {
        const FileError readError = Utils::readTextFile(m_filePath, &original);
        if (!readError.isOk()) {
            qCWarning(lcSymbols) << "Failed to read symbols file:" << m_filePath << "Error:" << readError.message;
            return readError;
        }
    } else {
        original = Markers::GeneratedHeader;
    }

    const QString updated = applyChanges(original, changes);
    if (exists && updated == original) {
        qCDebug(lcSymbols) << "Symbols file unchanged:" << m_filePath;
        return FileError::ok();
    }

    const FileError writeError = Utils::writeFile(m_filePath, updated.toUtf8());
    if (!writeError.isOk()) {
        qCWarning(lcSymbols) << "Failed to write symbols file:" << m_filePath << "Error:" << writeError.message;
        return writeError;
    }

    qCInfo(lcSymbols) << "Updated symbols file:" << m_filePath << "entries=" << changes.size();
    return FileError::ok();
}

FileError SymbolsFile::listVariants(QSet<QString>* names) const
{
    QString text;
    const FileError error = Utils::readTextFile(m_filePath, &text);
    if (!error.isOk()) {
        qCWarning(lcSymbols) << "Failed to read symbols file:" << m_filePath << "Error:" << error.message;
        return error;
    }

    *names = blockNames(text);
    return FileError::ok();
}

} // namespace XKalamine
