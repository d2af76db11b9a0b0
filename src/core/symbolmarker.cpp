// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "symbolmarker.h"
#include "constants.h"

namespace XKalamine {

SymbolMarker::SymbolMarker(Format format, const QString& name, const QString& closingLine)
    : m_format(format)
    , m_name(name)
    , m_closingLine(closingLine)
{
}

std::optional<SymbolMarker> SymbolMarker::parseBegin(const QString& line)
{
    if (!line.endsWith(Markers::BeginSuffix)) {
        return std::nullopt;
    }

    // "// KALAMINE::" NAME "::BEGIN" -> closed by "// KALAMINE::" NAME "::END"
    const QString closingLine = line.chopped(Markers::Begin.size()) + Markers::End;

    if (line.startsWith(Markers::CurrentPrefix)) {
        const qsizetype nameLength = line.size() - Markers::CurrentPrefix.size() - Markers::BeginSuffix.size();
        if (nameLength <= 0) {
            return std::nullopt;
        }
        return SymbolMarker(Format::Current, lookupKey(line.mid(Markers::CurrentPrefix.size(), nameLength)),
                            closingLine);
    }

    // "// LAFAYETTE::BEGIN" carries no name of its own
    if (line == QString(Markers::LegacyPrefix) + Markers::Begin) {
        return SymbolMarker(Format::Legacy, QString(Markers::LegacyVariant), closingLine);
    }

    return std::nullopt;
}

bool SymbolMarker::isEndLine(const QString& line)
{
    return line.endsWith(Markers::EndSuffix);
}

QString SymbolMarker::lookupKey(const QString& name)
{
    return name.toUpper().toLower();
}

QString SymbolMarker::beginLine(const QString& name)
{
    return QString(Markers::CurrentPrefix) + name.toUpper() + Markers::BeginSuffix;
}

QString SymbolMarker::endLine(const QString& name)
{
    return QString(Markers::CurrentPrefix) + name.toUpper() + Markers::EndSuffix;
}

bool SymbolMarker::closes(const QString& line) const
{
    return isEndLine(line) && line.startsWith(m_closingLine);
}

} // namespace XKalamine
