// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xkalamine_export.h"
#include <QString>
#include <optional>

namespace XKalamine {

/**
 * @brief Opening marker of a layout block in an XKB/symbols file
 *
 * Two marker formats exist:
 * - Current: "// KALAMINE::BEPO::BEGIN" ... "// KALAMINE::BEPO::END"
 * - Legacy:  "// LAFAYETTE::BEGIN" ... "// LAFAYETTE::END", always named "lafayette"
 *
 * The legacy end line has a different prefix than the current one, so a
 * block is only closed by the end line derived from its own begin line.
 * Lines are passed without their trailing newline.
 */
class XKALAMINE_EXPORT SymbolMarker
{
public:
    enum class Format {
        Current,
        Legacy
    };

    /**
     * @brief Recognize a begin line
     * @return The marker, or std::nullopt if @p line does not open a block
     */
    static std::optional<SymbolMarker> parseBegin(const QString& line);

    /**
     * @brief True if @p line looks like an end marker of any block
     */
    static bool isEndLine(const QString& line);

    /**
     * @brief Lookup key of a variant name: the name as written in markers, lower-cased
     *
     * Names are upper-cased on write, which is not reversible for every
     * character ("straße" is written "STRASSE"). Keys compare names the way
     * they appear on disk.
     */
    static QString lookupKey(const QString& name);

    /// Begin line written for a variant (name is upper-cased)
    static QString beginLine(const QString& name);
    /// End line written for a variant (name is upper-cased)
    static QString endLine(const QString& name);

    Format format() const
    {
        return m_format;
    }

    /// Variant name as lookupKey() returns it
    QString name() const
    {
        return m_name;
    }

    /**
     * @brief True if @p line is the end marker matching this begin marker
     */
    bool closes(const QString& line) const;

private:
    SymbolMarker(Format format, const QString& name, const QString& closingLine);

    Format m_format;
    QString m_name;
    QString m_closingLine;
};

} // namespace XKalamine
