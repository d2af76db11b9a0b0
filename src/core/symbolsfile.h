// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layoutindex.h"
#include "types.h"
#include <QList>
#include <QSet>
#include <QString>

namespace XKalamine {

/**
 * @brief An XKB/symbols/[locale] file holding marker-delimited layouts
 *
 * Only the blocks named in an update are touched: every other line, including
 * blocks written by other tools, is kept verbatim.
 *
 * Updating a variant drops its existing block and appends a fresh one at the
 * end of the file, so installing the same layout twice gives the same file.
 * Removing a variant drops its block and appends nothing.
 */
class XKALAMINE_EXPORT SymbolsFile
{
public:
    explicit SymbolsFile(const QString& filePath);

    QString filePath() const
    {
        return m_filePath;
    }

    /**
     * @brief Apply installs/removals to the file
     *
     * A missing file is created with a "Generated by Kalamine" header. The
     * file is only written when its content changes, and not at all when
     * @p changes is empty.
     */
    FileError update(const QList<VariantChange>& changes) const;

    /**
     * @brief Names (lower case) of the layout blocks present in the file
     */
    FileError listVariants(QSet<QString>* names) const;

    /**
     * @brief Text of a symbols file after applying @p changes to @p text
     */
    static QString applyChanges(const QString& text, const QList<VariantChange>& changes);

    /**
     * @brief Names (lower case) of the top-level layout blocks in @p text
     */
    static QSet<QString> blockNames(const QString& text);

    /**
     * @brief Layout body as written between markers: "//#" lines dropped, trailing space trimmed
     */
    static QString sanitizedBody(const QString& body);

private:
    QString m_filePath;
};

} // namespace XKalamine
