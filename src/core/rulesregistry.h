// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layoutindex.h"
#include "layoutmask.h"
#include "types.h"
#include <QDomDocument>
#include <QDomElement>
#include <QString>

namespace XKalamine {

/**
 * @brief One XKB/rules/{base,evdev}.xml file: the layout list desktops show
 *
 * Layout references look like this:
 *   <layout>
 *     <configItem><name>fr</name></configItem>
 *     <variantList>
 *       <variant>
 *         <configItem>
 *           <name>bepo</name>
 *           <description>French (BÉPO)</description>
 *         </configItem>
 *       </variant>
 *     </variantList>
 *   </layout>
 *
 * A variant missing here is not offered by layout selectors, even when its
 * symbols are installed. Everything else in the document is kept as-is;
 * whitespace-only text is dropped on load and re-created by indentation on save.
 */
class XKALAMINE_EXPORT RulesRegistry
{
public:
    explicit RulesRegistry(const QString& filePath);

    QString filePath() const
    {
        return m_filePath;
    }

    /**
     * @brief Parse the file
     * @return MalformedRegistry if the XML cannot be parsed
     */
    FileError load();

    /**
     * @brief Write the document back (UTF-8, XML declaration, indented)
     */
    FileError save();

    /**
     * @brief Parse the file, apply every change of @p index, write it back
     *
     * Removals drop the variant node; installs drop it and append a new one,
     * so a reinstalled variant moves to the end of its locale. Nothing is
     * read or written when @p index is empty.
     */
    FileError apply(const LayoutIndex& index);

    /**
     * @brief The <layout> element for @p locale, appended to <layoutList> if missing
     * @param layout Output: the layout element
     * @return MalformedRegistry when the document has no <layoutList>
     */
    FileError locateOrCreateLocale(const QString& locale, QDomElement* layout);

    /**
     * @brief The single <variantList> of a <layout> element
     * @return MalformedRegistry if there is not exactly one
     */
    FileError variantListOf(const QDomElement& layout, QDomElement* variantList) const;

    /**
     * @brief Replace any variant named @p name by a new one at the end of the list
     */
    static void upsertVariant(QDomElement& variantList, const QString& name, const QString& description);

    /**
     * @brief Drop the variant named @p name
     * @return Number of nodes removed (absence is not an error)
     */
    static int removeVariant(QDomElement& variantList, const QString& name);

    /**
     * @brief Collect all declared variants matching @p mask into @p listing
     */
    void collectVariants(const LayoutMask& mask, VariantListing* listing) const;

    /**
     * @brief True if a <layout> named @p locale is declared
     */
    bool declaresLayout(const QString& locale) const;

    /**
     * @brief Strip the obsolete "type" attribute older installers set on variants
     * @return Number of attributes removed
     */
    int dropTypeAttributes();

    const QDomDocument& document() const
    {
        return m_document;
    }

private:
    QDomElement layoutList() const;

    QString m_filePath;
    QDomDocument m_document;
};

} // namespace XKalamine
