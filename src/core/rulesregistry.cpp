// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "rulesregistry.h"
#include "constants.h"
#include "logging.h"
#include "utils.h"
#include <QDomNodeList>
#include <QDomProcessingInstruction>
#include <QList>

namespace XKalamine {

namespace {

QList<QDomElement> childElements(const QDomElement& parent, const QString& tagName)
{
    QList<QDomElement> children;
    for (QDomElement child = parent.firstChildElement(tagName); !child.isNull();
         child = child.nextSiblingElement(tagName)) {
        children.append(child);
    }
    return children;
}

// <element><configItem><name>NAME</name></configItem></element> -> NAME
QString configItemText(const QDomElement& element, const QString& field)
{
    return element.firstChildElement(XmlKeys::ConfigItem).firstChildElement(field).text();
}

QDomElement textElement(QDomDocument& document, const QString& tagName, const QString& text)
{
    QDomElement element = document.createElement(tagName);
    element.appendChild(document.createTextNode(text));
    return element;
}

} // namespace

RulesRegistry::RulesRegistry(const QString& filePath)
    : m_filePath(filePath)
{
}

FileError RulesRegistry::load()
{
    QByteArray data;
    const FileError readError = Utils::readFile(m_filePath, &data);
    if (!readError.isOk()) {
        qCWarning(lcRules) << "Failed to read rules file:" << m_filePath << "Error:" << readError.message;
        return readError;
    }

    m_document = QDomDocument();
    const QDomDocument::ParseResult result = m_document.setContent(data);
    if (!result) {
        qCWarning(lcRules) << "Failed to parse rules file:" << m_filePath << "Error:" << result.errorMessage
                           << "at line" << result.errorLine << "column" << result.errorColumn;
        return FileError::malformed(m_filePath,
                                    QStringLiteral("%1 (line %2, column %3)")
                                        .arg(result.errorMessage)
                                        .arg(result.errorLine)
                                        .arg(result.errorColumn));
    }

    return FileError::ok();
}

FileError RulesRegistry::save()
{
    // The parser rebuilds the declaration with its own quoting: always write ours
    QDomNode first = m_document.firstChild();
    if (first.isProcessingInstruction() && first.toProcessingInstruction().target() == QLatin1String("xml")) {
        const QDomNode declaration = first;
        first = first.nextSibling();
        m_document.removeChild(declaration);
    }
    m_document.insertBefore(m_document.createProcessingInstruction(QStringLiteral("xml"),
                                                                   QStringLiteral("version=\"1.0\" encoding=\"UTF-8\"")),
                            first);

    const FileError error = Utils::writeFile(m_filePath, m_document.toByteArray(2));
    if (!error.isOk()) {
        qCWarning(lcRules) << "Failed to write rules file:" << m_filePath << "Error:" << error.message;
        return error;
    }

    qCInfo(lcRules) << "Saved rules file:" << m_filePath;
    return FileError::ok();
}

QDomElement RulesRegistry::layoutList() const
{
    return m_document.documentElement().firstChildElement(XmlKeys::LayoutList);
}

FileError RulesRegistry::locateOrCreateLocale(const QString& locale, QDomElement* layout)
{
    QDomElement list = layoutList();
    if (list.isNull()) {
        return FileError::malformed(m_filePath, QStringLiteral("no <layoutList> element"));
    }

    for (const QDomElement& candidate : childElements(list, XmlKeys::Layout)) {
        if (configItemText(candidate, XmlKeys::Name) == locale) {
            *layout = candidate;
            return FileError::ok();
        }
    }

    qCDebug(lcRules) << "Adding layout" << locale << "to" << m_filePath;
    QDomElement configItem = m_document.createElement(XmlKeys::ConfigItem);
    configItem.appendChild(textElement(m_document, XmlKeys::Name, locale));

    QDomElement created = m_document.createElement(XmlKeys::Layout);
    created.appendChild(configItem);
    created.appendChild(m_document.createElement(XmlKeys::VariantList));
    list.appendChild(created);

    *layout = created;
    return FileError::ok();
}

FileError RulesRegistry::variantListOf(const QDomElement& layout, QDomElement* variantList) const
{
    const QList<QDomElement> lists = childElements(layout, XmlKeys::VariantList);
    if (lists.size() != 1) {
        return FileError::malformed(m_filePath,
                                    QStringLiteral("layout \"%1\" has %2 <variantList> elements, expected 1")
                                        .arg(configItemText(layout, XmlKeys::Name))
                                        .arg(lists.size()));
    }
    *variantList = lists.constFirst();
    return FileError::ok();
}

void RulesRegistry::upsertVariant(QDomElement& variantList, const QString& name, const QString& description)
{
    removeVariant(variantList, name);

    QDomDocument document = variantList.ownerDocument();
    QDomElement configItem = document.createElement(XmlKeys::ConfigItem);
    configItem.appendChild(textElement(document, XmlKeys::Name, name));
    configItem.appendChild(textElement(document, XmlKeys::Description, description));

    QDomElement variant = document.createElement(XmlKeys::Variant);
    variant.appendChild(configItem);
    variantList.appendChild(variant);
}

int RulesRegistry::removeVariant(QDomElement& variantList, const QString& name)
{
    int removed = 0;
    for (const QDomElement& variant : childElements(variantList, XmlKeys::Variant)) {
        if (configItemText(variant, XmlKeys::Name) == name) {
            variantList.removeChild(variant);
            ++removed;
        }
    }
    return removed;
}

FileError RulesRegistry::apply(const LayoutIndex& index)
{
    if (index.isEmpty()) {
        return FileError::ok();
    }

    FileError error = load();
    if (!error.isOk()) {
        return error;
    }

    for (const LocaleChanges& changes : index.locales()) {
        QDomElement layout;
        error = locateOrCreateLocale(changes.locale, &layout);
        if (!error.isOk()) {
            return error;
        }

        QDomElement variantList;
        error = variantListOf(layout, &variantList);
        if (!error.isOk()) {
            qCWarning(lcRules) << "Unexpected XML format in" << m_filePath << ":" << error.message;
            return error;
        }

        for (const VariantChange& change : changes.variants) {
            if (change.isRemoval()) {
                removeVariant(variantList, change.name);
            } else {
                upsertVariant(variantList, change.name, change.definition->description);
            }
        }
    }

    return save();
}

void RulesRegistry::collectVariants(const LayoutMask& mask, VariantListing* listing) const
{
    const QDomNodeList variants = m_document.elementsByTagName(XmlKeys::Variant);
    for (int i = 0; i < variants.size(); ++i) {
        const QDomElement variant = variants.at(i).toElement();
        // variant -> variantList -> layout
        const QDomElement layout = variant.parentNode().parentNode().toElement();
        if (layout.tagName() != XmlKeys::Layout) {
            qCDebug(lcRules) << "Ignoring variant outside of a layout in" << m_filePath;
            continue;
        }

        const QString locale = configItemText(layout, XmlKeys::Name);
        const QString name = configItemText(variant, XmlKeys::Name);
        if (mask.matches(locale, name)) {
            (*listing)[locale][name] = configItemText(variant, XmlKeys::Description);
        }
    }
}

bool RulesRegistry::declaresLayout(const QString& locale) const
{
    const QDomNodeList layouts = m_document.elementsByTagName(XmlKeys::Layout);
    for (int i = 0; i < layouts.size(); ++i) {
        if (configItemText(layouts.at(i).toElement(), XmlKeys::Name) == locale) {
            return true;
        }
    }
    return false;
}

int RulesRegistry::dropTypeAttributes()
{
    int dropped = 0;
    const QDomNodeList variants = m_document.elementsByTagName(XmlKeys::Variant);
    for (int i = 0; i < variants.size(); ++i) {
        QDomElement variant = variants.at(i).toElement();
        if (variant.hasAttribute(XmlKeys::Type)) {
            variant.removeAttribute(XmlKeys::Type);
            ++dropped;
        }
    }
    return dropped;
}

} // namespace XKalamine
