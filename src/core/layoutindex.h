// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include <QList>
#include <QString>
#include <optional>

namespace XKalamine {

/**
 * @brief Pending change for one variant: a definition to install, or removal
 */
struct XKALAMINE_EXPORT VariantChange
{
    QString name;
    std::optional<LayoutDefinition> definition; ///< std::nullopt means "remove"

    bool isRemoval() const
    {
        return !definition.has_value();
    }
};

/**
 * @brief Pending changes for all variants of one locale, in declaration order
 */
struct XKALAMINE_EXPORT LocaleChanges
{
    QString locale;
    QList<VariantChange> variants;

    const VariantChange* find(const QString& name) const;
};

/**
 * @brief Set of layout installations and removals waiting to be committed
 *
 * A (locale, variant) pair appears at most once: a later add() or remove()
 * for the same pair replaces the earlier one in place. Locales and variants
 * keep the order in which they were first declared.
 *
 * An index is a plain value. It is built by the caller, then moved into
 * RegistrationManager::commit() which consumes it.
 */
class XKALAMINE_EXPORT LayoutIndex
{
public:
    /**
     * @brief Declare a layout to install (or reinstall)
     * @return false if the locale or variant name is empty (nothing is recorded)
     */
    bool add(const LayoutDefinition& layout);

    /**
     * @brief Declare a variant to remove
     * @return false if the locale or variant name is empty (nothing is recorded)
     */
    bool remove(const QString& locale, const QString& variant);

    bool isEmpty() const
    {
        return m_locales.isEmpty();
    }

    /// Number of (locale, variant) entries
    int size() const;

    const QList<LocaleChanges>& locales() const
    {
        return m_locales;
    }

    const LocaleChanges* locale(const QString& locale) const;

    void clear()
    {
        m_locales.clear();
    }

private:
    void setChange(const QString& locale, VariantChange change);

    QList<LocaleChanges> m_locales;
};

} // namespace XKalamine
