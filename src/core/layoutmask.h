// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xkalamine_export.h"
#include <QString>

namespace XKalamine {

/**
 * @brief Filter on registered layouts: "", "*", "locale" or "locale/variant"
 *
 * Each segment is either "*" (any) or an exact name. A missing or empty
 * variant segment matches every variant of the locale.
 */
class XKALAMINE_EXPORT LayoutMask
{
public:
    LayoutMask() = default;

    static LayoutMask parse(const QString& mask);

    bool matches(const QString& locale, const QString& variant) const;

    bool matchesAnyLocale() const
    {
        return m_locale.isEmpty();
    }

    /// Empty when any locale matches
    QString locale() const
    {
        return m_locale;
    }

    /// Empty when any variant matches
    QString variant() const
    {
        return m_variant;
    }

private:
    QString m_locale;
    QString m_variant;
};

} // namespace XKalamine
