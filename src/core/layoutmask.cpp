// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layoutmask.h"
#include <QStringList>

namespace XKalamine {

namespace {

QString segment(const QString& value)
{
    return value == QLatin1String("*") ? QString() : value;
}

} // namespace

LayoutMask LayoutMask::parse(const QString& mask)
{
    LayoutMask result;
    const QStringList parts = mask.split(QLatin1Char('/'));
    if (parts.size() == 2) {
        result.m_locale = segment(parts.at(0));
        result.m_variant = segment(parts.at(1));
    } else {
        // "", "*" and "fr" all end up here
        result.m_locale = segment(mask);
    }
    return result;
}

bool LayoutMask::matches(const QString& locale, const QString& variant) const
{
    return (m_locale.isEmpty() || m_locale == locale) && (m_variant.isEmpty() || m_variant == variant);
}

} // namespace XKalamine
