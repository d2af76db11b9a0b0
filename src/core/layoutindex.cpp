// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layoutindex.h"
#include "logging.h"
#include <algorithm>
#include <iterator>

namespace XKalamine {

const VariantChange* LocaleChanges::find(const QString& name) const
{
    auto it = std::find_if(variants.cbegin(), variants.cend(), [&name](const VariantChange& change) {
        return change.name == name;
    });
    return it != variants.cend() ? &*it : nullptr;
}

bool LayoutIndex::add(const LayoutDefinition& layout)
{
    if (layout.locale.isEmpty() || layout.name.isEmpty()) {
        qCWarning(lcCore) << "Refusing layout with an empty name:" << layout.locale << layout.name;
        return false;
    }
    setChange(layout.locale, VariantChange{layout.name, layout});
    return true;
}

bool LayoutIndex::remove(const QString& locale, const QString& variant)
{
    if (locale.isEmpty() || variant.isEmpty()) {
        qCWarning(lcCore) << "Refusing removal with an empty name:" << locale << variant;
        return false;
    }
    setChange(locale, VariantChange{variant, std::nullopt});
    return true;
}

int LayoutIndex::size() const
{
    int count = 0;
    for (const LocaleChanges& changes : m_locales) {
        count += changes.variants.size();
    }
    return count;
}

const LocaleChanges* LayoutIndex::locale(const QString& locale) const
{
    auto it = std::find_if(m_locales.cbegin(), m_locales.cend(), [&locale](const LocaleChanges& changes) {
        return changes.locale == locale;
    });
    return it != m_locales.cend() ? &*it : nullptr;
}

void LayoutIndex::setChange(const QString& locale, VariantChange change)
{
    auto localeIt = std::find_if(m_locales.begin(), m_locales.end(), [&locale](const LocaleChanges& changes) {
        return changes.locale == locale;
    });
    if (localeIt == m_locales.end()) {
        m_locales.append(LocaleChanges{locale, {}});
        localeIt = std::prev(m_locales.end());
    }

    QList<VariantChange>& variants = localeIt->variants;
    auto variantIt = std::find_if(variants.begin(), variants.end(), [&change](const VariantChange& existing) {
        return existing.name == change.name;
    });
    if (variantIt != variants.end()) {
        // Last write wins, first declaration keeps its position
        *variantIt = std::move(change);
    } else {
        variants.append(std::move(change));
    }
}

} // namespace XKalamine
