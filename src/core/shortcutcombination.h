// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "modifierutils.h"
#include <QDebug>
#include <QHashFunctions>
#include <QMetaType>
#include <QString>
#include <QVector>
#include <optional>

namespace Tessera {

/**
 * @brief An ordered modifier set plus one key
 *
 * Modifiers are kept sorted in canonical chord order and deduplicated, so two
 * combinations typed in different orders compare equal. Keys are stored in
 * Qt's portable key-name form ("A", "1", "F5", "Left", "Space").
 *
 * Text form: lower-case modifier names and key joined by '+', e.g. "opt+1"
 * or "ctrl+shift+left".
 */
class TESSERA_EXPORT ShortcutCombination
{
public:
    ShortcutCombination() = default;

    /**
     * @brief Build a combination from modifiers and a key name
     *
     * An unknown key name yields an invalid combination.
     */
    ShortcutCombination(const QVector<Modifier>& modifiers, const QString& key);

    /**
     * @brief Parse the text form
     * @return The combination, or std::nullopt if a part is unknown or no modifier is given
     */
    static std::optional<ShortcutCombination> parse(const QString& text);

    /**
     * @brief Build from a raw key event (Qt::KeyboardModifiers bitmask and Qt::Key)
     */
    static ShortcutCombination fromKeyEvent(int modifierBitmask, int qtKey);

    /**
     * @brief At least one modifier and a known key
     */
    bool isValid() const noexcept
    {
        return !m_modifiers.isEmpty() && !m_key.isEmpty();
    }

    const QVector<Modifier>& modifiers() const noexcept
    {
        return m_modifiers;
    }

    QString key() const
    {
        return m_key;
    }

    bool uses(Modifier modifier) const
    {
        return m_modifiers.contains(modifier);
    }

    /**
     * @brief Copy with @p from replaced by @p to, remaining modifiers and key kept
     *
     * Returns an unchanged copy when @p from is not used.
     */
    ShortcutCombination replacingModifier(Modifier from, Modifier to) const;

    QString toString() const;

    bool operator==(const ShortcutCombination& other) const
    {
        return m_modifiers == other.m_modifiers && m_key == other.m_key;
    }
    bool operator!=(const ShortcutCombination& other) const
    {
        return !(*this == other);
    }

private:
    void normalizeModifiers();

    QVector<Modifier> m_modifiers;
    QString m_key;
};

inline size_t qHash(const ShortcutCombination& combination, size_t seed = 0)
{
    return qHash(combination.toString(), seed);
}

TESSERA_EXPORT QDebug operator<<(QDebug debug, const ShortcutCombination& combination);

} // namespace Tessera

Q_DECLARE_METATYPE(Tessera::ShortcutCombination)
