// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "shortcutcombination.h"
#include <QKeyCombination>
#include <QKeySequence>
#include <QStringList>
#include <algorithm>

namespace Tessera {

namespace {

/**
 * @brief Normalize a key name to Qt's portable form
 * @return Portable name, or an empty string if the key is unknown or carries modifiers
 */
QString canonicalKeyName(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }

    const QKeySequence sequence = QKeySequence::fromString(trimmed, QKeySequence::PortableText);
    if (sequence.count() != 1) {
        return QString();
    }

    const QKeyCombination combination = sequence[0];
    if (combination.key() == Qt::Key_unknown || combination.keyboardModifiers() != Qt::NoModifier) {
        return QString();
    }
    return QKeySequence(QKeyCombination(combination.key())).toString(QKeySequence::PortableText);
}

} // anonymous namespace

ShortcutCombination::ShortcutCombination(const QVector<Modifier>& modifiers, const QString& key)
    : m_modifiers(modifiers)
    , m_key(canonicalKeyName(key))
{
    normalizeModifiers();
}

std::optional<ShortcutCombination> ShortcutCombination::parse(const QString& text)
{
    const QStringList parts = text.split(QLatin1Char('+'));
    if (parts.size() < 2) {
        return std::nullopt;
    }

    QVector<Modifier> modifiers;
    modifiers.reserve(parts.size() - 1);
    for (int i = 0; i < parts.size() - 1; ++i) {
        const auto modifier = ModifierUtils::modifierFromString(parts.at(i));
        if (!modifier) {
            return std::nullopt;
        }
        modifiers.append(*modifier);
    }

    ShortcutCombination combination(modifiers, parts.last());
    if (!combination.isValid()) {
        return std::nullopt;
    }
    return combination;
}

ShortcutCombination ShortcutCombination::fromKeyEvent(int modifierBitmask, int qtKey)
{
    QVector<Modifier> modifiers;
    for (Modifier modifier : {Modifier::Control, Modifier::Option, Modifier::Shift, Modifier::Command}) {
        if (ModifierUtils::bitmaskHasModifier(modifierBitmask, modifier)) {
            modifiers.append(modifier);
        }
    }

    ShortcutCombination combination;
    combination.m_modifiers = modifiers;
    const auto key = static_cast<Qt::Key>(qtKey);
    if (key != Qt::Key_unknown && key != 0) {
        combination.m_key = QKeySequence(QKeyCombination(key)).toString(QKeySequence::PortableText);
    }
    return combination;
}

ShortcutCombination ShortcutCombination::replacingModifier(Modifier from, Modifier to) const
{
    ShortcutCombination result = *this;
    for (Modifier& modifier : result.m_modifiers) {
        if (modifier == from) {
            modifier = to;
        }
    }
    result.normalizeModifiers();
    return result;
}

QString ShortcutCombination::toString() const
{
    QStringList parts;
    parts.reserve(m_modifiers.size() + 1);
    for (Modifier modifier : m_modifiers) {
        parts.append(ModifierUtils::modifierToString(modifier));
    }
    parts.append(m_key.toLower());
    return parts.join(QLatin1Char('+'));
}

void ShortcutCombination::normalizeModifiers()
{
    std::sort(m_modifiers.begin(), m_modifiers.end());
    m_modifiers.erase(std::unique(m_modifiers.begin(), m_modifiers.end()), m_modifiers.end());
}

QDebug operator<<(QDebug debug, const ShortcutCombination& combination)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "ShortcutCombination(" << combination.toString() << ')';
    return debug;
}

} // namespace Tessera
