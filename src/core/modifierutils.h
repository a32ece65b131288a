// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include <QString>
#include <Qt>
#include <optional>

namespace Tessera {

/**
 * @brief Keyboard modifiers in canonical chord order
 *
 * The enum order is the order modifiers are written in a combination
 * ("ctrl+opt+shift+cmd"). Command is the modifier the host OS reserves for
 * its own shortcuts; Option is the safe modifier by default.
 */
enum class Modifier {
    Control = 0,
    Option = 1,
    Shift = 2,
    Command = 3
};

/**
 * @brief Conversions between Modifier, text names and Qt::KeyboardModifier bitmasks
 *
 * Option maps to Qt::AltModifier and Command to Qt::MetaModifier, matching
 * how Qt reports the Alt and Super/Meta keys.
 */
namespace ModifierUtils {

/**
 * @brief Convert a Modifier to its Qt::KeyboardModifier bit
 */
TESSERA_EXPORT int modifierToBitmask(Modifier modifier);

/**
 * @brief Check whether a Qt::KeyboardModifier bitmask contains @p modifier
 */
TESSERA_EXPORT bool bitmaskHasModifier(int bitmask, Modifier modifier);

/**
 * @brief Canonical short name ("ctrl", "opt", "shift", "cmd")
 */
TESSERA_EXPORT QString modifierToString(Modifier modifier);

/**
 * @brief Parse a modifier name
 *
 * Accepts, case-insensitively: ctrl/control, opt/option/alt,
 * shift, cmd/command/meta/super.
 *
 * @return The modifier, or std::nullopt for an unknown name
 */
TESSERA_EXPORT std::optional<Modifier> modifierFromString(const QString& name);

} // namespace ModifierUtils

} // namespace Tessera
