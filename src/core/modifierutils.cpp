// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "modifierutils.h"

namespace Tessera {
namespace ModifierUtils {

int modifierToBitmask(Modifier modifier)
{
    switch (modifier) {
    case Modifier::Control:
        return Qt::ControlModifier;
    case Modifier::Option:
        return Qt::AltModifier;
    case Modifier::Shift:
        return Qt::ShiftModifier;
    case Modifier::Command:
        return Qt::MetaModifier;
    }
    return 0;
}

bool bitmaskHasModifier(int bitmask, Modifier modifier)
{
    return (bitmask & modifierToBitmask(modifier)) != 0;
}

QString modifierToString(Modifier modifier)
{
    switch (modifier) {
    case Modifier::Control:
        return QStringLiteral("ctrl");
    case Modifier::Option:
        return QStringLiteral("opt");
    case Modifier::Shift:
        return QStringLiteral("shift");
    case Modifier::Command:
        return QStringLiteral("cmd");
    }
    return QString();
}

std::optional<Modifier> modifierFromString(const QString& name)
{
    const QString lower = name.trimmed().toLower();
    if (lower == QLatin1String("ctrl") || lower == QLatin1String("control")) {
        return Modifier::Control;
    }
    if (lower == QLatin1String("opt") || lower == QLatin1String("option") || lower == QLatin1String("alt")) {
        return Modifier::Option;
    }
    if (lower == QLatin1String("shift")) {
        return Modifier::Shift;
    }
    if (lower == QLatin1String("cmd") || lower == QLatin1String("command") || lower == QLatin1String("meta")
        || lower == QLatin1String("super")) {
        return Modifier::Command;
    }
    return std::nullopt;
}

} // namespace ModifierUtils
} // namespace Tessera
