// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "keyboardmapping.h"
#include "constants.h"
#include "utils.h"
#include <KLocalizedString>
#include <QStringList>
#include <QVariant>

namespace Tessera {

using namespace JsonKeys;

namespace {

struct ActionName
{
    ActionKind kind;
    const char* name;
};

constexpr ActionName ActionNames[] = {
    {ActionKind::SwitchWorkspace, "switch-workspace"},
    {ActionKind::MoveWindowToWorkspace, "move-window-to-workspace"},
    {ActionKind::DeleteWorkspace, "delete-workspace"},
    {ActionKind::CreateWorkspace, "create-workspace"},
    {ActionKind::MoveWindowToMonitor, "move-window-to-monitor"},
    {ActionKind::ResizeWindow, "resize-window"},
    {ActionKind::FocusNext, "focus-next"},
    {ActionKind::FocusPrevious, "focus-previous"},
    {ActionKind::ToggleFloating, "toggle-floating"},
    {ActionKind::ToggleFullscreen, "toggle-fullscreen"},
    {ActionKind::CloseWindow, "close-window"},
    {ActionKind::MinimizeWindow, "minimize-window"},
    {ActionKind::RefreshLayout, "refresh-layout"},
    {ActionKind::ShowOverview, "show-overview"},
    {ActionKind::Custom, "custom"},
};

bool isResizeDirection(const QString& direction)
{
    static const QStringList directions = {QStringLiteral("left"), QStringLiteral("right"), QStringLiteral("up"),
                                           QStringLiteral("down")};
    return directions.contains(direction);
}

} // anonymous namespace

QString actionKindToString(ActionKind kind)
{
    for (const ActionName& entry : ActionNames) {
        if (entry.kind == kind) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QString();
}

std::optional<ActionKind> actionKindFromString(const QString& str)
{
    for (const ActionName& entry : ActionNames) {
        if (str == QLatin1String(entry.name)) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

QString mappingScopeToString(MappingScope scope)
{
    return scope == MappingScope::Application ? QStringLiteral("application") : QStringLiteral("global");
}

std::optional<MappingScope> mappingScopeFromString(const QString& str)
{
    if (str == QLatin1String("global")) {
        return MappingScope::Global;
    }
    if (str == QLatin1String("application")) {
        return MappingScope::Application;
    }
    return std::nullopt;
}

bool actionTargetsWorkspace(ActionKind kind) noexcept
{
    return kind == ActionKind::SwitchWorkspace || kind == ActionKind::MoveWindowToWorkspace
        || kind == ActionKind::DeleteWorkspace;
}

bool KeyboardMapping::operator==(const KeyboardMapping& other) const
{
    return id == other.id && combination == other.combination && action == other.action
        && targetId == other.targetId && parameters == other.parameters && enabled == other.enabled
        && scope == other.scope && scopeApplication == other.scopeApplication;
}

bool KeyboardMapping::operator!=(const KeyboardMapping& other) const
{
    return !(*this == other);
}

OperationResult KeyboardMapping::validate() const
{
    if (id.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Keyboard mapping has no id"));
    }
    if (!combination.isValid()) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("A shortcut needs at least one modifier and a key"));
    }
    if (scope == MappingScope::Application && scopeApplication.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("An application-scoped shortcut needs an application id"));
    }

    if (actionTargetsWorkspace(action)) {
        if (targetId.isEmpty()) {
            return OperationResult::failure(ErrorKind::Validation,
                                            i18n("Action %1 needs a target workspace", actionKindToString(action)));
        }
        return OperationResult::ok();
    }

    if (!targetId.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Action %1 does not take a target", actionKindToString(action)));
    }

    switch (action) {
    case ActionKind::CreateWorkspace:
        if (parameters.value(ActionParams::Name).trimmed().isEmpty()) {
            return OperationResult::failure(ErrorKind::Validation, i18n("Creating a workspace needs a name"));
        }
        break;
    case ActionKind::MoveWindowToMonitor:
        if (parameters.value(ActionParams::Monitor).isEmpty()) {
            return OperationResult::failure(ErrorKind::Validation, i18n("Moving a window needs a target monitor"));
        }
        break;
    case ActionKind::ResizeWindow: {
        bool amountOk = false;
        const int amount = parameters.value(ActionParams::Amount).toInt(&amountOk);
        if (!isResizeDirection(parameters.value(ActionParams::Direction)) || !amountOk || amount == 0) {
            return OperationResult::failure(ErrorKind::Validation,
                                            i18n("Resizing needs a direction (left, right, up, down) and a non-zero amount"));
        }
        break;
    }
    case ActionKind::Custom:
        if (parameters.value(ActionParams::Command).isEmpty()) {
            return OperationResult::failure(ErrorKind::Validation, i18n("A custom action needs a command"));
        }
        break;
    default:
        break;
    }
    return OperationResult::ok();
}

QString KeyboardMapping::scopeKey() const
{
    const QString prefix = scope == MappingScope::Application ? scopeApplication : QStringLiteral("*");
    return prefix + QLatin1Char('|') + combination.toString();
}

QJsonObject KeyboardMapping::toJson() const
{
    QJsonObject json;
    json[Id] = id;
    json[Combination] = combination.toString();
    json[Action] = actionKindToString(action);
    if (!targetId.isEmpty()) {
        json[TargetId] = targetId;
    }
    if (!parameters.isEmpty()) {
        QJsonObject params;
        for (auto it = parameters.constBegin(); it != parameters.constEnd(); ++it) {
            params[it.key()] = it.value();
        }
        json[Parameters] = params;
    }
    json[Enabled] = enabled;
    json[Scope] = mappingScopeToString(scope);
    if (scope == MappingScope::Application) {
        json[ScopeApplication] = scopeApplication;
    }
    return json;
}

std::optional<KeyboardMapping> KeyboardMapping::fromJson(const QJsonObject& json)
{
    const auto combination = ShortcutCombination::parse(json[Combination].toString());
    const auto action = actionKindFromString(json[Action].toString());
    const auto scope = mappingScopeFromString(json[Scope].toString(QStringLiteral("global")));
    if (!combination || !action || !scope) {
        return std::nullopt;
    }

    KeyboardMapping mapping;
    mapping.id = json[Id].toString();
    mapping.combination = *combination;
    mapping.action = *action;
    mapping.targetId = json[TargetId].toString();

    const QJsonObject params = json[Parameters].toObject();
    for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
        mapping.parameters.insert(it.key(), it.value().toVariant().toString());
    }

    mapping.enabled = json[Enabled].toBool(true);
    mapping.scope = *scope;
    mapping.scopeApplication = json[ScopeApplication].toString();
    return mapping;
}

KeyboardMapping KeyboardMapping::create(const ShortcutCombination& combination, ActionKind action,
                                        const QString& targetId)
{
    KeyboardMapping mapping;
    mapping.id = Utils::generateId();
    mapping.combination = combination;
    mapping.action = action;
    mapping.targetId = targetId;
    return mapping;
}

} // namespace Tessera
