// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "shortcutcombination.h"
#include "types.h"
#include <QJsonObject>
#include <QMap>
#include <QMetaType>
#include <QString>
#include <optional>

namespace Tessera {

/**
 * @brief What a keyboard mapping does when triggered
 */
enum class ActionKind {
    SwitchWorkspace,      ///< Target: workspace id
    MoveWindowToWorkspace, ///< Target: workspace id
    DeleteWorkspace,      ///< Target: workspace id
    CreateWorkspace,      ///< Parameter: name
    MoveWindowToMonitor,  ///< Parameter: monitor
    ResizeWindow,         ///< Parameters: direction, amount
    FocusNext,
    FocusPrevious,
    ToggleFloating,
    ToggleFullscreen,
    CloseWindow,
    MinimizeWindow,
    RefreshLayout,
    ShowOverview,
    Custom                ///< Parameter: command
};

/**
 * @brief Where a mapping is active
 */
enum class MappingScope {
    Global,     ///< Active regardless of the focused application
    Application ///< Active only while scopeApplication has focus
};

TESSERA_EXPORT QString actionKindToString(ActionKind kind);
TESSERA_EXPORT std::optional<ActionKind> actionKindFromString(const QString& str);
TESSERA_EXPORT QString mappingScopeToString(MappingScope scope);
TESSERA_EXPORT std::optional<MappingScope> mappingScopeFromString(const QString& str);

/**
 * @brief Whether an action kind targets a workspace through targetId
 */
TESSERA_EXPORT bool actionTargetsWorkspace(ActionKind kind) noexcept;

/**
 * @brief A shortcut combination bound to an action
 *
 * Uniqueness of (scope, combination) among enabled mappings and the reserved
 * modifier policy are enforced by EntityRegistry, since both depend on the
 * rest of the mapping set and on runtime configuration.
 */
struct TESSERA_EXPORT KeyboardMapping
{
    QString id;
    ShortcutCombination combination;
    ActionKind action = ActionKind::SwitchWorkspace;
    QString targetId;                 ///< Workspace id for workspace-targeting actions
    QMap<QString, QString> parameters; ///< Opaque action payload
    bool enabled = true;
    MappingScope scope = MappingScope::Global;
    QString scopeApplication;         ///< Application id when scope == Application

    bool operator==(const KeyboardMapping& other) const;
    bool operator!=(const KeyboardMapping& other) const;

    /**
     * @brief Check combination, target and payload against the action kind
     *
     * Whether targetId names an existing workspace is checked by EntityRegistry.
     */
    OperationResult validate() const;

    /**
     * @brief Key identifying the mapping's slot in the shortcut space
     *
     * Two enabled mappings with the same scope key must not exist.
     */
    QString scopeKey() const;

    QJsonObject toJson() const;
    static std::optional<KeyboardMapping> fromJson(const QJsonObject& json);

    static KeyboardMapping create(const ShortcutCombination& combination, ActionKind action,
                                  const QString& targetId = QString());
};

} // namespace Tessera

Q_DECLARE_METATYPE(Tessera::KeyboardMapping)
