// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "types.h"
#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <optional>

namespace Tessera {

/**
 * @brief Runtime state of a workspace in the switching state machine
 *
 * Switching and Modified are transient: Switching is held only while a
 * switch_to transition waits for the platform driver, Modified only while the
 * Active workspace is re-tiled after its window set changed.
 */
enum class WorkspaceState {
    Inactive,
    Switching,
    Active,
    Modified
};

TESSERA_EXPORT QString workspaceStateToString(WorkspaceState state);

/**
 * @brief A named, switchable grouping of windows with a layout policy
 *
 * The persisted part of a workspace. Window membership and the state machine
 * state are runtime data owned by WorkspaceManager.
 */
struct TESSERA_EXPORT Workspace
{
    QString id;
    QString name;                              ///< Unique, 1-100 characters after trimming
    QString description;                       ///< Optional, at most 500 characters
    QString shortcutId;                        ///< KeyboardMapping id, empty if unassigned
    QString defaultPatternId;                  ///< TilingPattern used when no monitor override applies
    QHash<QString, QString> monitorOverrides;  ///< monitor id -> pattern id
    bool autoArrange = true;                   ///< Re-tile when the window set changes
    QDateTime createdAt;
    QDateTime lastUsed;

    bool operator==(const Workspace& other) const;
    bool operator!=(const Workspace& other) const;

    /**
     * @brief Check the workspace's own invariants (name and description lengths)
     *
     * Cross-entity invariants (unique name, existing references) are checked
     * by EntityRegistry.
     */
    OperationResult validate() const;

    QJsonObject toJson() const;
    static std::optional<Workspace> fromJson(const QJsonObject& json);

    /**
     * @brief Create a workspace with a fresh id and both timestamps set to now
     */
    static Workspace create(const QString& name, const QString& defaultPatternId = QString());

    /**
     * @brief Pattern id for a monitor from the override map, else the default
     */
    QString patternForMonitor(const QString& monitorId) const;
};

} // namespace Tessera

Q_DECLARE_METATYPE(Tessera::WorkspaceState)
