// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "workspace.h"
#include "constants.h"
#include "utils.h"
#include <KLocalizedString>

namespace Tessera {

using namespace JsonKeys;

QString workspaceStateToString(WorkspaceState state)
{
    switch (state) {
    case WorkspaceState::Switching:
        return QStringLiteral("switching");
    case WorkspaceState::Active:
        return QStringLiteral("active");
    case WorkspaceState::Modified:
        return QStringLiteral("modified");
    case WorkspaceState::Inactive:
    default:
        return QStringLiteral("inactive");
    }
}

bool Workspace::operator==(const Workspace& other) const
{
    return id == other.id && name == other.name && description == other.description
        && shortcutId == other.shortcutId && defaultPatternId == other.defaultPatternId
        && monitorOverrides == other.monitorOverrides && autoArrange == other.autoArrange
        && createdAt == other.createdAt && lastUsed == other.lastUsed;
}

bool Workspace::operator!=(const Workspace& other) const
{
    return !(*this == other);
}

OperationResult Workspace::validate() const
{
    if (id.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Workspace has no id"));
    }
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Workspace name must not be empty"));
    }
    if (trimmed.size() > Defaults::MaxWorkspaceNameLength) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Workspace name is longer than %1 characters",
                                             Defaults::MaxWorkspaceNameLength));
    }
    if (description.size() > Defaults::MaxDescriptionLength) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Workspace description is longer than %1 characters",
                                             Defaults::MaxDescriptionLength));
    }
    for (auto it = monitorOverrides.constBegin(); it != monitorOverrides.constEnd(); ++it) {
        if (it.key().isEmpty() || it.value().isEmpty()) {
            return OperationResult::failure(ErrorKind::Validation,
                                            i18n("Workspace monitor override has an empty monitor or pattern"));
        }
    }
    return OperationResult::ok();
}

QJsonObject Workspace::toJson() const
{
    QJsonObject json;
    json[Id] = id;
    json[Name] = name;
    if (!description.isEmpty()) {
        json[Description] = description;
    }
    if (!shortcutId.isEmpty()) {
        json[ShortcutId] = shortcutId;
    }
    json[DefaultPatternId] = defaultPatternId;

    QJsonObject overrides;
    for (auto it = monitorOverrides.constBegin(); it != monitorOverrides.constEnd(); ++it) {
        overrides[it.key()] = it.value();
    }
    json[MonitorOverrides] = overrides;
    json[AutoArrange] = autoArrange;
    json[CreatedAt] = Utils::dateTimeToJson(createdAt);
    json[LastUsed] = Utils::dateTimeToJson(lastUsed);
    return json;
}

std::optional<Workspace> Workspace::fromJson(const QJsonObject& json)
{
    if (!json.contains(Id) || !json.contains(Name)) {
        return std::nullopt;
    }

    Workspace workspace;
    workspace.id = json[Id].toString();
    workspace.name = json[Name].toString();
    workspace.description = json[Description].toString();
    workspace.shortcutId = json[ShortcutId].toString();
    workspace.defaultPatternId = json[DefaultPatternId].toString();

    const QJsonObject overrides = json[MonitorOverrides].toObject();
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        workspace.monitorOverrides.insert(it.key(), it.value().toString());
    }

    workspace.autoArrange = json[AutoArrange].toBool(true);
    workspace.createdAt = Utils::dateTimeFromJson(json[CreatedAt]);
    workspace.lastUsed = Utils::dateTimeFromJson(json[LastUsed]);
    return workspace;
}

Workspace Workspace::create(const QString& name, const QString& defaultPatternId)
{
    Workspace workspace;
    workspace.id = Utils::generateId();
    workspace.name = name.trimmed();
    workspace.defaultPatternId = defaultPatternId;
    workspace.createdAt = QDateTime::currentDateTimeUtc();
    workspace.lastUsed = workspace.createdAt;
    return workspace;
}

QString Workspace::patternForMonitor(const QString& monitorId) const
{
    return monitorOverrides.value(monitorId, defaultPatternId);
}

} // namespace Tessera
