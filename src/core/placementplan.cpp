// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "placementplan.h"
#include "constants.h"
#include "utils.h"
#include <QJsonArray>

namespace Tessera {

int PlacementPlan::tiledCount() const
{
    int count = 0;
    for (const PlacementEntry& entry : entries) {
        if (entry.mode == PlacementMode::AutoTile && !entry.layered) {
            ++count;
        }
    }
    return count;
}

int PlacementPlan::layeredCount() const
{
    int count = 0;
    for (const PlacementEntry& entry : entries) {
        if (entry.layered) {
            ++count;
        }
    }
    return count;
}

const PlacementEntry* PlacementPlan::entryFor(const QString& windowId) const
{
    for (const PlacementEntry& entry : entries) {
        if (entry.windowId == windowId) {
            return &entry;
        }
    }
    return nullptr;
}

QVector<PlacementEntry> PlacementPlan::entriesOn(const QString& monitorId) const
{
    QVector<PlacementEntry> result;
    for (const PlacementEntry& entry : entries) {
        if (entry.monitorId == monitorId) {
            result.append(entry);
        }
    }
    return result;
}

QJsonObject PlacementPlan::toJson() const
{
    QJsonArray array;
    for (const PlacementEntry& entry : entries) {
        QJsonObject obj;
        obj[QLatin1String("windowId")] = entry.windowId;
        obj[JsonKeys::MonitorId] = entry.monitorId;
        obj[QLatin1String("geometry")] = Utils::rectToJson(entry.geometry);
        obj[QLatin1String("z")] = entry.zOrder;
        obj[JsonKeys::Placement] = placementModeToString(entry.mode);
        obj[QLatin1String("layered")] = entry.layered;
        array.append(obj);
    }

    QJsonObject json;
    json[JsonKeys::WorkspaceId] = workspaceId;
    json[QLatin1String("entries")] = array;
    json[QLatin1String("fallback")] = fallback;
    if (!warning.isEmpty()) {
        json[QLatin1String("warning")] = warning;
    }
    return json;
}

} // namespace Tessera
