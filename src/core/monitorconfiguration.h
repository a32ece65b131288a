// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "types.h"
#include <QJsonObject>
#include <QRect>
#include <QString>
#include <optional>

namespace Tessera {

/**
 * @brief Orientation preference for directional layouts
 *
 * Current follows the usable area's aspect ratio (wider than tall is landscape).
 */
enum class Orientation {
    Current,
    Landscape,
    Portrait
};

TESSERA_EXPORT QString orientationToString(Orientation orientation);
TESSERA_EXPORT std::optional<Orientation> orientationFromString(const QString& str);

/**
 * @brief Per-workspace layout settings for one monitor
 *
 * Owned by its workspace: deleting the workspace with cascade deletes its
 * monitor configurations. At most one configuration exists per
 * (workspace, monitor) pair.
 */
struct TESSERA_EXPORT MonitorConfiguration
{
    QString id;
    QString workspaceId;
    QString monitorId;
    QString primaryPatternId;
    QString secondaryPatternId;  ///< Used once the window count exceeds maxPrimaryWindows
    int maxPrimaryWindows = 0;   ///< 0 means the primary pattern is always used
    QRect usableArea;            ///< Invalid means the monitor's own work area
    Orientation orientation = Orientation::Current;
    qreal scaleFactor = 1.0;     ///< > 0

    bool operator==(const MonitorConfiguration& other) const;
    bool operator!=(const MonitorConfiguration& other) const;

    OperationResult validate() const;

    QJsonObject toJson() const;
    static std::optional<MonitorConfiguration> fromJson(const QJsonObject& json);

    static MonitorConfiguration create(const QString& workspaceId, const QString& monitorId,
                                       const QString& primaryPatternId);

    /**
     * @brief Pattern id to use for @p windowCount auto-tiled windows
     */
    QString patternFor(int windowCount) const;

    /**
     * @brief Usable area clipped to the monitor's physical bounds
     *
     * Falls back to the monitor's work area when no area is configured.
     */
    QRect effectiveUsableArea(const MonitorSnapshot& monitor) const;
};

} // namespace Tessera
