// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "windowrule.h"
#include <QJsonObject>
#include <QMetaType>
#include <QRect>
#include <QString>
#include <QVector>

namespace Tessera {

/**
 * @brief Target placement of one window
 */
struct TESSERA_EXPORT PlacementEntry
{
    QString windowId;
    QString monitorId;
    QRect geometry;
    int zOrder = 0;          ///< Higher is closer to the viewer
    PlacementMode mode = PlacementMode::AutoTile;
    bool layered = false;    ///< Overflow window stacked behind a tiled slot

    bool operator==(const PlacementEntry& other) const
    {
        return windowId == other.windowId && monitorId == other.monitorId && geometry == other.geometry
            && zOrder == other.zOrder && mode == other.mode && layered == other.layered;
    }
};

/**
 * @brief Computed placement of a workspace's windows
 *
 * A plan has no side effects until the platform driver applies it.
 *
 * Z-order bands:
 * - tiled windows: 0, layered overflow windows below it (-1, -2, ...)
 * - fixed: 100 + rule priority
 * - floating: 1000 + rule priority
 * - fullscreen: 10000 + rule priority
 */
struct TESSERA_EXPORT PlacementPlan
{
    QString workspaceId;
    QVector<PlacementEntry> entries;
    bool fallback = false; ///< A pattern could not be used; windows were placed by the overflow fallback
    QString warning;       ///< Reason for the fallback

    static constexpr int TiledZ = 0;
    static constexpr int FixedZBase = 100;
    static constexpr int FloatingZBase = 1000;
    static constexpr int FullscreenZBase = 10000;

    int windowCount() const noexcept
    {
        return entries.size();
    }

    int tiledCount() const;
    int layeredCount() const;

    /**
     * @brief Entry for a window, or nullptr if the plan does not place it
     */
    const PlacementEntry* entryFor(const QString& windowId) const;

    /**
     * @brief Entries placed on one monitor, in plan order
     */
    QVector<PlacementEntry> entriesOn(const QString& monitorId) const;

    QJsonObject toJson() const;
};

} // namespace Tessera

Q_DECLARE_METATYPE(Tessera::PlacementPlan)
