// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "core/applicationmatcher.h"
#include "core/applicationprofile.h"
#include "core/placementplan.h"
#include "core/tilingpattern.h"
#include "core/types.h"
#include "core/windowrule.h"
#include <QHash>
#include <QObject>
#include <QRect>
#include <QString>
#include <QVector>

namespace Tessera {

class AlgorithmRegistry;
class EntityRegistry;
class TilingAlgorithm;
struct MonitorConfiguration;
struct Workspace;

/**
 * @brief Result of a plan computation
 *
 * - ok: @c plan is complete
 * - Tiling error with plan.fallback set: a pattern could not be used, the
 *   affected windows were placed by the allow-overflow fallback and the plan
 *   is still usable
 * - any other error: no plan (unknown workspace, no monitors)
 */
struct TESSERA_EXPORT PlanResult
{
    PlacementPlan plan;
    OperationResult result;

    bool isOk() const noexcept
    {
        return result.isOk();
    }

    bool hasPlan() const noexcept
    {
        return result.isOk() || plan.fallback;
    }
};

/**
 * @brief Tiled slots for one monitor
 */
struct TileSlots
{
    QVector<QRect> rects;
    QVector<bool> layered; ///< Parallel to rects: stacked behind the last tiled slot
};

/**
 * @brief Computes placement plans for workspaces
 *
 * TilingEngine turns a workspace's window set into a PlacementPlan:
 * - Windows matching a fixed, floating or fullscreen WindowRule (or whose
 *   ApplicationProfile defaults to one of these) are placed on their own
 * - The remaining windows are tiled per monitor with the pattern chosen by
 *   the MonitorConfiguration, the workspace's monitor overrides, or the
 *   workspace's default pattern, in that order
 * - Windows beyond a pattern's capacity follow its overflow policy
 *
 * Application matchers are compiled once per registry commit, not per plan.
 *
 * The engine has no side effects: plans are applied by the platform driver.
 *
 * @see TilingAlgorithm for the algorithm interface
 * @see AlgorithmRegistry for algorithm lookup
 */
class TESSERA_EXPORT TilingEngine : public QObject
{
    Q_OBJECT

public:
    /**
     * @param registry Entity registry (must outlive the engine)
     */
    explicit TilingEngine(EntityRegistry &registry, QObject *parent = nullptr);
    ~TilingEngine() override;

    AlgorithmRegistry *algorithms() const noexcept
    {
        return m_algorithms;
    }

    /**
     * @brief Compute the placement plan for a workspace
     *
     * @param workspaceId Workspace to place
     * @param monitors Live monitor snapshot
     * @param windows The workspace's windows; minimized windows are left out of the plan
     */
    PlanResult computePlan(const QString &workspaceId, const QVector<MonitorSnapshot> &monitors,
                           const QVector<WindowSnapshot> &windows) const;

    /**
     * @brief Slots for @p windowCount tiled windows of one pattern
     *
     * Applies the window margin, gap and overflow policy of @p pattern.
     * Returns no slots when the algorithm is unknown or the area left after
     * the margin is empty.
     */
    TileSlots layoutSlots(const TilingPattern &pattern, int windowCount, const QRect &area,
                          Qt::Orientation orientation) const;

    /**
     * @brief Placement mode a window gets from the workspace's rules or its application profile
     * @param priority Receives the matching rule's stacking priority (0 otherwise, may be null)
     * @param rule Receives the matching rule (may be null)
     */
    PlacementMode placementFor(const QString &workspaceId, const WindowSnapshot &window, int *priority = nullptr,
                               WindowRule *rule = nullptr) const;

    /**
     * @brief Move and shrink @p rect so it lies within @p bounds
     */
    static QRect clampInto(const QRect &rect, const QRect &bounds);

private:
    struct CompiledRule
    {
        WindowRule rule;
        ApplicationMatcher matcher;
    };

    struct CompiledProfile
    {
        ApplicationProfile profile;
        ApplicationMatcher matcher;
    };

    void rebuildMatchers();

    QString patternIdFor(const Workspace &workspace, const MonitorConfiguration *config, const QString &monitorId,
                         int windowCount) const;

    const MonitorSnapshot *monitorFor(const WindowSnapshot &window, const QVector<MonitorSnapshot> &monitors) const;

    EntityRegistry &m_registry;
    AlgorithmRegistry *m_algorithms = nullptr;

    QHash<QString, QVector<CompiledRule>> m_rulesByWorkspace; ///< Sorted by descending priority, then registry order
    QHash<QString, CompiledProfile> m_profilesByBundle;
};

} // namespace Tessera

Q_DECLARE_METATYPE(Tessera::PlanResult)
