// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "../core/keyboardmapping.h"
#include "../core/placementplan.h"
#include "../core/tilingpattern.h"
#include "../core/types.h"
#include "../core/workspace.h"
#include <QElapsedTimer>
#include <QHash>
#include <QObject>
#include <QStringList>
#include <QVector>
#include <optional>

class QTimer;

namespace Tessera {

class EntityRegistry;
class IMonitorProvider;
class IPlatformDriver;
class ShortcutTable;
class TilingEngine;

/**
 * @brief Top-level coordinator of workspace switching
 *
 * Owns the workspace state machine and the runtime window membership:
 *
 *   Inactive --switchTo--> Switching --driver ack--> Active
 *   Active --window set changes--> Modified --re-tile ack--> Active
 *   Active --switchAway / another switch--> Inactive
 *
 * A switch computes a placement plan through the TilingEngine and hands it
 * to the platform driver. The driver acknowledges asynchronously through
 * acknowledgePlan(). A missing acknowledgment times out after ackTimeout()
 * and is retried with exponential backoff up to driverMaxAttempts(); after
 * that the target returns to Inactive and the previous workspace stays
 * Active. Permission errors are not retried.
 *
 * Only one transition is in flight at a time. A second switchTo() returns
 * Busy; membership changes during a transition re-tile once it completes.
 *
 * Metrics are collected on the switch path and published from a timer.
 */
class TESSERA_EXPORT WorkspaceManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @param registry Entity registry (must outlive the manager)
     * @param engine Tiling engine (must outlive the manager)
     * @param shortcuts Shortcut table used by handleShortcut() (must outlive the manager)
     * @param driver Platform driver (not owned, may be null until set)
     * @param monitors Monitor provider (not owned, may be null until set)
     */
    WorkspaceManager(EntityRegistry& registry, TilingEngine& engine, ShortcutTable& shortcuts,
                     IPlatformDriver* driver = nullptr, IMonitorProvider* monitors = nullptr,
                     QObject* parent = nullptr);
    ~WorkspaceManager() override;

    void setPlatformDriver(IPlatformDriver* driver);
    void setMonitorProvider(IMonitorProvider* monitors);

    // ═══════════════════════════════════════════════════════════════════════════
    // Tunables
    // ═══════════════════════════════════════════════════════════════════════════

    int ackTimeout() const noexcept
    {
        return m_ackTimeoutMs;
    }
    void setAckTimeout(int ms);

    int driverMaxAttempts() const noexcept
    {
        return m_driverMaxAttempts;
    }
    void setDriverMaxAttempts(int attempts);

    void setRetryDelays(int baseMs, int maxMs);

    /**
     * @brief Backoff before retry number @p attempt (1-based)
     */
    int retryDelay(int attempt) const;

    int metricsFlushInterval() const;
    void setMetricsFlushInterval(int ms);

    // ═══════════════════════════════════════════════════════════════════════════
    // State
    // ═══════════════════════════════════════════════════════════════════════════

    QString activeWorkspaceId() const
    {
        return m_activeId;
    }

    WorkspaceState state(const QString& workspaceId) const;

    bool isTransitioning() const noexcept
    {
        return m_pending.has_value();
    }

    /**
     * @brief Target of the switch in flight, empty if none
     */
    QString pendingWorkspaceId() const;

    SwitchMetrics metrics() const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Transitions
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Start switching to a workspace
     *
     * @return Ok when the plan was handed to the driver; completion is
     *         reported by workspaceActivated() or switchFailed(). Otherwise
     *         NotFound, Validation (already active), Busy, Tiling or Driver.
     */
    OperationResult switchTo(const QString& workspaceId);

    /**
     * @brief Cancel the switch in flight before the driver acknowledged it
     */
    OperationResult cancelSwitch();

    /**
     * @brief Deactivate the Active workspace without activating another
     */
    OperationResult switchAway();

    /**
     * @brief Workspace with the most recent last-used timestamp, empty if none was used
     */
    QString lastUsedWorkspaceId() const;

    /**
     * @brief Switch to the workspace used most recently
     */
    OperationResult restoreLastActive();

    /**
     * @brief Re-tile the Active workspace (Active -> Modified -> Active)
     *
     * Deferred until the transition in flight completes.
     */
    OperationResult retile();

    /**
     * @brief Update a pattern and re-tile the Active workspace if it uses it
     */
    OperationResult updatePattern(const TilingPattern& pattern);

    /**
     * @brief Driver acknowledgment of a plan handed over by applyPlan()
     *
     * Acknowledgments for superseded request ids are ignored.
     */
    void acknowledgePlan(quint64 requestId, const OperationResult& status);

    // ═══════════════════════════════════════════════════════════════════════════
    // Window membership
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Put a window on a workspace, removing it from any other
     */
    OperationResult assignWindow(const QString& workspaceId, const WindowSnapshot& window);
    OperationResult unassignWindow(const QString& windowId);
    QVector<WindowSnapshot> windowsOf(const QString& workspaceId) const;

    /**
     * @brief Workspace holding a window, empty if unassigned
     */
    QString workspaceOf(const QString& windowId) const;

    // Platform notifications
    void windowCreated(const WindowSnapshot& window);
    void windowDestroyed(const QString& windowId);
    void windowMoved(const WindowSnapshot& window);
    void monitorsChanged();

    // ═══════════════════════════════════════════════════════════════════════════
    // Commands
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Create a workspace
     * @param patternId Default pattern; the first registered pattern when empty
     * @param createdId Receives the new workspace id (may be null)
     */
    OperationResult createWorkspace(const QString& name, const QString& patternId = QString(),
                                    QString* createdId = nullptr);

    /**
     * @brief Delete a workspace that is neither Active nor being switched to
     */
    OperationResult deleteWorkspace(const QString& workspaceId, bool cascade);

    QVector<Workspace> listWorkspaces() const;

    /**
     * @brief Execute a mapping's action
     *
     * Workspace actions, focus cycling and layout refresh run here; the
     * remaining actions are forwarded through actionRequested().
     *
     * @param focusedWindowId Window with keyboard focus, for window actions
     */
    OperationResult dispatch(const KeyboardMapping& mapping, const QString& focusedWindowId = QString());

    /**
     * @brief Resolve a key chord through the shortcut table and dispatch it
     */
    OperationResult handleShortcut(const ShortcutCombination& combination, const QString& focusedApplication,
                                   const QString& focusedWindowId = QString());

Q_SIGNALS:
    void workspaceActivated(const QString& workspaceId, qint64 latencyMs);
    void workspaceStateChanged(const QString& workspaceId, Tessera::WorkspaceState state);
    void switchFailed(const QString& workspaceId, const Tessera::OperationResult& error);
    void layoutApplied(const QString& workspaceId, int windowCount);
    void tilingFailed(const QString& workspaceId, const QString& reason);
    void metricsUpdated(const Tessera::SwitchMetrics& metrics);

    /**
     * @brief A mapping's action is handled outside the core
     */
    void actionRequested(const Tessera::KeyboardMapping& mapping);

private:
    enum class TransitionKind {
        Switch,
        Retile
    };

    struct PendingTransition
    {
        TransitionKind kind = TransitionKind::Switch;
        QString workspaceId;
        PlacementPlan plan;
        quint64 requestId = 0; ///< 0 while waiting for a retry
        int attempt = 0;
        QElapsedTimer elapsed;
    };

    void setState(const QString& workspaceId, WorkspaceState state);
    QVector<MonitorSnapshot> currentMonitors() const;
    void sendPlan();
    void onAckTimeout();
    void handleDriverFailure(const OperationResult& status);
    void completeTransition();
    void failTransition(const OperationResult& error);
    void membershipChanged(const QString& workspaceId);
    OperationResult focusAdjacent(const QString& focusedWindowId, int step);
    void recordFailure(const OperationResult& result);
    void flushMetrics();

    EntityRegistry& m_registry;
    TilingEngine& m_engine;
    ShortcutTable& m_shortcuts;
    IPlatformDriver* m_driver = nullptr;
    IMonitorProvider* m_monitors = nullptr;

    QString m_activeId;
    QHash<QString, WorkspaceState> m_states;
    std::optional<PendingTransition> m_pending;
    bool m_retileRequested = false;
    OperationResult m_lastTransitionError;
    quint64 m_nextRequestId = 0;

    QHash<QString, QStringList> m_members;      ///< workspace id -> window ids in assignment order
    QHash<QString, WindowSnapshot> m_windows;   ///< window id -> last snapshot (assigned windows only)

    QTimer* m_ackTimer = nullptr;
    QTimer* m_retryTimer = nullptr;
    QTimer* m_metricsTimer = nullptr;

    int m_ackTimeoutMs;
    int m_driverMaxAttempts;
    int m_retryBaseDelayMs;
    int m_retryMaxDelayMs;

    SwitchMetrics m_metrics;
};

} // namespace Tessera
