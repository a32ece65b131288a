// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "workspacemanager.h"
#include "shortcuttable.h"
#include "../autotile/TilingEngine.h"
#include "../core/constants.h"
#include "../core/entityregistry.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include "../core/monitorconfiguration.h"
#include <KLocalizedString>
#include <QDateTime>
#include <QTimer>
#include <algorithm>

namespace Tessera {

WorkspaceManager::WorkspaceManager(EntityRegistry& registry, TilingEngine& engine, ShortcutTable& shortcuts,
                                   IPlatformDriver* driver, IMonitorProvider* monitors, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_engine(engine)
    , m_shortcuts(shortcuts)
    , m_driver(driver)
    , m_monitors(monitors)
    , m_ackTimer(new QTimer(this))
    , m_retryTimer(new QTimer(this))
    , m_metricsTimer(new QTimer(this))
    , m_ackTimeoutMs(Defaults::AckTimeoutMs)
    , m_driverMaxAttempts(Defaults::DriverMaxAttempts)
    , m_retryBaseDelayMs(Defaults::RetryBaseDelayMs)
    , m_retryMaxDelayMs(Defaults::RetryMaxDelayMs)
{
    m_ackTimer->setSingleShot(true);
    connect(m_ackTimer, &QTimer::timeout, this, &WorkspaceManager::onAckTimeout);

    m_retryTimer->setSingleShot(true);
    connect(m_retryTimer, &QTimer::timeout, this, &WorkspaceManager::sendPlan);

    m_metricsTimer->setInterval(Defaults::MetricsFlushIntervalMs);
    connect(m_metricsTimer, &QTimer::timeout, this, &WorkspaceManager::flushMetrics);
    m_metricsTimer->start();

    // Forget runtime state of workspaces removed behind our back
    connect(&m_registry, &EntityRegistry::changed, this,
            [this](EntityRegistry::EntityKind kind, const QString& id) {
                if (kind != EntityRegistry::EntityKind::Workspace || m_registry.workspace(id)) {
                    return;
                }
                if (m_pending && m_pending->workspaceId == id) {
                    failTransition(OperationResult::failure(ErrorKind::NotFound,
                                                            i18n("Workspace %1 was removed", id)));
                }
                const QStringList orphaned = m_members.take(id);
                for (const QString& windowId : orphaned) {
                    m_windows.remove(windowId);
                }
                m_states.remove(id);
                if (m_activeId == id) {
                    qCWarning(lcWorkspace) << "Active workspace" << id << "was removed";
                    m_activeId.clear();
                }
            });
}

WorkspaceManager::~WorkspaceManager() = default;

void WorkspaceManager::setPlatformDriver(IPlatformDriver* driver)
{
    m_driver = driver;
}

void WorkspaceManager::setMonitorProvider(IMonitorProvider* monitors)
{
    m_monitors = monitors;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Tunables
// ═══════════════════════════════════════════════════════════════════════════════

void WorkspaceManager::setAckTimeout(int ms)
{
    m_ackTimeoutMs = std::max(ms, 1);
}

void WorkspaceManager::setDriverMaxAttempts(int attempts)
{
    m_driverMaxAttempts = std::max(attempts, 1);
}

void WorkspaceManager::setRetryDelays(int baseMs, int maxMs)
{
    m_retryBaseDelayMs = std::max(baseMs, 0);
    m_retryMaxDelayMs = std::max(maxMs, m_retryBaseDelayMs);
}

int WorkspaceManager::retryDelay(int attempt) const
{
    // base, 2*base, 4*base, ... capped; the shift is bounded so it cannot overflow
    const int exponent = std::clamp(attempt - 1, 0, 16);
    const qint64 delay = static_cast<qint64>(m_retryBaseDelayMs) << exponent;
    return static_cast<int>(std::min<qint64>(delay, m_retryMaxDelayMs));
}

int WorkspaceManager::metricsFlushInterval() const
{
    return m_metricsTimer->interval();
}

void WorkspaceManager::setMetricsFlushInterval(int ms)
{
    m_metricsTimer->setInterval(std::max(ms, 1));
}

// ═══════════════════════════════════════════════════════════════════════════════
// State
// ═══════════════════════════════════════════════════════════════════════════════

WorkspaceState WorkspaceManager::state(const QString& workspaceId) const
{
    return m_states.value(workspaceId, WorkspaceState::Inactive);
}

QString WorkspaceManager::pendingWorkspaceId() const
{
    if (m_pending && m_pending->kind == TransitionKind::Switch) {
        return m_pending->workspaceId;
    }
    return QString();
}

SwitchMetrics WorkspaceManager::metrics() const
{
    SwitchMetrics current = m_metrics;
    current.activeWindowCount = m_activeId.isEmpty() ? 0 : m_members.value(m_activeId).size();
    return current;
}

void WorkspaceManager::setState(const QString& workspaceId, WorkspaceState state)
{
    if (this->state(workspaceId) == state) {
        return;
    }
    m_states.insert(workspaceId, state);
    qCDebug(lcWorkspace) << "Workspace" << workspaceId << "->" << workspaceStateToString(state);
    Q_EMIT workspaceStateChanged(workspaceId, state);
}

QVector<MonitorSnapshot> WorkspaceManager::currentMonitors() const
{
    return m_monitors ? m_monitors->enumerateMonitors() : QVector<MonitorSnapshot>();
}

void WorkspaceManager::recordFailure(const OperationResult& result)
{
    if (!result.isOk()) {
        m_metrics.recordError(result.kind);
    }
}

void WorkspaceManager::flushMetrics()
{
    Q_EMIT metricsUpdated(metrics());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Transitions
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult WorkspaceManager::switchTo(const QString& workspaceId)
{
    if (m_pending) {
        qCInfo(lcWorkspace) << "Switch to" << workspaceId << "rejected: transition to" << m_pending->workspaceId
                            << "in flight";
        return OperationResult::failure(ErrorKind::Busy, i18n("A workspace switch is already in progress"));
    }

    const auto workspace = m_registry.workspace(workspaceId);
    if (!workspace) {
        const auto result = OperationResult::failure(ErrorKind::NotFound, i18n("Unknown workspace %1", workspaceId));
        recordFailure(result);
        return result;
    }
    if (workspaceId == m_activeId) {
        const auto result = OperationResult::failure(ErrorKind::Validation,
                                                     i18n("Workspace \"%1\" is already active", workspace->name));
        recordFailure(result);
        return result;
    }

    PendingTransition transition;
    transition.kind = TransitionKind::Switch;
    transition.workspaceId = workspaceId;
    transition.elapsed.start();

    setState(workspaceId, WorkspaceState::Switching);

    const PlanResult planned = m_engine.computePlan(workspaceId, currentMonitors(), windowsOf(workspaceId));
    if (!planned.hasPlan()) {
        qCWarning(lcWorkspace) << "Switch to" << workspace->name << "failed, no plan:" << planned.result;
        recordFailure(planned.result);
        ++m_metrics.failedSwitchCount;
        setState(workspaceId, WorkspaceState::Inactive);
        Q_EMIT tilingFailed(workspaceId, planned.result.message);
        Q_EMIT switchFailed(workspaceId, planned.result);
        return planned.result;
    }
    if (planned.plan.fallback) {
        recordFailure(planned.result);
        Q_EMIT tilingFailed(workspaceId, planned.plan.warning);
    }

    transition.plan = planned.plan;
    m_pending = transition;
    qCInfo(lcWorkspace) << "Switching to" << workspace->name << "from"
                        << (m_activeId.isEmpty() ? QStringLiteral("none") : m_activeId) << "with" << planned.plan.windowCount() << "windows";

    sendPlan();

    // The driver may have refused the plan synchronously
    if (!m_pending && state(workspaceId) == WorkspaceState::Inactive) {
        return m_lastTransitionError;
    }
    return OperationResult::ok();
}

void WorkspaceManager::sendPlan()
{
    if (!m_pending) {
        return;
    }

    if (!m_driver) {
        failTransition(OperationResult::failure(ErrorKind::Driver, i18n("No platform driver available")));
        return;
    }

    const quint64 requestId = ++m_nextRequestId;
    m_pending->requestId = requestId;
    ++m_pending->attempt;
    m_ackTimer->start(m_ackTimeoutMs);

    qCDebug(lcWorkspace) << "Applying plan for" << m_pending->workspaceId << "request" << requestId << "attempt"
                         << m_pending->attempt;
    const OperationResult accepted = m_driver->applyPlan(requestId, m_pending->plan);

    // Acknowledged (or cancelled) from inside applyPlan
    if (!m_pending || m_pending->requestId != requestId) {
        return;
    }

    if (!accepted.isOk()) {
        m_ackTimer->stop();
        handleDriverFailure(accepted);
    }
}

void WorkspaceManager::acknowledgePlan(quint64 requestId, const OperationResult& status)
{
    if (!m_pending || requestId == 0 || m_pending->requestId != requestId) {
        qCDebug(lcWorkspace) << "Ignoring stale acknowledgment for request" << requestId;
        return;
    }

    m_ackTimer->stop();
    if (status.isOk()) {
        completeTransition();
    } else {
        handleDriverFailure(status);
    }
}

void WorkspaceManager::onAckTimeout()
{
    if (!m_pending) {
        return;
    }
    qCWarning(lcWorkspace) << "Driver did not acknowledge request" << m_pending->requestId << "within"
                           << m_ackTimeoutMs << "ms";
    handleDriverFailure(OperationResult::failure(
        ErrorKind::Driver, i18n("The platform driver did not acknowledge the plan within %1 ms", m_ackTimeoutMs)));
}

void WorkspaceManager::handleDriverFailure(const OperationResult& status)
{
    if (!m_pending) {
        return;
    }

    // Late acknowledgments of this request no longer count
    m_pending->requestId = 0;
    const OperationResult error =
        status.kind == ErrorKind::Permission ? status : OperationResult::failure(ErrorKind::Driver, status.message);
    recordFailure(error);

    if (error.kind == ErrorKind::Permission) {
        qCWarning(lcWorkspace) << "Driver lacks permission, not retrying:" << error.message;
        failTransition(error);
        return;
    }

    if (m_pending->attempt >= m_driverMaxAttempts) {
        qCWarning(lcWorkspace) << "Giving up on" << m_pending->workspaceId << "after" << m_pending->attempt
                               << "attempts:" << error.message;
        failTransition(error);
        return;
    }

    const int delay = retryDelay(m_pending->attempt);
    qCInfo(lcWorkspace) << "Retrying plan for" << m_pending->workspaceId << "in" << delay << "ms (attempt"
                        << m_pending->attempt + 1 << "of" << m_driverMaxAttempts << ")";
    m_retryTimer->start(delay);
}

void WorkspaceManager::completeTransition()
{
    const PendingTransition done = *m_pending;
    m_pending.reset();
    m_retryTimer->stop();

    if (done.kind == TransitionKind::Switch) {
        const QString previous = m_activeId;
        if (!previous.isEmpty()) {
            setState(previous, WorkspaceState::Inactive);
        }
        m_activeId = done.workspaceId;
        setState(done.workspaceId, WorkspaceState::Active);

        const qint64 latency = done.elapsed.elapsed();
        ++m_metrics.switchCount;
        m_metrics.lastSwitchLatencyMs = latency;
        m_metrics.totalSwitchLatencyMs += latency;

        if (auto workspace = m_registry.workspace(done.workspaceId)) {
            workspace->lastUsed = QDateTime::currentDateTimeUtc();
            const OperationResult saved = m_registry.updateWorkspace(*workspace);
            if (!saved.isOk()) {
                qCWarning(lcWorkspace) << "Could not record last use of" << done.workspaceId << ":" << saved;
            }
        }

        qCInfo(lcWorkspace) << "Workspace" << done.workspaceId << "active after" << latency << "ms";
        Q_EMIT workspaceActivated(done.workspaceId, latency);
    } else {
        setState(done.workspaceId, WorkspaceState::Active);
    }

    Q_EMIT layoutApplied(done.workspaceId, done.plan.windowCount());

    if (m_retileRequested) {
        m_retileRequested = false;
        const OperationResult result = retile();
        if (!result.isOk()) {
            qCWarning(lcWorkspace) << "Deferred re-tile failed:" << result;
        }
    }
}

void WorkspaceManager::failTransition(const OperationResult& error)
{
    const PendingTransition failed = *m_pending;
    m_pending.reset();
    m_lastTransitionError = error;
    m_ackTimer->stop();
    m_retryTimer->stop();

    if (failed.kind == TransitionKind::Switch) {
        // All-or-nothing: the previous workspace was never touched
        ++m_metrics.failedSwitchCount;
        setState(failed.workspaceId, WorkspaceState::Inactive);
        qCWarning(lcWorkspace) << "Switch to" << failed.workspaceId << "failed:" << error << "- staying on"
                               << (m_activeId.isEmpty() ? QStringLiteral("none") : m_activeId);
        if (error.kind != ErrorKind::Cancelled) {
            Q_EMIT tilingFailed(failed.workspaceId, error.message);
        }
        Q_EMIT switchFailed(failed.workspaceId, error);
    } else {
        setState(failed.workspaceId, WorkspaceState::Active);
        qCWarning(lcWorkspace) << "Re-tile of" << failed.workspaceId << "failed:" << error;
        Q_EMIT tilingFailed(failed.workspaceId, error.message);
    }

    m_retileRequested = false;
}

OperationResult WorkspaceManager::cancelSwitch()
{
    if (!m_pending || m_pending->kind != TransitionKind::Switch) {
        return OperationResult::failure(ErrorKind::Validation, i18n("No workspace switch in progress"));
    }
    qCInfo(lcWorkspace) << "Switch to" << m_pending->workspaceId << "cancelled";
    failTransition(OperationResult::failure(ErrorKind::Cancelled, i18n("Workspace switch cancelled")));
    return OperationResult::ok();
}

OperationResult WorkspaceManager::switchAway()
{
    if (m_pending) {
        return OperationResult::failure(ErrorKind::Busy, i18n("A workspace switch is already in progress"));
    }
    if (m_activeId.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("No workspace is active"));
    }
    const QString previous = m_activeId;
    m_activeId.clear();
    setState(previous, WorkspaceState::Inactive);
    qCInfo(lcWorkspace) << "Switched away from" << previous;
    return OperationResult::ok();
}

QString WorkspaceManager::lastUsedWorkspaceId() const
{
    const QVector<Workspace> workspaces = m_registry.workspaces();
    const Workspace* latest = nullptr;
    for (const Workspace& ws : workspaces) {
        if (ws.lastUsed.isValid() && (!latest || ws.lastUsed > latest->lastUsed)) {
            latest = &ws;
        }
    }
    return latest ? latest->id : QString();
}

OperationResult WorkspaceManager::restoreLastActive()
{
    const QString latest = lastUsedWorkspaceId();
    if (latest.isEmpty()) {
        qCDebug(lcWorkspace) << "No workspace was used before";
        return OperationResult::failure(ErrorKind::NotFound, i18n("No workspace was used before"));
    }
    qCInfo(lcWorkspace) << "Restoring last active workspace" << latest;
    return switchTo(latest);
}

OperationResult WorkspaceManager::retile()
{
    if (m_activeId.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("No workspace is active"));
    }
    if (m_pending) {
        m_retileRequested = true;
        return OperationResult::ok();
    }

    const QString workspaceId = m_activeId;
    setState(workspaceId, WorkspaceState::Modified);

    const PlanResult planned = m_engine.computePlan(workspaceId, currentMonitors(), windowsOf(workspaceId));
    if (!planned.hasPlan()) {
        recordFailure(planned.result);
        setState(workspaceId, WorkspaceState::Active);
        qCWarning(lcWorkspace) << "Re-tile of" << workspaceId << "failed:" << planned.result;
        Q_EMIT tilingFailed(workspaceId, planned.result.message);
        return planned.result;
    }
    if (planned.plan.fallback) {
        recordFailure(planned.result);
        Q_EMIT tilingFailed(workspaceId, planned.plan.warning);
    }

    PendingTransition transition;
    transition.kind = TransitionKind::Retile;
    transition.workspaceId = workspaceId;
    transition.plan = planned.plan;
    transition.elapsed.start();
    m_pending = transition;

    sendPlan();
    return OperationResult::ok();
}

OperationResult WorkspaceManager::updatePattern(const TilingPattern& pattern)
{
    const OperationResult result = m_registry.updatePattern(pattern);
    if (!result.isOk()) {
        recordFailure(result);
        return result;
    }

    if (m_activeId.isEmpty()) {
        return result;
    }
    const auto active = m_registry.workspace(m_activeId);
    bool used = active && active->defaultPatternId == pattern.id;
    if (active && !used) {
        used = std::any_of(active->monitorOverrides.cbegin(), active->monitorOverrides.cend(),
                           [&pattern](const QString& patternId) {
                               return patternId == pattern.id;
                           });
    }
    if (!used) {
        const QVector<MonitorConfiguration> configs = m_registry.monitorConfigurations();
        used = std::any_of(configs.cbegin(), configs.cend(), [this, &pattern](const MonitorConfiguration& config) {
            return config.workspaceId == m_activeId
                && (config.primaryPatternId == pattern.id || config.secondaryPatternId == pattern.id);
        });
    }
    return used ? retile() : result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Window membership
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult WorkspaceManager::assignWindow(const QString& workspaceId, const WindowSnapshot& window)
{
    if (window.id.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Window has no id"));
    }
    if (!m_registry.workspace(workspaceId)) {
        return OperationResult::failure(ErrorKind::NotFound, i18n("Unknown workspace %1", workspaceId));
    }

    const QString previous = workspaceOf(window.id);
    m_windows.insert(window.id, window);
    if (previous == workspaceId) {
        return OperationResult::ok();
    }
    if (!previous.isEmpty()) {
        m_members[previous].removeAll(window.id);
    }
    m_members[workspaceId].append(window.id);
    qCDebug(lcWorkspace) << "Window" << window.id << "assigned to" << workspaceId;

    if (!previous.isEmpty()) {
        membershipChanged(previous);
    }
    membershipChanged(workspaceId);
    return OperationResult::ok();
}

OperationResult WorkspaceManager::unassignWindow(const QString& windowId)
{
    const QString workspaceId = workspaceOf(windowId);
    if (workspaceId.isEmpty()) {
        return OperationResult::failure(ErrorKind::NotFound, i18n("Window %1 is not on any workspace", windowId));
    }
    m_members[workspaceId].removeAll(windowId);
    m_windows.remove(windowId);
    membershipChanged(workspaceId);
    return OperationResult::ok();
}

QVector<WindowSnapshot> WorkspaceManager::windowsOf(const QString& workspaceId) const
{
    QVector<WindowSnapshot> windows;
    const QStringList ids = m_members.value(workspaceId);
    windows.reserve(ids.size());
    for (const QString& id : ids) {
        windows.append(m_windows.value(id));
    }
    return windows;
}

QString WorkspaceManager::workspaceOf(const QString& windowId) const
{
    for (auto it = m_members.constBegin(); it != m_members.constEnd(); ++it) {
        if (it.value().contains(windowId)) {
            return it.key();
        }
    }
    return QString();
}

void WorkspaceManager::membershipChanged(const QString& workspaceId)
{
    if (workspaceId != m_activeId) {
        return;
    }
    const auto workspace = m_registry.workspace(workspaceId);
    if (!workspace || !workspace->autoArrange) {
        return;
    }
    const OperationResult result = retile();
    if (!result.isOk()) {
        qCWarning(lcWorkspace) << "Re-tile after membership change failed:" << result;
    }
}

void WorkspaceManager::windowCreated(const WindowSnapshot& window)
{
    if (m_activeId.isEmpty()) {
        qCDebug(lcWorkspace) << "Window" << window.id << "created with no active workspace";
        return;
    }
    const OperationResult result = assignWindow(m_activeId, window);
    if (!result.isOk()) {
        qCWarning(lcWorkspace) << "Could not assign new window" << window.id << ":" << result;
    }
}

void WorkspaceManager::windowDestroyed(const QString& windowId)
{
    if (workspaceOf(windowId).isEmpty()) {
        return;
    }
    const OperationResult result = unassignWindow(windowId);
    if (!result.isOk()) {
        qCWarning(lcWorkspace) << "Could not drop destroyed window" << windowId << ":" << result;
    }
}

void WorkspaceManager::windowMoved(const WindowSnapshot& window)
{
    auto it = m_windows.find(window.id);
    if (it == m_windows.end()) {
        return;
    }
    const bool monitorChanged = it->monitorId != window.monitorId;
    *it = window;
    if (monitorChanged) {
        membershipChanged(workspaceOf(window.id));
    }
}

void WorkspaceManager::monitorsChanged()
{
    if (m_activeId.isEmpty()) {
        return;
    }
    qCInfo(lcWorkspace) << "Monitor topology changed, re-tiling" << m_activeId;
    const OperationResult result = retile();
    if (!result.isOk()) {
        qCWarning(lcWorkspace) << "Re-tile after monitor change failed:" << result;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult WorkspaceManager::createWorkspace(const QString& name, const QString& patternId, QString* createdId)
{
    QString defaultPattern = patternId;
    if (defaultPattern.isEmpty()) {
        const QVector<TilingPattern> patterns = m_registry.patterns();
        if (!patterns.isEmpty()) {
            defaultPattern = patterns.constFirst().id;
        }
    }

    const Workspace workspace = Workspace::create(name, defaultPattern);
    const OperationResult result = m_registry.createWorkspace(workspace);
    if (!result.isOk()) {
        recordFailure(result);
        return result;
    }

    ++m_metrics.workspacesCreated;
    if (createdId) {
        *createdId = workspace.id;
    }
    qCInfo(lcWorkspace) << "Created workspace" << workspace.name.trimmed() << workspace.id;
    return result;
}

OperationResult WorkspaceManager::deleteWorkspace(const QString& workspaceId, bool cascade)
{
    if (workspaceId == m_activeId || (m_pending && m_pending->workspaceId == workspaceId)) {
        const auto result = OperationResult::failure(ErrorKind::Validation,
                                                     i18n("Cannot delete the active workspace; switch away first"));
        recordFailure(result);
        return result;
    }

    const OperationResult result = m_registry.removeWorkspace(workspaceId, cascade);
    if (!result.isOk()) {
        recordFailure(result);
        return result;
    }
    ++m_metrics.workspacesDeleted;
    qCInfo(lcWorkspace) << "Deleted workspace" << workspaceId << (cascade ? "with dependents" : "");
    return result;
}

QVector<Workspace> WorkspaceManager::listWorkspaces() const
{
    return m_registry.workspaces();
}

OperationResult WorkspaceManager::focusAdjacent(const QString& focusedWindowId, int step)
{
    const QStringList ids = m_members.value(m_activeId);
    if (ids.isEmpty()) {
        return OperationResult::failure(ErrorKind::NotFound, i18n("No windows on the active workspace"));
    }
    if (!m_driver) {
        return OperationResult::failure(ErrorKind::Driver, i18n("No platform driver available"));
    }
    const int current = ids.indexOf(focusedWindowId);
    const int next = current < 0 ? 0 : (current + step + ids.size()) % ids.size();
    return m_driver->focusWindow(ids.at(next));
}

OperationResult WorkspaceManager::dispatch(const KeyboardMapping& mapping, const QString& focusedWindowId)
{
    if (!mapping.enabled) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Mapping %1 is disabled", mapping.id));
    }

    qCDebug(lcWorkspace) << "Dispatching" << actionKindToString(mapping.action) << mapping.targetId;

    OperationResult result;
    switch (mapping.action) {
    case ActionKind::SwitchWorkspace:
        return switchTo(mapping.targetId);
    case ActionKind::MoveWindowToWorkspace: {
        const auto it = m_windows.constFind(focusedWindowId);
        if (it == m_windows.constEnd()) {
            result = OperationResult::failure(ErrorKind::NotFound, i18n("No focused window to move"));
            break;
        }
        result = assignWindow(mapping.targetId, *it);
        break;
    }
    case ActionKind::DeleteWorkspace:
        return deleteWorkspace(mapping.targetId, false);
    case ActionKind::CreateWorkspace:
        return createWorkspace(mapping.parameters.value(ActionParams::Name));
    case ActionKind::RefreshLayout:
        result = retile();
        break;
    case ActionKind::FocusNext:
        result = focusAdjacent(focusedWindowId, 1);
        break;
    case ActionKind::FocusPrevious:
        result = focusAdjacent(focusedWindowId, -1);
        break;
    case ActionKind::MoveWindowToMonitor:
    case ActionKind::ResizeWindow:
    case ActionKind::ToggleFloating:
    case ActionKind::ToggleFullscreen:
    case ActionKind::CloseWindow:
    case ActionKind::MinimizeWindow:
    case ActionKind::ShowOverview:
    case ActionKind::Custom:
        Q_EMIT actionRequested(mapping);
        return OperationResult::ok();
    }

    recordFailure(result);
    return result;
}

OperationResult WorkspaceManager::handleShortcut(const ShortcutCombination& combination,
                                                 const QString& focusedApplication, const QString& focusedWindowId)
{
    const auto mapping = m_shortcuts.resolve(combination, focusedApplication);
    if (!mapping) {
        qCDebug(lcWorkspace) << "No mapping for" << combination;
        return OperationResult::failure(ErrorKind::NotFound, i18n("No action bound to %1", combination.toString()));
    }
    return dispatch(*mapping, focusedWindowId);
}

} // namespace Tessera
