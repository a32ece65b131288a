// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

// Qt headers
#include <QDebug>

// KDE headers
#include <KLocalizedString>

// Project headers
#include "TilingEngine.h"
#include "AlgorithmRegistry.h"
#include "TilingAlgorithm.h"
#include "core/constants.h"
#include "core/entityregistry.h"
#include "core/logging.h"
#include "core/monitorconfiguration.h"
#include "core/registrysnapshot.h"
#include "core/workspace.h"

#include <algorithm>

namespace Tessera {

namespace {

Qt::Orientation orientationFor(const MonitorConfiguration *config, const QRect &area)
{
    const Orientation preference = config ? config->orientation : Orientation::Current;
    switch (preference) {
    case Orientation::Landscape:
        return Qt::Horizontal;
    case Orientation::Portrait:
        return Qt::Vertical;
    case Orientation::Current:
        break;
    }
    return area.height() > area.width() ? Qt::Vertical : Qt::Horizontal;
}

TilingPattern fallbackPattern()
{
    TilingPattern pattern;
    pattern.algorithm = AlgorithmRegistry::defaultAlgorithmId();
    pattern.gapSize = 0;
    pattern.windowMargin = 0;
    pattern.overflowPolicy = OverflowPolicy::AllowOverflow;
    return pattern;
}

} // anonymous namespace

TilingEngine::TilingEngine(EntityRegistry &registry, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_algorithms(new AlgorithmRegistry(this))
{
    connect(&m_registry, &EntityRegistry::changed, this, [this](EntityRegistry::EntityKind kind) {
        if (kind == EntityRegistry::EntityKind::Rule || kind == EntityRegistry::EntityKind::Application
            || kind == EntityRegistry::EntityKind::Workspace) {
            rebuildMatchers();
        }
    });
    connect(&m_registry, &EntityRegistry::reloaded, this, &TilingEngine::rebuildMatchers);
    rebuildMatchers();
}

TilingEngine::~TilingEngine() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Matchers
// ═══════════════════════════════════════════════════════════════════════════════

void TilingEngine::rebuildMatchers()
{
    m_rulesByWorkspace.clear();
    m_profilesByBundle.clear();

    const QVector<WindowRule> rules = m_registry.rules();
    for (const WindowRule &rule : rules) {
        if (!rule.enabled) {
            continue;
        }
        QString error;
        const auto matcher =
            ApplicationMatcher::compile(rule.applicationId, rule.applicationGlob, rule.titlePattern, &error);
        if (!matcher) {
            // Committed rules were validated; this only happens if validation and compilation disagree
            qCWarning(lcTiling) << "Rule" << rule.id << "has an invalid pattern:" << error << "- ignoring";
            continue;
        }
        m_rulesByWorkspace[rule.workspaceId].append({rule, *matcher});
    }

    for (auto it = m_rulesByWorkspace.begin(); it != m_rulesByWorkspace.end(); ++it) {
        std::stable_sort(it->begin(), it->end(), [](const CompiledRule &a, const CompiledRule &b) {
            return a.rule.priority > b.rule.priority;
        });
    }

    const QVector<ApplicationProfile> profiles = m_registry.applications();
    for (const ApplicationProfile &profile : profiles) {
        QString error;
        const auto matcher = ApplicationMatcher::compile(profile.bundleId, QString(), profile.detectionPattern, &error);
        if (!matcher) {
            qCWarning(lcTiling) << "Application profile" << profile.bundleId << "has an invalid detection pattern:"
                                << error << "- ignoring";
            continue;
        }
        m_profilesByBundle.insert(profile.bundleId, {profile, *matcher});
    }

    qCDebug(lcTiling) << "Compiled matchers for" << rules.size() << "rules and" << m_profilesByBundle.size()
                      << "application profiles";
}

PlacementMode TilingEngine::placementFor(const QString &workspaceId, const WindowSnapshot &window, int *priority,
                                         WindowRule *rule) const
{
    if (priority) {
        *priority = 0;
    }

    // First matching rule in priority order wins
    const auto rulesIt = m_rulesByWorkspace.constFind(workspaceId);
    if (rulesIt != m_rulesByWorkspace.constEnd()) {
        for (const CompiledRule &compiled : *rulesIt) {
            if (compiled.matcher.matches(window)) {
                if (priority) {
                    *priority = compiled.rule.priority;
                }
                if (rule) {
                    *rule = compiled.rule;
                }
                return compiled.rule.placement;
            }
        }
    }

    // No rule: the application's profile supplies the default mode
    const auto profileIt = m_profilesByBundle.constFind(window.applicationId);
    if (profileIt != m_profilesByBundle.constEnd() && profileIt->matcher.matches(window)) {
        return profileIt->profile.defaultPlacement;
    }

    return PlacementMode::AutoTile;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Layout
// ═══════════════════════════════════════════════════════════════════════════════

TileSlots TilingEngine::layoutSlots(const TilingPattern &pattern, int windowCount, const QRect &area,
                                    Qt::Orientation orientation) const
{
    TileSlots slots;
    if (windowCount <= 0) {
        return slots;
    }

    TilingAlgorithm *algo = m_algorithms->algorithm(pattern.algorithm);
    if (!algo) {
        qCWarning(lcTiling) << "Unknown algorithm" << pattern.algorithm << "in pattern" << pattern.id;
        return slots;
    }

    const QRect inner = TilingAlgorithm::innerRect(area, pattern.windowMargin);
    if (inner.isEmpty()) {
        return slots;
    }

    const int capacity = std::max(pattern.maxWindows, 1);
    const bool overflowing = windowCount > capacity && pattern.overflowPolicy != OverflowPolicy::ShrinkToFit;

    TilingParams params;
    params.windowCount = overflowing ? capacity : windowCount;
    params.area = area;
    params.gap = pattern.gapSize;
    params.margin = pattern.windowMargin;
    params.mainAreaRatio = pattern.mainAreaRatio;
    params.orientation = orientation;

    slots.rects = algo->calculateSlots(params);
    if (slots.rects.size() != params.windowCount) {
        qCWarning(lcTiling) << "Algorithm" << pattern.algorithm << "returned" << slots.rects.size()
                            << "slots for" << params.windowCount << "windows";
        return TileSlots();
    }
    slots.layered.fill(false, slots.rects.size());

    if (!overflowing) {
        return slots;
    }

    const QRect last = slots.rects.constLast();
    const int excess = windowCount - capacity;
    for (int i = 0; i < excess; ++i) {
        if (pattern.overflowPolicy == OverflowPolicy::StackExcess) {
            slots.rects.append(last);
            slots.layered.append(true);
            continue;
        }

        // AllowOverflow: continue past the far edge at the last slot's size
        QRect rect = last;
        if (orientation == Qt::Vertical) {
            rect.moveTop(inner.y() + inner.height() + pattern.gapSize + i * (last.height() + pattern.gapSize));
        } else {
            rect.moveLeft(inner.x() + inner.width() + pattern.gapSize + i * (last.width() + pattern.gapSize));
        }
        slots.rects.append(rect);
        slots.layered.append(false);
    }
    return slots;
}

QRect TilingEngine::clampInto(const QRect &rect, const QRect &bounds)
{
    if (bounds.isEmpty()) {
        return rect;
    }
    const QSize size = rect.size().boundedTo(bounds.size()).expandedTo(QSize(1, 1));
    const int x = std::clamp(rect.x(), bounds.x(), bounds.x() + bounds.width() - size.width());
    const int y = std::clamp(rect.y(), bounds.y(), bounds.y() + bounds.height() - size.height());
    return QRect(QPoint(x, y), size);
}

const MonitorSnapshot *TilingEngine::monitorFor(const WindowSnapshot &window,
                                                const QVector<MonitorSnapshot> &monitors) const
{
    const MonitorSnapshot *primary = nullptr;
    const MonitorSnapshot *containing = nullptr;
    for (const MonitorSnapshot &monitor : monitors) {
        if (monitor.id == window.monitorId) {
            return &monitor;
        }
        if (!primary && monitor.isPrimary) {
            primary = &monitor;
        }
        if (!containing && window.geometry.isValid() && monitor.geometry.contains(window.geometry.center())) {
            containing = &monitor;
        }
    }
    if (containing) {
        return containing;
    }
    return primary ? primary : &monitors.constFirst();
}

QString TilingEngine::patternIdFor(const Workspace &workspace, const MonitorConfiguration *config,
                                   const QString &monitorId, int windowCount) const
{
    if (config) {
        const QString configured = config->patternFor(windowCount);
        if (!configured.isEmpty()) {
            return configured;
        }
    }
    return workspace.patternForMonitor(monitorId);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Plans
// ═══════════════════════════════════════════════════════════════════════════════

PlanResult TilingEngine::computePlan(const QString &workspaceId, const QVector<MonitorSnapshot> &monitors,
                                     const QVector<WindowSnapshot> &windows) const
{
    PlanResult out;
    out.plan.workspaceId = workspaceId;

    const RegistrySnapshot state = m_registry.snapshot();
    const Workspace *workspace = state.workspace(workspaceId);
    if (!workspace) {
        out.result = OperationResult::failure(ErrorKind::NotFound, i18n("Unknown workspace %1", workspaceId));
        return out;
    }

    if (monitors.isEmpty()) {
        out.result = OperationResult::failure(ErrorKind::Tiling, i18n("No monitors available"));
        return out;
    }

    // Sort windows into tiled groups per monitor and independently placed entries
    QHash<QString, QVector<WindowSnapshot>> tiledByMonitor;
    QVector<PlacementEntry> placed;
    for (const WindowSnapshot &window : windows) {
        if (window.isMinimized) {
            continue;
        }
        const MonitorSnapshot *monitor = monitorFor(window, monitors);

        int priority = 0;
        WindowRule rule;
        const PlacementMode mode = placementFor(workspaceId, window, &priority, &rule);

        PlacementEntry entry;
        entry.windowId = window.id;
        entry.monitorId = monitor->id;
        entry.mode = mode;

        switch (mode) {
        case PlacementMode::AutoTile:
            tiledByMonitor[monitor->id].append(window);
            continue;
        case PlacementMode::Fixed:
            if (!rule.fixedGeometry.isValid()) {
                // Profiles cannot default to fixed; a rule without geometry keeps the window where it is
                entry.geometry = clampInto(window.geometry, monitor->geometry);
            } else if (!monitor->geometry.contains(rule.fixedGeometry)) {
                qCWarning(lcTiling) << "Fixed geometry" << rule.fixedGeometry << "of rule" << rule.id
                                    << "exceeds monitor" << monitor->id << monitor->geometry << "- clamping";
                entry.geometry = clampInto(rule.fixedGeometry, monitor->geometry);
            } else {
                entry.geometry = rule.fixedGeometry;
            }
            entry.zOrder = PlacementPlan::FixedZBase + priority;
            break;
        case PlacementMode::Floating:
            entry.geometry = clampInto(window.geometry, monitor->usableArea());
            entry.zOrder = PlacementPlan::FloatingZBase + priority;
            break;
        case PlacementMode::Fullscreen:
            entry.geometry = monitor->geometry;
            entry.zOrder = PlacementPlan::FullscreenZBase + priority;
            break;
        }
        placed.append(entry);
    }

    QStringList warnings;
    for (const MonitorSnapshot &monitor : monitors) {
        const QVector<WindowSnapshot> tiled = tiledByMonitor.value(monitor.id);
        if (tiled.isEmpty()) {
            continue;
        }

        const MonitorConfiguration *config = state.monitorConfigurationFor(workspaceId, monitor.id);
        const QString patternId = patternIdFor(*workspace, config, monitor.id, tiled.size());
        const TilingPattern *pattern = state.pattern(patternId);
        const QRect area = config ? config->effectiveUsableArea(monitor) : monitor.usableArea();
        const Qt::Orientation orientation = orientationFor(config, area);

        TileSlots slots;
        QString failure;
        if (!pattern) {
            failure = i18n("Pattern %1 for monitor %2 does not exist", patternId, monitor.id);
        } else if (area.isEmpty()) {
            failure = i18n("Monitor %1 has no usable area", monitor.id);
        } else {
            slots = layoutSlots(*pattern, tiled.size(), area, orientation);
            if (slots.rects.size() != tiled.size()) {
                failure = i18n("Pattern %1 cannot place %2 windows on monitor %3", pattern->name,
                               tiled.size(), monitor.id);
            }
        }

        if (!failure.isEmpty()) {
            qCWarning(lcTiling) << "Tiling workspace" << workspace->name << "failed:" << failure
                                << "- using overflow fallback";
            warnings.append(failure);
            slots = layoutSlots(fallbackPattern(), tiled.size(), monitor.geometry,
                                orientationFor(nullptr, monitor.geometry));
            if (slots.rects.size() != tiled.size()) {
                out.result = OperationResult::failure(ErrorKind::Tiling, failure);
                out.plan.entries.clear();
                return out;
            }
        }

        int layeredZ = PlacementPlan::TiledZ;
        for (int i = 0; i < tiled.size(); ++i) {
            PlacementEntry entry;
            entry.windowId = tiled.at(i).id;
            entry.monitorId = monitor.id;
            entry.geometry = slots.rects.at(i);
            entry.mode = PlacementMode::AutoTile;
            entry.layered = slots.layered.at(i);
            entry.zOrder = entry.layered ? --layeredZ : PlacementPlan::TiledZ;
            out.plan.entries.append(entry);
        }
    }

    out.plan.entries.append(placed);

    if (!warnings.isEmpty()) {
        out.plan.fallback = true;
        out.plan.warning = warnings.join(QLatin1Char('\n'));
        out.result = OperationResult::failure(ErrorKind::Tiling, out.plan.warning);
    }

    qCDebug(lcTiling) << "Plan for" << workspace->name << ":" << out.plan.entries.size() << "windows,"
                      << out.plan.tiledCount() << "tiled," << out.plan.layeredCount() << "layered"
                      << (out.plan.fallback ? "(fallback)" : "");
    return out;
}

} // namespace Tessera
