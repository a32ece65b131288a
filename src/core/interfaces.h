// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "types.h"
#include <QString>
#include <QVector>

namespace Tessera {

struct PlacementPlan;
struct RegistrySnapshot;

/**
 * @brief Abstract interface for the platform driver
 *
 * The driver enumerates real windows and moves them. It is a pure abstract
 * interface (no QObject): notifications flow back into the core by direct
 * calls on WorkspaceManager (windowCreated, windowDestroyed, windowMoved,
 * acknowledgePlan), so no signal has to be declared on an interface.
 */
class TESSERA_EXPORT IPlatformDriver
{
public:
    IPlatformDriver() = default;
    virtual ~IPlatformDriver();

    virtual QVector<WindowSnapshot> enumerateWindows() const = 0;

    /**
     * @brief Hand a placement plan to the platform
     *
     * The returned result only reports whether the driver accepted the plan.
     * Completion is reported later through WorkspaceManager::acknowledgePlan()
     * with the same @p requestId. A Permission result is not retried.
     */
    virtual OperationResult applyPlan(quint64 requestId, const PlacementPlan& plan) = 0;

    virtual OperationResult focusWindow(const QString& windowId) = 0;
};

/**
 * @brief Abstract interface for display topology
 *
 * Hot-plug is reported through WorkspaceManager::monitorsChanged().
 */
class TESSERA_EXPORT IMonitorProvider
{
public:
    IMonitorProvider() = default;
    virtual ~IMonitorProvider();

    virtual QVector<MonitorSnapshot> enumerateMonitors() const = 0;
};

/**
 * @brief Abstract interface for entity storage
 *
 * Implementations must either store the whole snapshot or leave the previous
 * stored state in place.
 */
class TESSERA_EXPORT IPersistence
{
public:
    IPersistence() = default;
    virtual ~IPersistence();

    /**
     * @brief Read every stored entity into @p snapshot
     *
     * Missing storage is not an error and yields an empty snapshot.
     */
    virtual OperationResult loadEntities(RegistrySnapshot& snapshot) = 0;
    virtual OperationResult saveEntities(const RegistrySnapshot& snapshot) = 0;
};

} // namespace Tessera
