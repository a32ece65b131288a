// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "../core/types.h"
#include <QObject>
#include <memory>

namespace Tessera {

class CoreSettings;
class EntityRegistry;
class IMonitorProvider;
class IPlatformDriver;
class JsonRegistryStore;
class ShortcutTable;
class TilingEngine;
class WorkspaceManager;

/**
 * @brief Owns and wires the core components
 *
 * Construction order follows the dependency order: settings, store,
 * registry, tiling engine, shortcut table, workspace manager. Settings
 * changes are pushed to the components as they happen, except the data
 * directory, which is read once by init().
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class TESSERA_EXPORT Session : public QObject
{
    Q_OBJECT

public:
    /**
     * @param configName KConfig file name, or an absolute path
     */
    explicit Session(const QString& configName = QStringLiteral("tesserarc"), QObject* parent = nullptr);
    ~Session() override;

    /**
     * @brief Load settings and stored entities
     *
     * On first run (no stored patterns) a default pattern, a first workspace
     * and the default shortcuts are created.
     */
    OperationResult init();

    /**
     * @brief Attach the platform collaborators and restore the last workspace
     */
    void start(IPlatformDriver* driver, IMonitorProvider* monitors);

    CoreSettings* settings() const
    {
        return m_settings.get();
    }
    JsonRegistryStore* store() const
    {
        return m_store.get();
    }
    EntityRegistry* registry() const
    {
        return m_registry.get();
    }
    TilingEngine* engine() const
    {
        return m_engine.get();
    }
    ShortcutTable* shortcuts() const
    {
        return m_shortcuts.get();
    }
    WorkspaceManager* workspaces() const
    {
        return m_workspaces.get();
    }

private:
    void applySettings();
    OperationResult seedDefaults();

    std::unique_ptr<CoreSettings> m_settings;
    std::unique_ptr<JsonRegistryStore> m_store;
    std::unique_ptr<EntityRegistry> m_registry;
    std::unique_ptr<TilingEngine> m_engine;
    std::unique_ptr<ShortcutTable> m_shortcuts;
    std::unique_ptr<WorkspaceManager> m_workspaces;
    bool m_initialized = false;
};

} // namespace Tessera
