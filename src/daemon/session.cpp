// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session.h"
#include "shortcuttable.h"
#include "workspacemanager.h"
#include "../autotile/TilingEngine.h"
#include "../config/coresettings.h"
#include "../core/constants.h"
#include "../core/entityregistry.h"
#include "../core/interfaces.h"
#include "../core/jsonregistrystore.h"
#include "../core/logging.h"
#include "../core/registrysnapshot.h"
#include "../core/tilingpattern.h"
#include "../core/workspace.h"
#include <KLocalizedString>

namespace Tessera {

Session::Session(const QString& configName, QObject* parent)
    : QObject(parent)
    , m_settings(std::make_unique<CoreSettings>(configName))
    , m_registry(std::make_unique<EntityRegistry>())
{
    m_engine = std::make_unique<TilingEngine>(*m_registry);
    m_shortcuts = std::make_unique<ShortcutTable>(*m_registry);
    m_workspaces = std::make_unique<WorkspaceManager>(*m_registry, *m_engine, *m_shortcuts);

    connect(m_settings.get(), &CoreSettings::settingsChanged, this, &Session::applySettings);
    applySettings();
}

Session::~Session() = default;

void Session::applySettings()
{
    m_registry->setMaxWorkspaces(m_settings->maxWorkspaces());
    const OperationResult modifiers =
        m_shortcuts->setModifiers(m_settings->safeModifier(), m_settings->reservedModifier());
    if (!modifiers.isOk()) {
        qCWarning(lcConfig) << "Modifier settings applied with problems:" << modifiers;
    }

    QVector<ShortcutCombination> reserved;
    const QStringList reservedTexts = m_settings->reservedCombinations();
    for (const QString& text : reservedTexts) {
        if (const auto combination = ShortcutCombination::parse(text)) {
            reserved.append(*combination);
        }
    }
    m_shortcuts->setReservedCombinations(reserved);

    m_workspaces->setAckTimeout(m_settings->ackTimeoutMs());
    m_workspaces->setDriverMaxAttempts(m_settings->driverMaxAttempts());
    m_workspaces->setRetryDelays(m_settings->retryBaseDelayMs(), m_settings->retryMaxDelayMs());
    m_workspaces->setMetricsFlushInterval(m_settings->metricsFlushIntervalMs());

    if (m_store) {
        m_store->setKeepBackups(m_settings->keepBackups());
        if (m_store->directory() != m_settings->dataDirectory()) {
            qCInfo(lcConfig) << "Data directory change to" << m_settings->dataDirectory()
                             << "takes effect on next start";
        }
    }
}

OperationResult Session::init()
{
    if (m_initialized) {
        return OperationResult::ok();
    }

    m_settings->load();

    m_store = std::make_unique<JsonRegistryStore>(m_settings->dataDirectory());
    m_store->setKeepBackups(m_settings->keepBackups());

    RegistrySnapshot stored;
    OperationResult result = m_store->loadEntities(stored);
    if (!result.isOk()) {
        qCCritical(lcCore) << "Could not read stored entities:" << result;
        return result;
    }

    // Persistence goes in first so migrated legacy mappings are written back
    m_registry->setPersistence(m_store.get());
    result = m_registry->loadSnapshot(stored);
    if (!result.isOk()) {
        qCCritical(lcCore) << "Could not load stored entities:" << result;
        return result;
    }
    if (!result.message.isEmpty()) {
        qCWarning(lcCore) << result.message;
    }

    if (m_registry->patterns().isEmpty()) {
        result = seedDefaults();
        if (!result.isOk()) {
            return result;
        }
    }

    m_initialized = true;
    qCInfo(lcCore) << "Session ready:" << m_registry->workspaces().size() << "workspaces,"
                   << m_registry->mappings().size() << "shortcuts, data in" << m_store->directory();
    return OperationResult::ok();
}

OperationResult Session::seedDefaults()
{
    qCInfo(lcCore) << "No stored patterns, creating defaults";

    const TilingPattern pattern = TilingPattern::create(i18n("Primary and stack"), AlgorithmId::PrimaryStack);
    OperationResult result = m_registry->createPattern(pattern);
    if (!result.isOk()) {
        qCCritical(lcCore) << "Could not create default pattern:" << result;
        return result;
    }

    if (m_registry->workspaces().isEmpty()) {
        result = m_workspaces->createWorkspace(i18n("Main"), pattern.id);
        if (!result.isOk()) {
            qCCritical(lcCore) << "Could not create default workspace:" << result;
            return result;
        }
    }

    if (m_registry->mappings().isEmpty()) {
        result = m_shortcuts->installDefaults();
        if (!result.isOk()) {
            qCWarning(lcCore) << "Could not install default shortcuts:" << result;
            return result;
        }
    }
    return OperationResult::ok();
}

void Session::start(IPlatformDriver* driver, IMonitorProvider* monitors)
{
    m_workspaces->setPlatformDriver(driver);
    m_workspaces->setMonitorProvider(monitors);

    if (!m_settings->restoreLastActive()) {
        return;
    }

    // Windows already open belong to the workspace that was active last
    const QString target = m_workspaces->lastUsedWorkspaceId();
    if (driver && !target.isEmpty()) {
        const QVector<WindowSnapshot> windows = driver->enumerateWindows();
        for (const WindowSnapshot& window : windows) {
            const OperationResult assigned = m_workspaces->assignWindow(target, window);
            if (!assigned.isOk()) {
                qCWarning(lcCore) << "Could not adopt window" << window.id << ":" << assigned;
            }
        }
        qCDebug(lcCore) << "Adopted" << windows.size() << "open windows into" << target;
    }

    const OperationResult result = m_workspaces->restoreLastActive();
    if (!result.isOk() && result.kind != ErrorKind::NotFound) {
        qCWarning(lcCore) << "Could not restore last active workspace:" << result;
    }
}

} // namespace Tessera
