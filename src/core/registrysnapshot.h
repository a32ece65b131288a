// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "applicationprofile.h"
#include "constants.h"
#include "keyboardmapping.h"
#include "monitorconfiguration.h"
#include "tilingpattern.h"
#include "windowrule.h"
#include "workspace.h"
#include <QVector>

namespace Tessera {

/**
 * @brief Immutable view of every entity the registry holds
 *
 * Handed out by value; the containers are implicitly shared, so taking a
 * snapshot is cheap and later registry commits never change it. Entities keep
 * their insertion order, which is the tie-breaker for rule evaluation.
 */
struct RegistrySnapshot
{
    QVector<Workspace> workspaces;
    QVector<TilingPattern> patterns;
    QVector<WindowRule> rules;
    QVector<MonitorConfiguration> monitorConfigurations;
    QVector<KeyboardMapping> mappings;
    QVector<ApplicationProfile> applications;

    /// Shortcut policy version of the mapping source; below the current one means legacy
    int mappingPolicyVersion = Defaults::ShortcutPolicyVersion;

    bool isEmpty() const noexcept
    {
        return workspaces.isEmpty() && patterns.isEmpty() && rules.isEmpty() && monitorConfigurations.isEmpty()
            && mappings.isEmpty() && applications.isEmpty();
    }

    const Workspace* workspace(const QString& id) const
    {
        return findById(workspaces, id);
    }
    const TilingPattern* pattern(const QString& id) const
    {
        return findById(patterns, id);
    }
    const WindowRule* rule(const QString& id) const
    {
        return findById(rules, id);
    }
    const MonitorConfiguration* monitorConfiguration(const QString& id) const
    {
        return findById(monitorConfigurations, id);
    }
    const MonitorConfiguration* monitorConfigurationFor(const QString& workspaceId, const QString& monitorId) const
    {
        for (const MonitorConfiguration& config : monitorConfigurations) {
            if (config.workspaceId == workspaceId && config.monitorId == monitorId) {
                return &config;
            }
        }
        return nullptr;
    }
    const KeyboardMapping* mapping(const QString& id) const
    {
        return findById(mappings, id);
    }
    const ApplicationProfile* application(const QString& id) const
    {
        return findById(applications, id);
    }

private:
    template<typename T>
    static const T* findById(const QVector<T>& entities, const QString& id)
    {
        for (const T& entity : entities) {
            if (entity.id == id) {
                return &entity;
            }
        }
        return nullptr;
    }
};

} // namespace Tessera
