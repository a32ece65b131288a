// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "modifierutils.h"
#include "registrysnapshot.h"
#include "types.h"
#include <QHash>
#include <QObject>
#include <QString>
#include <QVector>
#include <functional>
#include <optional>

namespace Tessera {

class IPersistence;

/**
 * @brief In-memory store of every core entity
 *
 * The registry exclusively owns workspaces, tiling patterns, window rules,
 * monitor configurations, keyboard mappings and application profiles. Other
 * components refer to entities by id and read value copies.
 *
 * Every mutation is built on a copy of the committed state, checked against
 * each entity's own rules and the cross-entity invariants, optionally
 * written through the persistence collaborator and only then swapped in.
 * A failing mutation leaves the registry untouched and returns the reason.
 *
 * Cross-entity invariants:
 * - ids are unique per entity kind
 * - workspace names are unique (case-sensitive, trimmed)
 * - at most maxWorkspaces() workspaces
 * - referenced workspaces, patterns and mappings exist
 * - no two workspaces share a shortcut mapping
 * - one monitor configuration per (workspace, monitor)
 * - no two enabled mappings share a (scope, combination)
 * - no mapping uses the reserved modifier
 * - application bundle ids are unique
 *
 * The registry is single-writer: a mutation started from a slot connected to
 * changed() while another mutation is being committed is rejected with Busy.
 *
 * Note: This class does NOT use the singleton pattern. Create one instance
 * and pass it by reference to the components that need it.
 */
class TESSERA_EXPORT EntityRegistry : public QObject
{
    Q_OBJECT

public:
    enum class EntityKind {
        Workspace,
        Pattern,
        Rule,
        MonitorConfiguration,
        Mapping,
        Application
    };
    Q_ENUM(EntityKind)

    /**
     * @brief A change applied to a copy of the committed state
     *
     * Returns a failure to abort the transaction before validation.
     */
    using Mutation = std::function<OperationResult(RegistrySnapshot&)>;

    explicit EntityRegistry(QObject* parent = nullptr);
    ~EntityRegistry() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Configuration
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Write every commit through @p persistence (not owned, may be null)
     *
     * A failed write aborts the commit with an Io error.
     */
    void setPersistence(IPersistence* persistence);
    IPersistence* persistence() const noexcept
    {
        return m_persistence;
    }

    void setMaxWorkspaces(int maxWorkspaces);
    int maxWorkspaces() const noexcept
    {
        return m_maxWorkspaces;
    }

    /**
     * @brief Modifier no mapping may use
     *
     * Takes effect on the next commit, which validates every mapping against
     * it. ShortcutTable::setModifiers() migrates the stored mappings in the
     * same step.
     */
    void setReservedModifier(Modifier modifier);
    Modifier reservedModifier() const noexcept
    {
        return m_reservedModifier;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Snapshot access
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Last committed state
     */
    RegistrySnapshot snapshot() const
    {
        return m_state;
    }

    /**
     * @brief Number of commits since construction
     */
    quint64 revision() const noexcept
    {
        return m_revision;
    }

    /**
     * @brief Replace the whole state with entities read from storage
     *
     * Entities failing validation are skipped with a warning. Mappings that
     * use the reserved modifier, or all mappings when the snapshot predates
     * the current shortcut policy, are held back and reported through
     * legacyMappingsFound() for migration. Nothing is written back.
     *
     * @return Number of skipped entities in the message of an ok result
     */
    OperationResult loadSnapshot(const RegistrySnapshot& loaded);

    /**
     * @brief Apply a multi-entity change as one commit
     * @param kind Entity kind reported by changed()
     * @param subjectId Id reported by changed(), and excluded when naming a conflicting entity
     */
    OperationResult transaction(EntityKind kind, const QString& subjectId, const Mutation& mutation);

    // ═══════════════════════════════════════════════════════════════════════════
    // Workspaces
    // ═══════════════════════════════════════════════════════════════════════════

    OperationResult createWorkspace(const Workspace& workspace);
    OperationResult updateWorkspace(const Workspace& workspace);

    /**
     * @brief Remove a workspace
     * @param cascade Remove its rules, monitor configurations and the mappings
     *                targeting it in the same commit; otherwise fail with
     *                Conflict naming the first dependent
     */
    OperationResult removeWorkspace(const QString& id, bool cascade);
    std::optional<Workspace> workspace(const QString& id) const;
    std::optional<Workspace> workspaceByName(const QString& name) const;
    QVector<Workspace> workspaces() const
    {
        return m_state.workspaces;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Tiling patterns
    // ═══════════════════════════════════════════════════════════════════════════

    OperationResult createPattern(const TilingPattern& pattern);
    OperationResult updatePattern(const TilingPattern& pattern);

    /**
     * @brief Remove a pattern; fails with Conflict while a workspace or
     *        monitor configuration still refers to it
     */
    OperationResult removePattern(const QString& id);
    std::optional<TilingPattern> pattern(const QString& id) const;
    QVector<TilingPattern> patterns() const
    {
        return m_state.patterns;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Window rules
    // ═══════════════════════════════════════════════════════════════════════════

    OperationResult createRule(const WindowRule& rule);
    OperationResult updateRule(const WindowRule& rule);
    OperationResult removeRule(const QString& id);
    std::optional<WindowRule> rule(const QString& id) const;
    QVector<WindowRule> rules() const
    {
        return m_state.rules;
    }
    QVector<WindowRule> rulesForWorkspace(const QString& workspaceId) const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Monitor configurations
    // ═══════════════════════════════════════════════════════════════════════════

    OperationResult createMonitorConfiguration(const MonitorConfiguration& config);
    OperationResult updateMonitorConfiguration(const MonitorConfiguration& config);
    OperationResult removeMonitorConfiguration(const QString& id);
    std::optional<MonitorConfiguration> monitorConfiguration(const QString& id) const;
    std::optional<MonitorConfiguration> monitorConfigurationFor(const QString& workspaceId,
                                                                const QString& monitorId) const;
    QVector<MonitorConfiguration> monitorConfigurations() const
    {
        return m_state.monitorConfigurations;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Keyboard mappings
    // ═══════════════════════════════════════════════════════════════════════════

    OperationResult createMapping(const KeyboardMapping& mapping);
    OperationResult updateMapping(const KeyboardMapping& mapping);

    /**
     * @brief Remove a mapping, detaching it from the workspace that uses it as its shortcut
     */
    OperationResult removeMapping(const QString& id);
    std::optional<KeyboardMapping> mapping(const QString& id) const;
    QVector<KeyboardMapping> mappings() const
    {
        return m_state.mappings;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Application profiles
    // ═══════════════════════════════════════════════════════════════════════════

    OperationResult createApplication(const ApplicationProfile& profile);
    OperationResult updateApplication(const ApplicationProfile& profile);
    OperationResult removeApplication(const QString& id);
    std::optional<ApplicationProfile> application(const QString& id) const;
    std::optional<ApplicationProfile> applicationForBundle(const QString& bundleId) const;
    QVector<ApplicationProfile> applications() const
    {
        return m_state.applications;
    }

    /**
     * @brief Check a complete state against every entity rule and cross-entity invariant
     * @param subjectId Entity being changed; a Conflict names the other party
     */
    OperationResult validateState(const RegistrySnapshot& state, const QString& subjectId = QString()) const;

Q_SIGNALS:
    /**
     * @brief Emitted after each commit
     */
    void changed(Tessera::EntityRegistry::EntityKind kind, const QString& id);

    /**
     * @brief Emitted after loadSnapshot() replaced the whole state
     */
    void reloaded();

    /**
     * @brief Emitted after loadSnapshot() for mappings held back for migration
     * @param mappings The mappings as stored
     * @param shortcutOwners mapping id -> workspace id for workspaces that used them as shortcut
     */
    void legacyMappingsFound(const QVector<Tessera::KeyboardMapping>& mappings,
                             const QHash<QString, QString>& shortcutOwners);

private:
    template<typename T>
    OperationResult insertEntity(EntityKind kind, QVector<T> RegistrySnapshot::*list, const T& entity);
    template<typename T>
    OperationResult replaceEntity(EntityKind kind, QVector<T> RegistrySnapshot::*list, const T& entity);
    template<typename T>
    OperationResult eraseEntity(EntityKind kind, QVector<T> RegistrySnapshot::*list, const QString& id);

    IPersistence* m_persistence = nullptr;
    RegistrySnapshot m_state;
    quint64 m_revision = 0;
    int m_maxWorkspaces;
    Modifier m_reservedModifier = Modifier::Command;
    bool m_mutating = false;
};

TESSERA_EXPORT QString entityKindToString(EntityRegistry::EntityKind kind);

} // namespace Tessera
