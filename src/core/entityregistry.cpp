// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "entityregistry.h"
#include "constants.h"
#include "interfaces.h"
#include "logging.h"
#include <KLocalizedString>
#include <QDateTime>
#include <QScopeGuard>
#include <QSet>
#include <QStringList>
#include <utility>

namespace Tessera {

namespace {

// The other party of a collision, so a Conflict never names the entity being changed
QString otherParty(const QString& first, const QString& second, const QString& subjectId)
{
    return first == subjectId ? second : first;
}

template<typename T>
OperationResult validateEntities(const QVector<T>& entities)
{
    QSet<QString> ids;
    for (const T& entity : entities) {
        const OperationResult result = entity.validate();
        if (!result.isOk()) {
            return result;
        }
        if (ids.contains(entity.id)) {
            return OperationResult::conflict(entity.id, i18n("Duplicate id %1", entity.id));
        }
        ids.insert(entity.id);
    }
    return OperationResult::ok();
}

template<typename T>
QSet<QString> idsOf(const QVector<T>& entities)
{
    QSet<QString> ids;
    ids.reserve(entities.size());
    for (const T& entity : entities) {
        ids.insert(entity.id);
    }
    return ids;
}

template<typename T>
int indexOfId(const QVector<T>& entities, const QString& id)
{
    for (int i = 0; i < entities.size(); ++i) {
        if (entities.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

template<typename T>
std::optional<T> findCopy(const QVector<T>& entities, const QString& id)
{
    const int index = indexOfId(entities, id);
    if (index < 0) {
        return std::nullopt;
    }
    return entities.at(index);
}

bool mappingTargets(const KeyboardMapping& mapping, const QString& workspaceId)
{
    return actionTargetsWorkspace(mapping.action) && mapping.targetId == workspaceId;
}

} // anonymous namespace

QString entityKindToString(EntityRegistry::EntityKind kind)
{
    switch (kind) {
    case EntityRegistry::EntityKind::Workspace:
        return QStringLiteral("workspace");
    case EntityRegistry::EntityKind::Pattern:
        return QStringLiteral("pattern");
    case EntityRegistry::EntityKind::Rule:
        return QStringLiteral("rule");
    case EntityRegistry::EntityKind::MonitorConfiguration:
        return QStringLiteral("monitor configuration");
    case EntityRegistry::EntityKind::Mapping:
        return QStringLiteral("mapping");
    case EntityRegistry::EntityKind::Application:
        return QStringLiteral("application");
    }
    return QString();
}

EntityRegistry::EntityRegistry(QObject* parent)
    : QObject(parent)
    , m_maxWorkspaces(Defaults::MaxWorkspaces)
{
}

EntityRegistry::~EntityRegistry() = default;

void EntityRegistry::setPersistence(IPersistence* persistence)
{
    m_persistence = persistence;
}

void EntityRegistry::setMaxWorkspaces(int maxWorkspaces)
{
    const int clamped = qBound(Defaults::MinWorkspaces, maxWorkspaces, Defaults::MaxWorkspacesLimit);
    if (clamped != maxWorkspaces) {
        qCWarning(lcRegistry) << "Workspace limit" << maxWorkspaces << "out of range, using" << clamped;
    }
    m_maxWorkspaces = clamped;
    if (m_state.workspaces.size() > m_maxWorkspaces) {
        qCWarning(lcRegistry) << "Registry holds" << m_state.workspaces.size() << "workspaces, above the new limit"
                              << m_maxWorkspaces << "- no new workspace can be created";
    }
}

void EntityRegistry::setReservedModifier(Modifier modifier)
{
    m_reservedModifier = modifier;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult EntityRegistry::validateState(const RegistrySnapshot& state, const QString& subjectId) const
{
    OperationResult result = validateEntities(state.patterns);
    if (result.isOk()) {
        result = validateEntities(state.workspaces);
    }
    if (result.isOk()) {
        result = validateEntities(state.rules);
    }
    if (result.isOk()) {
        result = validateEntities(state.monitorConfigurations);
    }
    if (result.isOk()) {
        result = validateEntities(state.mappings);
    }
    if (result.isOk()) {
        result = validateEntities(state.applications);
    }
    if (!result.isOk()) {
        return result;
    }

    if (state.workspaces.size() > m_maxWorkspaces) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("At most %1 workspaces are allowed", m_maxWorkspaces));
    }

    const QSet<QString> patternIds = idsOf(state.patterns);
    const QSet<QString> workspaceIds = idsOf(state.workspaces);
    const QSet<QString> mappingIds = idsOf(state.mappings);

    // Workspaces: unique names, unique shortcuts, existing patterns and mappings
    QHash<QString, QString> names;
    QHash<QString, QString> shortcutOwners;
    for (const Workspace& ws : state.workspaces) {
        const QString name = ws.name.trimmed();
        const auto existingName = names.constFind(name);
        if (existingName != names.constEnd()) {
            return OperationResult::conflict(otherParty(*existingName, ws.id, subjectId),
                                             i18n("A workspace named \"%1\" already exists", name));
        }
        names.insert(name, ws.id);

        if (!ws.defaultPatternId.isEmpty() && !patternIds.contains(ws.defaultPatternId)) {
            return OperationResult::failure(ErrorKind::NotFound,
                                            i18n("Tiling pattern %1 does not exist", ws.defaultPatternId));
        }
        for (auto it = ws.monitorOverrides.constBegin(); it != ws.monitorOverrides.constEnd(); ++it) {
            if (!patternIds.contains(it.value())) {
                return OperationResult::failure(ErrorKind::NotFound,
                                                i18n("Tiling pattern %1 does not exist", it.value()));
            }
        }

        if (!ws.shortcutId.isEmpty()) {
            if (!mappingIds.contains(ws.shortcutId)) {
                return OperationResult::failure(ErrorKind::NotFound,
                                                i18n("Keyboard mapping %1 does not exist", ws.shortcutId));
            }
            const auto existingOwner = shortcutOwners.constFind(ws.shortcutId);
            if (existingOwner != shortcutOwners.constEnd()) {
                return OperationResult::conflict(otherParty(*existingOwner, ws.id, subjectId),
                                                 i18n("The shortcut is already assigned to another workspace"));
            }
            shortcutOwners.insert(ws.shortcutId, ws.id);
        }
    }

    for (const WindowRule& rule : state.rules) {
        if (!workspaceIds.contains(rule.workspaceId)) {
            return OperationResult::failure(ErrorKind::NotFound,
                                            i18n("Workspace %1 does not exist", rule.workspaceId));
        }
    }

    // Monitor configurations: one per (workspace, monitor)
    QHash<QString, QString> monitorSlots;
    for (const MonitorConfiguration& config : state.monitorConfigurations) {
        if (!workspaceIds.contains(config.workspaceId)) {
            return OperationResult::failure(ErrorKind::NotFound,
                                            i18n("Workspace %1 does not exist", config.workspaceId));
        }
        if (!patternIds.contains(config.primaryPatternId)) {
            return OperationResult::failure(ErrorKind::NotFound,
                                            i18n("Tiling pattern %1 does not exist", config.primaryPatternId));
        }
        if (!config.secondaryPatternId.isEmpty() && !patternIds.contains(config.secondaryPatternId)) {
            return OperationResult::failure(ErrorKind::NotFound,
                                            i18n("Tiling pattern %1 does not exist", config.secondaryPatternId));
        }
        const QString slot = config.workspaceId + QLatin1Char('|') + config.monitorId;
        const auto existing = monitorSlots.constFind(slot);
        if (existing != monitorSlots.constEnd()) {
            return OperationResult::conflict(otherParty(*existing, config.id, subjectId),
                                             i18n("Monitor %1 is already configured for this workspace",
                                                  config.monitorId));
        }
        monitorSlots.insert(slot, config.id);
    }

    // Mappings: reserved modifier, targets, (scope, combination) uniqueness among enabled ones
    QHash<QString, QString> combinations;
    for (const KeyboardMapping& mapping : state.mappings) {
        if (mapping.combination.uses(m_reservedModifier)) {
            return OperationResult::failure(ErrorKind::Validation,
                                            i18n("Shortcut %1 uses the reserved modifier %2",
                                                 mapping.combination.toString(),
                                                 ModifierUtils::modifierToString(m_reservedModifier)));
        }
        if (actionTargetsWorkspace(mapping.action) && !workspaceIds.contains(mapping.targetId)) {
            return OperationResult::failure(ErrorKind::NotFound,
                                            i18n("Workspace %1 does not exist", mapping.targetId));
        }
        if (!mapping.enabled) {
            continue;
        }
        const QString key = mapping.scopeKey();
        const auto existing = combinations.constFind(key);
        if (existing != combinations.constEnd()) {
            return OperationResult::conflict(otherParty(*existing, mapping.id, subjectId),
                                             i18n("Shortcut %1 is already in use", mapping.combination.toString()));
        }
        combinations.insert(key, mapping.id);
    }

    QHash<QString, QString> bundles;
    for (const ApplicationProfile& profile : state.applications) {
        const auto existing = bundles.constFind(profile.bundleId);
        if (existing != bundles.constEnd()) {
            return OperationResult::conflict(otherParty(*existing, profile.id, subjectId),
                                             i18n("A profile for %1 already exists", profile.bundleId));
        }
        bundles.insert(profile.bundleId, profile.id);
    }

    return OperationResult::ok();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Commit
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult EntityRegistry::transaction(EntityKind kind, const QString& subjectId, const Mutation& mutation)
{
    if (m_mutating) {
        qCWarning(lcRegistry) << "Rejected re-entrant mutation of" << kind << subjectId;
        return OperationResult::failure(ErrorKind::Busy, i18n("Another registry change is being committed"));
    }

    {
        m_mutating = true;
        auto resetGuard = qScopeGuard([this] {
            m_mutating = false;
        });

        RegistrySnapshot next = m_state;
        OperationResult result = mutation(next);
        if (result.isOk()) {
            result = validateState(next, subjectId);
        }
        if (!result.isOk()) {
            qCWarning(lcRegistry) << "Rejected change of" << kind << subjectId << result;
            return result;
        }

        if (m_persistence) {
            result = m_persistence->saveEntities(next);
            if (!result.isOk()) {
                qCWarning(lcRegistry) << "Change of" << kind << subjectId << "not committed, save failed:" << result;
                return OperationResult::failure(ErrorKind::Io, result.message);
            }
        }

        m_state = std::move(next);
        ++m_revision;
        qCDebug(lcRegistry) << "Committed" << kind << subjectId << "revision" << m_revision;
    }

    Q_EMIT changed(kind, subjectId);
    return OperationResult::ok();
}

template<typename T>
OperationResult EntityRegistry::insertEntity(EntityKind kind, QVector<T> RegistrySnapshot::*list, const T& entity)
{
    return transaction(kind, entity.id, [&](RegistrySnapshot& next) {
        (next.*list).append(entity);
        return OperationResult::ok();
    });
}

template<typename T>
OperationResult EntityRegistry::replaceEntity(EntityKind kind, QVector<T> RegistrySnapshot::*list, const T& entity)
{
    return transaction(kind, entity.id, [&](RegistrySnapshot& next) {
        const int index = indexOfId(next.*list, entity.id);
        if (index < 0) {
            return OperationResult::failure(ErrorKind::NotFound,
                                            i18n("No %1 with id %2", entityKindToString(kind), entity.id));
        }
        (next.*list)[index] = entity;
        return OperationResult::ok();
    });
}

template<typename T>
OperationResult EntityRegistry::eraseEntity(EntityKind kind, QVector<T> RegistrySnapshot::*list, const QString& id)
{
    return transaction(kind, id, [&](RegistrySnapshot& next) {
        const int index = indexOfId(next.*list, id);
        if (index < 0) {
            return OperationResult::failure(ErrorKind::NotFound,
                                            i18n("No %1 with id %2", entityKindToString(kind), id));
        }
        (next.*list).removeAt(index);
        return OperationResult::ok();
    });
}

// ═══════════════════════════════════════════════════════════════════════════════
// Loading
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult EntityRegistry::loadSnapshot(const RegistrySnapshot& loaded)
{
    if (m_mutating) {
        qCWarning(lcRegistry) << "Rejected reload during a commit";
        return OperationResult::failure(ErrorKind::Busy, i18n("Another registry change is being committed"));
    }

    RegistrySnapshot next;
    int skipped = 0;

    auto keepIfValid = [this, &next, &skipped](auto& list, const auto& entity, const char* what) {
        list.append(entity);
        const OperationResult result = validateState(next, entity.id);
        if (!result.isOk()) {
            list.removeLast();
            ++skipped;
            qCWarning(lcRegistry) << "Skipping stored" << what << entity.id << ":" << result.message;
        }
    };

    for (const TilingPattern& pattern : loaded.patterns) {
        keepIfValid(next.patterns, pattern, "pattern");
    }
    for (const ApplicationProfile& profile : loaded.applications) {
        keepIfValid(next.applications, profile, "application profile");
    }

    // Shortcut links are restored once the mappings are in
    QHash<QString, QString> storedShortcuts;
    for (Workspace ws : loaded.workspaces) {
        ws.name = ws.name.trimmed();
        const QString shortcutId = ws.shortcutId;
        ws.shortcutId.clear();
        const int before = next.workspaces.size();
        keepIfValid(next.workspaces, ws, "workspace");
        if (next.workspaces.size() > before && !shortcutId.isEmpty()) {
            storedShortcuts.insert(ws.id, shortcutId);
        }
    }
    for (const WindowRule& rule : loaded.rules) {
        keepIfValid(next.rules, rule, "window rule");
    }
    for (const MonitorConfiguration& config : loaded.monitorConfigurations) {
        keepIfValid(next.monitorConfigurations, config, "monitor configuration");
    }

    const bool legacySource = loaded.mappingPolicyVersion < Defaults::ShortcutPolicyVersion;
    QVector<KeyboardMapping> legacy;
    for (const KeyboardMapping& mapping : loaded.mappings) {
        if (legacySource || mapping.combination.uses(m_reservedModifier)) {
            legacy.append(mapping);
            continue;
        }
        keepIfValid(next.mappings, mapping, "keyboard mapping");
    }

    const QSet<QString> legacyIds = idsOf(legacy);
    QHash<QString, QString> legacyOwners;
    for (Workspace& ws : next.workspaces) {
        const QString shortcutId = storedShortcuts.value(ws.id);
        if (shortcutId.isEmpty()) {
            continue;
        }
        if (legacyIds.contains(shortcutId)) {
            legacyOwners.insert(shortcutId, ws.id);
            continue;
        }
        ws.shortcutId = shortcutId;
        const OperationResult result = validateState(next, ws.id);
        if (!result.isOk()) {
            ws.shortcutId.clear();
            qCWarning(lcRegistry) << "Clearing shortcut of workspace" << ws.id << ":" << result.message;
        }
    }

    m_state = std::move(next);
    ++m_revision;
    qCInfo(lcRegistry) << "Loaded" << m_state.workspaces.size() << "workspaces," << m_state.patterns.size()
                       << "patterns," << m_state.rules.size() << "rules," << m_state.mappings.size() << "mappings;"
                       << skipped << "skipped," << legacy.size() << "awaiting migration";

    Q_EMIT reloaded();
    if (!legacy.isEmpty()) {
        Q_EMIT legacyMappingsFound(legacy, legacyOwners);
    }

    OperationResult result = OperationResult::ok();
    if (skipped > 0) {
        result.message = i18np("%1 stored entity was skipped", "%1 stored entities were skipped", skipped);
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Workspaces
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult EntityRegistry::createWorkspace(const Workspace& workspace)
{
    Workspace ws = workspace;
    ws.name = ws.name.trimmed();
    if (!ws.createdAt.isValid()) {
        ws.createdAt = QDateTime::currentDateTimeUtc();
    }
    if (!ws.lastUsed.isValid()) {
        ws.lastUsed = ws.createdAt;
    }
    return insertEntity(EntityKind::Workspace, &RegistrySnapshot::workspaces, ws);
}

OperationResult EntityRegistry::updateWorkspace(const Workspace& workspace)
{
    Workspace ws = workspace;
    ws.name = ws.name.trimmed();
    return replaceEntity(EntityKind::Workspace, &RegistrySnapshot::workspaces, ws);
}

OperationResult EntityRegistry::removeWorkspace(const QString& id, bool cascade)
{
    return transaction(EntityKind::Workspace, id, [&](RegistrySnapshot& next) {
        const int index = indexOfId(next.workspaces, id);
        if (index < 0) {
            return OperationResult::failure(ErrorKind::NotFound, i18n("No workspace with id %1", id));
        }

        if (!cascade) {
            for (const WindowRule& rule : std::as_const(next.rules)) {
                if (rule.workspaceId == id) {
                    return OperationResult::conflict(rule.id, i18n("Workspace still has window rules"));
                }
            }
            for (const MonitorConfiguration& config : std::as_const(next.monitorConfigurations)) {
                if (config.workspaceId == id) {
                    return OperationResult::conflict(config.id, i18n("Workspace still has monitor configurations"));
                }
            }
            for (const KeyboardMapping& mapping : std::as_const(next.mappings)) {
                if (mappingTargets(mapping, id)) {
                    return OperationResult::conflict(mapping.id, i18n("Keyboard mappings still target the workspace"));
                }
            }
        }

        QSet<QString> removedMappings;
        for (const KeyboardMapping& mapping : std::as_const(next.mappings)) {
            if (mappingTargets(mapping, id)) {
                removedMappings.insert(mapping.id);
            }
        }

        next.rules.removeIf([&id](const WindowRule& rule) {
            return rule.workspaceId == id;
        });
        next.monitorConfigurations.removeIf([&id](const MonitorConfiguration& config) {
            return config.workspaceId == id;
        });
        next.mappings.removeIf([&removedMappings](const KeyboardMapping& mapping) {
            return removedMappings.contains(mapping.id);
        });
        next.workspaces.removeAt(index);

        for (Workspace& ws : next.workspaces) {
            if (removedMappings.contains(ws.shortcutId)) {
                ws.shortcutId.clear();
            }
        }
        return OperationResult::ok();
    });
}

std::optional<Workspace> EntityRegistry::workspace(const QString& id) const
{
    return findCopy(m_state.workspaces, id);
}

std::optional<Workspace> EntityRegistry::workspaceByName(const QString& name) const
{
    const QString trimmed = name.trimmed();
    for (const Workspace& ws : m_state.workspaces) {
        if (ws.name == trimmed) {
            return ws;
        }
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Tiling patterns
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult EntityRegistry::createPattern(const TilingPattern& pattern)
{
    return insertEntity(EntityKind::Pattern, &RegistrySnapshot::patterns, pattern);
}

OperationResult EntityRegistry::updatePattern(const TilingPattern& pattern)
{
    return replaceEntity(EntityKind::Pattern, &RegistrySnapshot::patterns, pattern);
}

OperationResult EntityRegistry::removePattern(const QString& id)
{
    return transaction(EntityKind::Pattern, id, [&](RegistrySnapshot& next) {
        const int index = indexOfId(next.patterns, id);
        if (index < 0) {
            return OperationResult::failure(ErrorKind::NotFound, i18n("No tiling pattern with id %1", id));
        }
        for (const Workspace& ws : std::as_const(next.workspaces)) {
            const QStringList overrides = ws.monitorOverrides.values();
            if (ws.defaultPatternId == id || overrides.contains(id)) {
                return OperationResult::conflict(ws.id, i18n("Workspace \"%1\" still uses the pattern", ws.name));
            }
        }
        for (const MonitorConfiguration& config : std::as_const(next.monitorConfigurations)) {
            if (config.primaryPatternId == id || config.secondaryPatternId == id) {
                return OperationResult::conflict(config.id, i18n("A monitor configuration still uses the pattern"));
            }
        }
        next.patterns.removeAt(index);
        return OperationResult::ok();
    });
}

std::optional<TilingPattern> EntityRegistry::pattern(const QString& id) const
{
    return findCopy(m_state.patterns, id);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Window rules
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult EntityRegistry::createRule(const WindowRule& rule)
{
    return insertEntity(EntityKind::Rule, &RegistrySnapshot::rules, rule);
}

OperationResult EntityRegistry::updateRule(const WindowRule& rule)
{
    return replaceEntity(EntityKind::Rule, &RegistrySnapshot::rules, rule);
}

OperationResult EntityRegistry::removeRule(const QString& id)
{
    return eraseEntity(EntityKind::Rule, &RegistrySnapshot::rules, id);
}

std::optional<WindowRule> EntityRegistry::rule(const QString& id) const
{
    return findCopy(m_state.rules, id);
}

QVector<WindowRule> EntityRegistry::rulesForWorkspace(const QString& workspaceId) const
{
    QVector<WindowRule> result;
    for (const WindowRule& rule : m_state.rules) {
        if (rule.workspaceId == workspaceId) {
            result.append(rule);
        }
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Monitor configurations
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult EntityRegistry::createMonitorConfiguration(const MonitorConfiguration& config)
{
    return insertEntity(EntityKind::MonitorConfiguration, &RegistrySnapshot::monitorConfigurations, config);
}

OperationResult EntityRegistry::updateMonitorConfiguration(const MonitorConfiguration& config)
{
    return replaceEntity(EntityKind::MonitorConfiguration, &RegistrySnapshot::monitorConfigurations, config);
}

OperationResult EntityRegistry::removeMonitorConfiguration(const QString& id)
{
    return eraseEntity(EntityKind::MonitorConfiguration, &RegistrySnapshot::monitorConfigurations, id);
}

std::optional<MonitorConfiguration> EntityRegistry::monitorConfiguration(const QString& id) const
{
    return findCopy(m_state.monitorConfigurations, id);
}

std::optional<MonitorConfiguration> EntityRegistry::monitorConfigurationFor(const QString& workspaceId,
                                                                            const QString& monitorId) const
{
    if (const MonitorConfiguration* config = m_state.monitorConfigurationFor(workspaceId, monitorId)) {
        return *config;
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Keyboard mappings
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult EntityRegistry::createMapping(const KeyboardMapping& mapping)
{
    return insertEntity(EntityKind::Mapping, &RegistrySnapshot::mappings, mapping);
}

OperationResult EntityRegistry::updateMapping(const KeyboardMapping& mapping)
{
    return replaceEntity(EntityKind::Mapping, &RegistrySnapshot::mappings, mapping);
}

OperationResult EntityRegistry::removeMapping(const QString& id)
{
    return transaction(EntityKind::Mapping, id, [&](RegistrySnapshot& next) {
        const int index = indexOfId(next.mappings, id);
        if (index < 0) {
            return OperationResult::failure(ErrorKind::NotFound, i18n("No keyboard mapping with id %1", id));
        }
        next.mappings.removeAt(index);
        for (Workspace& ws : next.workspaces) {
            if (ws.shortcutId == id) {
                ws.shortcutId.clear();
            }
        }
        return OperationResult::ok();
    });
}

std::optional<KeyboardMapping> EntityRegistry::mapping(const QString& id) const
{
    return findCopy(m_state.mappings, id);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Application profiles
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult EntityRegistry::createApplication(const ApplicationProfile& profile)
{
    return insertEntity(EntityKind::Application, &RegistrySnapshot::applications, profile);
}

OperationResult EntityRegistry::updateApplication(const ApplicationProfile& profile)
{
    return replaceEntity(EntityKind::Application, &RegistrySnapshot::applications, profile);
}

OperationResult EntityRegistry::removeApplication(const QString& id)
{
    return eraseEntity(EntityKind::Application, &RegistrySnapshot::applications, id);
}

std::optional<ApplicationProfile> EntityRegistry::application(const QString& id) const
{
    return findCopy(m_state.applications, id);
}

std::optional<ApplicationProfile> EntityRegistry::applicationForBundle(const QString& bundleId) const
{
    for (const ApplicationProfile& profile : m_state.applications) {
        if (profile.bundleId == bundleId) {
            return profile;
        }
    }
    return std::nullopt;
}

} // namespace Tessera
