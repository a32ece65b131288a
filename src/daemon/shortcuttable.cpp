// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "shortcuttable.h"
#include "../core/constants.h"
#include "../core/entityregistry.h"
#include "../core/jsonregistrystore.h"
#include "../core/logging.h"
#include "../core/registrysnapshot.h"
#include <KLocalizedString>
#include <QJsonObject>
#include <QStringList>
#include <algorithm>
#include <utility>

namespace Tessera {

ShortcutTable::ShortcutTable(EntityRegistry& registry, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_reservedCombinations(defaultReservedCombinations())
{
    connect(&m_registry, &EntityRegistry::legacyMappingsFound, this,
            [this](const QVector<KeyboardMapping>& mappings, const QHash<QString, QString>& owners) {
                const OperationResult result = loadLegacy(mappings, owners);
                if (!result.isOk()) {
                    qCWarning(lcShortcuts) << "Legacy mappings migrated with problems:" << result;
                }
            });
}

ShortcutTable::~ShortcutTable() = default;

void ShortcutTable::setSafeModifier(Modifier modifier)
{
    if (modifier == reservedModifier()) {
        qCWarning(lcShortcuts) << "Safe modifier cannot be the reserved modifier"
                               << ModifierUtils::modifierToString(modifier) << "- keeping"
                               << ModifierUtils::modifierToString(m_safeModifier);
        return;
    }
    m_safeModifier = modifier;
}

Modifier ShortcutTable::reservedModifier() const
{
    return m_registry.reservedModifier();
}

void ShortcutTable::setReservedModifier(Modifier modifier)
{
    const OperationResult result = setModifiers(m_safeModifier, modifier);
    if (!result.isOk()) {
        qCWarning(lcShortcuts) << "Reserved modifier change to" << ModifierUtils::modifierToString(modifier) << ":"
                               << result;
    }
}

OperationResult ShortcutTable::setModifiers(Modifier safe, Modifier reserved)
{
    if (safe == reserved) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("The safe modifier cannot also be the reserved modifier (%1)",
                                             ModifierUtils::modifierToString(safe)));
    }
    const Modifier previousSafe = m_safeModifier;
    const Modifier previousReserved = reservedModifier();
    if (safe == previousSafe && reserved == previousReserved) {
        return OperationResult::ok();
    }

    // Validation in the commit below already runs against the new modifiers
    m_safeModifier = safe;
    m_registry.setReservedModifier(reserved);

    QVector<std::pair<ShortcutCombination, ShortcutCombination>> rewritten;
    QVector<std::pair<KeyboardMapping, QString>> collisions;
    const OperationResult result =
        m_registry.transaction(EntityRegistry::EntityKind::Mapping, QString(), [&](RegistrySnapshot& next) {
            QHash<QString, QString> holders;
            for (const KeyboardMapping& mapping : std::as_const(next.mappings)) {
                if (mapping.enabled && !mapping.combination.uses(reserved)) {
                    holders.insert(mapping.scopeKey(), mapping.id);
                }
            }
            for (KeyboardMapping& mapping : next.mappings) {
                if (!mapping.combination.uses(reserved)) {
                    continue;
                }
                const ShortcutCombination old = mapping.combination;
                mapping.combination = old.replacingModifier(reserved, safe);
                rewritten.append(std::make_pair(old, mapping.combination));
                if (!mapping.enabled) {
                    continue;
                }
                const QString holder = holders.value(mapping.scopeKey());
                if (!holder.isEmpty()) {
                    mapping.enabled = false;
                    collisions.append(std::make_pair(mapping, holder));
                } else if (isReservedCombination(mapping.combination)) {
                    mapping.enabled = false;
                } else {
                    holders.insert(mapping.scopeKey(), mapping.id);
                }
            }
            return OperationResult::ok();
        });

    if (!result.isOk()) {
        m_safeModifier = previousSafe;
        m_registry.setReservedModifier(previousReserved);
        qCWarning(lcShortcuts) << "Could not migrate mappings to the new modifiers:" << result;
        return result;
    }

    qCInfo(lcShortcuts) << "Modifiers now safe" << ModifierUtils::modifierToString(safe) << "reserved"
                        << ModifierUtils::modifierToString(reserved) << "-" << rewritten.size() << "mappings migrated,"
                        << collisions.size() << "conflicts";
    for (const auto& [from, to] : std::as_const(rewritten)) {
        Q_EMIT shortcutMigrated(from, to);
    }
    for (const auto& [mapping, holder] : std::as_const(collisions)) {
        Q_EMIT shortcutConflict(mapping, holder);
    }
    if (!collisions.isEmpty()) {
        const auto& [mapping, holder] = collisions.constFirst();
        return OperationResult::conflict(holder,
                                         i18n("Migrated shortcut %1 is already assigned", mapping.combination.toString()));
    }
    return OperationResult::ok();
}

void ShortcutTable::setReservedCombinations(const QVector<ShortcutCombination>& combinations)
{
    QVector<ShortcutCombination> valid;
    for (const ShortcutCombination& combination : combinations) {
        if (combination.isValid() && !valid.contains(combination)) {
            valid.append(combination);
        }
    }
    m_reservedCombinations = valid;
}

bool ShortcutTable::isReservedCombination(const ShortcutCombination& combination) const
{
    return m_reservedCombinations.contains(combination);
}

QVector<ShortcutCombination> ShortcutTable::defaultReservedCombinations()
{
    QVector<ShortcutCombination> combinations;
    for (const char* text : Defaults::ReservedCombinations) {
        if (const auto combination = ShortcutCombination::parse(QString::fromLatin1(text))) {
            combinations.append(*combination);
        }
    }
    return combinations;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Registration
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<KeyboardMapping> ShortcutTable::holderOf(const QString& scopeKey, const QString& exceptId) const
{
    const QVector<KeyboardMapping> all = m_registry.mappings();
    for (const KeyboardMapping& mapping : all) {
        if (mapping.enabled && mapping.id != exceptId && mapping.scopeKey() == scopeKey) {
            return mapping;
        }
    }
    return std::nullopt;
}

OperationResult ShortcutTable::insertMapping(const KeyboardMapping& mapping, const QString& ownerWorkspaceId)
{
    return m_registry.transaction(EntityRegistry::EntityKind::Mapping, mapping.id, [&](RegistrySnapshot& next) {
        next.mappings.append(mapping);
        if (ownerWorkspaceId.isEmpty()) {
            return OperationResult::ok();
        }
        for (Workspace& ws : next.workspaces) {
            if (ws.id == ownerWorkspaceId && ws.shortcutId.isEmpty()) {
                ws.shortcutId = mapping.id;
                break;
            }
        }
        return OperationResult::ok();
    });
}

OperationResult ShortcutTable::registerMapping(const KeyboardMapping& mapping)
{
    const OperationResult valid = mapping.validate();
    if (!valid.isOk()) {
        qCWarning(lcShortcuts) << "Rejected mapping" << mapping.combination << ":" << valid.message;
        return valid;
    }

    if (mapping.combination.uses(reservedModifier())) {
        qCWarning(lcShortcuts) << "Rejected mapping" << mapping.combination << "- uses the reserved modifier";
        return OperationResult::failure(
            ErrorKind::Validation,
            i18n("Shortcut %1 uses the reserved %2 modifier; use %3 instead", mapping.combination.toString(),
                 ModifierUtils::modifierToString(reservedModifier()), ModifierUtils::modifierToString(m_safeModifier)));
    }

    if (isReservedCombination(mapping.combination)) {
        qCWarning(lcShortcuts) << "Rejected mapping" << mapping.combination << "- reserved by the system";
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Shortcut %1 is reserved by the system", mapping.combination.toString()));
    }

    if (mapping.enabled) {
        if (const auto holder = holderOf(mapping.scopeKey())) {
            qCInfo(lcShortcuts) << "Shortcut" << mapping.combination << "already bound by mapping" << holder->id;
            Q_EMIT shortcutConflict(mapping, holder->id);
            return OperationResult::conflict(holder->id,
                                             i18n("Shortcut %1 is already assigned", mapping.combination.toString()));
        }
    }

    const OperationResult result = insertMapping(mapping, QString());
    if (result.isOk()) {
        qCDebug(lcShortcuts) << "Registered" << mapping.combination << "->" << actionKindToString(mapping.action)
                             << mapping.targetId;
    } else if (result.kind == ErrorKind::Conflict && !result.conflictingId.isEmpty()) {
        Q_EMIT shortcutConflict(mapping, result.conflictingId);
    }
    return result;
}

OperationResult ShortcutTable::replaceMapping(const KeyboardMapping& mapping)
{
    const OperationResult valid = mapping.validate();
    if (!valid.isOk()) {
        return valid;
    }
    if (isReservedCombination(mapping.combination)) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Shortcut %1 is reserved by the system", mapping.combination.toString()));
    }

    return m_registry.transaction(EntityRegistry::EntityKind::Mapping, mapping.id, [&](RegistrySnapshot& next) {
        QStringList removed;
        for (int i = next.mappings.size() - 1; i >= 0; --i) {
            const KeyboardMapping& other = next.mappings.at(i);
            if (other.id != mapping.id && other.enabled && mapping.enabled && other.scopeKey() == mapping.scopeKey()) {
                removed.append(other.id);
                next.mappings.removeAt(i);
            }
        }
        for (Workspace& ws : next.workspaces) {
            if (removed.contains(ws.shortcutId)) {
                ws.shortcutId.clear();
            }
        }

        bool updated = false;
        for (KeyboardMapping& existing : next.mappings) {
            if (existing.id == mapping.id) {
                existing = mapping;
                updated = true;
                break;
            }
        }
        if (!updated) {
            next.mappings.append(mapping);
        }

        if (!removed.isEmpty()) {
            qCInfo(lcShortcuts) << "Shortcut" << mapping.combination << "taken over from" << removed;
        }
        return OperationResult::ok();
    });
}

OperationResult ShortcutTable::unregisterMapping(const QString& id)
{
    return m_registry.removeMapping(id);
}

OperationResult ShortcutTable::setEnabled(const QString& id, bool enabled)
{
    auto mapping = m_registry.mapping(id);
    if (!mapping) {
        return OperationResult::failure(ErrorKind::NotFound, i18n("No keyboard mapping with id %1", id));
    }
    if (mapping->enabled == enabled) {
        return OperationResult::ok();
    }

    if (enabled) {
        if (const auto holder = holderOf(mapping->scopeKey(), id)) {
            Q_EMIT shortcutConflict(*mapping, holder->id);
            return OperationResult::conflict(holder->id,
                                             i18n("Shortcut %1 is already assigned", mapping->combination.toString()));
        }
    }

    mapping->enabled = enabled;
    return m_registry.updateMapping(*mapping);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lookup
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<KeyboardMapping> ShortcutTable::resolve(const ShortcutCombination& combination,
                                                      const QString& focusedApplication) const
{
    if (!combination.isValid()) {
        return std::nullopt;
    }

    std::optional<KeyboardMapping> global;
    const QVector<KeyboardMapping> all = m_registry.mappings();
    for (const KeyboardMapping& mapping : all) {
        if (!mapping.enabled || mapping.combination != combination) {
            continue;
        }
        if (mapping.scope == MappingScope::Application) {
            if (!focusedApplication.isEmpty() && mapping.scopeApplication == focusedApplication) {
                return mapping;
            }
        } else if (!global) {
            global = mapping;
        }
    }
    return global;
}

QVector<KeyboardMapping> ShortcutTable::mappings() const
{
    return m_registry.mappings();
}

QVector<ShortcutConflict> ShortcutTable::conflicts() const
{
    const QVector<KeyboardMapping> all = m_registry.mappings();

    QHash<QString, QString> holders;
    for (const KeyboardMapping& mapping : all) {
        if (mapping.enabled) {
            holders.insert(mapping.scopeKey(), mapping.id);
        }
    }

    QVector<ShortcutConflict> found;
    QHash<QString, QString> firstDisabled;
    for (const KeyboardMapping& mapping : all) {
        if (mapping.enabled) {
            continue;
        }
        const QString key = mapping.scopeKey();
        QString existing = holders.value(key);
        if (existing.isEmpty()) {
            // Disabled duplicates of each other: the first one stands in for the holder
            if (!firstDisabled.contains(key)) {
                firstDisabled.insert(key, mapping.id);
                continue;
            }
            existing = firstDisabled.value(key);
        }
        found.append({mapping.id, existing, mapping.combination});
    }
    return found;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Migration
// ═══════════════════════════════════════════════════════════════════════════════

KeyboardMapping ShortcutTable::migrateLegacy(const KeyboardMapping& mapping) const
{
    if (!mapping.combination.uses(reservedModifier())) {
        return mapping;
    }
    KeyboardMapping migrated = mapping;
    migrated.combination = mapping.combination.replacingModifier(reservedModifier(), m_safeModifier);
    return migrated;
}

OperationResult ShortcutTable::loadLegacy(const QVector<KeyboardMapping>& mappings,
                                          const QHash<QString, QString>& shortcutOwners)
{
    OperationResult firstFailure = OperationResult::ok();
    int migratedCount = 0;
    int conflictCount = 0;

    for (const KeyboardMapping& legacy : mappings) {
        KeyboardMapping mapping = migrateLegacy(legacy);
        if (mapping.combination != legacy.combination) {
            ++migratedCount;
            qCInfo(lcShortcuts) << "Migrated shortcut" << legacy.combination << "to" << mapping.combination;
            Q_EMIT shortcutMigrated(legacy.combination, mapping.combination);
        }

        if (m_registry.mapping(mapping.id)) {
            // Same id already registered, e.g. a re-import: keep the registered one
            qCDebug(lcShortcuts) << "Mapping" << mapping.id << "already registered, skipping";
            continue;
        }

        const OperationResult valid = mapping.validate();
        if (!valid.isOk()) {
            qCWarning(lcShortcuts) << "Dropping invalid legacy mapping" << legacy.id << ":" << valid.message;
            if (firstFailure.isOk()) {
                firstFailure = valid;
            }
            continue;
        }

        if (mapping.enabled && isReservedCombination(mapping.combination)) {
            qCWarning(lcShortcuts) << "Migrated shortcut" << mapping.combination
                                   << "is reserved by the system - keeping it disabled";
            if (firstFailure.isOk()) {
                firstFailure = OperationResult::failure(
                    ErrorKind::Validation, i18n("Shortcut %1 is reserved by the system", mapping.combination.toString()));
            }
            mapping.enabled = false;
        }

        if (mapping.enabled) {
            if (const auto holder = holderOf(mapping.scopeKey())) {
                ++conflictCount;
                qCWarning(lcShortcuts) << "Migrated shortcut" << mapping.combination << "collides with mapping"
                                       << holder->id << "- keeping it disabled";
                Q_EMIT shortcutConflict(mapping, holder->id);
                if (firstFailure.isOk()) {
                    firstFailure = OperationResult::conflict(
                        holder->id, i18n("Migrated shortcut %1 is already assigned", mapping.combination.toString()));
                }
                mapping.enabled = false;
            }
        }

        const OperationResult result = insertMapping(mapping, shortcutOwners.value(legacy.id));
        if (!result.isOk()) {
            qCWarning(lcShortcuts) << "Failed to register migrated mapping" << mapping.id << ":" << result;
            if (firstFailure.isOk()) {
                firstFailure = result;
            }
        }
    }

    qCInfo(lcShortcuts) << "Loaded" << mappings.size() << "legacy mappings," << migratedCount << "migrated,"
                        << conflictCount << "conflicts";
    return firstFailure;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Defaults and files
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult ShortcutTable::installDefaults()
{
    struct DefaultMapping
    {
        KeyboardMapping mapping;
        QString owner;
    };
    QVector<DefaultMapping> defaults;

    const QVector<Workspace> workspaces = m_registry.workspaces();
    const int quickSlots = std::min(int(workspaces.size()), Defaults::QuickSwitchSlots);
    for (int i = 0; i < quickSlots; ++i) {
        const ShortcutCombination combination({m_safeModifier}, QString::number(i + 1));
        defaults.append({KeyboardMapping::create(combination, ActionKind::SwitchWorkspace, workspaces.at(i).id),
                         workspaces.at(i).id});
    }

    auto add = [this, &defaults](const QVector<Modifier>& extra, const QString& key, ActionKind action) {
        QVector<Modifier> modifiers = extra;
        modifiers.prepend(m_safeModifier);
        defaults.append({KeyboardMapping::create(ShortcutCombination(modifiers, key), action), QString()});
    };
    add({}, QStringLiteral("J"), ActionKind::FocusNext);
    add({}, QStringLiteral("K"), ActionKind::FocusPrevious);
    add({Modifier::Shift}, QStringLiteral("Space"), ActionKind::ToggleFloating);
    add({}, QStringLiteral("F"), ActionKind::ToggleFullscreen);
    add({Modifier::Shift}, QStringLiteral("R"), ActionKind::RefreshLayout);

    int installed = 0;
    for (const DefaultMapping& entry : std::as_const(defaults)) {
        if (isReservedCombination(entry.mapping.combination)) {
            qCDebug(lcShortcuts) << "Default" << entry.mapping.combination << "is reserved by the system";
            continue;
        }
        if (const auto holder = holderOf(entry.mapping.scopeKey())) {
            qCDebug(lcShortcuts) << "Default" << entry.mapping.combination << "already bound by" << holder->id;
            continue;
        }
        const OperationResult result = insertMapping(entry.mapping, entry.owner);
        if (!result.isOk()) {
            qCWarning(lcShortcuts) << "Failed to install default" << entry.mapping.combination << ":" << result;
            return result;
        }
        ++installed;
    }

    qCInfo(lcShortcuts) << "Installed" << installed << "default mappings";
    OperationResult result = OperationResult::ok();
    result.message = i18np("%1 default shortcut installed", "%1 default shortcuts installed", installed);
    return result;
}

OperationResult ShortcutTable::exportMappings(const QString& filePath) const
{
    const QJsonObject document =
        JsonRegistryStore::mappingsToDocument(m_registry.mappings(), Defaults::ShortcutPolicyVersion);
    const OperationResult result = JsonRegistryStore::writeDocument(filePath, document, false);
    if (result.isOk()) {
        qCInfo(lcShortcuts) << "Exported" << m_registry.mappings().size() << "mappings to" << filePath;
    }
    return result;
}

OperationResult ShortcutTable::importMappings(const QString& filePath)
{
    QJsonObject document;
    const OperationResult read = JsonRegistryStore::readDocument(filePath, document);
    if (!read.isOk()) {
        return read;
    }
    if (document.isEmpty()) {
        qCWarning(lcShortcuts) << "Nothing to import from" << filePath;
        return OperationResult::failure(ErrorKind::NotFound, i18n("No keybinding document at %1", filePath));
    }

    int policyVersion = 0;
    const QVector<KeyboardMapping> imported = JsonRegistryStore::mappingsFromDocument(document, &policyVersion);
    if (policyVersion < Defaults::ShortcutPolicyVersion) {
        qCInfo(lcShortcuts) << filePath << "predates the safe-modifier policy (version" << policyVersion
                            << ") - migrating";
        return loadLegacy(imported);
    }

    OperationResult firstFailure = OperationResult::ok();
    int added = 0;
    for (const KeyboardMapping& mapping : imported) {
        if (m_registry.mapping(mapping.id)) {
            qCDebug(lcShortcuts) << "Mapping" << mapping.id << "already registered, skipping";
            continue;
        }
        const OperationResult result = registerMapping(mapping);
        if (result.isOk()) {
            ++added;
        } else if (firstFailure.isOk()) {
            firstFailure = result;
        }
    }

    qCInfo(lcShortcuts) << "Imported" << added << "of" << imported.size() << "mappings from" << filePath;
    return firstFailure;
}

} // namespace Tessera
