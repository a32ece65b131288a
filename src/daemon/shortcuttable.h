// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "../core/keyboardmapping.h"
#include "../core/modifierutils.h"
#include "../core/shortcutcombination.h"
#include "../core/types.h"
#include <QHash>
#include <QObject>
#include <QVector>
#include <optional>

namespace Tessera {

class EntityRegistry;

/**
 * @brief Two mappings sharing a (scope, combination) pair
 *
 * At most one of them is enabled; the other was registered disabled or was
 * kept back when a migrated mapping collided with an existing one.
 */
struct TESSERA_EXPORT ShortcutConflict
{
    QString mappingId;   ///< The mapping that could not take the combination
    QString existingId;  ///< The mapping holding it
    ShortcutCombination combination;
};

/**
 * @brief Keyboard shortcut table over the entity registry
 *
 * Mappings live in the EntityRegistry; this class adds the registration
 * policy on top of it:
 * - a (scope, combination) pair held by an enabled mapping is never
 *   silently overwritten, callers get a Conflict naming the holder
 * - combinations using the reserved modifier are rejected, and mappings from
 *   sources that predate the safe-modifier policy are migrated on load
 * - lookups prefer a mapping scoped to the focused application over a
 *   global one
 */
class TESSERA_EXPORT ShortcutTable : public QObject
{
    Q_OBJECT

public:
    /**
     * @param registry Entity registry (must outlive the table). Legacy
     *        mappings it reports on load are migrated automatically.
     */
    explicit ShortcutTable(EntityRegistry& registry, QObject* parent = nullptr);
    ~ShortcutTable() override;

    Modifier safeModifier() const noexcept
    {
        return m_safeModifier;
    }
    void setSafeModifier(Modifier modifier);

    /**
     * @brief The reserved modifier is owned by the registry, which enforces it
     */
    Modifier reservedModifier() const;
    void setReservedModifier(Modifier modifier);

    /**
     * @brief Change the safe and reserved modifiers together
     *
     * Registered mappings that use the new reserved modifier are rewritten to
     * the new safe modifier in one registry commit, so the registry never
     * holds a mapping its own validation would reject. A rewritten mapping
     * that collides with an enabled one is kept disabled and reported through
     * shortcutConflict().
     *
     * @return Ok, Validation when @p safe equals @p reserved (nothing
     *         changes), the commit failure (nothing changes), or the first
     *         Conflict among the rewritten mappings
     */
    OperationResult setModifiers(Modifier safe, Modifier reserved);

    /**
     * @brief Chords owned by the operating system, refused for registration
     */
    QVector<ShortcutCombination> reservedCombinations() const
    {
        return m_reservedCombinations;
    }
    void setReservedCombinations(const QVector<ShortcutCombination>& combinations);
    bool isReservedCombination(const ShortcutCombination& combination) const;

    /**
     * @brief The built-in reserved chords (application switcher, quit,
     *        clipboard, screenshots, desktop switching and so on)
     */
    static QVector<ShortcutCombination> defaultReservedCombinations();

    // ═══════════════════════════════════════════════════════════════════════════
    // Registration
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Register a new mapping
     *
     * @return Ok, Validation for an invalid mapping, one using the reserved
     *         modifier or a reserved chord, or Conflict carrying the id of the enabled mapping
     *         that already holds the (scope, combination) pair
     */
    OperationResult registerMapping(const KeyboardMapping& mapping);

    /**
     * @brief Register or update a mapping, removing any enabled mapping that
     *        holds its (scope, combination) pair
     */
    OperationResult replaceMapping(const KeyboardMapping& mapping);

    OperationResult unregisterMapping(const QString& id);

    /**
     * @brief Enable or disable a mapping
     * @return Conflict if enabling would collide with another enabled mapping
     */
    OperationResult setEnabled(const QString& id, bool enabled);

    // ═══════════════════════════════════════════════════════════════════════════
    // Lookup
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Enabled mapping for a key chord
     *
     * A mapping scoped to @p focusedApplication wins over a global one.
     */
    std::optional<KeyboardMapping> resolve(const ShortcutCombination& combination,
                                           const QString& focusedApplication = QString()) const;

    QVector<KeyboardMapping> mappings() const;

    /**
     * @brief Scan for mappings that share a (scope, combination) pair
     */
    QVector<ShortcutConflict> conflicts() const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Migration
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Rewrite a reserved-modifier combination to the safe modifier
     *
     * The remaining modifiers and the key are kept. Mappings that do not use
     * the reserved modifier are returned unchanged, so migration is idempotent.
     */
    KeyboardMapping migrateLegacy(const KeyboardMapping& mapping) const;

    /**
     * @brief Migrate and register mappings from a legacy source
     *
     * A migrated mapping that collides with an existing one is registered
     * disabled and reported through shortcutConflict(); it is never dropped.
     * One that lands on a reserved chord is registered disabled as well.
     *
     * @param shortcutOwners mapping id -> workspace id whose shortcut it was
     * @return Ok, or the first failure (Conflict carrying the existing id)
     */
    OperationResult loadLegacy(const QVector<KeyboardMapping>& mappings,
                               const QHash<QString, QString>& shortcutOwners = {});

    // ═══════════════════════════════════════════════════════════════════════════
    // Defaults and files
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Register the default mappings
     *
     * Quick switch to the first nine workspaces on safe+1..9, focus
     * next/previous on safe+j/k, toggle floating on safe+shift+space, toggle
     * fullscreen on safe+f and refresh layout on safe+shift+r. Combinations
     * that are already taken are left alone.
     *
     * @return Ok; the message names how many mappings were added
     */
    OperationResult installDefaults();

    /**
     * @brief Write all mappings to a keybinding document
     */
    OperationResult exportMappings(const QString& filePath) const;

    /**
     * @brief Read mappings from a keybinding document
     *
     * Documents below the current policy version are migrated through
     * loadLegacy(). Mappings whose id is already registered are skipped.
     */
    OperationResult importMappings(const QString& filePath);

Q_SIGNALS:
    /**
     * @brief A legacy combination was rewritten
     */
    void shortcutMigrated(const Tessera::ShortcutCombination& oldCombination,
                          const Tessera::ShortcutCombination& newCombination);

    /**
     * @brief A mapping could not take its combination
     * @param attempted The mapping that was rejected or registered disabled
     * @param existingId The enabled mapping holding the combination
     */
    void shortcutConflict(const Tessera::KeyboardMapping& attempted, const QString& existingId);

private:
    /**
     * @brief Enabled mapping other than @p exceptId holding @p scopeKey
     */
    std::optional<KeyboardMapping> holderOf(const QString& scopeKey, const QString& exceptId = QString()) const;

    /**
     * @brief Insert a mapping and attach it as @p ownerWorkspaceId's shortcut in one commit
     */
    OperationResult insertMapping(const KeyboardMapping& mapping, const QString& ownerWorkspaceId);

    EntityRegistry& m_registry;
    Modifier m_safeModifier = Modifier::Option;
    QVector<ShortcutCombination> m_reservedCombinations;
};

} // namespace Tessera
