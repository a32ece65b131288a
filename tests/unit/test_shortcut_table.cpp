// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "core/entityregistry.h"
#include "core/jsonregistrystore.h"
#include "core/registrysnapshot.h"
#include "daemon/shortcuttable.h"

using namespace Tessera;

namespace {

ShortcutCombination combo(const QString &text)
{
    return ShortcutCombination::parse(text).value();
}

} // anonymous namespace

/**
 * @brief Unit tests for ShortcutTable
 *
 * Tests cover:
 * - Registration with reserved-modifier, reserved-chord and collision checks
 * - Changing the modifiers with registered mappings
 * - Legacy migration (rewrite, idempotence, collisions kept disabled)
 * - Resolution precedence of application-scoped mappings
 * - Conflict reporting
 * - Default mappings
 * - Export and import, including legacy documents
 */
class TestShortcutTable : public QObject
{
    Q_OBJECT

private:
    QString addWorkspace(EntityRegistry &registry, const QString &name)
    {
        const Workspace ws = Workspace::create(name);
        const OperationResult result = registry.createWorkspace(ws);
        if (!result.isOk()) {
            qWarning() << "createWorkspace failed" << result;
        }
        return ws.id;
    }

private Q_SLOTS:
    void initTestCase()
    {
        qRegisterMetaType<Tessera::KeyboardMapping>();
        qRegisterMetaType<Tessera::ShortcutCombination>();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Registration
    // ═══════════════════════════════════════════════════════════════════════════

    void testRegister_succeeds()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        const QString ws = addWorkspace(registry, QStringLiteral("W1"));

        const KeyboardMapping mapping = KeyboardMapping::create(combo(QStringLiteral("opt+1")),
                                                                ActionKind::SwitchWorkspace, ws);
        QVERIFY(table.registerMapping(mapping).isOk());
        QCOMPARE(table.mappings().size(), 1);
    }

    void testRegister_reservedModifierRejected()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);

        const OperationResult result =
            table.registerMapping(KeyboardMapping::create(combo(QStringLiteral("cmd+j")), ActionKind::FocusNext));

        QCOMPARE(result.kind, ErrorKind::Validation);
        QVERIFY(result.message.contains(QStringLiteral("cmd")));
        QVERIFY(result.message.contains(QStringLiteral("opt")));
        QVERIFY(table.mappings().isEmpty());
    }

    void testRegister_invalidMapping()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);

        // Switching needs a target
        const KeyboardMapping mapping =
            KeyboardMapping::create(combo(QStringLiteral("opt+1")), ActionKind::SwitchWorkspace);
        QCOMPARE(table.registerMapping(mapping).kind, ErrorKind::Validation);
    }

    void testRegister_collisionReportsHolder()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        QSignalSpy conflictSpy(&table, &ShortcutTable::shortcutConflict);

        const KeyboardMapping first = KeyboardMapping::create(combo(QStringLiteral("opt+j")), ActionKind::FocusNext);
        QVERIFY(table.registerMapping(first).isOk());

        const KeyboardMapping second =
            KeyboardMapping::create(combo(QStringLiteral("opt+j")), ActionKind::FocusPrevious);
        const OperationResult result = table.registerMapping(second);

        QCOMPARE(result.kind, ErrorKind::Conflict);
        QCOMPARE(result.conflictingId, first.id);
        QCOMPARE(conflictSpy.count(), 1);
        QCOMPARE(conflictSpy.first().at(0).value<KeyboardMapping>().id, second.id);
        QCOMPARE(conflictSpy.first().at(1).toString(), first.id);
        QCOMPARE(table.mappings().size(), 1);
    }

    void testReplace_takesOverCombination()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        Workspace ws = Workspace::create(QStringLiteral("W1"));
        QVERIFY(registry.createWorkspace(ws).isOk());

        const KeyboardMapping old =
            KeyboardMapping::create(combo(QStringLiteral("opt+1")), ActionKind::SwitchWorkspace, ws.id);
        QVERIFY(table.registerMapping(old).isOk());
        ws = *registry.workspace(ws.id);
        ws.shortcutId = old.id;
        QVERIFY(registry.updateWorkspace(ws).isOk());

        const KeyboardMapping replacement =
            KeyboardMapping::create(combo(QStringLiteral("opt+1")), ActionKind::ShowOverview);
        QVERIFY(table.replaceMapping(replacement).isOk());

        QCOMPARE(table.mappings().size(), 1);
        QCOMPARE(table.mappings().first().id, replacement.id);
        QVERIFY(registry.workspace(ws.id)->shortcutId.isEmpty());
    }

    void testSetEnabled_checksCollision()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);

        const KeyboardMapping holder = KeyboardMapping::create(combo(QStringLiteral("opt+f")), ActionKind::FocusNext);
        KeyboardMapping waiting = KeyboardMapping::create(combo(QStringLiteral("opt+f")), ActionKind::ToggleFullscreen);
        waiting.enabled = false;
        QVERIFY(table.registerMapping(holder).isOk());
        QVERIFY(table.registerMapping(waiting).isOk());

        const OperationResult blocked = table.setEnabled(waiting.id, true);
        QCOMPARE(blocked.kind, ErrorKind::Conflict);
        QCOMPARE(blocked.conflictingId, holder.id);

        QVERIFY(table.unregisterMapping(holder.id).isOk());
        QVERIFY(table.setEnabled(waiting.id, true).isOk());
        QVERIFY(registry.mapping(waiting.id)->enabled);
        QCOMPARE(table.setEnabled(QStringLiteral("missing"), true).kind, ErrorKind::NotFound);
    }

    void testSafeModifier_cannotBeReserved()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);

        table.setSafeModifier(Modifier::Command);
        QCOMPARE(table.safeModifier(), Modifier::Option);

        table.setSafeModifier(Modifier::Control);
        QCOMPARE(table.safeModifier(), Modifier::Control);

        table.setReservedModifier(Modifier::Control);
        QCOMPARE(table.reservedModifier(), Modifier::Command);
    }

    void testRegister_reservedCombinationRejected()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        table.setSafeModifier(Modifier::Control);

        const KeyboardMapping mapping =
            KeyboardMapping::create(combo(QStringLiteral("ctrl+left")), ActionKind::FocusPrevious);
        QVERIFY(table.isReservedCombination(mapping.combination));

        const OperationResult result = table.registerMapping(mapping);
        QCOMPARE(result.kind, ErrorKind::Validation);
        QVERIFY(result.message.contains(QStringLiteral("reserved by the system")));
        QVERIFY(table.mappings().isEmpty());
        QCOMPARE(table.replaceMapping(mapping).kind, ErrorKind::Validation);

        // The list is configurable
        table.setReservedCombinations({});
        QVERIFY(!table.isReservedCombination(mapping.combination));
        QVERIFY(table.registerMapping(mapping).isOk());
    }

    void testDefaults_skipReservedCombinations()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        table.setReservedCombinations({combo(QStringLiteral("opt+j"))});

        QVERIFY(table.installDefaults().isOk());

        QVERIFY(!table.resolve(combo(QStringLiteral("opt+j"))).has_value());
        QVERIFY(table.resolve(combo(QStringLiteral("opt+k"))).has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Modifier changes
    // ═══════════════════════════════════════════════════════════════════════════

    void testSetModifiers_migratesRegisteredMappings()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        const QString ws = addWorkspace(registry, QStringLiteral("W1"));
        QSignalSpy migratedSpy(&table, &ShortcutTable::shortcutMigrated);
        QSignalSpy conflictSpy(&table, &ShortcutTable::shortcutConflict);

        const KeyboardMapping quickSwitch =
            KeyboardMapping::create(combo(QStringLiteral("opt+1")), ActionKind::SwitchWorkspace, ws);
        const KeyboardMapping focus = KeyboardMapping::create(combo(QStringLiteral("opt+j")), ActionKind::FocusNext);
        const KeyboardMapping holder =
            KeyboardMapping::create(combo(QStringLiteral("ctrl+1")), ActionKind::RefreshLayout);
        QVERIFY(table.registerMapping(quickSwitch).isOk());
        QVERIFY(table.registerMapping(focus).isOk());
        QVERIFY(table.registerMapping(holder).isOk());

        const OperationResult result = table.setModifiers(Modifier::Control, Modifier::Option);

        // ctrl+1 was taken, so the rewritten quick switch stays disabled
        QCOMPARE(result.kind, ErrorKind::Conflict);
        QCOMPARE(result.conflictingId, holder.id);
        QCOMPARE(table.safeModifier(), Modifier::Control);
        QCOMPARE(registry.reservedModifier(), Modifier::Option);

        QCOMPARE(registry.mapping(quickSwitch.id)->combination, combo(QStringLiteral("ctrl+1")));
        QVERIFY(!registry.mapping(quickSwitch.id)->enabled);
        QCOMPARE(registry.mapping(focus.id)->combination, combo(QStringLiteral("ctrl+j")));
        QVERIFY(registry.mapping(focus.id)->enabled);
        QCOMPARE(table.resolve(combo(QStringLiteral("ctrl+1")))->id, holder.id);

        QCOMPARE(migratedSpy.count(), 2);
        QCOMPARE(conflictSpy.count(), 1);
        QCOMPARE(conflictSpy.first().at(0).value<KeyboardMapping>().id, quickSwitch.id);
        QCOMPARE(conflictSpy.first().at(1).toString(), holder.id);

        // Later commits still pass validation
        addWorkspace(registry, QStringLiteral("W2"));
        QCOMPARE(registry.workspaces().size(), 2);
        QVERIFY(table.registerMapping(KeyboardMapping::create(combo(QStringLiteral("cmd+k")), ActionKind::FocusPrevious))
                    .isOk());
        QCOMPARE(table.registerMapping(KeyboardMapping::create(combo(QStringLiteral("opt+k")), ActionKind::FocusPrevious))
                     .kind,
                 ErrorKind::Validation);
    }

    void testSetModifiers_equalModifiersRejected()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        QVERIFY(table.registerMapping(KeyboardMapping::create(combo(QStringLiteral("opt+j")), ActionKind::FocusNext))
                    .isOk());

        QCOMPARE(table.setModifiers(Modifier::Option, Modifier::Option).kind, ErrorKind::Validation);

        QCOMPARE(table.safeModifier(), Modifier::Option);
        QCOMPARE(table.reservedModifier(), Modifier::Command);
        QCOMPARE(table.mappings().first().combination, combo(QStringLiteral("opt+j")));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Legacy migration
    // ═══════════════════════════════════════════════════════════════════════════

    void testLegacy_reservedCombinationKeptDisabled()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        table.setSafeModifier(Modifier::Control);

        // cmd+space migrates onto ctrl+space, which the system owns
        const KeyboardMapping legacy =
            KeyboardMapping::create(combo(QStringLiteral("cmd+space")), ActionKind::ToggleFloating);
        const OperationResult result = table.loadLegacy({legacy});

        QCOMPARE(result.kind, ErrorKind::Validation);
        const auto stored = registry.mapping(legacy.id);
        QVERIFY(stored.has_value());
        QVERIFY(!stored->enabled);
        QCOMPARE(stored->combination, combo(QStringLiteral("ctrl+space")));
        QVERIFY(!table.resolve(combo(QStringLiteral("ctrl+space"))).has_value());
    }

    void testLegacy_collisionKeptDisabled()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        const QString ws = addWorkspace(registry, QStringLiteral("W1"));
        QSignalSpy migratedSpy(&table, &ShortcutTable::shortcutMigrated);
        QSignalSpy conflictSpy(&table, &ShortcutTable::shortcutConflict);

        const KeyboardMapping current =
            KeyboardMapping::create(combo(QStringLiteral("opt+1")), ActionKind::SwitchWorkspace, ws);
        QVERIFY(table.registerMapping(current).isOk());

        const KeyboardMapping legacy =
            KeyboardMapping::create(combo(QStringLiteral("cmd+1")), ActionKind::SwitchWorkspace, ws);
        const OperationResult result = table.loadLegacy({legacy});

        QCOMPARE(result.kind, ErrorKind::Conflict);
        QCOMPARE(result.conflictingId, current.id);

        QCOMPARE(migratedSpy.count(), 1);
        QCOMPARE(migratedSpy.first().at(0).value<ShortcutCombination>(), combo(QStringLiteral("cmd+1")));
        QCOMPARE(migratedSpy.first().at(1).value<ShortcutCombination>(), combo(QStringLiteral("opt+1")));
        QCOMPARE(conflictSpy.count(), 1);
        QCOMPARE(conflictSpy.first().at(1).toString(), current.id);

        const auto stored = registry.mapping(legacy.id);
        QVERIFY(stored.has_value());
        QVERIFY(!stored->enabled);
        QCOMPARE(stored->combination, combo(QStringLiteral("opt+1")));

        const QVector<ShortcutConflict> conflicts = table.conflicts();
        QCOMPARE(conflicts.size(), 1);
        QCOMPARE(conflicts.first().mappingId, legacy.id);
        QCOMPARE(conflicts.first().existingId, current.id);
    }

    void testLegacy_migrationIsIdempotent()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        const QString ws = addWorkspace(registry, QStringLiteral("W1"));

        const KeyboardMapping legacy =
            KeyboardMapping::create(combo(QStringLiteral("cmd+shift+1")), ActionKind::SwitchWorkspace, ws);
        const KeyboardMapping once = table.migrateLegacy(legacy);
        QCOMPARE(once.combination.toString(), QStringLiteral("opt+shift+1"));
        QCOMPARE(table.migrateLegacy(once), once);

        QVERIFY(table.loadLegacy({legacy}).isOk());
        QVERIFY(table.loadLegacy({legacy}).isOk());
        QCOMPARE(table.mappings().size(), 1);
        QVERIFY(table.mappings().first().enabled);
    }

    void testLegacy_ownerGetsShortcut()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        const QString ws = addWorkspace(registry, QStringLiteral("W1"));

        const KeyboardMapping legacy =
            KeyboardMapping::create(combo(QStringLiteral("cmd+3")), ActionKind::SwitchWorkspace, ws);
        QVERIFY(table.loadLegacy({legacy}, {{legacy.id, ws}}).isOk());

        QCOMPARE(registry.workspace(ws)->shortcutId, legacy.id);
    }

    void testLegacy_invalidDropped()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);

        KeyboardMapping broken = KeyboardMapping::create(combo(QStringLiteral("cmd+c")), ActionKind::Custom);
        const OperationResult result = table.loadLegacy({broken});

        QCOMPARE(result.kind, ErrorKind::Validation);
        QVERIFY(table.mappings().isEmpty());
    }

    void testLegacy_migratedOnRegistryLoad()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);

        RegistrySnapshot stored;
        Workspace ws = Workspace::create(QStringLiteral("W1"));
        const KeyboardMapping legacy =
            KeyboardMapping::create(combo(QStringLiteral("cmd+1")), ActionKind::SwitchWorkspace, ws.id);
        ws.shortcutId = legacy.id;
        stored.workspaces.append(ws);
        stored.mappings.append(legacy);

        QVERIFY(registry.loadSnapshot(stored).isOk());

        const auto migrated = registry.mapping(legacy.id);
        QVERIFY(migrated.has_value());
        QCOMPARE(migrated->combination, combo(QStringLiteral("opt+1")));
        QCOMPARE(registry.workspace(ws.id)->shortcutId, legacy.id);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Resolution
    // ═══════════════════════════════════════════════════════════════════════════

    void testResolve_applicationScopeWins()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);

        const KeyboardMapping global = KeyboardMapping::create(combo(QStringLiteral("opt+k")), ActionKind::FocusNext);
        KeyboardMapping scoped = KeyboardMapping::create(combo(QStringLiteral("opt+k")), ActionKind::FocusPrevious);
        scoped.scope = MappingScope::Application;
        scoped.scopeApplication = QStringLiteral("org.kde.kate");
        QVERIFY(table.registerMapping(global).isOk());
        QVERIFY(table.registerMapping(scoped).isOk());

        QCOMPARE(table.resolve(combo(QStringLiteral("opt+k")), QStringLiteral("org.kde.kate"))->id, scoped.id);
        QCOMPARE(table.resolve(combo(QStringLiteral("opt+k")), QStringLiteral("org.kde.dolphin"))->id, global.id);
        QCOMPARE(table.resolve(combo(QStringLiteral("opt+k")))->id, global.id);
        QVERIFY(!table.resolve(combo(QStringLiteral("opt+l"))).has_value());
    }

    void testResolve_ignoresDisabled()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);

        KeyboardMapping mapping = KeyboardMapping::create(combo(QStringLiteral("opt+m")), ActionKind::MinimizeWindow);
        mapping.enabled = false;
        QVERIFY(table.registerMapping(mapping).isOk());

        QVERIFY(!table.resolve(combo(QStringLiteral("opt+m"))).has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Defaults
    // ═══════════════════════════════════════════════════════════════════════════

    void testDefaults_installOnce()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        const QString first = addWorkspace(registry, QStringLiteral("W1"));
        const QString second = addWorkspace(registry, QStringLiteral("W2"));

        const OperationResult result = table.installDefaults();
        QVERIFY(result.isOk());
        QVERIFY(!result.message.isEmpty());

        // Two quick switches plus focus, floating, fullscreen and refresh
        QCOMPARE(table.mappings().size(), 7);
        QCOMPARE(table.resolve(combo(QStringLiteral("opt+1")))->targetId, first);
        QCOMPARE(table.resolve(combo(QStringLiteral("opt+2")))->targetId, second);
        QCOMPARE(table.resolve(combo(QStringLiteral("opt+j")))->action, ActionKind::FocusNext);
        QCOMPARE(table.resolve(combo(QStringLiteral("opt+shift+space")))->action, ActionKind::ToggleFloating);
        QCOMPARE(registry.workspace(first)->shortcutId, table.resolve(combo(QStringLiteral("opt+1")))->id);

        QVERIFY(table.installDefaults().isOk());
        QCOMPARE(table.mappings().size(), 7);
    }

    void testDefaults_followSafeModifier()
    {
        EntityRegistry registry;
        ShortcutTable table(registry);
        table.setSafeModifier(Modifier::Control);

        QVERIFY(table.installDefaults().isOk());
        QVERIFY(table.resolve(combo(QStringLiteral("ctrl+j"))).has_value());
        QVERIFY(!table.resolve(combo(QStringLiteral("opt+j"))).has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Export and import
    // ═══════════════════════════════════════════════════════════════════════════

    void testExportImport()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("keys.json"));

        RegistrySnapshot base;
        base.workspaces.append(Workspace::create(QStringLiteral("W1")));

        EntityRegistry source;
        ShortcutTable sourceTable(source);
        QVERIFY(source.loadSnapshot(base).isOk());
        QVERIFY(sourceTable.installDefaults().isOk());
        QVERIFY(sourceTable.exportMappings(path).isOk());

        EntityRegistry target;
        ShortcutTable targetTable(target);
        QVERIFY(target.loadSnapshot(base).isOk());
        QVERIFY(targetTable.importMappings(path).isOk());
        QCOMPARE(targetTable.mappings().size(), sourceTable.mappings().size());

        // Re-import skips what is already there
        QVERIFY(targetTable.importMappings(path).isOk());
        QCOMPARE(targetTable.mappings().size(), sourceTable.mappings().size());
    }

    void testImport_legacyDocumentMigrated()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("old-keys.json"));

        const KeyboardMapping legacy =
            KeyboardMapping::create(combo(QStringLiteral("cmd+shift+r")), ActionKind::RefreshLayout);
        QVERIFY(JsonRegistryStore::writeDocument(path, JsonRegistryStore::mappingsToDocument({legacy}, 1), false)
                    .isOk());

        EntityRegistry registry;
        ShortcutTable table(registry);
        QSignalSpy migratedSpy(&table, &ShortcutTable::shortcutMigrated);

        QVERIFY(table.importMappings(path).isOk());
        QCOMPARE(migratedSpy.count(), 1);
        QCOMPARE(registry.mapping(legacy.id)->combination, combo(QStringLiteral("opt+shift+r")));
    }

    void testImport_missingFile()
    {
        QTemporaryDir dir;
        EntityRegistry registry;
        ShortcutTable table(registry);

        QCOMPARE(table.importMappings(dir.filePath(QStringLiteral("absent.json"))).kind, ErrorKind::NotFound);
    }
};

QTEST_MAIN(TestShortcutTable)
#include "test_shortcut_table.moc"
