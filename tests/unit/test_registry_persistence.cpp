// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QTemporaryDir>

#include "core/constants.h"
#include "core/entityregistry.h"
#include "core/jsonregistrystore.h"
#include "core/registrysnapshot.h"
#include "daemon/shortcuttable.h"

using namespace Tessera;

namespace {

/**
 * @brief Store whose commit of one named document fails
 */
class FailingCommitStore : public JsonRegistryStore
{
public:
    using JsonRegistryStore::JsonRegistryStore;

    QString failingFile;

protected:
    bool commitFile(QSaveFile &file) override
    {
        if (!failingFile.isEmpty() && file.fileName().endsWith(QLatin1Char('/') + failingFile)) {
            return false;
        }
        return JsonRegistryStore::commitFile(file);
    }
};

} // anonymous namespace

/**
 * @brief Unit tests for JsonRegistryStore and registry persistence
 *
 * Tests cover:
 * - Save and reload of every entity kind through the registry
 * - Backups and skipping of unchanged documents
 * - Missing directories and corrupt documents
 * - Keybinding documents from before the safe-modifier policy
 * - Failed writes leaving the committed state untouched
 * - A failed commit putting back the documents the same save already replaced
 */
class TestRegistryPersistence : public QObject
{
    Q_OBJECT

private:
    static QByteArray readFile(const QString &path)
    {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            return QByteArray();
        }
        return file.readAll();
    }

    static bool writeFile(const QString &path, const QByteArray &data)
    {
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            return false;
        }
        return file.write(data) == data.size();
    }

    /**
     * @brief Fill @p registry with one entity of every kind
     */
    static void populate(EntityRegistry &registry, QString *workspaceId)
    {
        const TilingPattern pattern = TilingPattern::create(QStringLiteral("Stack"), AlgorithmId::PrimaryStack);
        QVERIFY(registry.createPattern(pattern).isOk());

        Workspace ws = Workspace::create(QStringLiteral("Code"), pattern.id);
        ws.description = QStringLiteral("Editors and terminals");
        ws.monitorOverrides.insert(QStringLiteral("HDMI-1"), pattern.id);
        QVERIFY(registry.createWorkspace(ws).isOk());
        *workspaceId = ws.id;

        WindowRule rule = WindowRule::create(ws.id, QStringLiteral("org.kde.kcalc"), PlacementMode::Fixed);
        rule.fixedGeometry = QRect(10, 20, 300, 400);
        rule.priority = 2;
        QVERIFY(registry.createRule(rule).isOk());

        MonitorConfiguration config = MonitorConfiguration::create(ws.id, QStringLiteral("DP-1"), pattern.id);
        config.usableArea = QRect(0, 0, 1000, 800);
        QVERIFY(registry.createMonitorConfiguration(config).isOk());

        const KeyboardMapping mapping = KeyboardMapping::create(
            ShortcutCombination::parse(QStringLiteral("opt+1")).value(), ActionKind::SwitchWorkspace, ws.id);
        QVERIFY(registry.createMapping(mapping).isOk());

        ApplicationProfile profile = ApplicationProfile::create(QStringLiteral("org.gimp"), PlacementMode::Floating);
        profile.displayName = QStringLiteral("GIMP");
        QVERIFY(registry.createApplication(profile).isOk());
    }

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Round trip
    // ═══════════════════════════════════════════════════════════════════════════

    void testSaveAndReload_allEntityKinds()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        JsonRegistryStore store(dir.path());
        EntityRegistry registry;
        registry.setPersistence(&store);
        QString workspaceId;
        populate(registry, &workspaceId);
        const RegistrySnapshot saved = registry.snapshot();

        for (const QLatin1String &name : {JsonRegistryStore::WorkspacesFile, JsonRegistryStore::PatternsFile,
                                          JsonRegistryStore::RulesFile, JsonRegistryStore::MonitorsFile,
                                          JsonRegistryStore::KeybindingsFile, JsonRegistryStore::ApplicationsFile}) {
            QVERIFY2(QFile::exists(store.filePath(name)), qPrintable(QString(name)));
        }

        JsonRegistryStore reader(dir.path());
        RegistrySnapshot loaded;
        QVERIFY(reader.loadEntities(loaded).isOk());

        QCOMPARE(loaded.workspaces.size(), 1);
        QCOMPARE(loaded.workspaces.first().name, QStringLiteral("Code"));
        QCOMPARE(loaded.workspaces.first().description, saved.workspaces.first().description);
        QCOMPARE(loaded.workspaces.first().monitorOverrides, saved.workspaces.first().monitorOverrides);
        QCOMPARE(loaded.workspaces.first().shortcutId, saved.workspaces.first().shortcutId);
        QCOMPARE(loaded.patterns, saved.patterns);
        QCOMPARE(loaded.rules, saved.rules);
        QCOMPARE(loaded.monitorConfigurations, saved.monitorConfigurations);
        QCOMPARE(loaded.mappings, saved.mappings);
        QCOMPARE(loaded.applications, saved.applications);
        QCOMPARE(loaded.mappingPolicyVersion, Defaults::ShortcutPolicyVersion);

        EntityRegistry restored;
        QVERIFY(restored.loadSnapshot(loaded).isOk());
        QVERIFY(restored.workspace(workspaceId).has_value());
        QCOMPARE(restored.rules().size(), 1);
    }

    void testLoad_missingDirectory()
    {
        QTemporaryDir dir;
        JsonRegistryStore store(dir.filePath(QStringLiteral("not-created")));

        RegistrySnapshot loaded;
        loaded.workspaces.append(Workspace::create(QStringLiteral("stale")));

        QVERIFY(store.loadEntities(loaded).isOk());
        QVERIFY(loaded.workspaces.isEmpty());
        QCOMPARE(loaded.mappingPolicyVersion, Defaults::ShortcutPolicyVersion);
    }

    void testSave_createsDirectory()
    {
        QTemporaryDir dir;
        JsonRegistryStore store(dir.filePath(QStringLiteral("nested/data")));
        EntityRegistry registry;
        registry.setPersistence(&store);

        QVERIFY(registry.createPattern(TilingPattern::create(QStringLiteral("Grid"), AlgorithmId::Grid)).isOk());
        QVERIFY(QFile::exists(store.filePath(JsonRegistryStore::PatternsFile)));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Backups and unchanged documents
    // ═══════════════════════════════════════════════════════════════════════════

    void testSave_backupsOnlyChangedDocuments()
    {
        QTemporaryDir dir;
        JsonRegistryStore store(dir.path());
        EntityRegistry registry;
        registry.setPersistence(&store);

        const TilingPattern pattern = TilingPattern::create(QStringLiteral("Stack"), AlgorithmId::PrimaryStack);
        QVERIFY(registry.createPattern(pattern).isOk());
        const QString workspacesPath = store.filePath(JsonRegistryStore::WorkspacesFile);
        const QString patternsPath = store.filePath(JsonRegistryStore::PatternsFile);
        const QByteArray before = readFile(workspacesPath);
        QVERIFY(!QFile::exists(workspacesPath + QStringLiteral(".bak")));

        QVERIFY(registry.createWorkspace(Workspace::create(QStringLiteral("Code"), pattern.id)).isOk());

        QVERIFY(QFile::exists(workspacesPath + QStringLiteral(".bak")));
        QCOMPARE(readFile(workspacesPath + QStringLiteral(".bak")), before);
        QVERIFY(!QFile::exists(patternsPath + QStringLiteral(".bak")));
    }

    void testSave_withoutBackups()
    {
        QTemporaryDir dir;
        JsonRegistryStore store(dir.path());
        store.setKeepBackups(false);
        EntityRegistry registry;
        registry.setPersistence(&store);

        QVERIFY(registry.createWorkspace(Workspace::create(QStringLiteral("One"))).isOk());
        QVERIFY(registry.createWorkspace(Workspace::create(QStringLiteral("Two"))).isOk());

        QVERIFY(!QFile::exists(store.filePath(JsonRegistryStore::WorkspacesFile) + QStringLiteral(".bak")));
    }

    void testSave_skipsUnchangedDocuments()
    {
        QTemporaryDir dir;
        JsonRegistryStore store(dir.path());
        EntityRegistry registry;
        registry.setPersistence(&store);
        QVERIFY(registry.createWorkspace(Workspace::create(QStringLiteral("One"))).isOk());

        const QString rulesPath = store.filePath(JsonRegistryStore::RulesFile);
        QVERIFY(writeFile(rulesPath, QByteArrayLiteral("edited by hand")));

        QVERIFY(registry.createWorkspace(Workspace::create(QStringLiteral("Two"))).isOk());

        QCOMPARE(readFile(rulesPath), QByteArrayLiteral("edited by hand"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Damaged documents
    // ═══════════════════════════════════════════════════════════════════════════

    void testLoad_corruptDocumentTreatedAsEmpty()
    {
        QTemporaryDir dir;
        {
            JsonRegistryStore store(dir.path());
            EntityRegistry registry;
            registry.setPersistence(&store);
            QString workspaceId;
            populate(registry, &workspaceId);
        }

        JsonRegistryStore store(dir.path());
        QVERIFY(writeFile(store.filePath(JsonRegistryStore::RulesFile), QByteArrayLiteral("{ not json")));

        QJsonObject document;
        QCOMPARE(JsonRegistryStore::readDocument(store.filePath(JsonRegistryStore::RulesFile), document).kind,
                 ErrorKind::Io);

        RegistrySnapshot loaded;
        QVERIFY(store.loadEntities(loaded).isOk());
        QVERIFY(loaded.rules.isEmpty());
        QCOMPARE(loaded.workspaces.size(), 1);
        QCOMPARE(loaded.patterns.size(), 1);
    }

    void testLoad_skipsMalformedEntries()
    {
        QTemporaryDir dir;
        JsonRegistryStore store(dir.path());

        const Workspace good = Workspace::create(QStringLiteral("Good"));
        QJsonArray entries;
        entries.append(42);
        entries.append(good.toJson());
        QJsonObject document;
        document[JsonKeys::Version] = Defaults::StoreFormatVersion;
        document[JsonKeys::Workspaces] = entries;
        QVERIFY(JsonRegistryStore::writeDocument(store.filePath(JsonRegistryStore::WorkspacesFile), document, false)
                    .isOk());

        RegistrySnapshot loaded;
        QVERIFY(store.loadEntities(loaded).isOk());
        QCOMPARE(loaded.workspaces.size(), 1);
        QCOMPARE(loaded.workspaces.first().id, good.id);
    }

    void testReadDocument_missingFile()
    {
        QTemporaryDir dir;
        QJsonObject document;
        document[QStringLiteral("leftover")] = true;

        QVERIFY(JsonRegistryStore::readDocument(dir.filePath(QStringLiteral("absent.json")), document).isOk());
        QVERIFY(document.isEmpty());
    }

    void testWriteDocument_backupKeepsPrevious()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("export.json"));
        QJsonObject first;
        first[QStringLiteral("n")] = 1;
        QJsonObject second;
        second[QStringLiteral("n")] = 2;

        QVERIFY(JsonRegistryStore::writeDocument(path, first, true).isOk());
        QVERIFY(!QFile::exists(path + QStringLiteral(".bak")));
        QVERIFY(JsonRegistryStore::writeDocument(path, second, true).isOk());

        QJsonObject current;
        QJsonObject backup;
        QVERIFY(JsonRegistryStore::readDocument(path, current).isOk());
        QVERIFY(JsonRegistryStore::readDocument(path + QStringLiteral(".bak"), backup).isOk());
        QCOMPARE(current, second);
        QCOMPARE(backup, first);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Keybinding policy
    // ═══════════════════════════════════════════════════════════════════════════

    void testMappingsDocument_policyDefaultsToLegacy()
    {
        const KeyboardMapping mapping =
            KeyboardMapping::create(ShortcutCombination::parse(QStringLiteral("opt+h")).value(), ActionKind::FocusNext);
        QJsonObject document = JsonRegistryStore::mappingsToDocument({mapping}, 2);

        int policy = 0;
        QCOMPARE(JsonRegistryStore::mappingsFromDocument(document, &policy).size(), 1);
        QCOMPARE(policy, 2);

        document.remove(JsonKeys::PolicyVersion);
        QCOMPARE(JsonRegistryStore::mappingsFromDocument(document, &policy).first(), mapping);
        QCOMPARE(policy, 1);
    }

    void testLegacyKeybindings_migratedAndRewritten()
    {
        QTemporaryDir dir;
        JsonRegistryStore store(dir.path());

        Workspace ws = Workspace::create(QStringLiteral("Code"));
        const KeyboardMapping legacy = KeyboardMapping::create(
            ShortcutCombination::parse(QStringLiteral("cmd+1")).value(), ActionKind::SwitchWorkspace, ws.id);
        ws.shortcutId = legacy.id;

        QJsonObject workspaces;
        workspaces[JsonKeys::Version] = Defaults::StoreFormatVersion;
        workspaces[JsonKeys::Workspaces] = QJsonArray{ws.toJson()};
        QVERIFY(JsonRegistryStore::writeDocument(store.filePath(JsonRegistryStore::WorkspacesFile), workspaces, false)
                    .isOk());

        QJsonObject keybindings = JsonRegistryStore::mappingsToDocument({legacy}, 1);
        keybindings.remove(JsonKeys::PolicyVersion);
        QVERIFY(JsonRegistryStore::writeDocument(store.filePath(JsonRegistryStore::KeybindingsFile), keybindings,
                                                 false)
                    .isOk());

        RegistrySnapshot loaded;
        QVERIFY(store.loadEntities(loaded).isOk());
        QCOMPARE(loaded.mappingPolicyVersion, 1);
        QCOMPARE(loaded.mappings.size(), 1);

        EntityRegistry registry;
        ShortcutTable shortcuts(registry);
        registry.setPersistence(&store);
        QVERIFY(registry.loadSnapshot(loaded).isOk());

        const auto migrated = registry.mapping(legacy.id);
        QVERIFY(migrated.has_value());
        QCOMPARE(migrated->combination.toString(), QStringLiteral("opt+1"));
        QCOMPARE(registry.workspace(ws.id)->shortcutId, legacy.id);

        // The migrated set was written back under the current policy
        QJsonObject rewritten;
        QVERIFY(JsonRegistryStore::readDocument(store.filePath(JsonRegistryStore::KeybindingsFile), rewritten).isOk());
        int policy = 0;
        const QVector<KeyboardMapping> stored = JsonRegistryStore::mappingsFromDocument(rewritten, &policy);
        QCOMPARE(policy, Defaults::ShortcutPolicyVersion);
        QCOMPARE(stored.size(), 1);
        QCOMPARE(stored.first().combination.toString(), QStringLiteral("opt+1"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Failures
    // ═══════════════════════════════════════════════════════════════════════════

    void testSave_unwritableDirectoryRejectsCommit()
    {
        QTemporaryDir dir;
        const QString blocker = dir.filePath(QStringLiteral("blocker"));
        QVERIFY(writeFile(blocker, QByteArrayLiteral("file, not a directory")));

        JsonRegistryStore store(blocker + QStringLiteral("/data"));
        EntityRegistry registry;
        registry.setPersistence(&store);
        const quint64 revision = registry.revision();

        const OperationResult result = registry.createWorkspace(Workspace::create(QStringLiteral("Lost")));

        QCOMPARE(result.kind, ErrorKind::Io);
        QVERIFY(registry.workspaces().isEmpty());
        QCOMPARE(registry.revision(), revision);
    }

    void testSave_failedCommitRestoresEarlierDocuments()
    {
        QTemporaryDir dir;
        FailingCommitStore store(dir.path());
        EntityRegistry registry;
        registry.setPersistence(&store);
        QString workspaceId;
        populate(registry, &workspaceId);

        const QString workspacesPath = store.filePath(JsonRegistryStore::WorkspacesFile);
        const QString rulesPath = store.filePath(JsonRegistryStore::RulesFile);
        const QString keybindingsPath = store.filePath(JsonRegistryStore::KeybindingsFile);
        const QByteArray workspacesBefore = readFile(workspacesPath);
        const QByteArray rulesBefore = readFile(rulesPath);
        const QByteArray keybindingsBefore = readFile(keybindingsPath);
        QVERIFY(!workspacesBefore.isEmpty());

        // The cascade rewrites workspaces.json and rules.json before keybindings.json
        store.failingFile = JsonRegistryStore::KeybindingsFile;
        const OperationResult result = registry.removeWorkspace(workspaceId, true);

        QCOMPARE(result.kind, ErrorKind::Io);
        QVERIFY(registry.workspace(workspaceId).has_value());
        QCOMPARE(readFile(workspacesPath), workspacesBefore);
        QCOMPARE(readFile(rulesPath), rulesBefore);
        QCOMPARE(readFile(keybindingsPath), keybindingsBefore);

        // Once commits work again the same change goes through
        store.failingFile.clear();
        QVERIFY(registry.removeWorkspace(workspaceId, true).isOk());
        QVERIFY(readFile(workspacesPath) != workspacesBefore);

        RegistrySnapshot reloaded;
        QVERIFY(store.loadEntities(reloaded).isOk());
        QVERIFY(reloaded.workspaces.isEmpty());
        QVERIFY(reloaded.mappings.isEmpty());
    }

    void testSave_failedFirstSaveLeavesNoDocuments()
    {
        QTemporaryDir dir;
        FailingCommitStore store(dir.filePath(QStringLiteral("data")));
        store.failingFile = JsonRegistryStore::ApplicationsFile;
        EntityRegistry registry;
        registry.setPersistence(&store);

        QCOMPARE(registry.createWorkspace(Workspace::create(QStringLiteral("Lost"))).kind, ErrorKind::Io);

        QVERIFY(!QFile::exists(store.filePath(JsonRegistryStore::WorkspacesFile)));
        QVERIFY(!QFile::exists(store.filePath(JsonRegistryStore::KeybindingsFile)));
        QVERIFY(registry.workspaces().isEmpty());
    }
};

QTEST_MAIN(TestRegistryPersistence)
#include "test_registry_persistence.moc"
