// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "jsonregistrystore.h"
#include "constants.h"
#include "logging.h"
#include "utils.h"
#include <KLocalizedString>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>
#include <memory>
#include <vector>

namespace Tessera {

using namespace JsonKeys;

namespace {

template<typename T>
QJsonObject entitiesToDocument(const QVector<T>& entities, QLatin1String rootKey)
{
    QJsonArray array;
    for (const T& entity : entities) {
        array.append(entity.toJson());
    }
    QJsonObject document;
    document[Version] = Defaults::StoreFormatVersion;
    document[rootKey] = array;
    return document;
}

template<typename T>
QVector<T> entitiesFromDocument(const QJsonObject& document, QLatin1String rootKey, const QString& source)
{
    QVector<T> entities;
    const int version = document[Version].toInt(Defaults::StoreFormatVersion);
    if (version > Defaults::StoreFormatVersion) {
        qCWarning(lcPersistence) << source << "has format version" << version << "newer than"
                                 << Defaults::StoreFormatVersion << "- reading known fields only";
    }

    const QJsonArray array = document[rootKey].toArray();
    entities.reserve(array.size());
    for (int i = 0; i < array.size(); ++i) {
        if (!array.at(i).isObject()) {
            qCWarning(lcPersistence) << "Invalid entry" << i << "in" << source << "(not an object), skipping";
            continue;
        }
        auto entity = T::fromJson(array.at(i).toObject());
        if (!entity) {
            qCWarning(lcPersistence) << "Invalid entry" << i << "in" << source << "(unknown tag), skipping";
            continue;
        }
        entities.append(*entity);
    }
    return entities;
}

} // anonymous namespace

JsonRegistryStore::JsonRegistryStore(const QString& directory)
    : m_directory(directory)
{
}

JsonRegistryStore::~JsonRegistryStore() = default;

QString JsonRegistryStore::defaultDirectory()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString JsonRegistryStore::filePath(const QString& fileName) const
{
    return QDir(m_directory).absoluteFilePath(fileName);
}

bool JsonRegistryStore::ensureDirectory() const
{
    QDir dir(m_directory);
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcPersistence) << "Failed to create data directory:" << m_directory;
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Documents
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult JsonRegistryStore::readDocument(const QString& filePath, QJsonObject& document)
{
    document = QJsonObject();

    QFile file(filePath);
    if (!file.exists()) {
        return OperationResult::ok();
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcPersistence) << "Failed to open file:" << filePath << "Error:" << file.errorString();
        return OperationResult::failure(ErrorKind::Io, i18n("Cannot open %1: %2", filePath, file.errorString()));
    }

    QString parseError;
    const auto parsed = Utils::parseJsonObject(file.readAll(), &parseError);
    if (!parsed) {
        qCWarning(lcPersistence) << "Failed to parse file:" << filePath << "Error:" << parseError;
        return OperationResult::failure(ErrorKind::Io, i18n("Cannot parse %1: %2", filePath, parseError));
    }

    document = *parsed;
    return OperationResult::ok();
}

OperationResult JsonRegistryStore::writeDocument(const QString& filePath, const QJsonObject& document,
                                                 bool keepBackup)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcPersistence) << "Failed to open file for writing:" << filePath << "Error:" << file.errorString();
        return OperationResult::failure(ErrorKind::Io, i18n("Cannot write %1: %2", filePath, file.errorString()));
    }

    const QByteArray data = QJsonDocument(document).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        qCWarning(lcPersistence) << "Failed to write file:" << filePath << "Error:" << file.errorString();
        file.cancelWriting();
        return OperationResult::failure(ErrorKind::Io, i18n("Cannot write %1: %2", filePath, file.errorString()));
    }

    if (keepBackup && QFile::exists(filePath)) {
        const QString backupPath = filePath + QStringLiteral(".bak");
        QFile::remove(backupPath);
        if (!QFile::copy(filePath, backupPath)) {
            qCWarning(lcPersistence) << "Failed to back up" << filePath << "to" << backupPath;
        }
    }

    if (!file.commit()) {
        qCWarning(lcPersistence) << "Failed to commit file:" << filePath << "Error:" << file.errorString();
        return OperationResult::failure(ErrorKind::Io, i18n("Cannot write %1: %2", filePath, file.errorString()));
    }
    return OperationResult::ok();
}

QJsonObject JsonRegistryStore::mappingsToDocument(const QVector<KeyboardMapping>& mappings, int policyVersion)
{
    QJsonObject document = entitiesToDocument(mappings, Mappings);
    document[PolicyVersion] = policyVersion;
    return document;
}

QVector<KeyboardMapping> JsonRegistryStore::mappingsFromDocument(const QJsonObject& document, int* policyVersion)
{
    if (policyVersion) {
        *policyVersion = document[PolicyVersion].toInt(1);
    }
    return entitiesFromDocument<KeyboardMapping>(document, Mappings, QStringLiteral("keybinding document"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// IPersistence
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult JsonRegistryStore::loadEntities(RegistrySnapshot& snapshot)
{
    snapshot = RegistrySnapshot();

    if (!QDir(m_directory).exists()) {
        qCInfo(lcPersistence) << "No data directory yet:" << m_directory;
        return OperationResult::ok();
    }

    // An unreadable document is treated as empty so the rest still loads
    auto read = [this](const QString& fileName) {
        QJsonObject document;
        const OperationResult result = readDocument(filePath(fileName), document);
        if (!result.isOk()) {
            qCWarning(lcPersistence) << "Treating" << fileName << "as empty";
        }
        return document;
    };

    snapshot.workspaces = entitiesFromDocument<Workspace>(read(WorkspacesFile), Workspaces, WorkspacesFile);
    snapshot.patterns = entitiesFromDocument<TilingPattern>(read(PatternsFile), Patterns, PatternsFile);
    snapshot.rules = entitiesFromDocument<WindowRule>(read(RulesFile), Rules, RulesFile);
    snapshot.monitorConfigurations =
        entitiesFromDocument<MonitorConfiguration>(read(MonitorsFile), Monitors, MonitorsFile);
    snapshot.applications =
        entitiesFromDocument<ApplicationProfile>(read(ApplicationsFile), Applications, ApplicationsFile);

    const QJsonObject keybindings = read(KeybindingsFile);
    if (keybindings.isEmpty()) {
        snapshot.mappingPolicyVersion = Defaults::ShortcutPolicyVersion;
    } else {
        snapshot.mappings = mappingsFromDocument(keybindings, &snapshot.mappingPolicyVersion);
    }

    qCInfo(lcPersistence) << "Read" << snapshot.workspaces.size() << "workspaces," << snapshot.patterns.size()
                          << "patterns," << snapshot.mappings.size() << "mappings (policy"
                          << snapshot.mappingPolicyVersion << ") from" << m_directory;
    return OperationResult::ok();
}

OperationResult JsonRegistryStore::saveEntities(const RegistrySnapshot& snapshot)
{
    if (!ensureDirectory()) {
        return OperationResult::failure(ErrorKind::Io, i18n("Cannot create data directory %1", m_directory));
    }

    const QList<QPair<QString, QJsonObject>> documents = {
        {WorkspacesFile, entitiesToDocument(snapshot.workspaces, Workspaces)},
        {PatternsFile, entitiesToDocument(snapshot.patterns, Patterns)},
        {RulesFile, entitiesToDocument(snapshot.rules, Rules)},
        {MonitorsFile, entitiesToDocument(snapshot.monitorConfigurations, Monitors)},
        {KeybindingsFile, mappingsToDocument(snapshot.mappings, Defaults::ShortcutPolicyVersion)},
        {ApplicationsFile, entitiesToDocument(snapshot.applications, Applications)},
    };

    // Write every changed document first and commit only when all writes succeeded
    std::vector<std::unique_ptr<QSaveFile>> pending;
    QHash<QString, QByteArray> written;
    for (const auto& [fileName, document] : documents) {
        const QByteArray data = QJsonDocument(document).toJson(QJsonDocument::Indented);
        if (m_lastWritten.value(fileName) == data && QFile::exists(filePath(fileName))) {
            continue;
        }

        auto file = std::make_unique<QSaveFile>(filePath(fileName));
        if (!file->open(QIODevice::WriteOnly)) {
            qCWarning(lcPersistence) << "Failed to open file for writing:" << file->fileName()
                                     << "Error:" << file->errorString();
            return OperationResult::failure(ErrorKind::Io,
                                            i18n("Cannot write %1: %2", file->fileName(), file->errorString()));
        }
        if (file->write(data) != data.size()) {
            qCWarning(lcPersistence) << "Failed to write file:" << file->fileName() << "Error:" << file->errorString();
            return OperationResult::failure(ErrorKind::Io,
                                            i18n("Cannot write %1: %2", file->fileName(), file->errorString()));
        }
        written.insert(fileName, data);
        pending.push_back(std::move(file));
    }

    QVector<PreviousContents> committed;
    for (const auto& file : pending) {
        const QString path = file->fileName();
        PreviousContents previous;
        previous.path = path;
        QFile existing(path);
        if (existing.open(QIODevice::ReadOnly)) {
            previous.existed = true;
            previous.data = existing.readAll();
            existing.close();
        }

        if (m_keepBackups && previous.existed) {
            const QString backupPath = path + QStringLiteral(".bak");
            QFile::remove(backupPath);
            if (!QFile::copy(path, backupPath)) {
                qCWarning(lcPersistence) << "Failed to back up" << path << "to" << backupPath;
            }
        }
        if (!commitFile(*file)) {
            qCCritical(lcPersistence) << "Failed to commit file:" << path << "Error:" << file->errorString();
            const OperationResult failure =
                OperationResult::failure(ErrorKind::Io, i18n("Cannot write %1: %2", path, file->errorString()));
            restore(committed);
            return failure;
        }
        committed.append(previous);
    }

    for (auto it = written.constBegin(); it != written.constEnd(); ++it) {
        m_lastWritten.insert(it.key(), it.value());
    }
    qCDebug(lcPersistence) << "Saved" << pending.size() << "documents to" << m_directory;
    return OperationResult::ok();
}

bool JsonRegistryStore::commitFile(QSaveFile& file)
{
    return file.commit();
}

void JsonRegistryStore::restore(const QVector<PreviousContents>& committed) const
{
    for (auto it = committed.crbegin(); it != committed.crend(); ++it) {
        if (!it->existed) {
            if (!QFile::remove(it->path)) {
                qCCritical(lcPersistence) << "Failed to remove partially saved" << it->path;
            }
            continue;
        }
        QSaveFile file(it->path);
        if (!file.open(QIODevice::WriteOnly) || file.write(it->data) != it->data.size() || !file.commit()) {
            qCCritical(lcPersistence) << "Failed to restore" << it->path << "Error:" << file.errorString();
            continue;
        }
        qCInfo(lcPersistence) << "Restored" << it->path << "after a failed save";
    }
}

} // namespace Tessera
