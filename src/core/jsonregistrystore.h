// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "interfaces.h"
#include "registrysnapshot.h"
#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QString>

class QSaveFile;

namespace Tessera {

/**
 * @brief File-backed entity storage, one JSON document per entity kind
 *
 * Files in directory():
 * - workspaces.json, patterns.json, rules.json, monitors.json,
 *   keybindings.json, applications.json
 *
 * Each document is an object holding "version" and an array under the entity
 * kind name; keybindings.json also carries "policyVersion". Documents are
 * replaced atomically through QSaveFile and, when backups are enabled, the
 * previous file is kept as <name>.bak. Unchanged documents are not rewritten.
 *
 * A save touches several documents. If one of them fails to commit, the ones
 * already committed by the same save are put back to their previous bytes
 * (or removed when they did not exist), so the directory never mixes two
 * registry revisions.
 */
class TESSERA_EXPORT JsonRegistryStore : public IPersistence
{
public:
    static constexpr QLatin1String WorkspacesFile{"workspaces.json"};
    static constexpr QLatin1String PatternsFile{"patterns.json"};
    static constexpr QLatin1String RulesFile{"rules.json"};
    static constexpr QLatin1String MonitorsFile{"monitors.json"};
    static constexpr QLatin1String KeybindingsFile{"keybindings.json"};
    static constexpr QLatin1String ApplicationsFile{"applications.json"};

    explicit JsonRegistryStore(const QString& directory = defaultDirectory());
    ~JsonRegistryStore() override;

    /**
     * @brief Per-user application data directory
     */
    static QString defaultDirectory();

    QString directory() const
    {
        return m_directory;
    }
    QString filePath(const QString& fileName) const;

    void setKeepBackups(bool keep)
    {
        m_keepBackups = keep;
    }
    bool keepBackups() const noexcept
    {
        return m_keepBackups;
    }

    OperationResult loadEntities(RegistrySnapshot& snapshot) override;
    OperationResult saveEntities(const RegistrySnapshot& snapshot) override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Keybinding documents, shared with mapping import/export
    // ═══════════════════════════════════════════════════════════════════════════

    static QJsonObject mappingsToDocument(const QVector<KeyboardMapping>& mappings, int policyVersion);

    /**
     * @brief Read mappings from a keybinding document
     *
     * Entries that cannot be parsed are skipped with a warning. A document
     * without "policyVersion" reports version 1.
     */
    static QVector<KeyboardMapping> mappingsFromDocument(const QJsonObject& document, int* policyVersion);

    /**
     * @brief Atomically write a JSON document, optionally keeping a .bak copy
     */
    static OperationResult writeDocument(const QString& filePath, const QJsonObject& document, bool keepBackup);

    /**
     * @brief Read a JSON document
     * @return Ok with @p document filled, Ok with an empty document if the file
     *         does not exist, or Io if it cannot be read or parsed
     */
    static OperationResult readDocument(const QString& filePath, QJsonObject& document);

protected:
    /**
     * @brief Replace the target of @p file with its written contents
     */
    virtual bool commitFile(QSaveFile& file);

private:
    struct PreviousContents
    {
        QString path;
        bool existed = false;
        QByteArray data;
    };

    bool ensureDirectory() const;
    void restore(const QVector<PreviousContents>& committed) const;

    QString m_directory;
    bool m_keepBackups = true;
    QHash<QString, QByteArray> m_lastWritten; ///< file name -> bytes last written
};

} // namespace Tessera
