// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "../core/constants.h"
#include "../core/modifierutils.h"
#include <KConfigGroup>
#include <KSharedConfig>
#include <QObject>
#include <QString>
#include <QStringList>

namespace Tessera {

/**
 * @brief Tunables of the Tessera core
 *
 * Read from and written to the tesserarc KConfig file. Out-of-range values
 * fall back to the defaults in constants.h with a warning.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class TESSERA_EXPORT CoreSettings : public QObject
{
    Q_OBJECT

    // Switching
    Q_PROPERTY(int ackTimeoutMs READ ackTimeoutMs WRITE setAckTimeoutMs NOTIFY ackTimeoutMsChanged)
    Q_PROPERTY(
        int driverMaxAttempts READ driverMaxAttempts WRITE setDriverMaxAttempts NOTIFY driverMaxAttemptsChanged)
    Q_PROPERTY(int retryBaseDelayMs READ retryBaseDelayMs WRITE setRetryBaseDelayMs NOTIFY retryBaseDelayMsChanged)
    Q_PROPERTY(int retryMaxDelayMs READ retryMaxDelayMs WRITE setRetryMaxDelayMs NOTIFY retryMaxDelayMsChanged)

    // Workspaces
    Q_PROPERTY(int maxWorkspaces READ maxWorkspaces WRITE setMaxWorkspaces NOTIFY maxWorkspacesChanged)
    Q_PROPERTY(
        bool restoreLastActive READ restoreLastActive WRITE setRestoreLastActive NOTIFY restoreLastActiveChanged)

    // Metrics
    Q_PROPERTY(int metricsFlushIntervalMs READ metricsFlushIntervalMs WRITE setMetricsFlushIntervalMs NOTIFY
                   metricsFlushIntervalMsChanged)

    // Storage
    Q_PROPERTY(QString dataDirectory READ dataDirectory WRITE setDataDirectory NOTIFY dataDirectoryChanged)
    Q_PROPERTY(bool keepBackups READ keepBackups WRITE setKeepBackups NOTIFY keepBackupsChanged)

public:
    /**
     * @param configName KConfig file name, or an absolute path
     */
    explicit CoreSettings(const QString& configName = QStringLiteral("tesserarc"), QObject* parent = nullptr);
    ~CoreSettings() override;

    // Switching
    int ackTimeoutMs() const
    {
        return m_ackTimeoutMs;
    }
    void setAckTimeoutMs(int value);
    int driverMaxAttempts() const
    {
        return m_driverMaxAttempts;
    }
    void setDriverMaxAttempts(int value);
    int retryBaseDelayMs() const
    {
        return m_retryBaseDelayMs;
    }
    void setRetryBaseDelayMs(int value);
    int retryMaxDelayMs() const
    {
        return m_retryMaxDelayMs;
    }
    void setRetryMaxDelayMs(int value);

    // Workspaces
    int maxWorkspaces() const
    {
        return m_maxWorkspaces;
    }
    void setMaxWorkspaces(int value);
    bool restoreLastActive() const
    {
        return m_restoreLastActive;
    }
    void setRestoreLastActive(bool value);

    // Shortcuts
    Modifier safeModifier() const
    {
        return m_safeModifier;
    }
    Modifier reservedModifier() const
    {
        return m_reservedModifier;
    }

    /**
     * @brief Set both modifiers; rejected when they are equal
     */
    bool setModifiers(Modifier safe, Modifier reserved);

    /**
     * @brief Chords the system keeps for itself, in "mod+key" text form
     *
     * Entries that do not parse are dropped with a warning; the rest are
     * stored in canonical form.
     */
    QStringList reservedCombinations() const
    {
        return m_reservedCombinations;
    }
    void setReservedCombinations(const QStringList& value);
    static QStringList defaultReservedCombinations();

    // Metrics
    int metricsFlushIntervalMs() const
    {
        return m_metricsFlushIntervalMs;
    }
    void setMetricsFlushIntervalMs(int value);

    // Storage
    QString dataDirectory() const
    {
        return m_dataDirectory;
    }
    void setDataDirectory(const QString& value);
    bool keepBackups() const
    {
        return m_keepBackups;
    }
    void setKeepBackups(bool value);

    // Persistence
    void load();
    void save();
    void reset();

Q_SIGNALS:
    void settingsChanged();
    void ackTimeoutMsChanged();
    void driverMaxAttemptsChanged();
    void retryBaseDelayMsChanged();
    void retryMaxDelayMsChanged();
    void maxWorkspacesChanged();
    void restoreLastActiveChanged();
    void modifiersChanged();
    void reservedCombinationsChanged();
    void metricsFlushIntervalMsChanged();
    void dataDirectoryChanged();
    void keepBackupsChanged();

private:
    int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                         const char* settingName);
    Modifier readModifier(const KConfigGroup& group, const char* key, Modifier defaultValue,
                          const char* settingName);
    static QStringList canonicalCombinations(const QStringList& texts);

    KSharedConfigPtr m_config;

    // Switching
    int m_ackTimeoutMs = Defaults::AckTimeoutMs;
    int m_driverMaxAttempts = Defaults::DriverMaxAttempts;
    int m_retryBaseDelayMs = Defaults::RetryBaseDelayMs;
    int m_retryMaxDelayMs = Defaults::RetryMaxDelayMs;

    // Workspaces
    int m_maxWorkspaces = Defaults::MaxWorkspaces;
    bool m_restoreLastActive = true;

    // Shortcuts
    Modifier m_safeModifier = Modifier::Option;
    Modifier m_reservedModifier = Modifier::Command;
    QStringList m_reservedCombinations = defaultReservedCombinations();

    // Metrics
    int m_metricsFlushIntervalMs = Defaults::MetricsFlushIntervalMs;

    // Storage
    QString m_dataDirectory;
    bool m_keepBackups = true;
};

} // namespace Tessera
