// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "coresettings.h"
#include "../core/jsonregistrystore.h"
#include "../core/logging.h"
#include "../core/shortcutcombination.h"
#include <KConfig>
#include <QStringList>

namespace Tessera {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define CORESETTINGS_SETTER(Type, name, member, signal) \
    void CoreSettings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define CORESETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void CoreSettings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

namespace {
const QString SwitchingGroup = QStringLiteral("Switching");
const QString WorkspacesGroup = QStringLiteral("Workspaces");
const QString ShortcutsGroup = QStringLiteral("Shortcuts");
const QString MetricsGroup = QStringLiteral("Metrics");
const QString StorageGroup = QStringLiteral("Storage");
} // anonymous namespace

CoreSettings::CoreSettings(const QString& configName, QObject* parent)
    : QObject(parent)
    , m_config(KSharedConfig::openConfig(configName, KConfig::SimpleConfig))
    , m_dataDirectory(JsonRegistryStore::defaultDirectory())
{
    load();
}

CoreSettings::~CoreSettings() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int CoreSettings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                   const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

Modifier CoreSettings::readModifier(const KConfigGroup& group, const char* key, Modifier defaultValue,
                                    const char* settingName)
{
    const QString name = group.readEntry(QLatin1String(key), ModifierUtils::modifierToString(defaultValue));
    const auto modifier = ModifierUtils::modifierFromString(name);
    if (!modifier) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << name << "using default"
                            << ModifierUtils::modifierToString(defaultValue);
        return defaultValue;
    }
    return *modifier;
}

QStringList CoreSettings::canonicalCombinations(const QStringList& texts)
{
    QStringList result;
    for (const QString& text : texts) {
        const auto combination = ShortcutCombination::parse(text.trimmed());
        if (!combination) {
            qCWarning(lcConfig) << "Invalid reserved shortcut:" << text << "- ignoring it";
            continue;
        }
        const QString canonical = combination->toString();
        if (!result.contains(canonical)) {
            result.append(canonical);
        }
    }
    return result;
}

QStringList CoreSettings::defaultReservedCombinations()
{
    QStringList texts;
    for (const char* text : Defaults::ReservedCombinations) {
        texts.append(QString::fromLatin1(text));
    }
    return canonicalCombinations(texts);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

CORESETTINGS_SETTER_CLAMPED(AckTimeoutMs, m_ackTimeoutMs, ackTimeoutMsChanged, Defaults::MinAckTimeoutMs,
                            Defaults::MaxAckTimeoutMs)
CORESETTINGS_SETTER_CLAMPED(DriverMaxAttempts, m_driverMaxAttempts, driverMaxAttemptsChanged, 1,
                            Defaults::MaxDriverAttempts)
CORESETTINGS_SETTER_CLAMPED(RetryBaseDelayMs, m_retryBaseDelayMs, retryBaseDelayMsChanged, 0,
                            Defaults::MaxRetryBaseDelayMs)
CORESETTINGS_SETTER_CLAMPED(RetryMaxDelayMs, m_retryMaxDelayMs, retryMaxDelayMsChanged, 0,
                            Defaults::MaxRetryMaxDelayMs)
CORESETTINGS_SETTER_CLAMPED(MaxWorkspaces, m_maxWorkspaces, maxWorkspacesChanged, Defaults::MinWorkspaces,
                            Defaults::MaxWorkspacesLimit)
CORESETTINGS_SETTER(bool, RestoreLastActive, m_restoreLastActive, restoreLastActiveChanged)
CORESETTINGS_SETTER_CLAMPED(MetricsFlushIntervalMs, m_metricsFlushIntervalMs, metricsFlushIntervalMsChanged,
                            Defaults::MinMetricsFlushIntervalMs, Defaults::MaxMetricsFlushIntervalMs)
CORESETTINGS_SETTER(const QString&, DataDirectory, m_dataDirectory, dataDirectoryChanged)
CORESETTINGS_SETTER(bool, KeepBackups, m_keepBackups, keepBackupsChanged)

bool CoreSettings::setModifiers(Modifier safe, Modifier reserved)
{
    if (safe == reserved) {
        qCWarning(lcConfig) << "Safe and reserved modifier must differ, both are"
                            << ModifierUtils::modifierToString(safe);
        return false;
    }
    if (m_safeModifier != safe || m_reservedModifier != reserved) {
        m_safeModifier = safe;
        m_reservedModifier = reserved;
        Q_EMIT modifiersChanged();
        Q_EMIT settingsChanged();
    }
    return true;
}

void CoreSettings::setReservedCombinations(const QStringList& value)
{
    const QStringList combinations = canonicalCombinations(value);
    if (m_reservedCombinations != combinations) {
        m_reservedCombinations = combinations;
        Q_EMIT reservedCombinationsChanged();
        Q_EMIT settingsChanged();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void CoreSettings::load()
{
    // KSharedConfig caches in memory; pick up changes written by other processes
    m_config->reparseConfiguration();

    const KConfigGroup switching = m_config->group(SwitchingGroup);
    const KConfigGroup workspaces = m_config->group(WorkspacesGroup);
    const KConfigGroup shortcuts = m_config->group(ShortcutsGroup);
    const KConfigGroup metrics = m_config->group(MetricsGroup);
    const KConfigGroup storage = m_config->group(StorageGroup);

    // Switching
    m_ackTimeoutMs = readValidatedInt(switching, "AckTimeoutMs", Defaults::AckTimeoutMs, Defaults::MinAckTimeoutMs,
                                      Defaults::MaxAckTimeoutMs, "acknowledgment timeout");
    m_driverMaxAttempts = readValidatedInt(switching, "DriverMaxAttempts", Defaults::DriverMaxAttempts, 1,
                                           Defaults::MaxDriverAttempts, "driver attempts");
    m_retryBaseDelayMs = readValidatedInt(switching, "RetryBaseDelayMs", Defaults::RetryBaseDelayMs, 0,
                                          Defaults::MaxRetryBaseDelayMs, "retry base delay");
    m_retryMaxDelayMs = readValidatedInt(switching, "RetryMaxDelayMs", Defaults::RetryMaxDelayMs, 0,
                                         Defaults::MaxRetryMaxDelayMs, "retry max delay");
    if (m_retryMaxDelayMs < m_retryBaseDelayMs) {
        qCWarning(lcConfig) << "Retry max delay" << m_retryMaxDelayMs << "below base delay" << m_retryBaseDelayMs
                            << "- using base delay";
        m_retryMaxDelayMs = m_retryBaseDelayMs;
    }

    // Workspaces
    m_maxWorkspaces = readValidatedInt(workspaces, "MaxWorkspaces", Defaults::MaxWorkspaces, Defaults::MinWorkspaces,
                                       Defaults::MaxWorkspacesLimit, "workspace limit");
    m_restoreLastActive = workspaces.readEntry(QLatin1String("RestoreLastActive"), true);

    // Shortcuts
    const Modifier safe = readModifier(shortcuts, "SafeModifier", Modifier::Option, "safe modifier");
    const Modifier reserved = readModifier(shortcuts, "ReservedModifier", Modifier::Command, "reserved modifier");
    if (safe == reserved) {
        qCWarning(lcConfig) << "Safe and reserved modifier are both" << ModifierUtils::modifierToString(safe)
                            << "- using defaults";
        m_safeModifier = Modifier::Option;
        m_reservedModifier = Modifier::Command;
    } else {
        m_safeModifier = safe;
        m_reservedModifier = reserved;
    }
    m_reservedCombinations = canonicalCombinations(
        shortcuts.readEntry(QLatin1String("ReservedCombinations"), defaultReservedCombinations()));

    // Metrics
    m_metricsFlushIntervalMs =
        readValidatedInt(metrics, "FlushIntervalMs", Defaults::MetricsFlushIntervalMs,
                         Defaults::MinMetricsFlushIntervalMs, Defaults::MaxMetricsFlushIntervalMs, "metrics interval");

    // Storage
    m_dataDirectory = storage.readEntry(QLatin1String("DataDirectory"), JsonRegistryStore::defaultDirectory());
    if (m_dataDirectory.isEmpty()) {
        m_dataDirectory = JsonRegistryStore::defaultDirectory();
    }
    m_keepBackups = storage.readEntry(QLatin1String("KeepBackups"), true);

    qCDebug(lcConfig) << "Settings loaded: ack timeout" << m_ackTimeoutMs << "ms, attempts" << m_driverMaxAttempts
                      << ", workspace limit" << m_maxWorkspaces << ", data" << m_dataDirectory;
    Q_EMIT settingsChanged();
}

void CoreSettings::save()
{
    KConfigGroup switching = m_config->group(SwitchingGroup);
    KConfigGroup workspaces = m_config->group(WorkspacesGroup);
    KConfigGroup shortcuts = m_config->group(ShortcutsGroup);
    KConfigGroup metrics = m_config->group(MetricsGroup);
    KConfigGroup storage = m_config->group(StorageGroup);

    // Switching
    switching.writeEntry(QLatin1String("AckTimeoutMs"), m_ackTimeoutMs);
    switching.writeEntry(QLatin1String("DriverMaxAttempts"), m_driverMaxAttempts);
    switching.writeEntry(QLatin1String("RetryBaseDelayMs"), m_retryBaseDelayMs);
    switching.writeEntry(QLatin1String("RetryMaxDelayMs"), m_retryMaxDelayMs);

    // Workspaces
    workspaces.writeEntry(QLatin1String("MaxWorkspaces"), m_maxWorkspaces);
    workspaces.writeEntry(QLatin1String("RestoreLastActive"), m_restoreLastActive);

    // Shortcuts
    shortcuts.writeEntry(QLatin1String("SafeModifier"), ModifierUtils::modifierToString(m_safeModifier));
    shortcuts.writeEntry(QLatin1String("ReservedModifier"), ModifierUtils::modifierToString(m_reservedModifier));
    shortcuts.writeEntry(QLatin1String("ReservedCombinations"), m_reservedCombinations);

    // Metrics
    metrics.writeEntry(QLatin1String("FlushIntervalMs"), m_metricsFlushIntervalMs);

    // Storage
    storage.writeEntry(QLatin1String("DataDirectory"), m_dataDirectory);
    storage.writeEntry(QLatin1String("KeepBackups"), m_keepBackups);

    if (!m_config->sync()) {
        qCWarning(lcConfig) << "Failed to write settings to" << m_config->name();
    }
}

void CoreSettings::reset()
{
    // Delete all setting groups (load() will use the defaults for missing keys)
    const QStringList groups = {SwitchingGroup, WorkspacesGroup, ShortcutsGroup, MetricsGroup, StorageGroup};
    for (const QString& groupName : groups) {
        m_config->deleteGroup(groupName);
    }
    if (!m_config->sync()) {
        qCWarning(lcConfig) << "Failed to write settings to" << m_config->name();
    }

    load();
    qCInfo(lcConfig) << "Settings reset to defaults";
}

} // namespace Tessera
