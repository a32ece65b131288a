// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include <QDebug>
#include <QMetaType>
#include <QRect>
#include <QString>
#include <QVector>

namespace Tessera {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types - Results and Snapshots Passed Between Core Modules
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Error classes reported by core operations
 *
 * None of these is fatal: every failing operation leaves the registry and the
 * workspace state machine at their last committed state.
 */
enum class ErrorKind {
    None = 0,   ///< Success
    Validation, ///< Entity invariant violated, nothing was changed
    NotFound,   ///< Referenced entity does not exist
    Conflict,   ///< Name or shortcut collision, or dependents block a delete
    Tiling,     ///< Pattern cannot place the windows under current constraints
    Driver,     ///< Platform driver call failed or timed out
    Permission, ///< Platform reports a missing OS permission
    Io,         ///< Persistence failure
    Busy,       ///< A workspace switch is already in flight
    Cancelled   ///< The caller cancelled the operation
};

TESSERA_EXPORT QString errorKindToString(ErrorKind kind);

/**
 * @brief Structured result of a fallible core operation
 *
 * Returned by the registry, the shortcut table and the workspace manager
 * instead of throwing. A Conflict carries the id of the entity that is in
 * the way so the caller can decide whether to replace it or keep both.
 */
struct TESSERA_EXPORT OperationResult
{
    ErrorKind kind = ErrorKind::None;
    QString message;       ///< Human-readable reason (translated where user-facing)
    QString conflictingId; ///< Existing entity id for Conflict results

    bool isOk() const noexcept
    {
        return kind == ErrorKind::None;
    }

    static OperationResult ok()
    {
        return OperationResult{};
    }

    static OperationResult failure(ErrorKind kind, const QString& message)
    {
        return OperationResult{kind, message, QString()};
    }

    static OperationResult conflict(const QString& existingId, const QString& message)
    {
        return OperationResult{ErrorKind::Conflict, message, existingId};
    }
};

TESSERA_EXPORT QDebug operator<<(QDebug debug, const OperationResult& result);

/**
 * @brief A display as reported by the monitor topology provider
 */
struct TESSERA_EXPORT MonitorSnapshot
{
    QString id;        ///< Stable monitor identifier (connector or EDID based)
    QRect geometry;    ///< Physical bounds in global coordinates
    QRect workArea;    ///< Bounds minus panels/docks; empty means same as geometry
    bool isPrimary = false;

    QRect usableArea() const
    {
        return workArea.isValid() ? workArea.intersected(geometry) : geometry;
    }
};

/**
 * @brief A window as reported by the platform driver
 */
struct TESSERA_EXPORT WindowSnapshot
{
    QString id;            ///< Platform window handle
    QString applicationId; ///< Bundle or process id
    QString title;
    QString monitorId;     ///< Monitor the window currently sits on (may be empty)
    QRect geometry;        ///< Current frame geometry
    bool isMinimized = false;
};

/**
 * @brief Counters published by the workspace manager
 *
 * Collected on the switch path by plain increments and published from a
 * timer, so recording never waits on a consumer.
 */
struct TESSERA_EXPORT SwitchMetrics
{
    int switchCount = 0;
    int failedSwitchCount = 0;
    int workspacesCreated = 0;
    int workspacesDeleted = 0;
    int activeWindowCount = 0;
    qint64 lastSwitchLatencyMs = 0;
    qint64 totalSwitchLatencyMs = 0;
    int validationErrors = 0;
    int conflictErrors = 0;
    int tilingErrors = 0;
    int driverErrors = 0;

    qreal averageSwitchLatencyMs() const
    {
        return switchCount > 0 ? static_cast<qreal>(totalSwitchLatencyMs) / switchCount : 0.0;
    }

    void recordError(ErrorKind kind);
};

} // namespace Tessera

Q_DECLARE_METATYPE(Tessera::OperationResult)
Q_DECLARE_METATYPE(Tessera::SwitchMetrics)
