// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for Tessera
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcTiling) << "Debug message";
 *   qCWarning(lcRegistry) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="tessera.*=true"                 # Enable all
 *   QT_LOGGING_RULES="tessera.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="tessera.workspace.debug=true"   # Trace workspace switching
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing, disabled in release builds
 *   qCInfo     - Significant operational events (workspace activated, mappings migrated)
 *   qCWarning  - Recoverable errors, invalid input, missing resources
 *   qCCritical - Failures preventing normal operation
 */

namespace Tessera {

// Core module - entities, registry, persistence
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcRegistry)
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPersistence)

// Tiling module - algorithms and placement plans
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcTiling)

// Daemon module - workspace state machine and shortcut table
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcWorkspace)
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcShortcuts)

// Configuration module - settings loading/saving
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace Tessera
