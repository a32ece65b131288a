// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace Tessera {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "tessera.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRegistry, "tessera.core.registry", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPersistence, "tessera.core.persistence", QtInfoMsg)

// Tiling module categories
Q_LOGGING_CATEGORY(lcTiling, "tessera.tiling", QtInfoMsg)

// Daemon module categories
Q_LOGGING_CATEGORY(lcWorkspace, "tessera.workspace", QtInfoMsg)
Q_LOGGING_CATEGORY(lcShortcuts, "tessera.shortcuts", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "tessera.config", QtInfoMsg)

} // namespace Tessera
