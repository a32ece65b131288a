// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "types.h"
#include "windowrule.h"
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <optional>

namespace Tessera {

/**
 * @brief How well an application cooperates with tiling
 */
enum class CompatibilityLevel {
    Full,
    Good,
    Limited,
    Poor,
    Incompatible
};

/**
 * @brief How an application grabs focus on its own
 */
enum class FocusStealing {
    Normal,
    Aggressive,
    Passive,
    NewWindowsOnly
};

TESSERA_EXPORT QString compatibilityLevelToString(CompatibilityLevel level);
TESSERA_EXPORT std::optional<CompatibilityLevel> compatibilityLevelFromString(const QString& str);
TESSERA_EXPORT QString focusStealingToString(FocusStealing behavior);
TESSERA_EXPORT std::optional<FocusStealing> focusStealingFromString(const QString& str);

/**
 * @brief Known defaults for an application
 *
 * Consulted by the tiling engine when no WindowRule of the workspace matches
 * a window: the profile's default placement mode applies. When a detection
 * pattern is set, the profile only applies to windows whose title matches it.
 */
struct TESSERA_EXPORT ApplicationProfile
{
    QString id;
    QString bundleId;                ///< Bundle/process id, unique across profiles
    QString displayName;
    PlacementMode defaultPlacement = PlacementMode::AutoTile;
    QStringList preferredPatterns;   ///< Ordered TilingPattern ids
    CompatibilityLevel compatibility = CompatibilityLevel::Full;
    QString compatibilityNotes;
    QString detectionPattern;        ///< Title regular expression, empty matches any title
    FocusStealing focusStealing = FocusStealing::Normal;

    bool operator==(const ApplicationProfile& other) const;
    bool operator!=(const ApplicationProfile& other) const;

    /**
     * @brief Check the profile's own invariants
     *
     * A fixed default placement is rejected since a profile carries no geometry.
     */
    OperationResult validate() const;

    QJsonObject toJson() const;
    static std::optional<ApplicationProfile> fromJson(const QJsonObject& json);

    static ApplicationProfile create(const QString& bundleId, PlacementMode defaultPlacement);
};

} // namespace Tessera
