// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "constants.h"
#include "types.h"
#include <QJsonObject>
#include <QString>
#include <optional>

namespace Tessera {

/**
 * @brief How a pattern handles more windows than its stated capacity
 */
enum class OverflowPolicy {
    ShrinkToFit,  ///< Recompute cell size so every window fits in the usable area
    StackExcess,  ///< Tile up to capacity, layer the rest behind the last slot
    AllowOverflow ///< Tile up to capacity, let the rest extend past the usable area
};

TESSERA_EXPORT QString overflowPolicyToString(OverflowPolicy policy);
TESSERA_EXPORT std::optional<OverflowPolicy> overflowPolicyFromString(const QString& str);

/**
 * @brief Parameters of a tiling layout
 *
 * TilingPattern is a value type shared by id between workspaces and monitor
 * configurations. It is immutable while an Active workspace's current plan
 * uses it, except through WorkspaceManager::updatePattern(), which re-tiles.
 *
 * Valid ranges:
 * - mainAreaRatio: 0.1 to 0.9
 * - gapSize, windowMargin: >= 0
 * - maxWindows: > 0
 */
struct TESSERA_EXPORT TilingPattern
{
    QString id;
    QString name;
    QString algorithm = AlgorithmId::PrimaryStack; ///< One of the AlgorithmId tags
    qreal mainAreaRatio = Defaults::MainAreaRatio;
    int gapSize = Defaults::GapSize;
    int windowMargin = Defaults::WindowMargin;
    int maxWindows = Defaults::MaxWindows;
    OverflowPolicy overflowPolicy = OverflowPolicy::ShrinkToFit;

    bool operator==(const TilingPattern& other) const;
    bool operator!=(const TilingPattern& other) const;

    /**
     * @brief Check the pattern's own invariants
     * @return Ok, or a Validation result naming the first violated field
     */
    OperationResult validate() const;

    QJsonObject toJson() const;

    /**
     * @brief Deserialize from JSON
     *
     * Values are taken as stored (no clamping) so that validate() can reject
     * out-of-range documents instead of silently repairing them.
     *
     * @return The pattern, or std::nullopt if a tag is unknown
     */
    static std::optional<TilingPattern> fromJson(const QJsonObject& json);

    /**
     * @brief Create a pattern with a fresh id and default parameters
     */
    static TilingPattern create(const QString& name, const QString& algorithm);

    /**
     * @brief Whether @p tag names a supported layout algorithm
     */
    static bool isKnownAlgorithm(const QString& tag);
};

} // namespace Tessera
