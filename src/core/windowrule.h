// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "types.h"
#include <QJsonObject>
#include <QRect>
#include <QString>
#include <optional>

namespace Tessera {

/**
 * @brief How a window is placed by the tiling engine
 */
enum class PlacementMode {
    AutoTile,  ///< Part of the pattern's tiling set
    Fixed,     ///< Placed at the rule's fixed geometry
    Floating,  ///< Keeps its own geometry, kept inside the usable area
    Fullscreen ///< Covers the whole monitor
};

/**
 * @brief When a window matched by a rule receives focus
 */
enum class FocusPolicy {
    Never,
    OnCreate,
    OnSwitch
};

TESSERA_EXPORT QString placementModeToString(PlacementMode mode);
TESSERA_EXPORT std::optional<PlacementMode> placementModeFromString(const QString& str);
TESSERA_EXPORT QString focusPolicyToString(FocusPolicy policy);
TESSERA_EXPORT std::optional<FocusPolicy> focusPolicyFromString(const QString& str);

/**
 * @brief Per-workspace placement rule for matching windows
 *
 * A rule matches a window when every matcher field that is set matches:
 * - applicationId: exact bundle/process id
 * - applicationGlob: bundle/process id glob (`*` and `?`)
 * - titlePattern: regular expression searched in the window title
 *
 * At least one matcher field must be set. Rules of a workspace are evaluated
 * by descending priority, then in registry order; the first match wins.
 */
struct TESSERA_EXPORT WindowRule
{
    QString id;
    QString workspaceId;
    QString applicationId;
    QString applicationGlob;
    QString titlePattern;
    PlacementMode placement = PlacementMode::AutoTile;
    QRect fixedGeometry;      ///< Required iff placement == Fixed
    int priority = 0;         ///< Stacking priority, >= 0
    FocusPolicy focusPolicy = FocusPolicy::OnCreate;
    bool enabled = true;

    bool operator==(const WindowRule& other) const;
    bool operator!=(const WindowRule& other) const;

    /**
     * @brief Check the rule's own invariants, including that its patterns compile
     */
    OperationResult validate() const;

    QJsonObject toJson() const;
    static std::optional<WindowRule> fromJson(const QJsonObject& json);

    static WindowRule create(const QString& workspaceId, const QString& applicationId, PlacementMode placement);
};

} // namespace Tessera
