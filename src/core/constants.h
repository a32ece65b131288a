// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace Tessera {

/**
 * @brief Default values and limits shared by the core modules
 *
 * User-configurable values (timeouts, retry policy, workspace limit) are read
 * through CoreSettings, which falls back to these constants and validates
 * against the Min/Max pairs below.
 */
namespace Defaults {
// Tiling pattern
constexpr qreal MinMainAreaRatio = 0.1;
constexpr qreal MaxMainAreaRatio = 0.9;
constexpr qreal MainAreaRatio = 0.6;
constexpr int GapSize = 8;
constexpr int WindowMargin = 8;
constexpr int MaxWindows = 8;

// Workspace
constexpr int MaxWorkspaces = 20;
constexpr int MinWorkspaces = 1;
constexpr int MaxWorkspacesLimit = 100;
constexpr int MaxWorkspaceNameLength = 100;
constexpr int MaxDescriptionLength = 500;

// Switching: driver acknowledgment budget and retry policy
constexpr int AckTimeoutMs = 200;
constexpr int MinAckTimeoutMs = 10;
constexpr int MaxAckTimeoutMs = 5000;
constexpr int DriverMaxAttempts = 3;
constexpr int MaxDriverAttempts = 10;
constexpr int RetryBaseDelayMs = 100;
constexpr int MaxRetryBaseDelayMs = 2000;
constexpr int RetryMaxDelayMs = 1000;
constexpr int MaxRetryMaxDelayMs = 10000;

// Metrics
constexpr int MetricsFlushIntervalMs = 1000;
constexpr int MinMetricsFlushIntervalMs = 100;
constexpr int MaxMetricsFlushIntervalMs = 60000;

// Shortcut table
constexpr int QuickSwitchSlots = 9;
constexpr int ShortcutPolicyVersion = 2; ///< Documents below this predate the safe-modifier policy

// Chords the operating system keeps for itself, in ShortcutCombination text form
inline constexpr const char* ReservedCombinations[] = {
    "cmd+space",   "cmd+tab",       "cmd+q",         "cmd+w",     "cmd+a",    "cmd+s",      "cmd+d",
    "cmd+f",       "cmd+z",         "cmd+x",         "cmd+c",     "cmd+v",    "cmd+shift+z", "cmd+shift+4",
    "cmd+shift+3", "ctrl+space",    "ctrl+up",       "ctrl+down", "ctrl+left", "ctrl+right",
};

// Persistence
constexpr int StoreFormatVersion = 1;
} // namespace Defaults

/**
 * @brief Layout algorithm tags as stored in TilingPattern::algorithm
 */
namespace AlgorithmId {
inline constexpr QLatin1String PrimaryStack{"primary-stack"};
inline constexpr QLatin1String Grid{"grid"};
inline constexpr QLatin1String Columns{"columns"};
inline constexpr QLatin1String Custom{"custom"};
} // namespace AlgorithmId

/**
 * @brief JSON keys for entity serialization
 */
namespace JsonKeys {
// Common
inline constexpr QLatin1String Id{"id"};
inline constexpr QLatin1String Name{"name"};
inline constexpr QLatin1String Description{"description"};
inline constexpr QLatin1String Enabled{"enabled"};
inline constexpr QLatin1String Version{"version"};
inline constexpr QLatin1String PolicyVersion{"policyVersion"};

// Geometry
inline constexpr QLatin1String X{"x"};
inline constexpr QLatin1String Y{"y"};
inline constexpr QLatin1String Width{"width"};
inline constexpr QLatin1String Height{"height"};

// Workspace
inline constexpr QLatin1String ShortcutId{"shortcutId"};
inline constexpr QLatin1String DefaultPatternId{"defaultPatternId"};
inline constexpr QLatin1String MonitorOverrides{"monitorOverrides"};
inline constexpr QLatin1String AutoArrange{"autoArrange"};
inline constexpr QLatin1String CreatedAt{"createdAt"};
inline constexpr QLatin1String LastUsed{"lastUsed"};

// TilingPattern
inline constexpr QLatin1String Algorithm{"algorithm"};
inline constexpr QLatin1String MainAreaRatio{"mainAreaRatio"};
inline constexpr QLatin1String GapSize{"gapSize"};
inline constexpr QLatin1String WindowMargin{"windowMargin"};
inline constexpr QLatin1String MaxWindows{"maxWindows"};
inline constexpr QLatin1String OverflowPolicyKey{"overflowPolicy"};

// WindowRule
inline constexpr QLatin1String WorkspaceId{"workspaceId"};
inline constexpr QLatin1String ApplicationId{"applicationId"};
inline constexpr QLatin1String ApplicationGlob{"applicationGlob"};
inline constexpr QLatin1String TitlePattern{"titlePattern"};
inline constexpr QLatin1String Placement{"placement"};
inline constexpr QLatin1String FixedGeometry{"fixedGeometry"};
inline constexpr QLatin1String Priority{"priority"};
inline constexpr QLatin1String FocusPolicyKey{"focusPolicy"};

// MonitorConfiguration
inline constexpr QLatin1String MonitorId{"monitorId"};
inline constexpr QLatin1String PrimaryPatternId{"primaryPatternId"};
inline constexpr QLatin1String SecondaryPatternId{"secondaryPatternId"};
inline constexpr QLatin1String MaxPrimaryWindows{"maxPrimaryWindows"};
inline constexpr QLatin1String UsableArea{"usableArea"};
inline constexpr QLatin1String OrientationKey{"orientation"};
inline constexpr QLatin1String ScaleFactor{"scaleFactor"};

// KeyboardMapping
inline constexpr QLatin1String Combination{"combination"};
inline constexpr QLatin1String Action{"action"};
inline constexpr QLatin1String TargetId{"targetId"};
inline constexpr QLatin1String Parameters{"parameters"};
inline constexpr QLatin1String Scope{"scope"};
inline constexpr QLatin1String ScopeApplication{"scopeApplication"};

// ApplicationProfile
inline constexpr QLatin1String BundleId{"bundleId"};
inline constexpr QLatin1String DisplayName{"displayName"};
inline constexpr QLatin1String DefaultPlacement{"defaultPlacement"};
inline constexpr QLatin1String PreferredPatterns{"preferredPatterns"};
inline constexpr QLatin1String Compatibility{"compatibility"};
inline constexpr QLatin1String CompatibilityNotes{"compatibilityNotes"};
inline constexpr QLatin1String DetectionPattern{"detectionPattern"};
inline constexpr QLatin1String FocusStealingKey{"focusStealing"};

// Document roots, one per entity kind
inline constexpr QLatin1String Workspaces{"workspaces"};
inline constexpr QLatin1String Patterns{"patterns"};
inline constexpr QLatin1String Rules{"rules"};
inline constexpr QLatin1String Monitors{"monitors"};
inline constexpr QLatin1String Mappings{"mappings"};
inline constexpr QLatin1String Applications{"applications"};
} // namespace JsonKeys

/**
 * @brief Payload keys carried in KeyboardMapping::parameters
 */
namespace ActionParams {
inline constexpr QLatin1String Name{"name"};
inline constexpr QLatin1String Monitor{"monitor"};
inline constexpr QLatin1String Direction{"direction"};
inline constexpr QLatin1String Amount{"amount"};
inline constexpr QLatin1String Command{"command"};
} // namespace ActionParams

} // namespace Tessera
