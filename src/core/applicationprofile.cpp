// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "applicationprofile.h"
#include "applicationmatcher.h"
#include "constants.h"
#include "utils.h"
#include <KLocalizedString>
#include <QJsonArray>

namespace Tessera {

using namespace JsonKeys;

QString compatibilityLevelToString(CompatibilityLevel level)
{
    switch (level) {
    case CompatibilityLevel::Good:
        return QStringLiteral("good");
    case CompatibilityLevel::Limited:
        return QStringLiteral("limited");
    case CompatibilityLevel::Poor:
        return QStringLiteral("poor");
    case CompatibilityLevel::Incompatible:
        return QStringLiteral("incompatible");
    case CompatibilityLevel::Full:
    default:
        return QStringLiteral("full");
    }
}

std::optional<CompatibilityLevel> compatibilityLevelFromString(const QString& str)
{
    if (str == QLatin1String("full")) {
        return CompatibilityLevel::Full;
    }
    if (str == QLatin1String("good")) {
        return CompatibilityLevel::Good;
    }
    if (str == QLatin1String("limited")) {
        return CompatibilityLevel::Limited;
    }
    if (str == QLatin1String("poor")) {
        return CompatibilityLevel::Poor;
    }
    if (str == QLatin1String("incompatible")) {
        return CompatibilityLevel::Incompatible;
    }
    return std::nullopt;
}

QString focusStealingToString(FocusStealing behavior)
{
    switch (behavior) {
    case FocusStealing::Aggressive:
        return QStringLiteral("aggressive");
    case FocusStealing::Passive:
        return QStringLiteral("passive");
    case FocusStealing::NewWindowsOnly:
        return QStringLiteral("new-windows-only");
    case FocusStealing::Normal:
    default:
        return QStringLiteral("normal");
    }
}

std::optional<FocusStealing> focusStealingFromString(const QString& str)
{
    if (str == QLatin1String("normal")) {
        return FocusStealing::Normal;
    }
    if (str == QLatin1String("aggressive")) {
        return FocusStealing::Aggressive;
    }
    if (str == QLatin1String("passive")) {
        return FocusStealing::Passive;
    }
    if (str == QLatin1String("new-windows-only")) {
        return FocusStealing::NewWindowsOnly;
    }
    return std::nullopt;
}

bool ApplicationProfile::operator==(const ApplicationProfile& other) const
{
    return id == other.id && bundleId == other.bundleId && displayName == other.displayName
        && defaultPlacement == other.defaultPlacement && preferredPatterns == other.preferredPatterns
        && compatibility == other.compatibility && compatibilityNotes == other.compatibilityNotes
        && detectionPattern == other.detectionPattern && focusStealing == other.focusStealing;
}

bool ApplicationProfile::operator!=(const ApplicationProfile& other) const
{
    return !(*this == other);
}

OperationResult ApplicationProfile::validate() const
{
    if (id.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Application profile has no id"));
    }
    if (bundleId.trimmed().isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Application profile needs a bundle id"));
    }
    if (defaultPlacement == PlacementMode::Fixed) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Application profiles cannot default to fixed placement"));
    }

    QString error;
    if (!ApplicationMatcher::compile(bundleId, QString(), detectionPattern, &error)) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Invalid detection pattern: %1", error));
    }
    return OperationResult::ok();
}

QJsonObject ApplicationProfile::toJson() const
{
    QJsonObject json;
    json[Id] = id;
    json[BundleId] = bundleId;
    json[DisplayName] = displayName;
    json[DefaultPlacement] = placementModeToString(defaultPlacement);
    json[PreferredPatterns] = QJsonArray::fromStringList(preferredPatterns);
    json[Compatibility] = compatibilityLevelToString(compatibility);
    if (!compatibilityNotes.isEmpty()) {
        json[CompatibilityNotes] = compatibilityNotes;
    }
    if (!detectionPattern.isEmpty()) {
        json[DetectionPattern] = detectionPattern;
    }
    json[FocusStealingKey] = focusStealingToString(focusStealing);
    return json;
}

std::optional<ApplicationProfile> ApplicationProfile::fromJson(const QJsonObject& json)
{
    const auto placement = placementModeFromString(json[DefaultPlacement].toString(QStringLiteral("auto-tile")));
    const auto compatibility = compatibilityLevelFromString(json[Compatibility].toString(QStringLiteral("full")));
    const auto focusStealing = focusStealingFromString(json[FocusStealingKey].toString(QStringLiteral("normal")));
    if (!placement || !compatibility || !focusStealing) {
        return std::nullopt;
    }

    ApplicationProfile profile;
    profile.id = json[Id].toString();
    profile.bundleId = json[BundleId].toString();
    profile.displayName = json[DisplayName].toString();
    profile.defaultPlacement = *placement;
    for (const QJsonValue& value : json[PreferredPatterns].toArray()) {
        profile.preferredPatterns.append(value.toString());
    }
    profile.compatibility = *compatibility;
    profile.compatibilityNotes = json[CompatibilityNotes].toString();
    profile.detectionPattern = json[DetectionPattern].toString();
    profile.focusStealing = *focusStealing;
    return profile;
}

ApplicationProfile ApplicationProfile::create(const QString& bundleId, PlacementMode defaultPlacement)
{
    ApplicationProfile profile;
    profile.id = Utils::generateId();
    profile.bundleId = bundleId;
    profile.displayName = bundleId;
    profile.defaultPlacement = defaultPlacement;
    return profile;
}

} // namespace Tessera
