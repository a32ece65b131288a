// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowrule.h"
#include "applicationmatcher.h"
#include "constants.h"
#include "utils.h"
#include <KLocalizedString>

namespace Tessera {

using namespace JsonKeys;

QString placementModeToString(PlacementMode mode)
{
    switch (mode) {
    case PlacementMode::Fixed:
        return QStringLiteral("fixed");
    case PlacementMode::Floating:
        return QStringLiteral("floating");
    case PlacementMode::Fullscreen:
        return QStringLiteral("fullscreen");
    case PlacementMode::AutoTile:
    default:
        return QStringLiteral("auto-tile");
    }
}

std::optional<PlacementMode> placementModeFromString(const QString& str)
{
    if (str == QLatin1String("auto-tile")) {
        return PlacementMode::AutoTile;
    }
    if (str == QLatin1String("fixed")) {
        return PlacementMode::Fixed;
    }
    if (str == QLatin1String("floating")) {
        return PlacementMode::Floating;
    }
    if (str == QLatin1String("fullscreen")) {
        return PlacementMode::Fullscreen;
    }
    return std::nullopt;
}

QString focusPolicyToString(FocusPolicy policy)
{
    switch (policy) {
    case FocusPolicy::Never:
        return QStringLiteral("never");
    case FocusPolicy::OnSwitch:
        return QStringLiteral("on-switch");
    case FocusPolicy::OnCreate:
    default:
        return QStringLiteral("on-create");
    }
}

std::optional<FocusPolicy> focusPolicyFromString(const QString& str)
{
    if (str == QLatin1String("never")) {
        return FocusPolicy::Never;
    }
    if (str == QLatin1String("on-create")) {
        return FocusPolicy::OnCreate;
    }
    if (str == QLatin1String("on-switch")) {
        return FocusPolicy::OnSwitch;
    }
    return std::nullopt;
}

bool WindowRule::operator==(const WindowRule& other) const
{
    return id == other.id && workspaceId == other.workspaceId && applicationId == other.applicationId
        && applicationGlob == other.applicationGlob && titlePattern == other.titlePattern
        && placement == other.placement && fixedGeometry == other.fixedGeometry && priority == other.priority
        && focusPolicy == other.focusPolicy && enabled == other.enabled;
}

bool WindowRule::operator!=(const WindowRule& other) const
{
    return !(*this == other);
}

OperationResult WindowRule::validate() const
{
    if (id.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Window rule has no id"));
    }
    if (workspaceId.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Window rule has no owning workspace"));
    }
    if (applicationId.isEmpty() && applicationGlob.isEmpty() && titlePattern.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Window rule needs an application id, glob or title pattern"));
    }
    if (priority < 0) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Window rule priority must not be negative"));
    }
    if (placement == PlacementMode::Fixed && (!fixedGeometry.isValid() || fixedGeometry.isEmpty())) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Fixed placement requires a geometry"));
    }
    if (placement != PlacementMode::Fixed && fixedGeometry.isValid()) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Only fixed placement may carry a fixed geometry"));
    }

    QString error;
    if (!ApplicationMatcher::compile(applicationId, applicationGlob, titlePattern, &error)) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Invalid window rule pattern: %1", error));
    }
    return OperationResult::ok();
}

QJsonObject WindowRule::toJson() const
{
    QJsonObject json;
    json[Id] = id;
    json[WorkspaceId] = workspaceId;
    if (!applicationId.isEmpty()) {
        json[ApplicationId] = applicationId;
    }
    if (!applicationGlob.isEmpty()) {
        json[ApplicationGlob] = applicationGlob;
    }
    if (!titlePattern.isEmpty()) {
        json[TitlePattern] = titlePattern;
    }
    json[Placement] = placementModeToString(placement);
    if (fixedGeometry.isValid()) {
        json[FixedGeometry] = Utils::rectToJson(fixedGeometry);
    }
    json[Priority] = priority;
    json[FocusPolicyKey] = focusPolicyToString(focusPolicy);
    json[Enabled] = enabled;
    return json;
}

std::optional<WindowRule> WindowRule::fromJson(const QJsonObject& json)
{
    WindowRule rule;
    rule.id = json[Id].toString();
    rule.workspaceId = json[WorkspaceId].toString();
    rule.applicationId = json[ApplicationId].toString();
    rule.applicationGlob = json[ApplicationGlob].toString();
    rule.titlePattern = json[TitlePattern].toString();

    const auto placement = placementModeFromString(json[Placement].toString(QStringLiteral("auto-tile")));
    const auto focus = focusPolicyFromString(json[FocusPolicyKey].toString(QStringLiteral("on-create")));
    if (!placement || !focus) {
        return std::nullopt;
    }
    rule.placement = *placement;
    rule.focusPolicy = *focus;

    if (json.contains(FixedGeometry)) {
        rule.fixedGeometry = Utils::rectFromJson(json[FixedGeometry]);
    }
    rule.priority = json[Priority].toInt(0);
    rule.enabled = json[Enabled].toBool(true);
    return rule;
}

WindowRule WindowRule::create(const QString& workspaceId, const QString& applicationId, PlacementMode placement)
{
    WindowRule rule;
    rule.id = Utils::generateId();
    rule.workspaceId = workspaceId;
    rule.applicationId = applicationId;
    rule.placement = placement;
    return rule;
}

} // namespace Tessera
