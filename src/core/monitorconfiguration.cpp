// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "monitorconfiguration.h"
#include "constants.h"
#include "logging.h"
#include "utils.h"
#include <KLocalizedString>
#include <QtMath>

namespace Tessera {

using namespace JsonKeys;

QString orientationToString(Orientation orientation)
{
    switch (orientation) {
    case Orientation::Landscape:
        return QStringLiteral("landscape");
    case Orientation::Portrait:
        return QStringLiteral("portrait");
    case Orientation::Current:
    default:
        return QStringLiteral("current");
    }
}

std::optional<Orientation> orientationFromString(const QString& str)
{
    if (str == QLatin1String("current")) {
        return Orientation::Current;
    }
    if (str == QLatin1String("landscape")) {
        return Orientation::Landscape;
    }
    if (str == QLatin1String("portrait")) {
        return Orientation::Portrait;
    }
    return std::nullopt;
}

bool MonitorConfiguration::operator==(const MonitorConfiguration& other) const
{
    return id == other.id && workspaceId == other.workspaceId && monitorId == other.monitorId
        && primaryPatternId == other.primaryPatternId && secondaryPatternId == other.secondaryPatternId
        && maxPrimaryWindows == other.maxPrimaryWindows && usableArea == other.usableArea
        && orientation == other.orientation && qFuzzyCompare(scaleFactor, other.scaleFactor);
}

bool MonitorConfiguration::operator!=(const MonitorConfiguration& other) const
{
    return !(*this == other);
}

OperationResult MonitorConfiguration::validate() const
{
    if (id.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Monitor configuration has no id"));
    }
    if (workspaceId.isEmpty() || monitorId.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Monitor configuration needs a workspace and a monitor"));
    }
    if (primaryPatternId.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Monitor configuration needs a primary pattern"));
    }
    if (maxPrimaryWindows < 0) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Primary window capacity must not be negative"));
    }
    if (maxPrimaryWindows > 0 && secondaryPatternId.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("A primary window capacity requires a secondary pattern"));
    }
    if (!(scaleFactor > 0.0)) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Scale factor must be positive"));
    }
    if (usableArea.isValid() && usableArea.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Usable area must not be empty"));
    }
    return OperationResult::ok();
}

QJsonObject MonitorConfiguration::toJson() const
{
    QJsonObject json;
    json[Id] = id;
    json[WorkspaceId] = workspaceId;
    json[MonitorId] = monitorId;
    json[PrimaryPatternId] = primaryPatternId;
    if (!secondaryPatternId.isEmpty()) {
        json[SecondaryPatternId] = secondaryPatternId;
    }
    json[MaxPrimaryWindows] = maxPrimaryWindows;
    if (usableArea.isValid()) {
        json[UsableArea] = Utils::rectToJson(usableArea);
    }
    json[OrientationKey] = orientationToString(orientation);
    json[ScaleFactor] = scaleFactor;
    return json;
}

std::optional<MonitorConfiguration> MonitorConfiguration::fromJson(const QJsonObject& json)
{
    MonitorConfiguration config;
    config.id = json[Id].toString();
    config.workspaceId = json[WorkspaceId].toString();
    config.monitorId = json[MonitorId].toString();
    config.primaryPatternId = json[PrimaryPatternId].toString();
    config.secondaryPatternId = json[SecondaryPatternId].toString();
    config.maxPrimaryWindows = json[MaxPrimaryWindows].toInt(0);
    if (json.contains(UsableArea)) {
        config.usableArea = Utils::rectFromJson(json[UsableArea]);
    }

    const auto orientation = orientationFromString(json[OrientationKey].toString(QStringLiteral("current")));
    if (!orientation) {
        return std::nullopt;
    }
    config.orientation = *orientation;
    config.scaleFactor = json[ScaleFactor].toDouble(1.0);
    return config;
}

MonitorConfiguration MonitorConfiguration::create(const QString& workspaceId, const QString& monitorId,
                                                  const QString& primaryPatternId)
{
    MonitorConfiguration config;
    config.id = Utils::generateId();
    config.workspaceId = workspaceId;
    config.monitorId = monitorId;
    config.primaryPatternId = primaryPatternId;
    return config;
}

QString MonitorConfiguration::patternFor(int windowCount) const
{
    if (maxPrimaryWindows > 0 && windowCount > maxPrimaryWindows && !secondaryPatternId.isEmpty()) {
        return secondaryPatternId;
    }
    return primaryPatternId;
}

QRect MonitorConfiguration::effectiveUsableArea(const MonitorSnapshot& monitor) const
{
    if (!usableArea.isValid()) {
        return monitor.usableArea();
    }
    if (!monitor.geometry.contains(usableArea)) {
        qCWarning(lcCore) << "Usable area" << usableArea << "of monitor configuration" << id
                          << "exceeds monitor bounds" << monitor.geometry << "- clipping";
    }
    return usableArea.intersected(monitor.geometry);
}

} // namespace Tessera
