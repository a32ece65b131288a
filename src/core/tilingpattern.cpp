// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tilingpattern.h"
#include "utils.h"
#include <KLocalizedString>
#include <QtMath>

namespace Tessera {

using namespace JsonKeys;

namespace {
constexpr QLatin1String ShrinkToFitTag{"shrink-to-fit"};
constexpr QLatin1String StackExcessTag{"stack-excess"};
constexpr QLatin1String AllowOverflowTag{"allow-overflow"};
} // anonymous namespace

QString overflowPolicyToString(OverflowPolicy policy)
{
    switch (policy) {
    case OverflowPolicy::StackExcess:
        return StackExcessTag;
    case OverflowPolicy::AllowOverflow:
        return AllowOverflowTag;
    case OverflowPolicy::ShrinkToFit:
    default:
        return ShrinkToFitTag;
    }
}

std::optional<OverflowPolicy> overflowPolicyFromString(const QString& str)
{
    if (str == ShrinkToFitTag) {
        return OverflowPolicy::ShrinkToFit;
    }
    if (str == StackExcessTag) {
        return OverflowPolicy::StackExcess;
    }
    if (str == AllowOverflowTag) {
        return OverflowPolicy::AllowOverflow;
    }
    return std::nullopt;
}

bool TilingPattern::operator==(const TilingPattern& other) const
{
    return id == other.id && name == other.name && algorithm == other.algorithm
        && qFuzzyCompare(1.0 + mainAreaRatio, 1.0 + other.mainAreaRatio) && gapSize == other.gapSize
        && windowMargin == other.windowMargin && maxWindows == other.maxWindows
        && overflowPolicy == other.overflowPolicy;
}

bool TilingPattern::operator!=(const TilingPattern& other) const
{
    return !(*this == other);
}

OperationResult TilingPattern::validate() const
{
    if (id.isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Tiling pattern has no id"));
    }
    if (name.trimmed().isEmpty()) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Tiling pattern name must not be empty"));
    }
    if (!isKnownAlgorithm(algorithm)) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Unknown layout algorithm: %1", algorithm));
    }
    // Compare with a small tolerance so 0.1 and 0.9 typed by hand stay valid
    if (mainAreaRatio < Defaults::MinMainAreaRatio - 1e-9 || mainAreaRatio > Defaults::MaxMainAreaRatio + 1e-9) {
        return OperationResult::failure(ErrorKind::Validation,
                                        i18n("Main area ratio %1 is outside 0.1 to 0.9", mainAreaRatio));
    }
    if (gapSize < 0) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Gap size must not be negative"));
    }
    if (windowMargin < 0) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Window margin must not be negative"));
    }
    if (maxWindows <= 0) {
        return OperationResult::failure(ErrorKind::Validation, i18n("Maximum window count must be positive"));
    }
    return OperationResult::ok();
}

QJsonObject TilingPattern::toJson() const
{
    QJsonObject json;
    json[Id] = id;
    json[Name] = name;
    json[Algorithm] = algorithm;
    json[MainAreaRatio] = mainAreaRatio;
    json[GapSize] = gapSize;
    json[WindowMargin] = windowMargin;
    json[MaxWindows] = maxWindows;
    json[OverflowPolicyKey] = overflowPolicyToString(overflowPolicy);
    return json;
}

std::optional<TilingPattern> TilingPattern::fromJson(const QJsonObject& json)
{
    TilingPattern pattern;
    pattern.id = json[Id].toString();
    pattern.name = json[Name].toString();
    pattern.algorithm = json[Algorithm].toString(pattern.algorithm);
    pattern.mainAreaRatio = json[MainAreaRatio].toDouble(pattern.mainAreaRatio);
    pattern.gapSize = json[GapSize].toInt(pattern.gapSize);
    pattern.windowMargin = json[WindowMargin].toInt(pattern.windowMargin);
    pattern.maxWindows = json[MaxWindows].toInt(pattern.maxWindows);

    if (json.contains(OverflowPolicyKey)) {
        const auto policy = overflowPolicyFromString(json[OverflowPolicyKey].toString());
        if (!policy) {
            return std::nullopt;
        }
        pattern.overflowPolicy = *policy;
    }
    return pattern;
}

TilingPattern TilingPattern::create(const QString& name, const QString& algorithm)
{
    TilingPattern pattern;
    pattern.id = Utils::generateId();
    pattern.name = name;
    pattern.algorithm = algorithm;
    return pattern;
}

bool TilingPattern::isKnownAlgorithm(const QString& tag)
{
    return tag == AlgorithmId::PrimaryStack || tag == AlgorithmId::Grid || tag == AlgorithmId::Columns
        || tag == AlgorithmId::Custom;
}

} // namespace Tessera
