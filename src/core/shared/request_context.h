#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QStringList>

#include <optional>

namespace vd {

// Typed view of the caller-supplied request context. Recognised keys are
// parsed with explicit defaults; anything else is recorded in ignoredKeys and
// otherwise has no effect on the decision.
struct RequestContext {
    std::optional<IntentClass> intentClass;
    std::optional<double> intentConfidence;
    std::optional<double> toxicityScore;
    double userHistoryScore = 0.5;
    int policyMatches = 0;
    int policyDenies = 0;
    int policyAllows = 0;
    RiskLevel riskLevel = RiskLevel::Medium;
    QStringList complianceFlags;
    int complianceFlagCount = 0;
    double sensitivityScore = 0.0;

    QStringList ignoredKeys;
    QStringList invalidKeys;

    static RequestContext fromJson(const QJsonObject& obj);
    QJsonObject toJson() const;
};

} // namespace vd
