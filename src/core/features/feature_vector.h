#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QStringList>

#include <array>
#include <optional>

namespace vd {

constexpr int kFeatureDim = 18;
constexpr int kContentLengthCap = 2000;
constexpr int kPolicyCountCap = 10;
constexpr int kComplianceFlagCap = 5;

using FeatureArray = std::array<double, kFeatureDim>;

// Normalised feature record for one request. Every numeric field is already
// scaled into [0,1]; intentClass is carried alongside its one-hot encoding
// and does not occupy its own slot in the model array.
struct FeatureVector {
    double intentConfidence = 0.5;
    IntentClass intentClass = IntentClass::Neutral;
    bool intentIsHelpful = false;
    bool intentIsHarmful = false;
    double contentLength = 0.0;
    bool contentHasUrls = false;
    bool contentHasEmail = false;
    bool contentHasCode = false;
    double contentToxicityScore = 0.0;
    double userHistoryScore = 0.5;
    double timeOfDay = 0.0;
    double dayOfWeek = 0.0;
    bool isBusinessHours = false;
    double policyMatchCount = 0.0;
    double policyDenyCount = 0.0;
    double policyAllowCount = 0.0;
    double riskLevel = 0.5;
    double complianceFlags = 0.0;
    double sensitivityScore = 0.0;

    FeatureArray toArray() const;
    static FeatureVector fromArray(const FeatureArray& values);

    QJsonObject toJson() const;
    static std::optional<FeatureVector> fromJson(const QJsonObject& obj);

    // Names of the model array slots, in array order.
    static const QStringList& arrayFeatureNames();
};

double normalizeContentLength(int chars);
double normalizeCount(int count, int cap);
double normalizeHour(int hour);
double normalizeDayOfWeek(int mondayBasedDay);
double riskLevelValue(RiskLevel level);
double clampUnit(double value);

} // namespace vd
