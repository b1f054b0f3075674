#include "core/features/feature_vector.h"

#include <algorithm>
#include <cmath>

namespace vd {

namespace {

double boolValue(bool value)
{
    return value ? 1.0 : 0.0;
}

bool readDouble(const QJsonObject& obj, const char* key, double* out)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (!value.isDouble()) {
        return false;
    }
    const double parsed = value.toDouble();
    if (!std::isfinite(parsed) || parsed < 0.0 || parsed > 1.0) {
        return false;
    }
    *out = parsed;
    return true;
}

bool readBool(const QJsonObject& obj, const char* key, bool* out)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (!value.isBool()) {
        return false;
    }
    *out = value.toBool();
    return true;
}

} // namespace

double clampUnit(double value)
{
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

double normalizeContentLength(int chars)
{
    const int clipped = std::clamp(chars, 0, kContentLengthCap);
    return static_cast<double>(clipped) / kContentLengthCap;
}

double normalizeCount(int count, int cap)
{
    if (cap <= 0) {
        return 0.0;
    }
    const int clipped = std::clamp(count, 0, cap);
    return static_cast<double>(clipped) / cap;
}

double normalizeHour(int hour)
{
    return static_cast<double>(std::clamp(hour, 0, 23)) / 23.0;
}

double normalizeDayOfWeek(int mondayBasedDay)
{
    return static_cast<double>(std::clamp(mondayBasedDay, 0, 6)) / 6.0;
}

double riskLevelValue(RiskLevel level)
{
    switch (level) {
    case RiskLevel::Low:    return 0.0;
    case RiskLevel::Medium: return 0.5;
    case RiskLevel::High:   return 1.0;
    }
    return 0.5;
}

FeatureArray FeatureVector::toArray() const
{
    return FeatureArray{
        intentConfidence,
        boolValue(intentIsHelpful),
        boolValue(intentIsHarmful),
        contentLength,
        boolValue(contentHasUrls),
        boolValue(contentHasEmail),
        boolValue(contentHasCode),
        contentToxicityScore,
        userHistoryScore,
        timeOfDay,
        dayOfWeek,
        boolValue(isBusinessHours),
        policyMatchCount,
        policyDenyCount,
        policyAllowCount,
        riskLevel,
        complianceFlags,
        sensitivityScore,
    };
}

FeatureVector FeatureVector::fromArray(const FeatureArray& values)
{
    FeatureVector fv;
    fv.intentConfidence = clampUnit(values[0]);
    fv.intentIsHelpful = values[1] >= 0.5;
    fv.intentIsHarmful = values[2] >= 0.5;
    fv.intentClass = fv.intentIsHarmful ? IntentClass::Harmful
                   : fv.intentIsHelpful ? IntentClass::Helpful
                                        : IntentClass::Neutral;
    fv.contentLength = clampUnit(values[3]);
    fv.contentHasUrls = values[4] >= 0.5;
    fv.contentHasEmail = values[5] >= 0.5;
    fv.contentHasCode = values[6] >= 0.5;
    fv.contentToxicityScore = clampUnit(values[7]);
    fv.userHistoryScore = clampUnit(values[8]);
    fv.timeOfDay = clampUnit(values[9]);
    fv.dayOfWeek = clampUnit(values[10]);
    fv.isBusinessHours = values[11] >= 0.5;
    fv.policyMatchCount = clampUnit(values[12]);
    fv.policyDenyCount = clampUnit(values[13]);
    fv.policyAllowCount = clampUnit(values[14]);
    fv.riskLevel = clampUnit(values[15]);
    fv.complianceFlags = clampUnit(values[16]);
    fv.sensitivityScore = clampUnit(values[17]);
    return fv;
}

QJsonObject FeatureVector::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("intent_confidence")] = intentConfidence;
    obj[QStringLiteral("intent_class")] = intentClassToString(intentClass);
    obj[QStringLiteral("intent_is_helpful")] = intentIsHelpful;
    obj[QStringLiteral("intent_is_harmful")] = intentIsHarmful;
    obj[QStringLiteral("content_length")] = contentLength;
    obj[QStringLiteral("content_has_urls")] = contentHasUrls;
    obj[QStringLiteral("content_has_email")] = contentHasEmail;
    obj[QStringLiteral("content_has_code")] = contentHasCode;
    obj[QStringLiteral("content_toxicity_score")] = contentToxicityScore;
    obj[QStringLiteral("user_history_score")] = userHistoryScore;
    obj[QStringLiteral("time_of_day")] = timeOfDay;
    obj[QStringLiteral("day_of_week")] = dayOfWeek;
    obj[QStringLiteral("is_business_hours")] = isBusinessHours;
    obj[QStringLiteral("policy_match_count")] = policyMatchCount;
    obj[QStringLiteral("policy_deny_count")] = policyDenyCount;
    obj[QStringLiteral("policy_allow_count")] = policyAllowCount;
    obj[QStringLiteral("risk_level")] = riskLevel;
    obj[QStringLiteral("compliance_flags")] = complianceFlags;
    obj[QStringLiteral("sensitivity_score")] = sensitivityScore;
    return obj;
}

std::optional<FeatureVector> FeatureVector::fromJson(const QJsonObject& obj)
{
    FeatureVector fv;
    const std::optional<IntentClass> intent =
        intentClassFromString(obj.value(QStringLiteral("intent_class")).toString());
    if (!intent) {
        return std::nullopt;
    }
    fv.intentClass = *intent;

    const bool ok =
        readDouble(obj, "intent_confidence", &fv.intentConfidence)
        && readBool(obj, "intent_is_helpful", &fv.intentIsHelpful)
        && readBool(obj, "intent_is_harmful", &fv.intentIsHarmful)
        && readDouble(obj, "content_length", &fv.contentLength)
        && readBool(obj, "content_has_urls", &fv.contentHasUrls)
        && readBool(obj, "content_has_email", &fv.contentHasEmail)
        && readBool(obj, "content_has_code", &fv.contentHasCode)
        && readDouble(obj, "content_toxicity_score", &fv.contentToxicityScore)
        && readDouble(obj, "user_history_score", &fv.userHistoryScore)
        && readDouble(obj, "time_of_day", &fv.timeOfDay)
        && readDouble(obj, "day_of_week", &fv.dayOfWeek)
        && readBool(obj, "is_business_hours", &fv.isBusinessHours)
        && readDouble(obj, "policy_match_count", &fv.policyMatchCount)
        && readDouble(obj, "policy_deny_count", &fv.policyDenyCount)
        && readDouble(obj, "policy_allow_count", &fv.policyAllowCount)
        && readDouble(obj, "risk_level", &fv.riskLevel)
        && readDouble(obj, "compliance_flags", &fv.complianceFlags)
        && readDouble(obj, "sensitivity_score", &fv.sensitivityScore);
    if (!ok) {
        return std::nullopt;
    }
    return fv;
}

const QStringList& FeatureVector::arrayFeatureNames()
{
    static const QStringList names = {
        QStringLiteral("intent_confidence"),
        QStringLiteral("intent_is_helpful"),
        QStringLiteral("intent_is_harmful"),
        QStringLiteral("content_length"),
        QStringLiteral("content_has_urls"),
        QStringLiteral("content_has_email"),
        QStringLiteral("content_has_code"),
        QStringLiteral("content_toxicity_score"),
        QStringLiteral("user_history_score"),
        QStringLiteral("time_of_day"),
        QStringLiteral("day_of_week"),
        QStringLiteral("is_business_hours"),
        QStringLiteral("policy_match_count"),
        QStringLiteral("policy_deny_count"),
        QStringLiteral("policy_allow_count"),
        QStringLiteral("risk_level"),
        QStringLiteral("compliance_flags"),
        QStringLiteral("sensitivity_score"),
    };
    return names;
}

} // namespace vd
