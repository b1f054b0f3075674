#include "core/shared/request_context.h"

#include <QJsonArray>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace vd {

namespace {

const QSet<QString>& recognisedKeys()
{
    static const QSet<QString> keys = {
        QStringLiteral("intent_class"),
        QStringLiteral("intent_confidence"),
        QStringLiteral("toxicity_score"),
        QStringLiteral("user_history_score"),
        QStringLiteral("policy_matches"),
        QStringLiteral("policy_denies"),
        QStringLiteral("policy_allows"),
        QStringLiteral("risk_level"),
        QStringLiteral("compliance_flags"),
        QStringLiteral("sensitivity_score"),
    };
    return keys;
}

std::optional<double> readNumber(const QJsonValue& value)
{
    double parsed = 0.0;
    if (value.isDouble()) {
        parsed = value.toDouble();
    } else if (value.isBool()) {
        parsed = value.toBool() ? 1.0 : 0.0;
    } else if (value.isString()) {
        bool ok = false;
        parsed = value.toString().trimmed().toDouble(&ok);
        if (!ok) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> readScore(const QJsonValue& value)
{
    const std::optional<double> number = readNumber(value);
    if (!number) {
        return std::nullopt;
    }
    return std::clamp(*number, 0.0, 1.0);
}

std::optional<int> readCount(const QJsonValue& value)
{
    if (value.isArray()) {
        return value.toArray().size();
    }
    const std::optional<double> number = readNumber(value);
    if (!number || *number < 0.0) {
        return std::nullopt;
    }
    return static_cast<int>(std::lround(std::min(*number, 1.0e6)));
}

} // namespace

RequestContext RequestContext::fromJson(const QJsonObject& obj)
{
    RequestContext ctx;

    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (!recognisedKeys().contains(it.key())) {
            ctx.ignoredKeys.append(it.key());
        }
    }

    auto markInvalid = [&ctx](const char* key) {
        ctx.invalidKeys.append(QString::fromLatin1(key));
    };

    if (obj.contains(QStringLiteral("intent_class"))) {
        ctx.intentClass = intentClassFromString(obj.value(QStringLiteral("intent_class")).toString());
        if (!ctx.intentClass) {
            markInvalid("intent_class");
        }
    }
    if (obj.contains(QStringLiteral("intent_confidence"))) {
        ctx.intentConfidence = readScore(obj.value(QStringLiteral("intent_confidence")));
        if (!ctx.intentConfidence) {
            markInvalid("intent_confidence");
        }
    }
    if (obj.contains(QStringLiteral("toxicity_score"))) {
        ctx.toxicityScore = readScore(obj.value(QStringLiteral("toxicity_score")));
        if (!ctx.toxicityScore) {
            markInvalid("toxicity_score");
        }
    }
    if (obj.contains(QStringLiteral("user_history_score"))) {
        if (const auto score = readScore(obj.value(QStringLiteral("user_history_score")))) {
            ctx.userHistoryScore = *score;
        } else {
            markInvalid("user_history_score");
        }
    }
    if (obj.contains(QStringLiteral("sensitivity_score"))) {
        if (const auto score = readScore(obj.value(QStringLiteral("sensitivity_score")))) {
            ctx.sensitivityScore = *score;
        } else {
            markInvalid("sensitivity_score");
        }
    }

    struct CountField {
        const char* key;
        int* target;
    };
    const CountField counts[] = {
        {"policy_matches", &ctx.policyMatches},
        {"policy_denies", &ctx.policyDenies},
        {"policy_allows", &ctx.policyAllows},
    };
    for (const CountField& field : counts) {
        const QString key = QString::fromLatin1(field.key);
        if (!obj.contains(key)) {
            continue;
        }
        if (const auto count = readCount(obj.value(key))) {
            *field.target = *count;
        } else {
            markInvalid(field.key);
        }
    }

    if (obj.contains(QStringLiteral("risk_level"))) {
        const QJsonValue raw = obj.value(QStringLiteral("risk_level"));
        if (const auto level = riskLevelFromString(raw.toString())) {
            ctx.riskLevel = *level;
        } else {
            markInvalid("risk_level");
        }
    }

    if (obj.contains(QStringLiteral("compliance_flags"))) {
        const QJsonValue raw = obj.value(QStringLiteral("compliance_flags"));
        if (raw.isArray()) {
            for (const QJsonValue& flag : raw.toArray()) {
                if (flag.isString() && !flag.toString().isEmpty()) {
                    ctx.complianceFlags.append(flag.toString());
                }
            }
            ctx.complianceFlagCount = raw.toArray().size();
        } else if (const auto count = readCount(raw)) {
            ctx.complianceFlagCount = *count;
        } else {
            markInvalid("compliance_flags");
        }
    }

    return ctx;
}

QJsonObject RequestContext::toJson() const
{
    QJsonObject obj;
    if (intentClass) {
        obj[QStringLiteral("intent_class")] = intentClassToString(*intentClass);
    }
    if (intentConfidence) {
        obj[QStringLiteral("intent_confidence")] = *intentConfidence;
    }
    if (toxicityScore) {
        obj[QStringLiteral("toxicity_score")] = *toxicityScore;
    }
    obj[QStringLiteral("user_history_score")] = userHistoryScore;
    obj[QStringLiteral("policy_matches")] = policyMatches;
    obj[QStringLiteral("policy_denies")] = policyDenies;
    obj[QStringLiteral("policy_allows")] = policyAllows;
    obj[QStringLiteral("risk_level")] = riskLevelToString(riskLevel);
    if (!complianceFlags.isEmpty()) {
        obj[QStringLiteral("compliance_flags")] = QJsonArray::fromStringList(complianceFlags);
    } else {
        obj[QStringLiteral("compliance_flags")] = complianceFlagCount;
    }
    obj[QStringLiteral("sensitivity_score")] = sensitivityScore;
    return obj;
}

} // namespace vd
