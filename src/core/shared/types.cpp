#include "core/shared/types.h"

namespace vd {

QString decisionToString(Decision decision)
{
    switch (decision) {
    case Decision::Allow:    return QStringLiteral("ALLOW");
    case Decision::Deny:     return QStringLiteral("DENY");
    case Decision::Escalate: return QStringLiteral("ESCALATE");
    case Decision::Monitor:  return QStringLiteral("MONITOR");
    }
    return QStringLiteral("MONITOR");
}

std::optional<Decision> decisionFromString(const QString& str)
{
    const QString upper = str.trimmed().toUpper();
    if (upper == QLatin1String("ALLOW"))    return Decision::Allow;
    if (upper == QLatin1String("DENY"))     return Decision::Deny;
    if (upper == QLatin1String("ESCALATE")) return Decision::Escalate;
    if (upper == QLatin1String("MONITOR"))  return Decision::Monitor;
    return std::nullopt;
}

Decision decisionFromIndex(int index)
{
    switch (index) {
    case 0: return Decision::Allow;
    case 1: return Decision::Deny;
    case 2: return Decision::Escalate;
    default: return Decision::Monitor;
    }
}

int decisionIndex(Decision decision)
{
    switch (decision) {
    case Decision::Allow:    return 0;
    case Decision::Deny:     return 1;
    case Decision::Escalate: return 2;
    case Decision::Monitor:  return 3;
    }
    return 3;
}

QString decisionDisplayName(Decision decision)
{
    switch (decision) {
    case Decision::Allow:    return QStringLiteral("Allow");
    case Decision::Deny:     return QStringLiteral("Deny");
    case Decision::Escalate: return QStringLiteral("Escalate");
    case Decision::Monitor:  return QStringLiteral("Monitor");
    }
    return QStringLiteral("Monitor");
}

QString modelTypeToString(ModelType type)
{
    switch (type) {
    case ModelType::RandomForest:  return QStringLiteral("random_forest");
    case ModelType::OnlineLearner: return QStringLiteral("online_learner");
    case ModelType::Ensemble:      return QStringLiteral("ensemble");
    }
    return QStringLiteral("random_forest");
}

std::optional<ModelType> modelTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("random_forest"))  return ModelType::RandomForest;
    if (lower == QLatin1String("online_learner")) return ModelType::OnlineLearner;
    if (lower == QLatin1String("ensemble"))       return ModelType::Ensemble;
    return std::nullopt;
}

QString modelStatusToString(ModelStatus status)
{
    switch (status) {
    case ModelStatus::Training:  return QStringLiteral("training");
    case ModelStatus::Candidate: return QStringLiteral("candidate");
    case ModelStatus::Active:    return QStringLiteral("active");
    case ModelStatus::Failed:    return QStringLiteral("failed");
    case ModelStatus::Retired:   return QStringLiteral("retired");
    }
    return QStringLiteral("failed");
}

std::optional<ModelStatus> modelStatusFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("training"))  return ModelStatus::Training;
    if (lower == QLatin1String("candidate")) return ModelStatus::Candidate;
    if (lower == QLatin1String("active"))    return ModelStatus::Active;
    if (lower == QLatin1String("failed"))    return ModelStatus::Failed;
    if (lower == QLatin1String("retired"))   return ModelStatus::Retired;
    return std::nullopt;
}

QString feedbackTypeToString(FeedbackType type)
{
    switch (type) {
    case FeedbackType::Correct:    return QStringLiteral("correct");
    case FeedbackType::Incorrect:  return QStringLiteral("incorrect");
    case FeedbackType::Escalated:  return QStringLiteral("escalated");
    case FeedbackType::Overridden: return QStringLiteral("overridden");
    }
    return QStringLiteral("incorrect");
}

std::optional<FeedbackType> feedbackTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("correct"))    return FeedbackType::Correct;
    if (lower == QLatin1String("incorrect"))  return FeedbackType::Incorrect;
    if (lower == QLatin1String("escalated"))  return FeedbackType::Escalated;
    if (lower == QLatin1String("overridden")) return FeedbackType::Overridden;
    return std::nullopt;
}

QString riskLevelToString(RiskLevel level)
{
    switch (level) {
    case RiskLevel::Low:    return QStringLiteral("low");
    case RiskLevel::Medium: return QStringLiteral("medium");
    case RiskLevel::High:   return QStringLiteral("high");
    }
    return QStringLiteral("medium");
}

std::optional<RiskLevel> riskLevelFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("low"))    return RiskLevel::Low;
    if (lower == QLatin1String("medium")) return RiskLevel::Medium;
    if (lower == QLatin1String("high"))   return RiskLevel::High;
    return std::nullopt;
}

QString intentClassToString(IntentClass intent)
{
    switch (intent) {
    case IntentClass::Helpful: return QStringLiteral("helpful");
    case IntentClass::Harmful: return QStringLiteral("harmful");
    case IntentClass::Neutral: return QStringLiteral("neutral");
    }
    return QStringLiteral("neutral");
}

std::optional<IntentClass> intentClassFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("helpful")) return IntentClass::Helpful;
    if (lower == QLatin1String("harmful")) return IntentClass::Harmful;
    if (lower == QLatin1String("neutral")) return IntentClass::Neutral;
    return std::nullopt;
}

QString abTestStatusToString(AbTestStatus status)
{
    switch (status) {
    case AbTestStatus::Active:    return QStringLiteral("active");
    case AbTestStatus::Completed: return QStringLiteral("completed");
    case AbTestStatus::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("cancelled");
}

std::optional<AbTestStatus> abTestStatusFromString(const QString& str)
{
    if (str == QLatin1String("active"))    return AbTestStatus::Active;
    if (str == QLatin1String("completed")) return AbTestStatus::Completed;
    if (str == QLatin1String("cancelled")) return AbTestStatus::Cancelled;
    return std::nullopt;
}

QString abCohortToString(AbCohort cohort)
{
    switch (cohort) {
    case AbCohort::Champion:  return QStringLiteral("champion");
    case AbCohort::Candidate: return QStringLiteral("candidate");
    }
    return QStringLiteral("champion");
}

std::optional<AbCohort> abCohortFromString(const QString& str)
{
    if (str == QLatin1String("champion"))  return AbCohort::Champion;
    if (str == QLatin1String("candidate")) return AbCohort::Candidate;
    return std::nullopt;
}

QString driftSeverityToString(DriftSeverity severity)
{
    switch (severity) {
    case DriftSeverity::None:     return QStringLiteral("none");
    case DriftSeverity::Low:      return QStringLiteral("low");
    case DriftSeverity::Moderate: return QStringLiteral("moderate");
    case DriftSeverity::High:     return QStringLiteral("high");
    case DriftSeverity::Critical: return QStringLiteral("critical");
    }
    return QStringLiteral("none");
}

} // namespace vd
