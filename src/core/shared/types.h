#pragma once

#include <QString>

#include <array>
#include <optional>

namespace vd {

// Governance outcome. Probability vectors are indexed in this order.
enum class Decision {
    Allow,
    Deny,
    Escalate,
    Monitor,
};

constexpr int kDecisionCount = 4;

QString decisionToString(Decision decision);
std::optional<Decision> decisionFromString(const QString& str);
Decision decisionFromIndex(int index);
int decisionIndex(Decision decision);

// Human-readable form used in reasoning text ("Allow", "Deny", ...)
QString decisionDisplayName(Decision decision);

enum class ModelType {
    RandomForest,
    OnlineLearner,
    Ensemble,
};

constexpr std::array<ModelType, 3> kAllModelTypes = {
    ModelType::RandomForest,
    ModelType::OnlineLearner,
    ModelType::Ensemble,
};

QString modelTypeToString(ModelType type);
std::optional<ModelType> modelTypeFromString(const QString& str);

enum class ModelStatus {
    Training,
    Candidate,
    Active,
    Failed,
    Retired,
};

QString modelStatusToString(ModelStatus status);
std::optional<ModelStatus> modelStatusFromString(const QString& str);

enum class FeedbackType {
    Correct,
    Incorrect,
    Escalated,
    Overridden,
};

constexpr int kFeedbackTypeCount = 4;

QString feedbackTypeToString(FeedbackType type);
std::optional<FeedbackType> feedbackTypeFromString(const QString& str);

enum class RiskLevel {
    Low,
    Medium,
    High,
};

QString riskLevelToString(RiskLevel level);
std::optional<RiskLevel> riskLevelFromString(const QString& str);

enum class IntentClass {
    Helpful,
    Harmful,
    Neutral,
};

QString intentClassToString(IntentClass intent);
std::optional<IntentClass> intentClassFromString(const QString& str);

enum class AbTestStatus {
    Active,
    Completed,
    Cancelled,
};

QString abTestStatusToString(AbTestStatus status);
std::optional<AbTestStatus> abTestStatusFromString(const QString& str);

enum class AbCohort {
    Champion,
    Candidate,
};

QString abCohortToString(AbCohort cohort);
std::optional<AbCohort> abCohortFromString(const QString& str);

enum class DriftSeverity {
    None,
    Low,
    Moderate,
    High,
    Critical,
};

QString driftSeverityToString(DriftSeverity severity);

} // namespace vd
