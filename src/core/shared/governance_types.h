#pragma once

#include "core/features/feature_vector.h"
#include "core/shared/request_context.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace vd {

struct GovernanceRequest {
    QString requestId;
    QString content;
    RequestContext context;
    QString userId;
    QString sessionId;
    QDateTime timestamp;
};

struct AbAssignment {
    QString testId;
    AbCohort cohort = AbCohort::Champion;
};

struct GovernanceResponse {
    QString requestId;
    Decision decision = Decision::Monitor;
    double confidence = 0.5;
    QString reasoning;
    QString modelVersion;
    FeatureVector features;
    double processingTimeMs = 0.0;
    QDateTime timestamp;
    std::optional<AbAssignment> abTest;
    bool fallbackUsed = false;
    QString fallbackReason;

    QJsonObject toJson() const;
    static std::optional<GovernanceResponse> fromJson(const QJsonObject& obj);
};

struct FeedbackSubmission {
    QString requestId;
    QString userId;
    FeedbackType feedbackType = FeedbackType::Incorrect;
    std::optional<Decision> correctDecision;
    QString rationale;
    QString severity = QStringLiteral("medium");
    QJsonObject metadata;
    QDateTime submittedAt;

    QJsonObject toJson() const;
};

struct ModelVersion {
    QString versionId;
    ModelType modelType = ModelType::RandomForest;
    ModelStatus status = ModelStatus::Training;
    double accuracy = 0.0;
    double precision = 0.0;
    double recall = 0.0;
    double f1Score = 0.0;
    int trainingSamples = 0;
    int validationSamples = 0;
    QDateTime createdAt;
    QDateTime deployedAt;
    QDateTime retiredAt;
    QJsonObject metadata;

    QJsonObject toJson() const;
    static std::optional<ModelVersion> fromJson(const QJsonObject& obj);
};

struct CohortMetrics {
    qint64 requests = 0;
    qint64 errors = 0;
    double totalLatencyMs = 0.0;
    double minLatencyMs = 0.0;
    double maxLatencyMs = 0.0;
    qint64 outcomes = 0;
    qint64 correctOutcomes = 0;

    void recordRequest(double latencyMs, bool error);
    void recordOutcome(bool correct);
    double accuracy() const;
    double averageLatencyMs() const;
    double errorRate() const;
    QJsonObject toJson() const;
};

struct ABTest {
    QString testId;
    QString championVersion;
    QString candidateVersion;
    ModelType modelType = ModelType::RandomForest;
    double trafficSplit = 0.1;
    AbTestStatus status = AbTestStatus::Active;
    QDateTime startedAt;
    QDateTime endedAt;
    CohortMetrics championMetrics;
    CohortMetrics candidateMetrics;

    QJsonObject toJson() const;
};

struct DriftDetectionResult {
    QString checkId;
    QString modelVersion;
    bool driftDetected = false;
    double driftScore = 0.0;
    double threshold = 0.1;
    QStringList affectedFeatures;
    DriftSeverity severity = DriftSeverity::None;
    int referenceSamples = 0;
    int currentSamples = 0;
    QDateTime timestamp;
    QJsonObject details;

    QJsonObject toJson() const;
    static std::optional<DriftDetectionResult> fromJson(const QJsonObject& obj);
};

} // namespace vd
