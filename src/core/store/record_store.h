#pragma once

#include "core/features/feature_vector.h"
#include "core/shared/governance_types.h"

#include <QDateTime>
#include <QString>

#include <optional>
#include <vector>

namespace vd {

struct PredictionRecord {
    GovernanceResponse response;
    QString userId;
    QString sessionId;
    QDateTime createdAt;
    QDateTime expiresAt;
};

struct FeedbackRecord {
    FeedbackSubmission feedback;
    Decision loggedDecision = Decision::Monitor;
    QString modelVersion;
    QDateTime expiresAt;
};

struct CorrectionRecord {
    QString requestId;
    QString modelVersion;
    Decision originalDecision = Decision::Monitor;
    Decision correctedDecision = Decision::Monitor;
    FeedbackType feedbackType = FeedbackType::Incorrect;
    FeatureVector features;
    QString userId;
    QString rationale;
    QDateTime createdAt;
};

// Append/expire-only log of issued responses.
class PredictionLog {
public:
    virtual ~PredictionLog() = default;

    virtual bool appendPrediction(const PredictionRecord& record, QString* errorOut = nullptr) = 0;
    // Expired entries are never returned.
    virtual std::optional<PredictionRecord> findPrediction(const QString& requestId) = 0;
    virtual bool featureWindow(const QString& modelVersion,
                               const QDateTime& from,
                               const QDateTime& to,
                               int limit,
                               std::vector<FeatureArray>* out,
                               QString* errorOut = nullptr) = 0;
};

class FeedbackStore {
public:
    virtual ~FeedbackStore() = default;
    virtual bool appendFeedback(const FeedbackRecord& record, QString* errorOut = nullptr) = 0;
};

// Long-term record of label corrections, kept without expiry.
class CorrectionStore {
public:
    virtual ~CorrectionStore() = default;
    virtual bool appendCorrection(const CorrectionRecord& record, QString* errorOut = nullptr) = 0;
};

class DriftHistoryStore {
public:
    virtual ~DriftHistoryStore() = default;
    virtual bool appendDriftResult(const DriftDetectionResult& result, QString* errorOut = nullptr) = 0;
    // Newest first. Empty modelVersion matches every version.
    virtual std::vector<DriftDetectionResult> driftHistory(const QString& modelVersion, int limit) = 0;
};

} // namespace vd
