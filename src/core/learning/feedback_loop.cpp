#include "core/learning/feedback_loop.h"
#include "core/models/evaluation.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <exception>

namespace vd {

namespace {

size_t typeSlot(ModelType type)
{
    for (size_t i = 0; i < kAllModelTypes.size(); ++i) {
        if (kAllModelTypes[i] == type) {
            return i;
        }
    }
    return 0;
}

} // namespace

double LearnerStatus::prequentialAccuracy() const
{
    if (prequentialTotal <= 0) {
        return 0.0;
    }
    return static_cast<double>(prequentialCorrect) / static_cast<double>(prequentialTotal);
}

QJsonObject LearnerStatus::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("model_version")] = versionId;
    obj[QStringLiteral("samples_learned")] = samplesLearned;
    obj[QStringLiteral("prequential_samples")] = prequentialTotal;
    obj[QStringLiteral("prequential_accuracy")] = prequentialAccuracy();
    obj[QStringLiteral("status")] = status;
    obj[QStringLiteral("last_update")] = lastUpdate.isValid()
        ? QJsonValue(lastUpdate.toString(Qt::ISODateWithMs))
        : QJsonValue();
    return obj;
}

FeedbackLoop::FeedbackLoop(ModelRegistry* registry,
                           PredictionLog* predictionLog,
                           FeedbackStore* feedbackStore,
                           CorrectionStore* correctionStore,
                           const AsyncLogWriter* pendingWrites,
                           EngineMetrics* metrics,
                           const Config& config)
    : m_registry(registry)
    , m_predictionLog(predictionLog)
    , m_feedbackStore(feedbackStore)
    , m_correctionStore(correctionStore)
    , m_pendingWrites(pendingWrites)
    , m_metrics(metrics)
    , m_config(config)
{
}

// ── Submission ──────────────────────────────────────────────

bool FeedbackLoop::submit(const FeedbackSubmission& feedback)
{
    const std::optional<PredictionRecord> logged = lookup(feedback.requestId);
    if (!logged) {
        LOG_WARN(vdLearning, "FeedbackLoop: no logged prediction for %s",
                 qUtf8Printable(feedback.requestId));
        EngineMetrics::bump(m_metrics->feedbackUnknownRequest);
        return false;
    }

    EngineMetrics::bump(m_metrics->feedbackReceived);
    m_metrics->recordFeedbackType(feedback.feedbackType);

    const GovernanceResponse& response = logged->response;
    const QDateTime now = QDateTime::currentDateTimeUtc();

    FeedbackRecord record;
    record.feedback = feedback;
    if (!record.feedback.submittedAt.isValid()) {
        record.feedback.submittedAt = now;
    }
    record.loggedDecision = response.decision;
    record.modelVersion = response.modelVersion;
    record.expiresAt = record.feedback.submittedAt.addDays(m_config.feedbackTtlDays);

    QString error;
    bool feedbackStored = false;
    if (m_feedbackStore) {
        feedbackStored = m_feedbackStore->appendFeedback(record, &error);
    } else {
        error = QStringLiteral("no feedback store");
    }
    if (!feedbackStored) {
        LOG_WARN(vdLearning, "FeedbackLoop: failed to store feedback for %s: %s",
                 qUtf8Printable(feedback.requestId), qUtf8Printable(error));
        EngineMetrics::bump(m_metrics->feedbackStoreFailures);
    }

    bool correctionStored = false;
    bool learnerUpdated = false;
    const bool corrected = feedback.correctDecision && *feedback.correctDecision != response.decision;
    if (corrected) {
        CorrectionRecord correction;
        correction.requestId = feedback.requestId;
        correction.modelVersion = response.modelVersion;
        correction.originalDecision = response.decision;
        correction.correctedDecision = *feedback.correctDecision;
        correction.feedbackType = feedback.feedbackType;
        correction.features = response.features;
        correction.userId = feedback.userId;
        correction.rationale = feedback.rationale;
        correction.createdAt = now;

        error.clear();
        if (m_correctionStore) {
            correctionStored = m_correctionStore->appendCorrection(correction, &error);
        } else {
            error = QStringLiteral("no correction store");
        }
        if (!correctionStored) {
            LOG_WARN(vdLearning, "FeedbackLoop: failed to store correction for %s: %s",
                     qUtf8Printable(feedback.requestId), qUtf8Printable(error));
            EngineMetrics::bump(m_metrics->correctionStoreFailures);
        }

        error.clear();
        learnerUpdated = updateLearner(ModelType::OnlineLearner, response.features.toArray(),
                                       *feedback.correctDecision, &error);
        if (!learnerUpdated) {
            LOG_WARN(vdLearning, "FeedbackLoop: learner update for %s skipped: %s",
                     qUtf8Printable(feedback.requestId), qUtf8Printable(error));
        }
    }

    // Outcome is known when a decision was supplied or the response was confirmed.
    std::optional<Decision> actual = feedback.correctDecision;
    if (!actual && feedback.feedbackType == FeedbackType::Correct) {
        actual = response.decision;
    }
    if (actual) {
        m_registry->recordFeedbackOutcome(response.modelVersion, response.decision, *actual);
        if (response.abTest) {
            m_registry->recordAbOutcome(response.abTest->testId, response.abTest->cohort,
                                        *actual == response.decision);
        }
    } else if (response.abTest && feedback.feedbackType == FeedbackType::Incorrect) {
        m_registry->recordAbOutcome(response.abTest->testId, response.abTest->cohort, false);
    }

    LOG_DEBUG(vdLearning, "FeedbackLoop: %s on %s (stored=%d corrected=%d updated=%d)",
              qUtf8Printable(feedbackTypeToString(feedback.feedbackType)),
              qUtf8Printable(feedback.requestId),
              feedbackStored ? 1 : 0, corrected ? 1 : 0, learnerUpdated ? 1 : 0);

    return feedbackStored || correctionStored || learnerUpdated;
}

std::optional<PredictionRecord> FeedbackLoop::lookup(const QString& requestId) const
{
    if (requestId.isEmpty()) {
        return std::nullopt;
    }
    if (m_pendingWrites) {
        if (std::optional<PredictionRecord> pending = m_pendingWrites->pending(requestId)) {
            return pending;
        }
    }
    if (!m_predictionLog) {
        return std::nullopt;
    }
    return m_predictionLog->findPrediction(requestId);
}

// ── Online learning ─────────────────────────────────────────

bool FeedbackLoop::updateLearner(ModelType type, const FeatureArray& features, Decision label,
                                 QString* errorOut)
{
    std::lock_guard<std::mutex> writer(m_writerMutex[typeSlot(type)]);

    const std::optional<QString> versionId = m_registry->activeVersion(type);
    if (!versionId) {
        if (errorOut) {
            *errorOut = QStringLiteral("no active %1").arg(modelTypeToString(type));
        }
        return false;
    }

    const std::shared_ptr<const Classifier> current = m_registry->artifact(*versionId);
    const auto* incremental = dynamic_cast<const IncrementalClassifier*>(current.get());
    if (!incremental) {
        if (errorOut) {
            *errorOut = QStringLiteral("%1 is not incrementally trainable").arg(*versionId);
        }
        EngineMetrics::bump(m_metrics->onlineUpdateFailures);
        return false;
    }

    bool predictedCorrectly = false;
    std::unique_ptr<IncrementalClassifier> next;
    try {
        next = incremental->clone();
        predictedCorrectly = argmaxDecision(next->predictProba(features)) == label;
        next->learnOne(features, label);
    } catch (const std::exception& e) {
        if (errorOut) {
            *errorOut = QString::fromUtf8(e.what());
        }
        LOG_ERROR(vdLearning, "FeedbackLoop: update of %s threw: %s",
                  qUtf8Printable(*versionId), e.what());
        EngineMetrics::bump(m_metrics->onlineUpdateFailures);
        return false;
    } catch (...) {
        if (errorOut) {
            *errorOut = QStringLiteral("unknown_exception");
        }
        LOG_ERROR(vdLearning, "FeedbackLoop: update of %s threw a non-standard exception",
                  qUtf8Printable(*versionId));
        EngineMetrics::bump(m_metrics->onlineUpdateFailures);
        return false;
    }

    if (!m_registry->replaceActiveArtifact(*versionId,
                                           std::shared_ptr<const Classifier>(std::move(next)),
                                           errorOut)) {
        EngineMetrics::bump(m_metrics->onlineUpdateFailures);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        Prequential& stats = m_prequential[*versionId];
        ++stats.total;
        if (predictedCorrectly) {
            ++stats.correct;
        }
        stats.lastUpdate = QDateTime::currentDateTimeUtc();
    }
    EngineMetrics::bump(m_metrics->onlineUpdates);
    return true;
}

QString FeedbackLoop::statusLabel(qint64 samples) const
{
    const qint64 ready = std::max(1, m_config.readySamples);
    if (samples < ready / 2) {
        return QStringLiteral("cold_start");
    }
    if (samples < ready) {
        return QStringLiteral("warming_up");
    }
    return QStringLiteral("ready");
}

std::vector<LearnerStatus> FeedbackLoop::learnerStatus() const
{
    std::vector<LearnerStatus> out;
    for (const ModelVersion& meta : m_registry->versions()) {
        if (meta.modelType != ModelType::OnlineLearner || meta.status == ModelStatus::Retired) {
            continue;
        }
        const std::shared_ptr<const Classifier> artifact = m_registry->artifact(meta.versionId);
        const auto* incremental = dynamic_cast<const IncrementalClassifier*>(artifact.get());

        LearnerStatus status;
        status.versionId = meta.versionId;
        status.samplesLearned = incremental ? incremental->samplesLearned() : 0;
        status.status = statusLabel(status.samplesLearned);
        {
            std::lock_guard<std::mutex> lock(m_statsMutex);
            auto it = m_prequential.find(meta.versionId);
            if (it != m_prequential.end()) {
                status.prequentialTotal = it->second.total;
                status.prequentialCorrect = it->second.correct;
                status.lastUpdate = it->second.lastUpdate;
            }
        }
        out.push_back(status);
    }
    return out;
}

} // namespace vd
