#pragma once

#include "core/models/model_registry.h"
#include "core/shared/engine_metrics.h"
#include "core/shared/governance_types.h"
#include "core/store/async_log_writer.h"
#include "core/store/record_store.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <array>
#include <map>
#include <mutex>
#include <vector>

namespace vd {

struct LearnerStatus {
    QString versionId;
    qint64 samplesLearned = 0;
    qint64 prequentialTotal = 0;
    qint64 prequentialCorrect = 0;
    QString status;
    QDateTime lastUpdate;

    double prequentialAccuracy() const;
    QJsonObject toJson() const;
};

// FeedbackLoop -- joins feedback to the logged prediction, stores it, and
// turns label corrections into online learner updates.
//
// Learner updates for a model type are serialised by that type's writer
// mutex. The writer clones the active learner, trains the clone and
// publishes it through the registry, so predictions keep reading the
// previous snapshot until the swap.
class FeedbackLoop {
public:
    struct Config {
        int feedbackTtlDays = 30;
        int readySamples = 500;
    };

    FeedbackLoop(ModelRegistry* registry,
                 PredictionLog* predictionLog,
                 FeedbackStore* feedbackStore,
                 CorrectionStore* correctionStore,
                 const AsyncLogWriter* pendingWrites,
                 EngineMetrics* metrics,
                 const Config& config);

    // False when the prediction is unknown or expired, or when none of the
    // feedback write, correction write and learner update succeeded.
    bool submit(const FeedbackSubmission& feedback);

    // Applies one labelled sample to the active learner of the given type.
    bool updateLearner(ModelType type, const FeatureArray& features, Decision label,
                       QString* errorOut = nullptr);

    std::vector<LearnerStatus> learnerStatus() const;

private:
    std::optional<PredictionRecord> lookup(const QString& requestId) const;
    QString statusLabel(qint64 samples) const;

    struct Prequential {
        qint64 total = 0;
        qint64 correct = 0;
        QDateTime lastUpdate;
    };

    ModelRegistry* m_registry = nullptr;
    PredictionLog* m_predictionLog = nullptr;
    FeedbackStore* m_feedbackStore = nullptr;
    CorrectionStore* m_correctionStore = nullptr;
    const AsyncLogWriter* m_pendingWrites = nullptr;
    EngineMetrics* m_metrics = nullptr;
    Config m_config;

    std::array<std::mutex, kAllModelTypes.size()> m_writerMutex;
    mutable std::mutex m_statsMutex;
    std::map<QString, Prequential> m_prequential;
};

} // namespace vd
