#pragma once

#include "core/features/feature_vector.h"
#include "core/models/model_registry.h"
#include "core/prediction/inference_pool.h"
#include "core/shared/engine_metrics.h"

#include <QString>

#include <vector>

namespace vd {

struct PredictionOutcome {
    Decision decision = Decision::Monitor;
    double confidence = 0.5;
    std::vector<double> probabilities;
    bool fallbackUsed = false;
    QString fallbackReason;
};

// Runs the selected model version against a feature vector. Never throws and
// never performs I/O: every fault (missing artifact, exception, malformed
// output, timeout) yields the conservative MONITOR outcome at 0.5.
class PredictionExecutor {
public:
    struct Config {
        int timeoutMs = 50;
        int workers = 2;
        int queueLimit = 256;
    };

    PredictionExecutor(const ModelRegistry& registry, EngineMetrics* metrics, const Config& config);

    PredictionOutcome predict(const FeatureVector& features, const QString& versionId);

    static PredictionOutcome fallback(const QString& reason);

    // Checks arity, finiteness and range, renormalising a sum that is within
    // tolerance of 1. Returns false for anything else.
    static bool validateProbabilities(std::vector<double>* probabilities, QString* reasonOut = nullptr);

private:
    const ModelRegistry& m_registry;
    EngineMetrics* m_metrics = nullptr;
    Config m_config;
    InferencePool m_pool;
};

} // namespace vd
