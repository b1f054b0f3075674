#include "core/prediction/prediction_executor.h"
#include "core/models/evaluation.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace vd {

namespace {

constexpr double kSumTolerance = 1e-3;

} // namespace

PredictionExecutor::PredictionExecutor(const ModelRegistry& registry,
                                       EngineMetrics* metrics,
                                       const Config& config)
    : m_registry(registry)
    , m_metrics(metrics)
    , m_config(config)
    , m_pool(config.workers, config.queueLimit)
{
}

PredictionOutcome PredictionExecutor::fallback(const QString& reason)
{
    PredictionOutcome outcome;
    outcome.decision = Decision::Monitor;
    outcome.confidence = 0.5;
    outcome.fallbackUsed = true;
    outcome.fallbackReason = reason;
    return outcome;
}

bool PredictionExecutor::validateProbabilities(std::vector<double>* probabilities, QString* reasonOut)
{
    auto reject = [reasonOut](const char* reason) {
        if (reasonOut) {
            *reasonOut = QString::fromLatin1(reason);
        }
        return false;
    };

    if (!probabilities || probabilities->size() != static_cast<size_t>(kDecisionCount)) {
        return reject("wrong_arity");
    }

    double sum = 0.0;
    for (double p : *probabilities) {
        if (!std::isfinite(p)) {
            return reject("non_finite");
        }
        if (p < 0.0 || p > 1.0 + kSumTolerance) {
            return reject("out_of_range");
        }
        sum += p;
    }
    if (std::fabs(sum - 1.0) > kSumTolerance) {
        return reject("not_normalised");
    }
    for (double& p : *probabilities) {
        p = std::clamp(p / sum, 0.0, 1.0);
    }
    return true;
}

PredictionOutcome PredictionExecutor::predict(const FeatureVector& features, const QString& versionId)
{
    std::shared_ptr<const Classifier> model = m_registry.artifact(versionId);
    if (!model) {
        LOG_WARN(vdCore, "PredictionExecutor: no artifact for '%s'; using fallback",
                 qUtf8Printable(versionId));
        if (m_metrics) {
            EngineMetrics::bump(m_metrics->modelUnavailable);
        }
        return fallback(QStringLiteral("model_unavailable"));
    }

    InferencePool::Result result = m_pool.run(std::move(model), features.toArray(), m_config.timeoutMs);
    switch (result.status) {
    case InferencePool::Result::Status::Ok:
        break;
    case InferencePool::Result::Status::Error:
        LOG_ERROR(vdCore, "PredictionExecutor: %s raised: %s",
                  qUtf8Printable(versionId), qUtf8Printable(result.error));
        if (m_metrics) {
            EngineMetrics::bump(m_metrics->inferenceErrors);
        }
        return fallback(QStringLiteral("inference_error"));
    case InferencePool::Result::Status::Timeout:
        LOG_WARN(vdCore, "PredictionExecutor: %s exceeded %d ms",
                 qUtf8Printable(versionId), m_config.timeoutMs);
        if (m_metrics) {
            EngineMetrics::bump(m_metrics->inferenceTimeouts);
        }
        return fallback(QStringLiteral("inference_timeout"));
    case InferencePool::Result::Status::QueueFull:
        LOG_WARN(vdCore, "PredictionExecutor: inference queue full");
        if (m_metrics) {
            EngineMetrics::bump(m_metrics->inferenceQueueRejected);
        }
        return fallback(QStringLiteral("inference_queue_full"));
    }

    QString invalidReason;
    if (!validateProbabilities(&result.probabilities, &invalidReason)) {
        LOG_ERROR(vdCore, "PredictionExecutor: %s returned malformed output (%s)",
                  qUtf8Printable(versionId), qUtf8Printable(invalidReason));
        if (m_metrics) {
            EngineMetrics::bump(m_metrics->malformedOutputs);
        }
        return fallback(QStringLiteral("malformed_output"));
    }

    PredictionOutcome outcome;
    outcome.decision = argmaxDecision(result.probabilities);
    outcome.confidence = std::clamp(
        result.probabilities[static_cast<size_t>(decisionIndex(outcome.decision))], 0.0, 1.0);
    outcome.probabilities = std::move(result.probabilities);
    return outcome;
}

} // namespace vd
