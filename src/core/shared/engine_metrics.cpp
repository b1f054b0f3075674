#include "core/shared/engine_metrics.h"

namespace vd {

namespace {

int feedbackSlot(FeedbackType type)
{
    switch (type) {
    case FeedbackType::Correct:    return 0;
    case FeedbackType::Incorrect:  return 1;
    case FeedbackType::Escalated:  return 2;
    case FeedbackType::Overridden: return 3;
    }
    return 1;
}

qint64 load(const std::atomic<qint64>& counter)
{
    return counter.load(std::memory_order_relaxed);
}

} // namespace

void EngineMetrics::recordFeedbackType(FeedbackType type)
{
    bump(feedbackByType[static_cast<size_t>(feedbackSlot(type))]);
}

qint64 EngineMetrics::feedbackCount(FeedbackType type) const
{
    return load(feedbackByType[static_cast<size_t>(feedbackSlot(type))]);
}

QJsonObject EngineMetrics::toJson() const
{
    QJsonObject prediction;
    prediction[QStringLiteral("total")] = load(predictions);
    prediction[QStringLiteral("fallbacks")] = load(fallbackPredictions);
    prediction[QStringLiteral("modelUnavailable")] = load(modelUnavailable);
    prediction[QStringLiteral("inferenceErrors")] = load(inferenceErrors);
    prediction[QStringLiteral("malformedOutputs")] = load(malformedOutputs);
    prediction[QStringLiteral("inferenceTimeouts")] = load(inferenceTimeouts);
    prediction[QStringLiteral("inferenceQueueRejected")] = load(inferenceQueueRejected);
    prediction[QStringLiteral("routerFallbacks")] = load(routerFallbacks);
    prediction[QStringLiteral("abRouted")] = load(abRoutedPredictions);
    prediction[QStringLiteral("logFailures")] = load(predictionLogFailures);

    QJsonObject byType;
    for (FeedbackType type : {FeedbackType::Correct, FeedbackType::Incorrect,
                              FeedbackType::Escalated, FeedbackType::Overridden}) {
        byType[feedbackTypeToString(type)] = feedbackCount(type);
    }

    QJsonObject feedback;
    feedback[QStringLiteral("total")] = load(feedbackReceived);
    feedback[QStringLiteral("byType")] = byType;
    feedback[QStringLiteral("unknownRequest")] = load(feedbackUnknownRequest);
    feedback[QStringLiteral("storeFailures")] = load(feedbackStoreFailures);
    feedback[QStringLiteral("correctionStoreFailures")] = load(correctionStoreFailures);
    feedback[QStringLiteral("onlineUpdates")] = load(onlineUpdates);
    feedback[QStringLiteral("onlineUpdateFailures")] = load(onlineUpdateFailures);

    QJsonObject drift;
    drift[QStringLiteral("checks")] = load(driftChecks);
    drift[QStringLiteral("detected")] = load(driftDetected);
    drift[QStringLiteral("noData")] = load(driftNoData);
    drift[QStringLiteral("scorerErrors")] = load(driftScorerErrors);

    QJsonObject obj;
    obj[QStringLiteral("prediction")] = prediction;
    obj[QStringLiteral("feedback")] = feedback;
    obj[QStringLiteral("drift")] = drift;
    return obj;
}

} // namespace vd
