#pragma once

#include "core/shared/types.h"

#include <QJsonObject>

#include <array>
#include <atomic>

namespace vd {

// Process-wide counters. Increments are relaxed; snapshots are not
// guaranteed to be mutually consistent.
struct EngineMetrics {
    std::atomic<qint64> predictions{0};
    std::atomic<qint64> fallbackPredictions{0};
    std::atomic<qint64> modelUnavailable{0};
    std::atomic<qint64> inferenceErrors{0};
    std::atomic<qint64> malformedOutputs{0};
    std::atomic<qint64> inferenceTimeouts{0};
    std::atomic<qint64> inferenceQueueRejected{0};
    std::atomic<qint64> routerFallbacks{0};
    std::atomic<qint64> abRoutedPredictions{0};
    std::atomic<qint64> predictionLogFailures{0};

    std::atomic<qint64> feedbackReceived{0};
    std::array<std::atomic<qint64>, kFeedbackTypeCount> feedbackByType{};
    std::atomic<qint64> feedbackUnknownRequest{0};
    std::atomic<qint64> feedbackStoreFailures{0};
    std::atomic<qint64> correctionStoreFailures{0};
    std::atomic<qint64> onlineUpdates{0};
    std::atomic<qint64> onlineUpdateFailures{0};

    std::atomic<qint64> driftChecks{0};
    std::atomic<qint64> driftDetected{0};
    std::atomic<qint64> driftNoData{0};
    std::atomic<qint64> driftScorerErrors{0};

    static void bump(std::atomic<qint64>& counter)
    {
        counter.fetch_add(1, std::memory_order_relaxed);
    }

    void recordFeedbackType(FeedbackType type);
    qint64 feedbackCount(FeedbackType type) const;

    QJsonObject toJson() const;
};

} // namespace vd
