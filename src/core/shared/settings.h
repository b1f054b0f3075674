#pragma once

#include <QString>

namespace vd {

// Engine configuration with built-in defaults. Persisted as JSON by
// SettingsManager; empty paths are resolved against dataDir at startup.
struct EngineSettings {
    QString dataDir;
    QString dbPath;
    QString modelsDir;

    // Feature extraction
    QString timezone = QStringLiteral("UTC");
    int businessHourStart = 9;
    int businessHourEnd = 17;

    // Retention
    int predictionTtlDays = 7;
    int feedbackTtlDays = 30;

    // Inference
    int inferenceTimeoutMs = 50;
    int inferenceWorkers = 2;
    int inferenceQueueLimit = 256;

    // A/B routing
    bool abStickyAssignment = false;
    int abMinSamples = 100;

    // Drift monitoring ("disabled" or "prediction_log")
    QString driftMode = QStringLiteral("disabled");
    double driftThreshold = 0.1;
    int driftCurrentWindowHours = 24;
    int driftReferenceDays = 7;
    int driftMinSamples = 50;
    int driftCheckIntervalMinutes = 360;

    // Cold-start baseline
    int baselineSamples = 1000;
    quint32 baselineSeed = 42;
    int baselineTrees = 100;
    int baselineMaxDepth = 10;

    // Online learning
    double onlineLearningRate = 0.05;
    double onlineL2 = 1e-4;
    int onlineReadySamples = 500;

    // Persistence
    int logQueueLimit = 10000;
    int maintenanceIntervalMinutes = 60;
};

} // namespace vd
