#pragma once

#include "core/drift/drift_monitor.h"
#include "core/features/feature_extractor.h"
#include "core/learning/feedback_loop.h"
#include "core/models/model_registry.h"
#include "core/prediction/prediction_executor.h"
#include "core/routing/ab_router.h"
#include "core/routing/ab_test_stats.h"
#include "core/shared/engine_metrics.h"
#include "core/shared/settings.h"
#include "core/store/async_log_writer.h"
#include "core/store/governance_store.h"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <memory>
#include <optional>

namespace vd {

struct AbConclusion {
    ABTest test;
    AbComparison comparison;
    bool promoted = false;

    QJsonObject toJson() const;
};

// GovernanceEngine -- owns every component of the decision engine and wires
// the request path: extract, route, predict, explain, log.
//
// Construct once, adjust collaborators through registry()/driftMonitor() if
// needed, then call initialize(). predict() never fails: a missing or faulty
// model yields the MONITOR fallback.
class GovernanceEngine {
public:
    explicit GovernanceEngine(const EngineSettings& settings);
    ~GovernanceEngine();

    GovernanceEngine(const GovernanceEngine&) = delete;
    GovernanceEngine& operator=(const GovernanceEngine&) = delete;

    // Opens the store and provisions models. Fails only when the store cannot
    // be opened; a model type that cannot be provisioned stays unavailable.
    bool initialize(QString* errorOut = nullptr);
    void shutdown();

    GovernanceResponse predict(const GovernanceRequest& request, bool useAbTest = false);
    bool submitFeedback(const FeedbackSubmission& feedback);

    QJsonObject status() const;
    QJsonObject modelMetrics() const;

    // Defaults to the active baseline. nullopt is "no data".
    std::optional<DriftDetectionResult> driftCheck(const QString& versionId = QString());
    std::vector<DriftDetectionResult> driftHistory(const QString& versionId, int limit) const;

    std::vector<ABTest> abTests() const;
    std::vector<LearnerStatus> onlineLearningStatus() const;

    std::optional<ABTest> createAbTest(const QString& championVersion,
                                       const QString& candidateVersion,
                                       double trafficSplit,
                                       QString* errorOut = nullptr);
    // Promotes the candidate when it wins, or unconditionally with force.
    // A test that is not promoted is closed as completed.
    std::optional<AbConclusion> concludeAbTest(const QString& testId, bool force,
                                               QString* errorOut = nullptr);
    bool promote(const QString& versionId, QString* errorOut = nullptr);

    // Prunes expired log rows and saves learner snapshots.
    void runMaintenance();
    // Blocks until queued prediction log writes have completed.
    void flushLogs();

    ModelRegistry& registry() { return m_registry; }
    const ModelRegistry& registry() const { return m_registry; }
    DriftMonitor* driftMonitor() { return m_drift.get(); }
    EngineMetrics& metrics() { return m_metrics; }
    const EngineSettings& settings() const { return m_settings; }
    const ModelRegistry::BootstrapReport& bootstrapReport() const { return m_bootstrap; }
    bool isInitialized() const { return m_initialized; }

private:
    QString stickyKeyFor(const GovernanceRequest& request) const;

    EngineSettings m_settings;
    EngineMetrics m_metrics;
    ModelRegistry m_registry;
    FeatureExtractor m_extractor;
    QDateTime m_startedAt;

    std::unique_ptr<GovernanceStore> m_store;
    std::unique_ptr<AbRouter> m_router;
    std::unique_ptr<PredictionExecutor> m_executor;
    std::unique_ptr<AsyncLogWriter> m_logWriter;
    std::unique_ptr<FeedbackLoop> m_feedback;
    std::unique_ptr<DriftMonitor> m_drift;

    ModelRegistry::BootstrapReport m_bootstrap;
    bool m_initialized = false;
};

} // namespace vd
