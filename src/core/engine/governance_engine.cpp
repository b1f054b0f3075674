#include "core/engine/governance_engine.h"
#include "core/prediction/reasoning_generator.h"
#include "core/shared/ids.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>

namespace vd {

namespace {

FeatureExtractor::Config extractorConfig(const EngineSettings& settings)
{
    FeatureExtractor::Config config;
    config.timezone = settings.timezone;
    config.businessHourStart = settings.businessHourStart;
    config.businessHourEnd = settings.businessHourEnd;
    return config;
}

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

QJsonObject AbConclusion::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("test")] = test.toJson();
    obj[QStringLiteral("comparison")] = comparison.toJson();
    obj[QStringLiteral("promoted")] = promoted;
    return obj;
}

GovernanceEngine::GovernanceEngine(const EngineSettings& settings)
    : m_settings(settings)
    , m_registry(settings.modelsDir)
    , m_extractor(extractorConfig(settings))
{
}

GovernanceEngine::~GovernanceEngine()
{
    shutdown();
}

// ── Lifecycle ───────────────────────────────────────────────

bool GovernanceEngine::initialize(QString* errorOut)
{
    if (m_initialized) {
        return true;
    }
    m_startedAt = QDateTime::currentDateTimeUtc();

    if (m_settings.dbPath != QLatin1String(":memory:")) {
        const QString dbDir = QFileInfo(m_settings.dbPath).absolutePath();
        if (!QDir().mkpath(dbDir)) {
            setError(errorOut, QStringLiteral("Cannot create data directory %1").arg(dbDir));
            return false;
        }
    }

    m_store = GovernanceStore::open(m_settings.dbPath);
    if (!m_store) {
        setError(errorOut, QStringLiteral("Failed to open database at %1").arg(m_settings.dbPath));
        LOG_ERROR(vdCore, "GovernanceEngine: cannot open store %s", qUtf8Printable(m_settings.dbPath));
        return false;
    }

    ModelRegistry::BootstrapConfig bootstrap;
    bootstrap.syntheticSamples = m_settings.baselineSamples;
    bootstrap.seed = m_settings.baselineSeed;
    bootstrap.forest.trees = m_settings.baselineTrees;
    bootstrap.forest.maxDepth = m_settings.baselineMaxDepth;
    bootstrap.forest.seed = m_settings.baselineSeed;
    bootstrap.online.learningRate = m_settings.onlineLearningRate;
    bootstrap.online.l2 = m_settings.onlineL2;
    m_bootstrap = m_registry.bootstrap(bootstrap);
    for (const auto& [type, reason] : m_bootstrap.failures) {
        LOG_ERROR(vdCore, "GovernanceEngine: %s unavailable: %s",
                  qUtf8Printable(modelTypeToString(type)), qUtf8Printable(reason));
    }

    AbRouter::Config routerConfig;
    routerConfig.stickyAssignment = m_settings.abStickyAssignment;
    m_router = std::make_unique<AbRouter>(m_registry, &m_metrics, routerConfig);

    PredictionExecutor::Config executorConfig;
    executorConfig.timeoutMs = m_settings.inferenceTimeoutMs;
    executorConfig.workers = m_settings.inferenceWorkers;
    executorConfig.queueLimit = m_settings.inferenceQueueLimit;
    m_executor = std::make_unique<PredictionExecutor>(m_registry, &m_metrics, executorConfig);

    m_logWriter = std::make_unique<AsyncLogWriter>(m_store.get(), &m_metrics,
                                                   m_settings.logQueueLimit);

    FeedbackLoop::Config feedbackConfig;
    feedbackConfig.feedbackTtlDays = m_settings.feedbackTtlDays;
    feedbackConfig.readySamples = m_settings.onlineReadySamples;
    m_feedback = std::make_unique<FeedbackLoop>(&m_registry, m_store.get(), m_store.get(),
                                                m_store.get(), m_logWriter.get(), &m_metrics,
                                                feedbackConfig);

    DriftMonitor::Config driftConfig;
    driftConfig.mode = driftModeFromString(m_settings.driftMode).value_or(DriftMode::Disabled);
    driftConfig.threshold = m_settings.driftThreshold;
    driftConfig.currentWindowHours = m_settings.driftCurrentWindowHours;
    driftConfig.referenceDays = m_settings.driftReferenceDays;
    driftConfig.minSamples = m_settings.driftMinSamples;
    m_drift = std::make_unique<DriftMonitor>(
        std::make_shared<PredictionLogWindowSource>(m_store.get()),
        m_store.get(), &m_metrics, driftConfig);

    m_initialized = true;
    LOG_INFO(vdCore, "GovernanceEngine: ready (baseline=%s learner=%s drift=%s)",
             qUtf8Printable(m_registry.activeVersion(ModelType::RandomForest).value_or(QStringLiteral("none"))),
             qUtf8Printable(m_registry.activeVersion(ModelType::OnlineLearner).value_or(QStringLiteral("none"))),
             qUtf8Printable(driftModeToString(driftConfig.mode)));
    return true;
}

void GovernanceEngine::shutdown()
{
    if (!m_initialized) {
        return;
    }
    m_logWriter->shutdown();
    QString error;
    if (!m_registry.saveArtifacts(&error)) {
        LOG_WARN(vdCore, "GovernanceEngine: failed to save models on shutdown: %s",
                 qUtf8Printable(error));
    }
    m_initialized = false;
}

// ── Prediction ──────────────────────────────────────────────

QString GovernanceEngine::stickyKeyFor(const GovernanceRequest& request) const
{
    if (!request.userId.isEmpty()) {
        return request.userId;
    }
    if (!request.sessionId.isEmpty()) {
        return request.sessionId;
    }
    return request.requestId;
}

GovernanceResponse GovernanceEngine::predict(const GovernanceRequest& request, bool useAbTest)
{
    QElapsedTimer timer;
    timer.start();

    GovernanceRequest req = request;
    if (req.requestId.isEmpty()) {
        req.requestId = generateId(QStringLiteral("req"));
    }
    if (!req.timestamp.isValid()) {
        req.timestamp = QDateTime::currentDateTimeUtc();
    }

    GovernanceResponse response;
    response.requestId = req.requestId;
    response.timestamp = QDateTime::currentDateTimeUtc();
    response.features = m_extractor.extract(req);

    std::optional<RouteSelection> route;
    if (m_router) {
        route = m_router->select(ModelType::RandomForest, useAbTest, stickyKeyFor(req));
    }

    PredictionOutcome outcome;
    if (m_executor) {
        outcome = m_executor->predict(response.features, route ? route->versionId : QString());
    } else {
        EngineMetrics::bump(m_metrics.modelUnavailable);
        outcome = PredictionExecutor::fallback(QStringLiteral("model_unavailable"));
    }

    response.decision = outcome.decision;
    response.confidence = outcome.confidence;
    response.fallbackUsed = outcome.fallbackUsed;
    response.fallbackReason = outcome.fallbackReason;
    response.modelVersion = route ? route->versionId : QStringLiteral("none");
    response.reasoning = outcome.fallbackUsed
        ? ReasoningGenerator::explainFallback(outcome.fallbackReason)
        : ReasoningGenerator::explain(response.features, outcome.decision, outcome.confidence);
    if (route && route->usedAb) {
        response.abTest = AbAssignment{route->testId, route->cohort};
    }
    response.processingTimeMs = timer.nsecsElapsed() / 1.0e6;

    EngineMetrics::bump(m_metrics.predictions);
    if (outcome.fallbackUsed) {
        EngineMetrics::bump(m_metrics.fallbackPredictions);
    }
    if (route) {
        m_registry.recordPrediction(route->versionId);
        if (route->usedAb) {
            EngineMetrics::bump(m_metrics.abRoutedPredictions);
            m_registry.recordAbRequest(route->testId, route->cohort, response.processingTimeMs,
                                       outcome.fallbackUsed);
        }
    }

    if (m_logWriter) {
        PredictionRecord record;
        record.response = response;
        record.userId = req.userId;
        record.sessionId = req.sessionId;
        record.createdAt = response.timestamp;
        record.expiresAt = response.timestamp.addDays(m_settings.predictionTtlDays);
        m_logWriter->enqueue(std::move(record));
    }

    LOG_DEBUG(vdCore, "GovernanceEngine: %s -> %s (%.3f) via %s in %.2f ms%s",
              qUtf8Printable(response.requestId),
              qUtf8Printable(decisionToString(response.decision)),
              response.confidence,
              qUtf8Printable(response.modelVersion),
              response.processingTimeMs,
              response.fallbackUsed ? " [fallback]" : "");
    return response;
}

bool GovernanceEngine::submitFeedback(const FeedbackSubmission& feedback)
{
    if (!m_feedback) {
        LOG_WARN(vdCore, "GovernanceEngine: feedback before initialize");
        return false;
    }
    return m_feedback->submit(feedback);
}

// ── Introspection ───────────────────────────────────────────

QJsonObject GovernanceEngine::status() const
{
    QJsonObject obj;
    obj[QStringLiteral("active_versions")] = m_registry.activeVersionsJson();

    QJsonArray tests;
    for (const ABTest& test : m_registry.abTests()) {
        if (test.status == AbTestStatus::Active) {
            tests.append(test.toJson());
        }
    }
    obj[QStringLiteral("active_ab_tests")] = tests;
    obj[QStringLiteral("metrics")] = m_metrics.toJson();

    QJsonObject unavailable;
    for (const auto& [type, reason] : m_bootstrap.failures) {
        unavailable[modelTypeToString(type)] = reason;
    }
    obj[QStringLiteral("unavailable_models")] = unavailable;
    obj[QStringLiteral("log_queue_depth")] = m_logWriter
        ? static_cast<qint64>(m_logWriter->queueDepth()) : 0;
    obj[QStringLiteral("drift_mode")] = m_drift ? driftModeToString(m_drift->config().mode)
                                                : m_settings.driftMode;
    obj[QStringLiteral("started_at")] = m_startedAt.toString(Qt::ISODateWithMs);
    return obj;
}

QJsonObject GovernanceEngine::modelMetrics() const
{
    QJsonObject obj;
    obj[QStringLiteral("versions")] = m_registry.versionMetricsJson();
    obj[QStringLiteral("active_versions")] = m_registry.activeVersionsJson();
    obj[QStringLiteral("total_predictions")] = m_metrics.predictions.load(std::memory_order_relaxed);
    obj[QStringLiteral("total_feedback")] = m_metrics.feedbackReceived.load(std::memory_order_relaxed);
    return obj;
}

// ── Drift ───────────────────────────────────────────────────

std::optional<DriftDetectionResult> GovernanceEngine::driftCheck(const QString& versionId)
{
    if (!m_drift) {
        return std::nullopt;
    }
    QString target = versionId;
    if (target.isEmpty()) {
        target = m_registry.activeVersion(ModelType::RandomForest).value_or(QString());
    }
    if (target.isEmpty()) {
        LOG_INFO(vdCore, "GovernanceEngine: no active baseline to check for drift");
        EngineMetrics::bump(m_metrics.driftNoData);
        return std::nullopt;
    }
    return m_drift->check(target);
}

std::vector<DriftDetectionResult> GovernanceEngine::driftHistory(const QString& versionId, int limit) const
{
    if (!m_drift) {
        return {};
    }
    return m_drift->history(versionId, limit);
}

// ── A/B tests & promotion ───────────────────────────────────

std::vector<ABTest> GovernanceEngine::abTests() const
{
    return m_registry.abTests();
}

std::vector<LearnerStatus> GovernanceEngine::onlineLearningStatus() const
{
    if (!m_feedback) {
        return {};
    }
    return m_feedback->learnerStatus();
}

std::optional<ABTest> GovernanceEngine::createAbTest(const QString& championVersion,
                                                     const QString& candidateVersion,
                                                     double trafficSplit,
                                                     QString* errorOut)
{
    return m_registry.createAbTest(championVersion, candidateVersion, trafficSplit, errorOut);
}

std::optional<AbConclusion> GovernanceEngine::concludeAbTest(const QString& testId, bool force,
                                                             QString* errorOut)
{
    std::optional<ABTest> test = m_registry.abTest(testId);
    if (!test) {
        setError(errorOut, QStringLiteral("unknown_ab_test"));
        return std::nullopt;
    }
    if (test->status != AbTestStatus::Active) {
        setError(errorOut, QStringLiteral("ab_test_not_active"));
        return std::nullopt;
    }

    AbConclusion conclusion;
    conclusion.comparison = compareCohorts(*test, m_settings.abMinSamples);

    if (conclusion.comparison.candidateBetter || force) {
        if (!m_registry.promote(test->candidateVersion, errorOut)) {
            return std::nullopt;
        }
        conclusion.promoted = true;
    } else if (!m_registry.endAbTest(testId, AbTestStatus::Completed, errorOut)) {
        return std::nullopt;
    }

    conclusion.test = m_registry.abTest(testId).value_or(*test);
    LOG_INFO(vdCore, "GovernanceEngine: A/B test %s concluded (%s, promoted=%d)",
             qUtf8Printable(testId), qUtf8Printable(conclusion.comparison.recommendation),
             conclusion.promoted ? 1 : 0);
    return conclusion;
}

bool GovernanceEngine::promote(const QString& versionId, QString* errorOut)
{
    return m_registry.promote(versionId, errorOut);
}

// ── Maintenance ─────────────────────────────────────────────

void GovernanceEngine::runMaintenance()
{
    if (!m_initialized) {
        return;
    }
    if (!m_store->pruneExpired(QDateTime::currentDateTimeUtc())) {
        LOG_WARN(vdCore, "GovernanceEngine: pruning expired records failed");
    }
    QString error;
    if (!m_registry.saveArtifacts(&error)) {
        LOG_WARN(vdCore, "GovernanceEngine: failed to save models: %s", qUtf8Printable(error));
    }
}

void GovernanceEngine::flushLogs()
{
    if (m_logWriter) {
        m_logWriter->flush();
    }
}

} // namespace vd
