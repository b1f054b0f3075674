#include "core/drift/drift_monitor.h"
#include "core/shared/ids.h"
#include "core/shared/logging.h"

#include <exception>

namespace vd {

// ── Window source ───────────────────────────────────────────

PredictionLogWindowSource::PredictionLogWindowSource(PredictionLog* log)
    : m_log(log)
{
}

bool PredictionLogWindowSource::window(const QString& versionId,
                                       const QDateTime& from,
                                       const QDateTime& to,
                                       int limit,
                                       std::vector<FeatureArray>* out,
                                       QString* errorOut)
{
    if (!m_log) {
        if (errorOut) {
            *errorOut = QStringLiteral("no prediction log");
        }
        return false;
    }
    return m_log->featureWindow(versionId, from, to, limit, out, errorOut);
}

std::optional<DriftMode> driftModeFromString(const QString& str)
{
    if (str == QLatin1String("disabled")) {
        return DriftMode::Disabled;
    }
    if (str == QLatin1String("prediction_log")) {
        return DriftMode::PredictionLog;
    }
    return std::nullopt;
}

QString driftModeToString(DriftMode mode)
{
    switch (mode) {
    case DriftMode::Disabled:
        return QStringLiteral("disabled");
    case DriftMode::PredictionLog:
        return QStringLiteral("prediction_log");
    }
    return QStringLiteral("disabled");
}

// ── Monitor ─────────────────────────────────────────────────

DriftMonitor::DriftMonitor(std::shared_ptr<FeatureWindowSource> source,
                           DriftHistoryStore* history,
                           EngineMetrics* metrics,
                           const Config& config)
    : m_source(std::move(source))
    , m_history(history)
    , m_metrics(metrics)
    , m_config(config)
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
{
}

void DriftMonitor::setScorer(std::shared_ptr<DriftScorer> scorer)
{
    std::lock_guard<std::mutex> lock(m_checkMutex);
    m_scorer = std::move(scorer);
}

void DriftMonitor::setClock(Clock clock)
{
    std::lock_guard<std::mutex> lock(m_checkMutex);
    if (clock) {
        m_clock = std::move(clock);
    }
}

DriftSeverity DriftMonitor::severityFor(int affectedFeatures)
{
    const double share = static_cast<double>(affectedFeatures) / kFeatureDim;
    if (share >= 0.75) {
        return DriftSeverity::Critical;
    }
    if (share >= 0.5) {
        return DriftSeverity::High;
    }
    if (share >= 0.25) {
        return DriftSeverity::Moderate;
    }
    if (share >= 0.1) {
        return DriftSeverity::Low;
    }
    return DriftSeverity::None;
}

std::optional<DriftDetectionResult> DriftMonitor::check(const QString& versionId)
{
    std::lock_guard<std::mutex> lock(m_checkMutex);
    EngineMetrics::bump(m_metrics->driftChecks);

    if (m_config.mode == DriftMode::Disabled) {
        LOG_DEBUG(vdDrift, "DriftMonitor: retrieval disabled, no data for %s",
                  qUtf8Printable(versionId));
        EngineMetrics::bump(m_metrics->driftNoData);
        return std::nullopt;
    }
    if (!m_source || !m_scorer) {
        LOG_WARN(vdDrift, "DriftMonitor: no %s configured, no data for %s",
                 m_source ? "scorer" : "window source", qUtf8Printable(versionId));
        EngineMetrics::bump(m_metrics->driftNoData);
        return std::nullopt;
    }

    const QDateTime now = m_clock();
    const QDateTime currentFrom = now.addSecs(-3600LL * m_config.currentWindowHours);
    const QDateTime referenceFrom = currentFrom.addDays(-m_config.referenceDays);

    std::vector<FeatureArray> current;
    std::vector<FeatureArray> reference;
    QString error;
    if (!m_source->window(versionId, currentFrom, now, m_config.windowLimit, &current, &error)
        || !m_source->window(versionId, referenceFrom, currentFrom, m_config.windowLimit,
                             &reference, &error)) {
        LOG_WARN(vdDrift, "DriftMonitor: window retrieval failed for %s: %s",
                 qUtf8Printable(versionId), qUtf8Printable(error));
        EngineMetrics::bump(m_metrics->driftNoData);
        return std::nullopt;
    }

    if (static_cast<int>(current.size()) < m_config.minSamples
        || static_cast<int>(reference.size()) < m_config.minSamples) {
        LOG_INFO(vdDrift, "DriftMonitor: insufficient data for %s (reference=%d current=%d min=%d)",
                 qUtf8Printable(versionId), static_cast<int>(reference.size()),
                 static_cast<int>(current.size()), m_config.minSamples);
        EngineMetrics::bump(m_metrics->driftNoData);
        return std::nullopt;
    }

    DriftScore scored;
    try {
        scored = m_scorer->score(reference, current);
    } catch (const std::exception& e) {
        LOG_ERROR(vdDrift, "DriftMonitor: scorer failed for %s: %s",
                  qUtf8Printable(versionId), e.what());
        EngineMetrics::bump(m_metrics->driftScorerErrors);
        return std::nullopt;
    } catch (...) {
        LOG_ERROR(vdDrift, "DriftMonitor: scorer failed for %s: unknown_exception",
                  qUtf8Printable(versionId));
        EngineMetrics::bump(m_metrics->driftScorerErrors);
        return std::nullopt;
    }

    DriftDetectionResult result;
    result.checkId = generateId(QStringLiteral("drift"));
    result.modelVersion = versionId;
    result.driftScore = scored.score;
    result.threshold = m_config.threshold;
    result.driftDetected = scored.score > m_config.threshold;
    result.affectedFeatures = scored.affectedFeatures;
    result.severity = result.driftDetected ? severityFor(scored.affectedFeatures.size())
                                           : DriftSeverity::None;
    result.referenceSamples = static_cast<int>(reference.size());
    result.currentSamples = static_cast<int>(current.size());
    result.timestamp = now;
    result.details = scored.details;

    if (result.driftDetected) {
        EngineMetrics::bump(m_metrics->driftDetected);
        LOG_WARN(vdDrift, "DriftMonitor: drift detected for %s (score=%.4f threshold=%.4f features=%s)",
                 qUtf8Printable(versionId), result.driftScore, result.threshold,
                 qUtf8Printable(result.affectedFeatures.join(QLatin1Char(','))));
    } else {
        LOG_INFO(vdDrift, "DriftMonitor: no drift for %s (score=%.4f)",
                 qUtf8Printable(versionId), result.driftScore);
    }

    if (m_history) {
        QString storeError;
        if (!m_history->appendDriftResult(result, &storeError)) {
            LOG_WARN(vdDrift, "DriftMonitor: failed to record check %s: %s",
                     qUtf8Printable(result.checkId), qUtf8Printable(storeError));
        }
    }
    return result;
}

std::vector<DriftDetectionResult> DriftMonitor::history(const QString& versionId, int limit) const
{
    if (!m_history) {
        return {};
    }
    return m_history->driftHistory(versionId, limit);
}

} // namespace vd
