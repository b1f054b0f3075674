#pragma once

#include "core/features/feature_vector.h"
#include "core/shared/engine_metrics.h"
#include "core/shared/governance_types.h"
#include "core/store/record_store.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace vd {

// Supplies the feature vectors a model version saw within [from, to).
class FeatureWindowSource {
public:
    virtual ~FeatureWindowSource() = default;
    virtual bool window(const QString& versionId,
                        const QDateTime& from,
                        const QDateTime& to,
                        int limit,
                        std::vector<FeatureArray>* out,
                        QString* errorOut = nullptr) = 0;
};

// Reads windows straight from the prediction log.
class PredictionLogWindowSource : public FeatureWindowSource {
public:
    explicit PredictionLogWindowSource(PredictionLog* log);

    bool window(const QString& versionId,
                const QDateTime& from,
                const QDateTime& to,
                int limit,
                std::vector<FeatureArray>* out,
                QString* errorOut = nullptr) override;

private:
    PredictionLog* m_log = nullptr;
};

struct DriftScore {
    double score = 0.0;
    QStringList affectedFeatures;
    QJsonObject details;
};

// Statistical distance between a reference and a current window. Supplied
// from outside; may throw, which the monitor treats as "no data".
class DriftScorer {
public:
    virtual ~DriftScorer() = default;
    virtual DriftScore score(const std::vector<FeatureArray>& reference,
                             const std::vector<FeatureArray>& current) = 0;
};

enum class DriftMode {
    Disabled,
    PredictionLog,
};

std::optional<DriftMode> driftModeFromString(const QString& str);
QString driftModeToString(DriftMode mode);

// DriftMonitor -- compares the current feature window of a model version
// against the window that precedes it. nullopt means "no data" and is
// distinct from a result with driftDetected == false.
class DriftMonitor {
public:
    struct Config {
        DriftMode mode = DriftMode::Disabled;
        double threshold = 0.1;
        int currentWindowHours = 24;
        int referenceDays = 7;
        int minSamples = 50;
        int windowLimit = 5000;
    };

    using Clock = std::function<QDateTime()>;

    DriftMonitor(std::shared_ptr<FeatureWindowSource> source,
                 DriftHistoryStore* history,
                 EngineMetrics* metrics,
                 const Config& config);

    void setScorer(std::shared_ptr<DriftScorer> scorer);
    void setClock(Clock clock);

    // Checks are serialised; a scheduled check and a requested one never run
    // the scorer concurrently.
    std::optional<DriftDetectionResult> check(const QString& versionId);
    std::vector<DriftDetectionResult> history(const QString& versionId, int limit) const;

    const Config& config() const { return m_config; }

    static DriftSeverity severityFor(int affectedFeatures);

private:
    std::shared_ptr<FeatureWindowSource> m_source;
    std::shared_ptr<DriftScorer> m_scorer;
    DriftHistoryStore* m_history = nullptr;
    EngineMetrics* m_metrics = nullptr;
    Config m_config;
    Clock m_clock;
    std::mutex m_checkMutex;
};

} // namespace vd
