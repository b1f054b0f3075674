#pragma once

#include "core/models/model_registry.h"
#include "core/shared/engine_metrics.h"

#include <QRandomGenerator>
#include <QString>

#include <mutex>
#include <optional>

namespace vd {

struct RouteSelection {
    QString versionId;
    bool usedAb = false;
    QString testId;
    AbCohort cohort = AbCohort::Champion;
};

// Chooses which model version serves a request. Non-sticky by default: each
// request draws independently. With sticky assignment the draw is derived
// from SHA-256 of the test id and a caller-stable key, so the same key
// always lands in the same cohort for the lifetime of a test.
class AbRouter {
public:
    struct Config {
        bool stickyAssignment = false;
        std::optional<quint32> seed;
    };

    AbRouter(const ModelRegistry& registry, EngineMetrics* metrics);
    AbRouter(const ModelRegistry& registry, EngineMetrics* metrics, const Config& config);

    // Returns nullopt only when no version of the type is active and no A/B
    // test applies.
    std::optional<RouteSelection> select(ModelType type,
                                         bool allowAb,
                                         const QString& stickyKey = QString());

    static double stickyDraw(const QString& testId, const QString& key);

private:
    double nextDraw();

    const ModelRegistry& m_registry;
    EngineMetrics* m_metrics = nullptr;
    Config m_config;
    QRandomGenerator m_seeded;
    std::mutex m_rngMutex;
};

} // namespace vd
