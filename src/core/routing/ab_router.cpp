#include "core/routing/ab_router.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>
#include <QtEndian>

namespace vd {

AbRouter::AbRouter(const ModelRegistry& registry, EngineMetrics* metrics)
    : AbRouter(registry, metrics, Config{})
{
}

AbRouter::AbRouter(const ModelRegistry& registry, EngineMetrics* metrics, const Config& config)
    : m_registry(registry)
    , m_metrics(metrics)
    , m_config(config)
    , m_seeded(config.seed.value_or(0u))
{
}

double AbRouter::nextDraw()
{
    if (!m_config.seed) {
        return QRandomGenerator::global()->generateDouble();
    }
    std::lock_guard<std::mutex> lock(m_rngMutex);
    return m_seeded.generateDouble();
}

double AbRouter::stickyDraw(const QString& testId, const QString& key)
{
    QCryptographicHash hash(QCryptographicHash::Sha256);
    hash.addData(testId.toUtf8());
    hash.addData(QByteArrayLiteral(":"));
    hash.addData(key.toUtf8());
    const QByteArray digest = hash.result();
    const quint64 prefix = qFromBigEndian<quint64>(digest.constData());
    return static_cast<double>(prefix % 10000u) / 10000.0;
}

std::optional<RouteSelection> AbRouter::select(ModelType type, bool allowAb, const QString& stickyKey)
{
    const std::optional<QString> active = m_registry.activeVersion(type);

    if (allowAb) {
        if (const std::optional<ABTest> test = m_registry.activeAbTest(type)) {
            const double draw = (m_config.stickyAssignment && !stickyKey.isEmpty())
                ? stickyDraw(test->testId, stickyKey)
                : nextDraw();

            RouteSelection selection;
            selection.usedAb = true;
            selection.testId = test->testId;
            selection.cohort = draw < test->trafficSplit ? AbCohort::Candidate : AbCohort::Champion;
            selection.versionId = selection.cohort == AbCohort::Candidate
                ? test->candidateVersion
                : test->championVersion;

            const std::optional<ModelVersion> selected = m_registry.version(selection.versionId);
            if (selected && selected->status != ModelStatus::Failed
                && m_registry.artifact(selection.versionId)) {
                return selection;
            }

            LOG_WARN(vdRouting, "AbRouter: %s selected %s but it cannot serve; "
                                "falling back to the active version",
                     qUtf8Printable(test->testId), qUtf8Printable(selection.versionId));
            if (m_metrics) {
                EngineMetrics::bump(m_metrics->routerFallbacks);
            }
        }
    }

    if (!active) {
        return std::nullopt;
    }
    RouteSelection selection;
    selection.versionId = *active;
    return selection;
}

} // namespace vd
