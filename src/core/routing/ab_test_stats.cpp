#include "core/routing/ab_test_stats.h"

#include <cmath>

namespace vd {

QJsonObject AbComparison::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("champion_accuracy")] = championAccuracy;
    obj[QStringLiteral("candidate_accuracy")] = candidateAccuracy;
    obj[QStringLiteral("improvement")] = improvement;
    obj[QStringLiteral("z_score")] = zScore;
    obj[QStringLiteral("significant")] = significant;
    obj[QStringLiteral("candidate_better")] = candidateBetter;
    obj[QStringLiteral("total_outcomes")] = totalOutcomes;
    obj[QStringLiteral("recommendation")] = recommendation;
    return obj;
}

AbComparison compareCohorts(const ABTest& test, int minTotalOutcomes)
{
    AbComparison result;
    const CohortMetrics& champion = test.championMetrics;
    const CohortMetrics& candidate = test.candidateMetrics;

    result.championAccuracy = champion.accuracy();
    result.candidateAccuracy = candidate.accuracy();
    result.improvement = result.candidateAccuracy - result.championAccuracy;
    result.totalOutcomes = champion.outcomes + candidate.outcomes;

    if (champion.outcomes >= kMinOutcomesPerCohort && candidate.outcomes >= kMinOutcomesPerCohort) {
        const double n1 = static_cast<double>(champion.outcomes);
        const double n2 = static_cast<double>(candidate.outcomes);
        const double pooled = (champion.correctOutcomes + candidate.correctOutcomes) / (n1 + n2);
        const double se = std::sqrt(pooled * (1.0 - pooled) * (1.0 / n1 + 1.0 / n2));
        if (se > 0.0) {
            result.zScore = result.improvement / se;
            result.significant = std::fabs(result.zScore) > kSignificanceZ;
        }
    }

    result.candidateBetter = result.improvement > 0.0
        && result.significant
        && result.totalOutcomes >= minTotalOutcomes;

    if (result.totalOutcomes < minTotalOutcomes
        || champion.outcomes < kMinOutcomesPerCohort
        || candidate.outcomes < kMinOutcomesPerCohort) {
        result.recommendation = QStringLiteral("continue_collecting");
    } else if (result.candidateBetter) {
        result.recommendation = QStringLiteral("promote_candidate");
    } else if (result.significant && result.improvement < 0.0) {
        result.recommendation = QStringLiteral("keep_champion");
    } else {
        result.recommendation = QStringLiteral("no_significant_difference");
    }
    return result;
}

} // namespace vd
