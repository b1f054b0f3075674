#pragma once

#include "core/shared/governance_types.h"

#include <QJsonObject>
#include <QString>

namespace vd {

struct AbComparison {
    double championAccuracy = 0.0;
    double candidateAccuracy = 0.0;
    double improvement = 0.0;
    double zScore = 0.0;
    bool significant = false;
    bool candidateBetter = false;
    qint64 totalOutcomes = 0;
    QString recommendation;

    QJsonObject toJson() const;
};

constexpr int kMinOutcomesPerCohort = 30;
constexpr double kSignificanceZ = 1.96;

// Two-proportion z-test on labelled outcomes. The candidate is better only
// when it improves on the champion, the difference is significant and the
// test has collected at least minTotalOutcomes labels.
AbComparison compareCohorts(const ABTest& test, int minTotalOutcomes);

} // namespace vd
