#pragma once

#include "core/features/feature_vector.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

namespace vd {

class ReasoningGenerator {
public:
    static constexpr double kHelpfulConfidenceThreshold = 0.8;
    static constexpr double kToxicityThreshold = 0.7;

    // Rule-ordered explanation; identical inputs give identical text.
    static QString explain(const FeatureVector& features, Decision decision, double confidence);
    static QStringList reasons(const FeatureVector& features);
    static QString explainFallback(const QString& reason);
};

} // namespace vd
