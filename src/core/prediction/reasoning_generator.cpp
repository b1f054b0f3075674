#include "core/prediction/reasoning_generator.h"

#include <algorithm>

namespace vd {

QStringList ReasoningGenerator::reasons(const FeatureVector& features)
{
    QStringList out;
    if (features.intentIsHarmful) {
        out << QStringLiteral("Content classified as potentially harmful");
    } else if (features.intentIsHelpful && features.intentConfidence > kHelpfulConfidenceThreshold) {
        out << QStringLiteral("High-confidence helpful intent detected");
    }
    if (features.contentToxicityScore > kToxicityThreshold) {
        out << QStringLiteral("High toxicity score detected");
    }
    if (!features.isBusinessHours) {
        out << QStringLiteral("Request made outside business hours");
    }
    if (features.riskLevel >= riskLevelValue(RiskLevel::High)) {
        out << QStringLiteral("High risk level assessment");
    }
    return out;
}

QString ReasoningGenerator::explain(const FeatureVector& features, Decision decision, double confidence)
{
    QStringList found = reasons(features);
    if (found.isEmpty()) {
        found << QStringLiteral("No significant risk factors identified");
    }
    const double pct = std::clamp(confidence, 0.0, 1.0) * 100.0;
    return QStringLiteral("%1 decision with %2% confidence. Reasons: %3")
        .arg(decisionDisplayName(decision))
        .arg(pct, 0, 'f', 1)
        .arg(found.join(QStringLiteral("; ")));
}

QString ReasoningGenerator::explainFallback(const QString& reason)
{
    return QStringLiteral("Monitor decision with 50.0% confidence. Reasons: "
                          "Using conservative fallback (%1)").arg(reason);
}

} // namespace vd
