#pragma once

#include "core/features/feature_vector.h"
#include "core/shared/governance_types.h"

#include <QString>
#include <QTimeZone>

namespace vd {

// Builds the normalised FeatureVector for a request. Pure: no I/O and no
// randomness, so identical requests always produce identical vectors.
class FeatureExtractor {
public:
    struct Config {
        QString timezone = QStringLiteral("UTC");
        int businessHourStart = 9;
        int businessHourEnd = 17;
    };

    struct IntentEstimate {
        IntentClass intentClass = IntentClass::Neutral;
        double confidence = 0.5;
    };

    FeatureExtractor();
    explicit FeatureExtractor(const Config& config);

    FeatureVector extract(const GovernanceRequest& request) const;

    static double toxicityScore(const QString& content);
    static IntentEstimate inferIntent(const QString& content);
    static bool containsUrl(const QString& content);
    static bool containsEmail(const QString& content);
    static bool containsCode(const QString& content);

private:
    Config m_config;
    QTimeZone m_zone;
};

} // namespace vd
