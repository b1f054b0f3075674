#include "core/models/synthetic_data.h"

#include <algorithm>

namespace vd {

SyntheticDataGenerator::SyntheticDataGenerator(quint32 seed)
    : m_rng(seed)
{
}

double SyntheticDataGenerator::beta(double a, double b)
{
    std::gamma_distribution<double> ga(a, 1.0);
    std::gamma_distribution<double> gb(b, 1.0);
    const double x = ga(m_rng);
    const double y = gb(m_rng);
    const double sum = x + y;
    return sum > 0.0 ? x / sum : 0.5;
}

FeatureVector SyntheticDataGenerator::sampleFeatures()
{
    std::uniform_int_distribution<int> intentPick(0, 2);
    std::uniform_int_distribution<int> hourPick(0, 23);
    std::uniform_int_distribution<int> dayPick(0, 6);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::poisson_distribution<int> lengthDist(200);
    std::poisson_distribution<int> policyDist(1.0);
    std::poisson_distribution<int> denyDist(0.3);
    std::poisson_distribution<int> flagDist(0.5);
    std::bernoulli_distribution urlDist(0.2);
    std::bernoulli_distribution emailDist(0.1);
    std::bernoulli_distribution codeDist(0.15);

    FeatureVector fv;
    switch (intentPick(m_rng)) {
    case 0: fv.intentClass = IntentClass::Helpful; break;
    case 1: fv.intentClass = IntentClass::Harmful; break;
    default: fv.intentClass = IntentClass::Neutral; break;
    }
    fv.intentConfidence = beta(2.0, 2.0);
    fv.intentIsHelpful = fv.intentClass == IntentClass::Helpful;
    fv.intentIsHarmful = fv.intentClass == IntentClass::Harmful;

    fv.contentLength = normalizeContentLength(lengthDist(m_rng));
    fv.contentHasUrls = urlDist(m_rng);
    fv.contentHasEmail = emailDist(m_rng);
    fv.contentHasCode = codeDist(m_rng);
    fv.contentToxicityScore = beta(1.0, 3.0);
    fv.userHistoryScore = unit(m_rng);

    const int hour = hourPick(m_rng);
    const int day = dayPick(m_rng);
    fv.timeOfDay = normalizeHour(hour);
    fv.dayOfWeek = normalizeDayOfWeek(day);
    fv.isBusinessHours = day < 5 && hour >= 9 && hour <= 17;

    fv.policyMatchCount = normalizeCount(policyDist(m_rng), kPolicyCountCap);
    fv.policyDenyCount = normalizeCount(denyDist(m_rng), kPolicyCountCap);
    fv.policyAllowCount = normalizeCount(policyDist(m_rng), kPolicyCountCap);

    const double riskDraw = unit(m_rng);
    fv.riskLevel = riskDraw < 0.3 ? riskLevelValue(RiskLevel::Low)
                 : riskDraw < 0.8 ? riskLevelValue(RiskLevel::Medium)
                                  : riskLevelValue(RiskLevel::High);
    fv.complianceFlags = normalizeCount(flagDist(m_rng), kComplianceFlagCap);
    fv.sensitivityScore = unit(m_rng);
    return fv;
}

Decision SyntheticDataGenerator::labelFor(const FeatureVector& features)
{
    if (features.intentIsHarmful || features.contentToxicityScore > 0.8) {
        return Decision::Deny;
    }
    if (features.contentToxicityScore > 0.6
        || (features.riskLevel >= 1.0 && features.sensitivityScore > 0.7)) {
        return Decision::Escalate;
    }
    if (features.intentIsHelpful && features.intentConfidence > 0.7
        && features.isBusinessHours && features.contentToxicityScore < 0.3) {
        return Decision::Allow;
    }
    if (features.intentConfidence > 0.8 && features.contentToxicityScore < 0.3) {
        return Decision::Allow;
    }
    return Decision::Monitor;
}

std::vector<LabeledSample> SyntheticDataGenerator::generate(int count)
{
    std::vector<LabeledSample> samples;
    samples.reserve(static_cast<size_t>(std::max(count, 0)));
    for (int i = 0; i < count; ++i) {
        const FeatureVector fv = sampleFeatures();
        samples.push_back(LabeledSample{fv.toArray(), labelFor(fv)});
    }
    return samples;
}

} // namespace vd
