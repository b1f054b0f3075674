#include "core/models/online_learner.h"

#include <QDateTime>
#include <QJsonArray>

#include <algorithm>
#include <cmath>

namespace vd {

namespace {

// Weight magnitude cap; keeps a run of contradictory labels from saturating
// the softmax.
constexpr double kWeightLimit = 50.0;

} // namespace

OnlineLearner::OnlineLearner()
    : OnlineLearner(Config{})
{
}

OnlineLearner::OnlineLearner(const Config& config)
    : m_config(config)
{
    for (FeatureArray& row : m_weights) {
        row.fill(0.0);
    }
    m_bias.fill(0.0);
}

double OnlineLearner::clamp(double value, double lo, double hi)
{
    return std::max(lo, std::min(hi, value));
}

std::array<double, kDecisionCount> OnlineLearner::logits(const FeatureArray& features) const
{
    std::array<double, kDecisionCount> z{};
    for (size_t c = 0; c < z.size(); ++c) {
        double acc = m_bias[c];
        for (size_t i = 0; i < features.size(); ++i) {
            acc += m_weights[c][i] * features[i];
        }
        z[c] = acc;
    }
    return z;
}

std::array<double, kDecisionCount> OnlineLearner::softmax(const std::array<double, kDecisionCount>& z)
{
    const double maxZ = *std::max_element(z.begin(), z.end());
    std::array<double, kDecisionCount> p{};
    double sum = 0.0;
    for (size_t c = 0; c < z.size(); ++c) {
        p[c] = std::exp(z[c] - maxZ);
        sum += p[c];
    }
    for (double& value : p) {
        value /= sum;
    }
    return p;
}

std::vector<double> OnlineLearner::predictProba(const FeatureArray& features) const
{
    const std::array<double, kDecisionCount> p = softmax(logits(features));
    return std::vector<double>(p.begin(), p.end());
}

void OnlineLearner::learnOne(const FeatureArray& features, Decision label)
{
    const std::array<double, kDecisionCount> p = softmax(logits(features));
    const size_t target = static_cast<size_t>(decisionIndex(label));
    const double lr = m_config.learningRate;

    for (size_t c = 0; c < p.size(); ++c) {
        const double grad = p[c] - (c == target ? 1.0 : 0.0);
        for (size_t i = 0; i < features.size(); ++i) {
            const double w = m_weights[c][i];
            m_weights[c][i] = clamp(w - lr * (grad * features[i] + m_config.l2 * w),
                                    -kWeightLimit, kWeightLimit);
        }
        m_bias[c] = clamp(m_bias[c] - lr * grad, -kWeightLimit, kWeightLimit);
    }
    ++m_samples;
}

std::unique_ptr<IncrementalClassifier> OnlineLearner::clone() const
{
    return std::make_unique<OnlineLearner>(*this);
}

QJsonObject OnlineLearner::toJson() const
{
    QJsonArray weights;
    for (const FeatureArray& row : m_weights) {
        QJsonArray packed;
        for (double value : row) {
            packed.append(value);
        }
        weights.append(packed);
    }

    QJsonArray bias;
    for (double value : m_bias) {
        bias.append(value);
    }

    QJsonObject root;
    root[QStringLiteral("type")] = modelTypeToString(ModelType::OnlineLearner);
    root[QStringLiteral("updatedAt")] = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    root[QStringLiteral("learningRate")] = m_config.learningRate;
    root[QStringLiteral("l2")] = m_config.l2;
    root[QStringLiteral("samples")] = m_samples;
    root[QStringLiteral("bias")] = bias;
    root[QStringLiteral("weights")] = weights;
    return root;
}

std::unique_ptr<OnlineLearner> OnlineLearner::fromJson(const QJsonObject& obj, QString* errorOut)
{
    const QJsonArray weights = obj.value(QStringLiteral("weights")).toArray();
    const QJsonArray bias = obj.value(QStringLiteral("bias")).toArray();
    if (weights.size() != kDecisionCount || bias.size() != kDecisionCount) {
        if (errorOut) {
            *errorOut = QStringLiteral("dimension_mismatch");
        }
        return nullptr;
    }

    Config config;
    config.learningRate = obj.value(QStringLiteral("learningRate")).toDouble(config.learningRate);
    config.l2 = obj.value(QStringLiteral("l2")).toDouble(config.l2);

    auto learner = std::make_unique<OnlineLearner>(config);
    for (int c = 0; c < kDecisionCount; ++c) {
        const QJsonArray row = weights.at(c).toArray();
        if (row.size() != kFeatureDim) {
            if (errorOut) {
                *errorOut = QStringLiteral("dimension_mismatch");
            }
            return nullptr;
        }
        for (int i = 0; i < kFeatureDim; ++i) {
            learner->m_weights[static_cast<size_t>(c)][static_cast<size_t>(i)] = row.at(i).toDouble(0.0);
        }
        learner->m_bias[static_cast<size_t>(c)] = bias.at(c).toDouble(0.0);
    }
    learner->m_samples = static_cast<qint64>(obj.value(QStringLiteral("samples")).toDouble(0.0));
    return learner;
}

} // namespace vd
