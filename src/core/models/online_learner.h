#pragma once

#include "core/models/classifier.h"

#include <array>
#include <memory>

namespace vd {

// Multinomial logistic regression trained by per-sample SGD with L2 decay.
class OnlineLearner : public IncrementalClassifier {
public:
    struct Config {
        double learningRate = 0.05;
        double l2 = 1e-4;
    };

    OnlineLearner();
    explicit OnlineLearner(const Config& config);

    ModelType modelType() const override { return ModelType::OnlineLearner; }
    std::vector<double> predictProba(const FeatureArray& features) const override;
    QJsonObject toJson() const override;

    void learnOne(const FeatureArray& features, Decision label) override;
    std::unique_ptr<IncrementalClassifier> clone() const override;
    qint64 samplesLearned() const override { return m_samples; }

    static std::unique_ptr<OnlineLearner> fromJson(const QJsonObject& obj,
                                                   QString* errorOut = nullptr);

    const Config& config() const { return m_config; }

private:
    std::array<double, kDecisionCount> logits(const FeatureArray& features) const;
    static std::array<double, kDecisionCount> softmax(const std::array<double, kDecisionCount>& z);
    static double clamp(double value, double lo, double hi);

    Config m_config;
    std::array<FeatureArray, kDecisionCount> m_weights{};
    std::array<double, kDecisionCount> m_bias{};
    qint64 m_samples = 0;
};

} // namespace vd
