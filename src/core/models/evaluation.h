#pragma once

#include "core/models/classifier.h"

#include <QJsonObject>

#include <array>
#include <vector>

namespace vd {

struct ClassificationReport {
    qint64 samples = 0;
    double accuracy = 0.0;
    double precision = 0.0; // macro average over classes with support
    double recall = 0.0;
    double f1Score = 0.0;

    QJsonObject toJson() const;
};

// Actual-by-predicted counts, indexed by decisionIndex().
class ConfusionMatrix {
public:
    void add(Decision actual, Decision predicted);
    qint64 total() const;
    ClassificationReport report() const;

private:
    std::array<std::array<qint64, kDecisionCount>, kDecisionCount> m_counts{};
};

// Arg-max over a probability vector; exact ties resolve toward the more
// conservative decision (Monitor, Escalate, Deny, Allow).
Decision argmaxDecision(const std::vector<double>& probabilities);

ClassificationReport evaluateClassifier(const Classifier& classifier,
                                        const std::vector<LabeledSample>& samples);

} // namespace vd
