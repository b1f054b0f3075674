#include "core/models/evaluation.h"

namespace vd {

QJsonObject ClassificationReport::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("samples")] = samples;
    obj[QStringLiteral("accuracy")] = accuracy;
    obj[QStringLiteral("precision")] = precision;
    obj[QStringLiteral("recall")] = recall;
    obj[QStringLiteral("f1_score")] = f1Score;
    return obj;
}

void ConfusionMatrix::add(Decision actual, Decision predicted)
{
    ++m_counts[static_cast<size_t>(decisionIndex(actual))][static_cast<size_t>(decisionIndex(predicted))];
}

qint64 ConfusionMatrix::total() const
{
    qint64 sum = 0;
    for (const auto& row : m_counts) {
        for (qint64 value : row) {
            sum += value;
        }
    }
    return sum;
}

ClassificationReport ConfusionMatrix::report() const
{
    ClassificationReport report;
    report.samples = total();
    if (report.samples == 0) {
        return report;
    }

    qint64 correct = 0;
    double precisionSum = 0.0;
    double recallSum = 0.0;
    double f1Sum = 0.0;
    int classes = 0;
    for (size_t c = 0; c < m_counts.size(); ++c) {
        const qint64 tp = m_counts[c][c];
        correct += tp;

        qint64 actualTotal = 0;
        qint64 predictedTotal = 0;
        for (size_t k = 0; k < m_counts.size(); ++k) {
            actualTotal += m_counts[c][k];
            predictedTotal += m_counts[k][c];
        }
        if (actualTotal == 0 && predictedTotal == 0) {
            continue;
        }

        const double precision = predictedTotal > 0 ? static_cast<double>(tp) / predictedTotal : 0.0;
        const double recall = actualTotal > 0 ? static_cast<double>(tp) / actualTotal : 0.0;
        const double f1 = (precision + recall) > 0.0
            ? 2.0 * precision * recall / (precision + recall)
            : 0.0;
        precisionSum += precision;
        recallSum += recall;
        f1Sum += f1;
        ++classes;
    }

    report.accuracy = static_cast<double>(correct) / report.samples;
    if (classes > 0) {
        report.precision = precisionSum / classes;
        report.recall = recallSum / classes;
        report.f1Score = f1Sum / classes;
    }
    return report;
}

Decision argmaxDecision(const std::vector<double>& probabilities)
{
    static const Decision kTieOrder[] = {
        Decision::Monitor, Decision::Escalate, Decision::Deny, Decision::Allow,
    };

    Decision best = Decision::Monitor;
    double bestValue = -1.0;
    for (Decision candidate : kTieOrder) {
        const size_t idx = static_cast<size_t>(decisionIndex(candidate));
        if (idx < probabilities.size() && probabilities[idx] > bestValue) {
            best = candidate;
            bestValue = probabilities[idx];
        }
    }
    return best;
}

ClassificationReport evaluateClassifier(const Classifier& classifier,
                                        const std::vector<LabeledSample>& samples)
{
    ConfusionMatrix matrix;
    for (const LabeledSample& sample : samples) {
        matrix.add(sample.label, argmaxDecision(classifier.predictProba(sample.features)));
    }
    return matrix.report();
}

} // namespace vd
