#include <QtTest/QtTest>

#include "core/models/evaluation.h"
#include "core/models/online_learner.h"
#include "core/models/synthetic_data.h"

#include <cmath>

namespace {

vd::FeatureArray harmfulFeatures()
{
    vd::FeatureVector fv;
    fv.intentClass = vd::IntentClass::Harmful;
    fv.intentIsHarmful = true;
    fv.intentConfidence = 0.9;
    fv.contentToxicityScore = 0.95;
    return fv.toArray();
}

} // namespace

class TestOnlineLearner : public QObject {
    Q_OBJECT

private slots:
    void testColdStartIsUniform();
    void testLearnOneMovesTowardLabel();
    void testCloneIsIndependent();
    void testWeightsStayBounded();
    void testLearnsFromSyntheticStream();
    void testJsonRestore();
};

void TestOnlineLearner::testColdStartIsUniform()
{
    const vd::OnlineLearner learner;
    const std::vector<double> proba = learner.predictProba(harmfulFeatures());
    QCOMPARE(static_cast<int>(proba.size()), vd::kDecisionCount);
    for (double p : proba) {
        QVERIFY(qAbs(p - 0.25) < 1e-12);
    }
    QCOMPARE(learner.samplesLearned(), qint64(0));
    QCOMPARE(vd::argmaxDecision(proba), vd::Decision::Monitor);
}

void TestOnlineLearner::testLearnOneMovesTowardLabel()
{
    vd::OnlineLearner learner;
    const vd::FeatureArray x = harmfulFeatures();
    const double before = learner.predictProba(x)[vd::decisionIndex(vd::Decision::Deny)];
    learner.learnOne(x, vd::Decision::Deny);
    const double after = learner.predictProba(x)[vd::decisionIndex(vd::Decision::Deny)];

    QVERIFY(after > before);
    QCOMPARE(learner.samplesLearned(), qint64(1));
}

void TestOnlineLearner::testCloneIsIndependent()
{
    vd::OnlineLearner original;
    const vd::FeatureArray x = harmfulFeatures();
    std::unique_ptr<vd::IncrementalClassifier> copy = original.clone();
    for (int i = 0; i < 10; ++i) {
        copy->learnOne(x, vd::Decision::Deny);
    }

    QCOMPARE(original.samplesLearned(), qint64(0));
    QCOMPARE(copy->samplesLearned(), qint64(10));
    QVERIFY(qAbs(original.predictProba(x)[1] - 0.25) < 1e-12);
    QCOMPARE(vd::argmaxDecision(copy->predictProba(x)), vd::Decision::Deny);
}

void TestOnlineLearner::testWeightsStayBounded()
{
    vd::OnlineLearner::Config config;
    config.learningRate = 100.0;
    vd::OnlineLearner learner(config);

    vd::FeatureArray ones;
    ones.fill(1.0);
    for (int i = 0; i < 200; ++i) {
        learner.learnOne(ones, i % 2 == 0 ? vd::Decision::Allow : vd::Decision::Escalate);
    }
    for (double p : learner.predictProba(ones)) {
        QVERIFY(std::isfinite(p));
    }
    const QJsonArray weights = learner.toJson().value(QStringLiteral("weights")).toArray();
    for (const QJsonValue& row : weights) {
        for (const QJsonValue& w : row.toArray()) {
            QVERIFY(qAbs(w.toDouble()) <= 50.0);
        }
    }
}

void TestOnlineLearner::testLearnsFromSyntheticStream()
{
    vd::OnlineLearner::Config config;
    config.learningRate = 0.1;
    vd::OnlineLearner learner(config);

    vd::SyntheticDataGenerator generator(11);
    for (int epoch = 0; epoch < 5; ++epoch) {
        for (const vd::LabeledSample& sample : generator.generate(400)) {
            learner.learnOne(sample.features, sample.label);
        }
    }

    const vd::ClassificationReport report =
        vd::evaluateClassifier(learner, vd::SyntheticDataGenerator(12).generate(300));
    // Well above the 0.25 of a uniform guess.
    QVERIFY2(report.accuracy > 0.5, qPrintable(QString::number(report.accuracy)));
}

void TestOnlineLearner::testJsonRestore()
{
    vd::OnlineLearner learner;
    const vd::FeatureArray x = harmfulFeatures();
    for (int i = 0; i < 5; ++i) {
        learner.learnOne(x, vd::Decision::Deny);
    }

    QString error;
    const std::unique_ptr<vd::Classifier> restored = vd::classifierFromJson(learner.toJson(), &error);
    QVERIFY2(restored, qPrintable(error));
    QCOMPARE(restored->modelType(), vd::ModelType::OnlineLearner);

    const auto* incremental = dynamic_cast<const vd::IncrementalClassifier*>(restored.get());
    QVERIFY(incremental);
    QCOMPARE(incremental->samplesLearned(), qint64(5));

    const std::vector<double> expected = learner.predictProba(x);
    const std::vector<double> actual = restored->predictProba(x);
    for (size_t i = 0; i < expected.size(); ++i) {
        QVERIFY(qAbs(expected[i] - actual[i]) < 1e-9);
    }
}

QTEST_MAIN(TestOnlineLearner)
#include "test_online_learner.moc"
