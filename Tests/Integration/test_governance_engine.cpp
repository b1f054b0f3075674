#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "core/engine/governance_engine.h"
#include "test_doubles.h"

namespace {

vd::EngineSettings testSettings(const QString& dir)
{
    vd::EngineSettings settings;
    settings.dataDir = dir;
    settings.dbPath = dir + "/verdict.db";
    settings.modelsDir = dir + "/models";
    settings.baselineSamples = 1000;
    settings.baselineTrees = 20;
    settings.baselineMaxDepth = 8;
    settings.inferenceTimeoutMs = 2000;
    settings.abMinSamples = 10;
    return settings;
}

vd::GovernanceRequest request(const QString& content, const QString& requestId = QString())
{
    vd::GovernanceRequest req;
    req.requestId = requestId;
    req.content = content;
    req.userId = QStringLiteral("user-42");
    req.timestamp = QDateTime(QDate(2024, 5, 15), QTime(10, 0), QTimeZone::utc());
    return req;
}

} // namespace

class TestGovernanceEngine : public QObject {
    Q_OBJECT

private slots:
    void testToxicContentIsBlocked();
    void testBenignRequestIsExplained();
    void testBaselineFailureFallsBackToMonitor();
    void testFeedbackCorrectionUpdatesLearner();
    void testUnknownFeedbackRejected();
    void testForcedAbConclusionPromotesCandidate();
    void testAbConclusionWithoutWinnerKeepsChampion();
    void testModelsReloadAfterRestart();
    void testDriftCheckWithoutDataReportsNothing();
};

void TestGovernanceEngine::testToxicContentIsBlocked()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    vd::GovernanceEngine engine(testSettings(dir.path()));
    QString error;
    QVERIFY2(engine.initialize(&error), qPrintable(error));

    const vd::GovernanceResponse response = engine.predict(request(
        QStringLiteral("I will kill you and bomb your house, you worthless idiot. I hate you.")));

    QVERIFY(!response.fallbackUsed);
    QVERIFY(response.decision == vd::Decision::Deny || response.decision == vd::Decision::Escalate);
    QVERIFY(response.reasoning.contains(QStringLiteral("High toxicity score detected")));
    QVERIFY(response.features.intentIsHarmful);
    QCOMPARE(response.modelVersion, QStringLiteral("baseline-v1.0"));
    QVERIFY(response.requestId.startsWith(QStringLiteral("req")));

    engine.flushLogs();
    QCOMPARE(engine.metrics().predictions.load(), qint64(1));
    QCOMPARE(engine.metrics().predictionLogFailures.load(), qint64(0));
}

void TestGovernanceEngine::testBenignRequestIsExplained()
{
    QTemporaryDir dir;
    vd::GovernanceEngine engine(testSettings(dir.path()));
    QVERIFY(engine.initialize());

    const vd::GovernanceResponse response = engine.predict(request(
        QStringLiteral("Could you please help me summarise this quarterly report?"),
        QStringLiteral("req-benign")));

    QCOMPARE(response.requestId, QStringLiteral("req-benign"));
    QVERIFY(response.confidence >= 0.0 && response.confidence <= 1.0);
    QVERIFY(response.reasoning.contains(QStringLiteral("% confidence. Reasons: ")));
    QVERIFY(!response.reasoning.contains(QStringLiteral("High toxicity score detected")));
    QCOMPARE(response.features.toArray().size(), size_t(vd::kFeatureDim));
}

void TestGovernanceEngine::testBaselineFailureFallsBackToMonitor()
{
    QTemporaryDir dir;
    vd::GovernanceEngine engine(testSettings(dir.path()));
    engine.registry().setBaselineTrainer([](const vd::ModelRegistry::BootstrapConfig&,
                                            vd::ModelVersion*, QString* errorOut) {
        *errorOut = QStringLiteral("training data unavailable");
        return std::shared_ptr<const vd::Classifier>();
    });
    QVERIFY(engine.initialize());

    QVERIFY(!engine.bootstrapReport().available(vd::ModelType::RandomForest));
    QVERIFY(engine.registry().activeVersion(vd::ModelType::OnlineLearner).has_value());

    const vd::GovernanceResponse response = engine.predict(request(QStringLiteral("hello there")));
    QCOMPARE(response.decision, vd::Decision::Monitor);
    QCOMPARE(response.confidence, 0.5);
    QVERIFY(response.fallbackUsed);
    QCOMPARE(response.fallbackReason, QStringLiteral("model_unavailable"));
    QCOMPARE(response.modelVersion, QStringLiteral("none"));
    QVERIFY(response.reasoning.contains(QStringLiteral("conservative fallback")));

    const QJsonObject status = engine.status();
    QCOMPARE(status.value(QStringLiteral("unavailable_models")).toObject()
                 .value(QStringLiteral("random_forest")).toString(),
             QStringLiteral("training data unavailable"));
    QCOMPARE(engine.metrics().fallbackPredictions.load(), qint64(1));
}

void TestGovernanceEngine::testFeedbackCorrectionUpdatesLearner()
{
    QTemporaryDir dir;
    vd::GovernanceEngine engine(testSettings(dir.path()));
    QVERIFY(engine.initialize());

    const vd::GovernanceResponse response = engine.predict(request(
        QStringLiteral("Please share the onboarding checklist"), QStringLiteral("req-fb")));
    const vd::Decision corrected = response.decision == vd::Decision::Deny
        ? vd::Decision::Allow : vd::Decision::Deny;

    vd::FeedbackSubmission feedback;
    feedback.requestId = QStringLiteral("req-fb");
    feedback.userId = QStringLiteral("reviewer");
    feedback.feedbackType = vd::FeedbackType::Incorrect;
    feedback.correctDecision = corrected;
    QVERIFY(engine.submitFeedback(feedback));

    const std::vector<vd::LearnerStatus> learners = engine.onlineLearningStatus();
    QCOMPARE(learners.size(), size_t(1));
    QCOMPARE(learners.front().samplesLearned, qint64(1));
    QCOMPARE(learners.front().status, QStringLiteral("cold_start"));

    const QJsonObject metrics = engine.modelMetrics();
    QCOMPARE(metrics.value(QStringLiteral("total_predictions")).toInt(), 1);
    QCOMPARE(metrics.value(QStringLiteral("total_feedback")).toInt(), 1);
}

void TestGovernanceEngine::testUnknownFeedbackRejected()
{
    QTemporaryDir dir;
    vd::GovernanceEngine engine(testSettings(dir.path()));
    QVERIFY(engine.initialize());

    vd::FeedbackSubmission feedback;
    feedback.requestId = QStringLiteral("req-missing");
    feedback.feedbackType = vd::FeedbackType::Correct;
    QVERIFY(!engine.submitFeedback(feedback));
    QCOMPARE(engine.metrics().feedbackUnknownRequest.load(), qint64(1));
}

void TestGovernanceEngine::testForcedAbConclusionPromotesCandidate()
{
    QTemporaryDir dir;
    vd::GovernanceEngine engine(testSettings(dir.path()));
    QVERIFY(engine.initialize());

    QVERIFY(engine.registry().registerVersion(
        vd::test::makeVersion(QStringLiteral("rf-candidate"), vd::ModelType::RandomForest),
        std::make_shared<vd::test::FixedClassifier>(vd::ModelType::RandomForest,
                                                    std::vector<double>{0.1, 0.1, 0.7, 0.1})));
    QString error;
    const std::optional<vd::ABTest> test = engine.createAbTest(
        QStringLiteral("baseline-v1.0"), QStringLiteral("rf-candidate"), 0.5, &error);
    QVERIFY2(test, qPrintable(error));

    int routed = 0;
    for (int i = 0; i < 20; ++i) {
        const vd::GovernanceResponse response =
            engine.predict(request(QStringLiteral("status update")), true);
        if (response.abTest) {
            QCOMPARE(response.abTest->testId, test->testId);
            ++routed;
        }
    }
    QCOMPARE(routed, 20);
    QCOMPARE(engine.metrics().abRoutedPredictions.load(), qint64(20));

    const std::optional<vd::AbConclusion> conclusion = engine.concludeAbTest(test->testId, true, &error);
    QVERIFY2(conclusion, qPrintable(error));
    QVERIFY(conclusion->promoted);
    QCOMPARE(conclusion->test.status, vd::AbTestStatus::Completed);
    QCOMPARE(engine.registry().activeVersion(vd::ModelType::RandomForest),
             std::optional<QString>(QStringLiteral("rf-candidate")));
    QCOMPARE(engine.registry().version(QStringLiteral("baseline-v1.0"))->status,
             vd::ModelStatus::Retired);

    QVERIFY(!engine.concludeAbTest(test->testId, true, &error));
    QCOMPARE(error, QStringLiteral("ab_test_not_active"));
    QVERIFY(!engine.concludeAbTest(QStringLiteral("ab_missing"), false, &error));
    QCOMPARE(error, QStringLiteral("unknown_ab_test"));
}

void TestGovernanceEngine::testAbConclusionWithoutWinnerKeepsChampion()
{
    QTemporaryDir dir;
    vd::GovernanceEngine engine(testSettings(dir.path()));
    QVERIFY(engine.initialize());

    QVERIFY(engine.registry().registerVersion(
        vd::test::makeVersion(QStringLiteral("rf-candidate"), vd::ModelType::RandomForest),
        std::make_shared<vd::test::FixedClassifier>(vd::ModelType::RandomForest,
                                                    std::vector<double>{0.1, 0.1, 0.7, 0.1})));
    const std::optional<vd::ABTest> test = engine.createAbTest(
        QStringLiteral("baseline-v1.0"), QStringLiteral("rf-candidate"), 0.3);
    QVERIFY(test);

    const std::optional<vd::AbConclusion> conclusion = engine.concludeAbTest(test->testId, false);
    QVERIFY(conclusion);
    QVERIFY(!conclusion->promoted);
    QCOMPARE(conclusion->comparison.recommendation, QStringLiteral("continue_collecting"));
    QCOMPARE(conclusion->test.status, vd::AbTestStatus::Completed);
    QCOMPARE(engine.registry().activeVersion(vd::ModelType::RandomForest),
             std::optional<QString>(QStringLiteral("baseline-v1.0")));
    QVERIFY(engine.status().value(QStringLiteral("active_ab_tests")).toArray().isEmpty());
}

void TestGovernanceEngine::testModelsReloadAfterRestart()
{
    QTemporaryDir dir;
    {
        vd::GovernanceEngine engine(testSettings(dir.path()));
        QVERIFY(engine.initialize());
        QVERIFY(engine.bootstrapReport().provisionedVersions.contains(QStringLiteral("baseline-v1.0")));
        engine.predict(request(QStringLiteral("first run"), QStringLiteral("req-persisted")));
        engine.shutdown();
    }

    vd::GovernanceEngine restarted(testSettings(dir.path()));
    QVERIFY(restarted.initialize());
    QVERIFY(restarted.bootstrapReport().provisionedVersions.isEmpty());
    QCOMPARE(restarted.registry().activeVersion(vd::ModelType::RandomForest),
             std::optional<QString>(QStringLiteral("baseline-v1.0")));

    vd::FeedbackSubmission feedback;
    feedback.requestId = QStringLiteral("req-persisted");
    feedback.feedbackType = vd::FeedbackType::Correct;
    QVERIFY(restarted.submitFeedback(feedback));
}

void TestGovernanceEngine::testDriftCheckWithoutDataReportsNothing()
{
    QTemporaryDir dir;
    vd::EngineSettings settings = testSettings(dir.path());
    settings.driftMode = QStringLiteral("prediction_log");
    vd::GovernanceEngine engine(settings);
    QVERIFY(engine.initialize());
    engine.driftMonitor()->setScorer(std::make_shared<vd::test::FixedDriftScorer>(0.5));

    QVERIFY(!engine.driftCheck().has_value());
    QCOMPARE(engine.metrics().driftNoData.load(), qint64(1));
    QVERIFY(engine.driftHistory(QString(), 10).empty());
    QCOMPARE(engine.status().value(QStringLiteral("drift_mode")).toString(),
             QStringLiteral("prediction_log"));
}

QTEST_MAIN(TestGovernanceEngine)
#include "test_governance_engine.moc"
