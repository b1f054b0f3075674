#include <QtTest/QtTest>

#include "core/models/model_registry.h"
#include "test_doubles.h"

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

vd::ModelRegistry::BootstrapConfig quickBootstrap()
{
    vd::ModelRegistry::BootstrapConfig config;
    config.syntheticSamples = 200;
    config.forest.trees = 5;
    config.forest.maxDepth = 6;
    return config;
}

std::shared_ptr<const vd::Classifier> fixedForest()
{
    return std::make_shared<vd::test::FixedClassifier>(
        vd::ModelType::RandomForest, std::vector<double>{0.7, 0.1, 0.1, 0.1});
}

int activeCount(const std::vector<vd::ModelVersion>& versions, vd::ModelType type)
{
    int count = 0;
    for (const vd::ModelVersion& meta : versions) {
        if (meta.modelType == type && meta.status == vd::ModelStatus::Active) {
            ++count;
        }
    }
    return count;
}

} // namespace

class TestModelRegistry : public QObject {
    Q_OBJECT

private slots:
    void testBootstrapProvisionsBaselineAndLearner();
    void testBootstrapReloadsPersistedVersions();
    void testBaselineFailureOnlyAffectsForest();
    void testBaselineTrainerExceptionIsContained();
    void testRegisterValidation();
    void testPromoteRetiresPrevious();
    void testExactlyOneActiveUnderConcurrentPromotion();
    void testRetireRules();
    void testReplaceArtifactPublishesSnapshot();
    void testReplaceActiveArtifactRejectsRetiredVersion();
    void testAbTestLifecycle();
    void testPromotingChampionCancelsTest();
    void testLiveMetricsFromFeedback();
};

void TestModelRegistry::testBootstrapProvisionsBaselineAndLearner()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    vd::ModelRegistry registry(dir.path());

    const vd::ModelRegistry::BootstrapReport report = registry.bootstrap(quickBootstrap());
    QVERIFY(report.failures.empty());
    QVERIFY(report.available(vd::ModelType::RandomForest));
    QCOMPARE(report.provisionedVersions.size(), 2);

    QCOMPARE(registry.activeVersion(vd::ModelType::RandomForest),
             std::optional<QString>(QStringLiteral("baseline-v1.0")));
    QCOMPARE(registry.activeVersion(vd::ModelType::OnlineLearner),
             std::optional<QString>(QStringLiteral("online-v1.0")));
    QVERIFY(!registry.activeVersion(vd::ModelType::Ensemble).has_value());

    const std::optional<vd::ModelVersion> baseline = registry.version(QStringLiteral("baseline-v1.0"));
    QVERIFY(baseline);
    QCOMPARE(baseline->trainingSamples, 160);
    QCOMPARE(baseline->validationSamples, 40);
    QVERIFY(baseline->accuracy > 0.0);
    QVERIFY(baseline->deployedAt.isValid());

    QVERIFY(QFileInfo::exists(dir.filePath(QStringLiteral("baseline-v1.0/metadata.json"))));
    QVERIFY(QFileInfo::exists(dir.filePath(QStringLiteral("baseline-v1.0/model.json"))));
}

void TestModelRegistry::testBootstrapReloadsPersistedVersions()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    {
        vd::ModelRegistry first(dir.path());
        first.bootstrap(quickBootstrap());
    }

    vd::ModelRegistry second(dir.path());
    bool trainerCalled = false;
    second.setBaselineTrainer([&trainerCalled](const vd::ModelRegistry::BootstrapConfig&,
                                               vd::ModelVersion*, QString*) {
        trainerCalled = true;
        return std::shared_ptr<const vd::Classifier>();
    });
    const vd::ModelRegistry::BootstrapReport report = second.bootstrap(quickBootstrap());

    QVERIFY(!trainerCalled);
    QVERIFY(report.provisionedVersions.isEmpty());
    QVERIFY(report.loadedVersions.contains(QStringLiteral("baseline-v1.0")));
    QCOMPARE(second.activeVersion(vd::ModelType::RandomForest),
             std::optional<QString>(QStringLiteral("baseline-v1.0")));
    QVERIFY(second.artifact(QStringLiteral("baseline-v1.0")));
}

void TestModelRegistry::testBaselineFailureOnlyAffectsForest()
{
    vd::ModelRegistry registry{QString()};
    registry.setBaselineTrainer([](const vd::ModelRegistry::BootstrapConfig&,
                                   vd::ModelVersion*, QString* errorOut) {
        *errorOut = QStringLiteral("synthetic data unavailable");
        return std::shared_ptr<const vd::Classifier>();
    });

    const vd::ModelRegistry::BootstrapReport report = registry.bootstrap(quickBootstrap());
    QVERIFY(!report.available(vd::ModelType::RandomForest));
    QVERIFY(report.available(vd::ModelType::OnlineLearner));
    QCOMPARE(report.failures.at(vd::ModelType::RandomForest),
             QStringLiteral("synthetic data unavailable"));
    QVERIFY(!registry.activeVersion(vd::ModelType::RandomForest).has_value());
    QVERIFY(registry.activeVersion(vd::ModelType::OnlineLearner).has_value());
}

void TestModelRegistry::testBaselineTrainerExceptionIsContained()
{
    vd::ModelRegistry registry{QString()};
    registry.setBaselineTrainer([](const vd::ModelRegistry::BootstrapConfig&,
                                   vd::ModelVersion*, QString*) -> std::shared_ptr<const vd::Classifier> {
        throw std::runtime_error("out of memory");
    });

    const vd::ModelRegistry::BootstrapReport report = registry.bootstrap(quickBootstrap());
    QCOMPARE(report.failures.at(vd::ModelType::RandomForest), QStringLiteral("out of memory"));
    QVERIFY(report.available(vd::ModelType::OnlineLearner));
}

void TestModelRegistry::testRegisterValidation()
{
    vd::ModelRegistry registry{QString()};
    QString error;

    QVERIFY(!registry.registerVersion(vd::test::makeVersion(QStringLiteral("../escape"),
                                                            vd::ModelType::RandomForest),
                                      fixedForest(), &error));
    QCOMPARE(error, QStringLiteral("invalid_version_id"));

    QVERIFY(!registry.registerVersion(vd::test::makeVersion(QStringLiteral("rf-2"),
                                                            vd::ModelType::OnlineLearner),
                                      fixedForest(), &error));
    QCOMPARE(error, QStringLiteral("model_type_mismatch"));

    QVERIFY(!registry.registerVersion(vd::test::makeVersion(QStringLiteral("rf-2"),
                                                            vd::ModelType::RandomForest,
                                                            vd::ModelStatus::Active),
                                      fixedForest(), &error));
    QCOMPARE(error, QStringLiteral("invalid_initial_status"));

    QVERIFY(registry.registerVersion(vd::test::makeVersion(QStringLiteral("rf-2"),
                                                           vd::ModelType::RandomForest),
                                     fixedForest(), &error));
    QVERIFY(!registry.registerVersion(vd::test::makeVersion(QStringLiteral("rf-2"),
                                                            vd::ModelType::RandomForest),
                                      fixedForest(), &error));
    QCOMPARE(error, QStringLiteral("version_exists"));
}

void TestModelRegistry::testPromoteRetiresPrevious()
{
    vd::ModelRegistry registry{QString()};
    QVERIFY(vd::test::installActive(registry, QStringLiteral("rf-1"), fixedForest()));
    QVERIFY(registry.registerVersion(vd::test::makeVersion(QStringLiteral("rf-2"),
                                                           vd::ModelType::RandomForest),
                                     fixedForest()));
    QVERIFY(registry.promote(QStringLiteral("rf-2")));

    QCOMPARE(registry.version(QStringLiteral("rf-1"))->status, vd::ModelStatus::Retired);
    QVERIFY(registry.version(QStringLiteral("rf-1"))->retiredAt.isValid());
    QCOMPARE(registry.version(QStringLiteral("rf-2"))->status, vd::ModelStatus::Active);
    QCOMPARE(activeCount(registry.versions(), vd::ModelType::RandomForest), 1);

    QString error;
    QVERIFY(!registry.promote(QStringLiteral("missing"), &error));
    QCOMPARE(error, QStringLiteral("unknown_version"));

    QVERIFY(registry.registerVersion(vd::test::makeVersion(QStringLiteral("rf-empty"),
                                                           vd::ModelType::RandomForest),
                                     nullptr));
    QVERIFY(!registry.promote(QStringLiteral("rf-empty"), &error));
    QCOMPARE(error, QStringLiteral("artifact_missing"));
}

void TestModelRegistry::testExactlyOneActiveUnderConcurrentPromotion()
{
    vd::ModelRegistry registry{QString()};
    const QStringList ids = {QStringLiteral("rf-a"), QStringLiteral("rf-b"), QStringLiteral("rf-c")};
    for (const QString& id : ids) {
        QVERIFY(registry.registerVersion(vd::test::makeVersion(id, vd::ModelType::RandomForest),
                                         fixedForest()));
    }
    QVERIFY(registry.promote(ids.front()));

    std::atomic<bool> stop{false};
    std::atomic<int> violations{0};
    std::atomic<int> observations{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&]() {
            while (!stop.load()) {
                if (activeCount(registry.versions(), vd::ModelType::RandomForest) != 1) {
                    ++violations;
                }
                const std::optional<QString> active = registry.activeVersion(vd::ModelType::RandomForest);
                if (!active || !registry.artifact(*active)) {
                    ++violations;
                }
                ++observations;
            }
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&, w]() {
            for (int i = 0; i < 300; ++i) {
                registry.promote(ids.at((w + i) % ids.size()));
            }
        });
    }
    for (std::thread& t : writers) {
        t.join();
    }
    stop.store(true);
    for (std::thread& t : readers) {
        t.join();
    }

    QVERIFY(observations.load() > 0);
    QCOMPARE(violations.load(), 0);
    QCOMPARE(activeCount(registry.versions(), vd::ModelType::RandomForest), 1);
}

void TestModelRegistry::testRetireRules()
{
    vd::ModelRegistry registry{QString()};
    QVERIFY(vd::test::installActive(registry, QStringLiteral("rf-1"), fixedForest()));
    QVERIFY(registry.registerVersion(vd::test::makeVersion(QStringLiteral("rf-2"),
                                                           vd::ModelType::RandomForest),
                                     fixedForest()));

    QString error;
    QVERIFY(!registry.retire(QStringLiteral("rf-1"), &error));
    QCOMPARE(error, QStringLiteral("version_active"));

    QVERIFY(registry.createAbTest(QStringLiteral("rf-1"), QStringLiteral("rf-2"), 0.2));
    QVERIFY(!registry.retire(QStringLiteral("rf-2"), &error));
    QCOMPARE(error, QStringLiteral("version_in_ab_test"));
}

void TestModelRegistry::testReplaceArtifactPublishesSnapshot()
{
    vd::ModelRegistry registry{QString()};
    auto log = std::make_shared<vd::test::RecordingLearner::Log>();
    QVERIFY(vd::test::installActive(registry, QStringLiteral("ol-1"),
                                    std::make_shared<vd::test::RecordingLearner>(log)));

    const std::shared_ptr<const vd::Classifier> held = registry.artifact(QStringLiteral("ol-1"));
    auto next = std::make_shared<vd::test::RecordingLearner>(log, 1);
    QVERIFY(registry.replaceArtifact(QStringLiteral("ol-1"), next));

    QCOMPARE(registry.artifact(QStringLiteral("ol-1")).get(), static_cast<const vd::Classifier*>(next.get()));
    // A reader holding the previous snapshot keeps a valid object.
    QCOMPARE(dynamic_cast<const vd::IncrementalClassifier*>(held.get())->samplesLearned(), qint64(0));

    QString error;
    QVERIFY(!registry.replaceArtifact(QStringLiteral("ol-1"), fixedForest(), &error));
    QCOMPARE(error, QStringLiteral("model_type_mismatch"));
}

void TestModelRegistry::testReplaceActiveArtifactRejectsRetiredVersion()
{
    vd::ModelRegistry registry{QString()};
    auto log = std::make_shared<vd::test::RecordingLearner::Log>();
    QVERIFY(vd::test::installActive(registry, QStringLiteral("ol-1"),
                                    std::make_shared<vd::test::RecordingLearner>(log)));
    QVERIFY(registry.registerVersion(
        vd::test::makeVersion(QStringLiteral("ol-2"), vd::ModelType::OnlineLearner),
        std::make_shared<vd::test::RecordingLearner>(log)));

    QString error;
    QVERIFY(registry.replaceActiveArtifact(QStringLiteral("ol-1"),
                                           std::make_shared<vd::test::RecordingLearner>(log, 1)));
    QVERIFY(!registry.replaceActiveArtifact(QStringLiteral("ol-2"),
                                            std::make_shared<vd::test::RecordingLearner>(log, 1),
                                            &error));
    QCOMPARE(error, QStringLiteral("version_not_active"));

    QVERIFY(registry.promote(QStringLiteral("ol-2")));
    const std::shared_ptr<const vd::Classifier> retired = registry.artifact(QStringLiteral("ol-1"));
    QVERIFY(!registry.replaceActiveArtifact(QStringLiteral("ol-1"),
                                            std::make_shared<vd::test::RecordingLearner>(log, 2),
                                            &error));
    QCOMPARE(error, QStringLiteral("version_not_active"));
    QCOMPARE(registry.artifact(QStringLiteral("ol-1")).get(), retired.get());
}

void TestModelRegistry::testAbTestLifecycle()
{
    vd::ModelRegistry registry{QString()};
    QVERIFY(vd::test::installActive(registry, QStringLiteral("rf-1"), fixedForest()));
    QVERIFY(registry.registerVersion(vd::test::makeVersion(QStringLiteral("rf-2"),
                                                           vd::ModelType::RandomForest),
                                     fixedForest()));

    QString error;
    QVERIFY(!registry.createAbTest(QStringLiteral("rf-2"), QStringLiteral("rf-1"), 0.2, &error));
    QCOMPARE(error, QStringLiteral("champion_not_active"));
    QVERIFY(!registry.createAbTest(QStringLiteral("rf-1"), QStringLiteral("rf-2"), 1.5, &error));
    QCOMPARE(error, QStringLiteral("invalid_traffic_split"));

    const std::optional<vd::ABTest> test =
        registry.createAbTest(QStringLiteral("rf-1"), QStringLiteral("rf-2"), 0.2, &error);
    QVERIFY2(test, qPrintable(error));
    QCOMPARE(registry.version(QStringLiteral("rf-2"))->status, vd::ModelStatus::Candidate);
    QVERIFY(registry.activeAbTest(vd::ModelType::RandomForest));

    QVERIFY(!registry.createAbTest(QStringLiteral("rf-1"), QStringLiteral("rf-2"), 0.2, &error));
    QCOMPARE(error, QStringLiteral("ab_test_already_active"));

    registry.recordAbRequest(test->testId, vd::AbCohort::Candidate, 2.0, false);
    registry.recordAbOutcome(test->testId, vd::AbCohort::Candidate, true);
    const std::optional<vd::ABTest> updated = registry.abTest(test->testId);
    QCOMPARE(updated->candidateMetrics.requests, qint64(1));
    QCOMPARE(updated->candidateMetrics.correctOutcomes, qint64(1));

    QVERIFY(registry.promote(QStringLiteral("rf-2")));
    QCOMPARE(registry.abTest(test->testId)->status, vd::AbTestStatus::Completed);
    QVERIFY(!registry.activeAbTest(vd::ModelType::RandomForest));
    QCOMPARE(registry.version(QStringLiteral("rf-1"))->status, vd::ModelStatus::Retired);
}

void TestModelRegistry::testPromotingChampionCancelsTest()
{
    vd::ModelRegistry registry{QString()};
    QVERIFY(vd::test::installActive(registry, QStringLiteral("rf-1"), fixedForest()));
    for (const char* id : {"rf-2", "rf-3"}) {
        QVERIFY(registry.registerVersion(vd::test::makeVersion(QString::fromLatin1(id),
                                                               vd::ModelType::RandomForest),
                                         fixedForest()));
    }
    const std::optional<vd::ABTest> test =
        registry.createAbTest(QStringLiteral("rf-1"), QStringLiteral("rf-2"), 0.5);
    QVERIFY(test);

    QVERIFY(registry.promote(QStringLiteral("rf-3")));
    QCOMPARE(registry.abTest(test->testId)->status, vd::AbTestStatus::Cancelled);
}

void TestModelRegistry::testLiveMetricsFromFeedback()
{
    vd::ModelRegistry registry{QString()};
    QVERIFY(vd::test::installActive(registry, QStringLiteral("rf-1"), fixedForest()));
    registry.recordPrediction(QStringLiteral("rf-1"));
    registry.recordPrediction(QStringLiteral("rf-1"));
    registry.recordFeedbackOutcome(QStringLiteral("rf-1"), vd::Decision::Allow, vd::Decision::Allow);
    registry.recordFeedbackOutcome(QStringLiteral("rf-1"), vd::Decision::Allow, vd::Decision::Deny);

    const QJsonArray metrics = registry.versionMetricsJson();
    QCOMPARE(metrics.size(), 1);
    const QJsonObject entry = metrics.at(0).toObject();
    QCOMPARE(entry.value(QStringLiteral("version_id")).toString(), QStringLiteral("rf-1"));
    QCOMPARE(entry.value(QStringLiteral("prediction_count")).toInt(), 2);
    QCOMPARE(entry.value(QStringLiteral("feedback_count")).toInt(), 2);
    QCOMPARE(entry.value(QStringLiteral("live")).toObject().value(QStringLiteral("accuracy")).toDouble(), 0.5);
}

QTEST_MAIN(TestModelRegistry)
#include "test_model_registry.moc"
