#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "core/shared/settings_manager.h"

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void cleanup();
    void testDefaults();
    void testSaveLoadRoundTrip();
    void testMissingFileReturnsNullopt();
    void testMalformedFileReturnsNullopt();
    void testInvalidValuesKeepDefaults();
    void testResolvePathsFromDataDir();
    void testEnvironmentOverrides();
};

void TestSettingsManager::cleanup()
{
    qunsetenv("VERDICT_CONFIG");
    qunsetenv("VERDICT_DATA_DIR");
}

void TestSettingsManager::testDefaults()
{
    const vd::EngineSettings settings = vd::SettingsManager::fromJson(QJsonObject());
    QCOMPARE(settings.timezone, QStringLiteral("UTC"));
    QCOMPARE(settings.businessHourStart, 9);
    QCOMPARE(settings.businessHourEnd, 17);
    QCOMPARE(settings.predictionTtlDays, 7);
    QCOMPARE(settings.feedbackTtlDays, 30);
    QCOMPARE(settings.driftMode, QStringLiteral("disabled"));
    QCOMPARE(settings.driftThreshold, 0.1);
    QCOMPARE(settings.baselineSamples, 1000);
    QCOMPARE(settings.baselineTrees, 100);
    QCOMPARE(settings.baselineMaxDepth, 10);
}

void TestSettingsManager::testSaveLoadRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + "/nested/settings.json";

    vd::EngineSettings settings;
    settings.timezone = QStringLiteral("Europe/Berlin");
    settings.driftMode = QStringLiteral("prediction_log");
    settings.driftThreshold = 0.25;
    settings.abStickyAssignment = true;
    settings.baselineSeed = 7;
    QVERIFY(vd::SettingsManager::save(settings, path));

    const std::optional<vd::EngineSettings> loaded = vd::SettingsManager::load(path);
    QVERIFY(loaded);
    QCOMPARE(loaded->timezone, QStringLiteral("Europe/Berlin"));
    QCOMPARE(loaded->driftMode, QStringLiteral("prediction_log"));
    QCOMPARE(loaded->driftThreshold, 0.25);
    QVERIFY(loaded->abStickyAssignment);
    QCOMPARE(loaded->baselineSeed, quint32(7));
}

void TestSettingsManager::testMissingFileReturnsNullopt()
{
    QTemporaryDir dir;
    QVERIFY(!vd::SettingsManager::load(dir.path() + "/absent.json").has_value());
}

void TestSettingsManager::testMalformedFileReturnsNullopt()
{
    QTemporaryDir dir;
    const QString path = dir.path() + "/settings.json";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QVERIFY(!vd::SettingsManager::load(path).has_value());
}

void TestSettingsManager::testInvalidValuesKeepDefaults()
{
    QJsonObject json;
    json.insert(QStringLiteral("timezone"), QStringLiteral("Mars/Olympus"));
    json.insert(QStringLiteral("businessHourStart"), 18);
    json.insert(QStringLiteral("businessHourEnd"), 8);
    json.insert(QStringLiteral("predictionTtlDays"), 0);
    json.insert(QStringLiteral("inferenceWorkers"), QStringLiteral("four"));
    json.insert(QStringLiteral("driftMode"), QStringLiteral("feature_store"));
    json.insert(QStringLiteral("driftThreshold"), -1.0);
    json.insert(QStringLiteral("someFutureKey"), true);

    const vd::EngineSettings settings = vd::SettingsManager::fromJson(json);
    QCOMPARE(settings.timezone, QStringLiteral("UTC"));
    QCOMPARE(settings.businessHourStart, 9);
    QCOMPARE(settings.businessHourEnd, 17);
    QCOMPARE(settings.predictionTtlDays, 7);
    QCOMPARE(settings.inferenceWorkers, 2);
    QCOMPARE(settings.driftMode, QStringLiteral("disabled"));
    QCOMPARE(settings.driftThreshold, 0.1);
}

void TestSettingsManager::testResolvePathsFromDataDir()
{
    vd::EngineSettings settings;
    settings.dataDir = QStringLiteral("/var/lib/verdict");
    vd::SettingsManager::resolvePaths(&settings);
    QCOMPARE(settings.dbPath, QStringLiteral("/var/lib/verdict/verdict.db"));
    QCOMPARE(settings.modelsDir, QStringLiteral("/var/lib/verdict/models"));

    vd::EngineSettings explicitPaths;
    explicitPaths.dataDir = QStringLiteral("/var/lib/verdict");
    explicitPaths.dbPath = QStringLiteral(":memory:");
    vd::SettingsManager::resolvePaths(&explicitPaths);
    QCOMPARE(explicitPaths.dbPath, QStringLiteral(":memory:"));
}

void TestSettingsManager::testEnvironmentOverrides()
{
    QTemporaryDir dir;
    const QString configPath = dir.path() + "/custom.json";
    qputenv("VERDICT_CONFIG", configPath.toUtf8());
    QCOMPARE(vd::SettingsManager::settingsFilePath(), configPath);

    vd::EngineSettings settings;
    settings.predictionTtlDays = 3;
    QVERIFY(vd::SettingsManager::save(settings));
    QCOMPARE(vd::SettingsManager::load()->predictionTtlDays, 3);

    qputenv("VERDICT_DATA_DIR", dir.path().toUtf8());
    vd::EngineSettings resolved;
    resolved.dataDir = QStringLiteral("/ignored");
    vd::SettingsManager::resolvePaths(&resolved);
    QCOMPARE(resolved.dataDir, dir.path());
    QCOMPARE(resolved.dbPath, QDir(dir.path()).filePath(QStringLiteral("verdict.db")));
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
