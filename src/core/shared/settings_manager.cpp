#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>
#include <QTimeZone>

namespace vd {

namespace {

void readInt(const QJsonObject& json, const char* key, int minValue, int* field)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isUndefined()) {
        return;
    }
    const int parsed = value.toInt(*field);
    if (!value.isDouble() || parsed < minValue) {
        LOG_WARN(vdCore, "Ignoring invalid setting %s", key);
        return;
    }
    *field = parsed;
}

void readDouble(const QJsonObject& json, const char* key, double minValue, double* field)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isUndefined()) {
        return;
    }
    if (!value.isDouble() || value.toDouble() < minValue) {
        LOG_WARN(vdCore, "Ignoring invalid setting %s", key);
        return;
    }
    *field = value.toDouble();
}

} // namespace

std::optional<EngineSettings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<EngineSettings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(vdCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(vdCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const EngineSettings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const EngineSettings& settings, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(vdCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(vdCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(vdCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString envPath = qEnvironmentVariable("VERDICT_CONFIG").trimmed();
    if (!envPath.isEmpty()) {
        return envPath;
    }
    return defaultDataDir() + QStringLiteral("/settings.json");
}

QString SettingsManager::defaultDataDir()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/verdict");
}

void SettingsManager::resolvePaths(EngineSettings* settings)
{
    if (!settings) {
        return;
    }

    const QString envDataDir = qEnvironmentVariable("VERDICT_DATA_DIR").trimmed();
    if (!envDataDir.isEmpty()) {
        settings->dataDir = envDataDir;
    }
    if (settings->dataDir.isEmpty()) {
        settings->dataDir = defaultDataDir();
    }

    const QDir dataDir(settings->dataDir);
    if (settings->dbPath.isEmpty()) {
        settings->dbPath = dataDir.filePath(QStringLiteral("verdict.db"));
    }
    if (settings->modelsDir.isEmpty()) {
        settings->modelsDir = dataDir.filePath(QStringLiteral("models"));
    }
}

QJsonObject SettingsManager::toJson(const EngineSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dataDir"), settings.dataDir);
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("modelsDir"), settings.modelsDir);
    json.insert(QStringLiteral("timezone"), settings.timezone);
    json.insert(QStringLiteral("businessHourStart"), settings.businessHourStart);
    json.insert(QStringLiteral("businessHourEnd"), settings.businessHourEnd);
    json.insert(QStringLiteral("predictionTtlDays"), settings.predictionTtlDays);
    json.insert(QStringLiteral("feedbackTtlDays"), settings.feedbackTtlDays);
    json.insert(QStringLiteral("inferenceTimeoutMs"), settings.inferenceTimeoutMs);
    json.insert(QStringLiteral("inferenceWorkers"), settings.inferenceWorkers);
    json.insert(QStringLiteral("inferenceQueueLimit"), settings.inferenceQueueLimit);
    json.insert(QStringLiteral("abStickyAssignment"), settings.abStickyAssignment);
    json.insert(QStringLiteral("abMinSamples"), settings.abMinSamples);
    json.insert(QStringLiteral("driftMode"), settings.driftMode);
    json.insert(QStringLiteral("driftThreshold"), settings.driftThreshold);
    json.insert(QStringLiteral("driftCurrentWindowHours"), settings.driftCurrentWindowHours);
    json.insert(QStringLiteral("driftReferenceDays"), settings.driftReferenceDays);
    json.insert(QStringLiteral("driftMinSamples"), settings.driftMinSamples);
    json.insert(QStringLiteral("driftCheckIntervalMinutes"), settings.driftCheckIntervalMinutes);
    json.insert(QStringLiteral("baselineSamples"), settings.baselineSamples);
    json.insert(QStringLiteral("baselineSeed"), static_cast<qint64>(settings.baselineSeed));
    json.insert(QStringLiteral("baselineTrees"), settings.baselineTrees);
    json.insert(QStringLiteral("baselineMaxDepth"), settings.baselineMaxDepth);
    json.insert(QStringLiteral("onlineLearningRate"), settings.onlineLearningRate);
    json.insert(QStringLiteral("onlineL2"), settings.onlineL2);
    json.insert(QStringLiteral("onlineReadySamples"), settings.onlineReadySamples);
    json.insert(QStringLiteral("logQueueLimit"), settings.logQueueLimit);
    json.insert(QStringLiteral("maintenanceIntervalMinutes"), settings.maintenanceIntervalMinutes);
    return json;
}

EngineSettings SettingsManager::fromJson(const QJsonObject& json)
{
    EngineSettings settings;

    const QJsonObject known = toJson(settings);
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        if (!known.contains(it.key())) {
            LOG_WARN(vdCore, "Ignoring unknown setting: %s", qUtf8Printable(it.key()));
        }
    }

    settings.dataDir = json.value(QStringLiteral("dataDir")).toString(settings.dataDir);
    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.modelsDir = json.value(QStringLiteral("modelsDir")).toString(settings.modelsDir);

    const QString timezone = json.value(QStringLiteral("timezone")).toString(settings.timezone);
    if (QTimeZone(timezone.toUtf8()).isValid()) {
        settings.timezone = timezone;
    } else {
        LOG_WARN(vdCore, "Unknown timezone '%s', keeping %s",
                 qUtf8Printable(timezone), qUtf8Printable(settings.timezone));
    }

    readInt(json, "businessHourStart", 0, &settings.businessHourStart);
    readInt(json, "businessHourEnd", 0, &settings.businessHourEnd);
    if (settings.businessHourStart > 23 || settings.businessHourEnd > 23
        || settings.businessHourStart > settings.businessHourEnd) {
        LOG_WARN(vdCore, "Invalid business hours %d-%d, using 9-17",
                 settings.businessHourStart, settings.businessHourEnd);
        settings.businessHourStart = 9;
        settings.businessHourEnd = 17;
    }

    readInt(json, "predictionTtlDays", 1, &settings.predictionTtlDays);
    readInt(json, "feedbackTtlDays", 1, &settings.feedbackTtlDays);
    readInt(json, "inferenceTimeoutMs", 0, &settings.inferenceTimeoutMs);
    readInt(json, "inferenceWorkers", 1, &settings.inferenceWorkers);
    readInt(json, "inferenceQueueLimit", 1, &settings.inferenceQueueLimit);
    settings.abStickyAssignment = json.value(QStringLiteral("abStickyAssignment"))
                                      .toBool(settings.abStickyAssignment);
    readInt(json, "abMinSamples", 0, &settings.abMinSamples);

    const QString driftMode = json.value(QStringLiteral("driftMode")).toString(settings.driftMode);
    if (driftMode == QLatin1String("disabled") || driftMode == QLatin1String("prediction_log")) {
        settings.driftMode = driftMode;
    } else {
        LOG_WARN(vdCore, "Unknown driftMode '%s', keeping %s",
                 qUtf8Printable(driftMode), qUtf8Printable(settings.driftMode));
    }
    readDouble(json, "driftThreshold", 0.0, &settings.driftThreshold);
    readInt(json, "driftCurrentWindowHours", 1, &settings.driftCurrentWindowHours);
    readInt(json, "driftReferenceDays", 1, &settings.driftReferenceDays);
    readInt(json, "driftMinSamples", 1, &settings.driftMinSamples);
    readInt(json, "driftCheckIntervalMinutes", 1, &settings.driftCheckIntervalMinutes);

    readInt(json, "baselineSamples", 10, &settings.baselineSamples);
    if (json.contains(QStringLiteral("baselineSeed"))) {
        settings.baselineSeed = static_cast<quint32>(
            json.value(QStringLiteral("baselineSeed")).toVariant().toUInt());
    }
    readInt(json, "baselineTrees", 1, &settings.baselineTrees);
    readInt(json, "baselineMaxDepth", 1, &settings.baselineMaxDepth);

    readDouble(json, "onlineLearningRate", 0.0, &settings.onlineLearningRate);
    readDouble(json, "onlineL2", 0.0, &settings.onlineL2);
    readInt(json, "onlineReadySamples", 1, &settings.onlineReadySamples);

    readInt(json, "logQueueLimit", 1, &settings.logQueueLimit);
    readInt(json, "maintenanceIntervalMinutes", 1, &settings.maintenanceIntervalMinutes);

    return settings;
}

} // namespace vd
