#include "core/models/model_registry.h"

#include "core/models/synthetic_data.h"
#include "core/shared/ids.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QSaveFile>

#include <algorithm>
#include <exception>

namespace vd {

namespace {

const QString kMetadataFile = QStringLiteral("metadata.json");
const QString kArtifactFile = QStringLiteral("model.json");
const QString kAbTestsFile = QStringLiteral("ab_tests.json");

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

bool isValidVersionId(const QString& versionId)
{
    static const QRegularExpression re(QStringLiteral("^[A-Za-z0-9][A-Za-z0-9._-]{0,127}$"));
    return re.match(versionId).hasMatch();
}

std::optional<QJsonObject> readJsonObject(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(vdModels, "ModelRegistry: failed to parse %s: %s",
                 qUtf8Printable(path), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }
    return doc.object();
}

bool writeJsonFile(const QString& path, const QJsonDocument& doc)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return false;
    }
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    file.write(doc.toJson(QJsonDocument::Compact));
    return file.commit();
}

CohortMetrics cohortFromJson(const QJsonObject& obj)
{
    CohortMetrics metrics;
    metrics.requests = obj.value(QStringLiteral("requests")).toInteger(0);
    metrics.errors = obj.value(QStringLiteral("errors")).toInteger(0);
    metrics.minLatencyMs = obj.value(QStringLiteral("min_latency_ms")).toDouble(0.0);
    metrics.maxLatencyMs = obj.value(QStringLiteral("max_latency_ms")).toDouble(0.0);
    metrics.totalLatencyMs = obj.value(QStringLiteral("avg_latency_ms")).toDouble(0.0) * metrics.requests;
    metrics.outcomes = obj.value(QStringLiteral("outcomes")).toInteger(0);
    metrics.correctOutcomes = obj.value(QStringLiteral("correct_outcomes")).toInteger(0);
    return metrics;
}

std::optional<ABTest> abTestFromJson(const QJsonObject& obj)
{
    ABTest test;
    test.testId = obj.value(QStringLiteral("test_id")).toString();
    test.championVersion = obj.value(QStringLiteral("champion_version")).toString();
    test.candidateVersion = obj.value(QStringLiteral("candidate_version")).toString();
    const auto type = modelTypeFromString(obj.value(QStringLiteral("model_type")).toString());
    const auto status = abTestStatusFromString(obj.value(QStringLiteral("status")).toString());
    if (test.testId.isEmpty() || test.championVersion.isEmpty()
        || test.candidateVersion.isEmpty() || !type || !status) {
        return std::nullopt;
    }
    test.modelType = *type;
    test.status = *status;
    test.trafficSplit = obj.value(QStringLiteral("traffic_split")).toDouble(0.0);
    test.startedAt = QDateTime::fromString(obj.value(QStringLiteral("started_at")).toString(),
                                           Qt::ISODateWithMs);
    test.endedAt = QDateTime::fromString(obj.value(QStringLiteral("ended_at")).toString(),
                                         Qt::ISODateWithMs);
    test.championMetrics = cohortFromJson(obj.value(QStringLiteral("champion_metrics")).toObject());
    test.candidateMetrics = cohortFromJson(obj.value(QStringLiteral("candidate_metrics")).toObject());
    return test;
}

} // namespace

ModelRegistry::ModelRegistry(const QString& modelsDir)
    : m_modelsDir(modelsDir)
    , m_baselineTrainer(&ModelRegistry::trainSyntheticBaseline)
{
}

ModelRegistry::~ModelRegistry() = default;

void ModelRegistry::setBaselineTrainer(BaselineTrainer trainer)
{
    m_baselineTrainer = std::move(trainer);
}

ModelRegistry::BootstrapReport ModelRegistry::bootstrap(const BootstrapConfig& config)
{
    BootstrapReport report;
    loadPersisted(&report);
    loadAbTests();

    if (!activeVersion(ModelType::RandomForest)) {
        provisionBaseline(config, &report);
    }
    if (!activeVersion(ModelType::OnlineLearner)) {
        provisionOnlineLearner(config, &report);
    }

    LOG_INFO(vdModels, "ModelRegistry: bootstrap loaded=%d provisioned=%d failed=%d",
             static_cast<int>(report.loadedVersions.size()),
             static_cast<int>(report.provisionedVersions.size()),
             static_cast<int>(report.failures.size()));
    return report;
}

void ModelRegistry::loadPersisted(BootstrapReport* report)
{
    if (m_modelsDir.isEmpty()) {
        return;
    }

    const QDir root(m_modelsDir);
    if (!root.exists()) {
        return;
    }

    const QFileInfoList dirs = root.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo& dirInfo : dirs) {
        const QDir versionDir(dirInfo.absoluteFilePath());
        const std::optional<QJsonObject> metaJson =
            readJsonObject(versionDir.filePath(kMetadataFile));
        if (!metaJson) {
            continue;
        }
        std::optional<ModelVersion> meta = ModelVersion::fromJson(*metaJson);
        if (!meta || meta->versionId != dirInfo.fileName()) {
            LOG_WARN(vdModels, "ModelRegistry: skipping invalid metadata in %s",
                     qUtf8Printable(dirInfo.absoluteFilePath()));
            continue;
        }

        std::shared_ptr<const Classifier> artifact;
        if (const std::optional<QJsonObject> artifactJson =
                readJsonObject(versionDir.filePath(kArtifactFile))) {
            QString error;
            std::unique_ptr<Classifier> loaded = classifierFromJson(*artifactJson, &error);
            if (loaded && loaded->modelType() == meta->modelType) {
                artifact = std::move(loaded);
            } else {
                LOG_WARN(vdModels, "ModelRegistry: artifact for %s failed to load: %s",
                         qUtf8Printable(meta->versionId), qUtf8Printable(error));
            }
        }

        const bool wasActive = meta->status == ModelStatus::Active;
        if (!artifact && (wasActive || meta->status == ModelStatus::Candidate)) {
            meta->status = ModelStatus::Failed;
        }

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (meta->status == ModelStatus::Active) {
            auto it = m_active.find(meta->modelType);
            if (it != m_active.end()) {
                // Two actives on disk means a promotion was interrupted;
                // keep the most recently deployed one.
                Entry& other = *m_entries.at(it->second);
                if (other.meta.deployedAt >= meta->deployedAt) {
                    meta->status = ModelStatus::Retired;
                } else {
                    other.meta.status = ModelStatus::Retired;
                    it->second = meta->versionId;
                }
            } else {
                m_active[meta->modelType] = meta->versionId;
            }
        }

        auto entry = std::make_unique<Entry>();
        entry->meta = *meta;
        entry->artifact = std::move(artifact);
        report->loadedVersions.append(meta->versionId);
        m_entries[meta->versionId] = std::move(entry);
    }
}

void ModelRegistry::loadAbTests()
{
    if (m_modelsDir.isEmpty()) {
        return;
    }
    const std::optional<QJsonObject> root = readJsonObject(QDir(m_modelsDir).filePath(kAbTestsFile));
    if (!root) {
        return;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (const QJsonValue& value : root->value(QStringLiteral("tests")).toArray()) {
        std::optional<ABTest> test = abTestFromJson(value.toObject());
        if (!test) {
            continue;
        }
        if (test->status == AbTestStatus::Active) {
            const bool championOk = m_entries.count(test->championVersion) > 0;
            const auto candidate = m_entries.find(test->candidateVersion);
            const bool candidateOk = candidate != m_entries.end() && candidate->second->artifact;
            if (!championOk || !candidateOk) {
                test->status = AbTestStatus::Cancelled;
                test->endedAt = QDateTime::currentDateTimeUtc();
            }
        }
        m_abTests[test->testId] = *test;
    }
}

std::shared_ptr<const Classifier> ModelRegistry::trainSyntheticBaseline(const BootstrapConfig& config,
                                                                        ModelVersion* metadata,
                                                                        QString* errorOut)
{
    SyntheticDataGenerator generator(config.seed);
    const std::vector<LabeledSample> samples = generator.generate(config.syntheticSamples);

    std::vector<LabeledSample> trainSet;
    std::vector<LabeledSample> holdout;
    for (size_t i = 0; i < samples.size(); ++i) {
        if (i % 5 == 0) {
            holdout.push_back(samples[i]);
        } else {
            trainSet.push_back(samples[i]);
        }
    }

    RandomForest::TrainConfig forestConfig = config.forest;
    forestConfig.seed = config.seed;
    std::unique_ptr<RandomForest> forest = RandomForest::train(trainSet, forestConfig, errorOut);
    if (!forest) {
        return nullptr;
    }

    const ClassificationReport eval = evaluateClassifier(*forest, holdout);
    if (metadata) {
        metadata->accuracy = eval.accuracy;
        metadata->precision = eval.precision;
        metadata->recall = eval.recall;
        metadata->f1Score = eval.f1Score;
        metadata->trainingSamples = static_cast<int>(trainSet.size());
        metadata->validationSamples = static_cast<int>(holdout.size());
        metadata->metadata[QStringLiteral("source")] = QStringLiteral("synthetic");
        metadata->metadata[QStringLiteral("seed")] = static_cast<qint64>(config.seed);
        metadata->metadata[QStringLiteral("trees")] = forest->treeCount();
        metadata->metadata[QStringLiteral("maxDepth")] = forestConfig.maxDepth;
    }
    return std::shared_ptr<const Classifier>(std::move(forest));
}

bool ModelRegistry::provisionBaseline(const BootstrapConfig& config, BootstrapReport* report)
{
    ModelVersion meta;
    meta.versionId = uniqueVersionId(QStringLiteral("baseline-v1.0"));
    meta.modelType = ModelType::RandomForest;
    meta.status = ModelStatus::Training;
    meta.createdAt = QDateTime::currentDateTimeUtc();

    QString error;
    std::shared_ptr<const Classifier> artifact;
    try {
        artifact = m_baselineTrainer
            ? m_baselineTrainer(config, &meta, &error)
            : nullptr;
    } catch (const std::exception& ex) {
        error = QString::fromUtf8(ex.what());
        artifact = nullptr;
    } catch (...) {
        error = QStringLiteral("unknown_exception");
        artifact = nullptr;
    }

    if (!artifact) {
        if (error.isEmpty()) {
            error = QStringLiteral("baseline_training_failed");
        }
        LOG_ERROR(vdModels, "ModelRegistry: baseline training failed: %s; "
                            "random_forest predictions will fall back",
                  qUtf8Printable(error));
        report->failures[ModelType::RandomForest] = error;
        return false;
    }

    if (!registerVersion(meta, artifact, &error) || !promote(meta.versionId, &error)) {
        LOG_ERROR(vdModels, "ModelRegistry: failed to activate baseline %s: %s",
                  qUtf8Printable(meta.versionId), qUtf8Printable(error));
        report->failures[ModelType::RandomForest] = error;
        return false;
    }

    LOG_INFO(vdModels, "ModelRegistry: baseline %s trained (accuracy=%.3f, samples=%d)",
             qUtf8Printable(meta.versionId), meta.accuracy, meta.trainingSamples);
    report->provisionedVersions.append(meta.versionId);
    return true;
}

bool ModelRegistry::provisionOnlineLearner(const BootstrapConfig& config, BootstrapReport* report)
{
    ModelVersion meta;
    meta.versionId = uniqueVersionId(QStringLiteral("online-v1.0"));
    meta.modelType = ModelType::OnlineLearner;
    meta.status = ModelStatus::Training;
    meta.createdAt = QDateTime::currentDateTimeUtc();
    meta.metadata[QStringLiteral("learningRate")] = config.online.learningRate;
    meta.metadata[QStringLiteral("l2")] = config.online.l2;

    QString error;
    auto learner = std::make_shared<const OnlineLearner>(config.online);
    if (!registerVersion(meta, learner, &error) || !promote(meta.versionId, &error)) {
        LOG_ERROR(vdModels, "ModelRegistry: failed to provision online learner: %s",
                  qUtf8Printable(error));
        report->failures[ModelType::OnlineLearner] = error;
        return false;
    }

    report->provisionedVersions.append(meta.versionId);
    return true;
}

QString ModelRegistry::uniqueVersionId(const QString& preferred) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (m_entries.count(preferred) == 0) {
        return preferred;
    }
    return QStringLiteral("%1-%2").arg(preferred,
        QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyyMMddHHmmsszzz")));
}

bool ModelRegistry::registerVersion(const ModelVersion& metadata,
                                    std::shared_ptr<const Classifier> artifact,
                                    QString* errorOut)
{
    if (!isValidVersionId(metadata.versionId)) {
        setError(errorOut, QStringLiteral("invalid_version_id"));
        return false;
    }
    if (artifact && artifact->modelType() != metadata.modelType) {
        setError(errorOut, QStringLiteral("model_type_mismatch"));
        return false;
    }
    if (metadata.status == ModelStatus::Active || metadata.status == ModelStatus::Retired) {
        setError(errorOut, QStringLiteral("invalid_initial_status"));
        return false;
    }

    auto entry = std::make_unique<Entry>();
    entry->meta = metadata;
    if (!entry->meta.createdAt.isValid()) {
        entry->meta.createdAt = QDateTime::currentDateTimeUtc();
    }
    entry->artifact = artifact;
    const ModelVersion stored = entry->meta;

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (m_entries.count(metadata.versionId) > 0) {
            setError(errorOut, QStringLiteral("version_exists"));
            return false;
        }
        m_entries[metadata.versionId] = std::move(entry);
    }

    if (artifact && !persistArtifact(stored.versionId, *artifact)) {
        LOG_WARN(vdModels, "ModelRegistry: failed to persist artifact for %s",
                 qUtf8Printable(stored.versionId));
    }
    persistMetadata(stored);

    LOG_INFO(vdModels, "ModelRegistry: registered %s (%s, %s)",
             qUtf8Printable(stored.versionId),
             qUtf8Printable(modelTypeToString(stored.modelType)),
             qUtf8Printable(modelStatusToString(stored.status)));
    return true;
}

bool ModelRegistry::promote(const QString& versionId, QString* errorOut)
{
    std::vector<ModelVersion> changed;
    QString endedTest;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(versionId);
        if (it == m_entries.end()) {
            setError(errorOut, QStringLiteral("unknown_version"));
            return false;
        }
        Entry& entry = *it->second;
        if (entry.meta.status == ModelStatus::Active) {
            return true;
        }
        if (entry.meta.status == ModelStatus::Failed) {
            setError(errorOut, QStringLiteral("version_failed"));
            return false;
        }
        if (!entry.artifact) {
            setError(errorOut, QStringLiteral("artifact_missing"));
            return false;
        }

        const QDateTime now = QDateTime::currentDateTimeUtc();
        const ModelType type = entry.meta.modelType;
        auto activeIt = m_active.find(type);
        if (activeIt != m_active.end()) {
            Entry& previous = *m_entries.at(activeIt->second);
            previous.meta.status = ModelStatus::Retired;
            previous.meta.retiredAt = now;
            changed.push_back(previous.meta);
        }
        entry.meta.status = ModelStatus::Active;
        entry.meta.deployedAt = now;
        entry.meta.retiredAt = QDateTime();
        m_active[type] = versionId;
        changed.push_back(entry.meta);

        // A live test for this type no longer has a valid champion.
        for (auto& [id, test] : m_abTests) {
            if (test.modelType == type && test.status == AbTestStatus::Active) {
                test.status = test.candidateVersion == versionId
                    ? AbTestStatus::Completed
                    : AbTestStatus::Cancelled;
                test.endedAt = now;
                endedTest = id;
            }
        }
    }

    for (const ModelVersion& meta : changed) {
        persistMetadata(meta);
    }
    if (!endedTest.isEmpty()) {
        persistAbTests();
    }

    LOG_INFO(vdModels, "ModelRegistry: promoted %s", qUtf8Printable(versionId));
    return true;
}

bool ModelRegistry::setStatus(const QString& versionId, ModelStatus status, QString* errorOut)
{
    if (status == ModelStatus::Active) {
        return promote(versionId, errorOut);
    }
    if (status == ModelStatus::Retired) {
        return retire(versionId, errorOut);
    }

    ModelVersion snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(versionId);
        if (it == m_entries.end()) {
            setError(errorOut, QStringLiteral("unknown_version"));
            return false;
        }
        Entry& entry = *it->second;
        if (entry.meta.status == ModelStatus::Active) {
            setError(errorOut, QStringLiteral("version_active"));
            return false;
        }
        if (status == ModelStatus::Candidate && !entry.artifact) {
            setError(errorOut, QStringLiteral("artifact_missing"));
            return false;
        }
        entry.meta.status = status;
        snapshot = entry.meta;
    }
    persistMetadata(snapshot);
    return true;
}

bool ModelRegistry::retire(const QString& versionId, QString* errorOut)
{
    ModelVersion snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(versionId);
        if (it == m_entries.end()) {
            setError(errorOut, QStringLiteral("unknown_version"));
            return false;
        }
        Entry& entry = *it->second;
        if (entry.meta.status == ModelStatus::Active) {
            // Retiring the active version directly would leave the type
            // without one; promote a replacement instead.
            setError(errorOut, QStringLiteral("version_active"));
            return false;
        }
        for (const auto& [id, test] : m_abTests) {
            if (test.status == AbTestStatus::Active
                && (test.candidateVersion == versionId || test.championVersion == versionId)) {
                setError(errorOut, QStringLiteral("version_in_ab_test"));
                return false;
            }
        }
        entry.meta.status = ModelStatus::Retired;
        entry.meta.retiredAt = QDateTime::currentDateTimeUtc();
        snapshot = entry.meta;
    }
    persistMetadata(snapshot);
    return true;
}

std::optional<QString> ModelRegistry::activeVersion(ModelType type) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_active.find(type);
    if (it == m_active.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<const Classifier> ModelRegistry::artifact(const QString& versionId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(versionId);
    if (it == m_entries.end()) {
        return nullptr;
    }
    return it->second->artifact;
}

std::optional<ModelVersion> ModelRegistry::version(const QString& versionId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(versionId);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second->meta;
}

std::vector<ModelVersion> ModelRegistry::versions() const
{
    std::vector<ModelVersion> out;
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    out.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        out.push_back(entry->meta);
    }
    std::sort(out.begin(), out.end(), [](const ModelVersion& a, const ModelVersion& b) {
        return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.versionId < b.versionId;
    });
    return out;
}

bool ModelRegistry::replaceArtifact(const QString& versionId,
                                    std::shared_ptr<const Classifier> artifact,
                                    QString* errorOut)
{
    return swapArtifact(versionId, std::move(artifact), false, errorOut);
}

bool ModelRegistry::replaceActiveArtifact(const QString& versionId,
                                          std::shared_ptr<const Classifier> artifact,
                                          QString* errorOut)
{
    return swapArtifact(versionId, std::move(artifact), true, errorOut);
}

bool ModelRegistry::swapArtifact(const QString& versionId,
                                 std::shared_ptr<const Classifier> artifact,
                                 bool requireActive,
                                 QString* errorOut)
{
    if (!artifact) {
        setError(errorOut, QStringLiteral("artifact_missing"));
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(versionId);
    if (it == m_entries.end()) {
        setError(errorOut, QStringLiteral("unknown_version"));
        return false;
    }
    Entry& entry = *it->second;
    if (artifact->modelType() != entry.meta.modelType) {
        setError(errorOut, QStringLiteral("model_type_mismatch"));
        return false;
    }
    if (requireActive) {
        auto active = m_active.find(entry.meta.modelType);
        if (active == m_active.end() || active->second != versionId) {
            setError(errorOut, QStringLiteral("version_not_active"));
            return false;
        }
    }
    entry.artifact = std::move(artifact);
    return true;
}

void ModelRegistry::recordPrediction(const QString& versionId)
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(versionId);
    if (it != m_entries.end()) {
        it->second->predictions.fetch_add(1, std::memory_order_relaxed);
    }
}

void ModelRegistry::recordFeedbackOutcome(const QString& versionId, Decision predicted, Decision actual)
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(versionId);
    if (it == m_entries.end()) {
        return;
    }
    std::lock_guard<std::mutex> statsLock(m_statsMutex);
    ++it->second->feedback;
    it->second->live.add(actual, predicted);
}

QJsonObject ModelRegistry::activeVersionsJson() const
{
    QJsonObject obj;
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    for (ModelType type : kAllModelTypes) {
        auto it = m_active.find(type);
        obj[modelTypeToString(type)] = it != m_active.end() ? QJsonValue(it->second) : QJsonValue();
    }
    return obj;
}

QJsonArray ModelRegistry::versionMetricsJson() const
{
    QJsonArray out;
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::lock_guard<std::mutex> statsLock(m_statsMutex);
    for (const auto& [id, entry] : m_entries) {
        QJsonObject obj = entry->meta.toJson();
        obj[QStringLiteral("prediction_count")] = entry->predictions.load(std::memory_order_relaxed);
        obj[QStringLiteral("feedback_count")] = entry->feedback;
        obj[QStringLiteral("live")] = entry->live.report().toJson();
        out.append(obj);
    }
    return out;
}

std::optional<ABTest> ModelRegistry::createAbTest(const QString& championVersion,
                                                  const QString& candidateVersion,
                                                  double trafficSplit,
                                                  QString* errorOut)
{
    if (!(trafficSplit > 0.0 && trafficSplit < 1.0)) {
        setError(errorOut, QStringLiteral("invalid_traffic_split"));
        return std::nullopt;
    }
    if (championVersion == candidateVersion) {
        setError(errorOut, QStringLiteral("same_version"));
        return std::nullopt;
    }

    ABTest test;
    ModelVersion candidateSnapshot;
    bool candidateChanged = false;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto champion = m_entries.find(championVersion);
        auto candidate = m_entries.find(candidateVersion);
        if (champion == m_entries.end() || candidate == m_entries.end()) {
            setError(errorOut, QStringLiteral("unknown_version"));
            return std::nullopt;
        }
        Entry& championEntry = *champion->second;
        Entry& candidateEntry = *candidate->second;
        if (championEntry.meta.modelType != candidateEntry.meta.modelType) {
            setError(errorOut, QStringLiteral("model_type_mismatch"));
            return std::nullopt;
        }
        if (championEntry.meta.status != ModelStatus::Active) {
            setError(errorOut, QStringLiteral("champion_not_active"));
            return std::nullopt;
        }
        if (!candidateEntry.artifact
            || candidateEntry.meta.status == ModelStatus::Failed
            || candidateEntry.meta.status == ModelStatus::Retired) {
            setError(errorOut, QStringLiteral("candidate_unavailable"));
            return std::nullopt;
        }
        for (const auto& [id, existing] : m_abTests) {
            if (existing.modelType == championEntry.meta.modelType
                && existing.status == AbTestStatus::Active) {
                setError(errorOut, QStringLiteral("ab_test_already_active"));
                return std::nullopt;
            }
        }

        test.testId = generateId(QStringLiteral("ab"));
        test.championVersion = championVersion;
        test.candidateVersion = candidateVersion;
        test.modelType = championEntry.meta.modelType;
        test.trafficSplit = trafficSplit;
        test.status = AbTestStatus::Active;
        test.startedAt = QDateTime::currentDateTimeUtc();
        m_abTests[test.testId] = test;

        if (candidateEntry.meta.status == ModelStatus::Training) {
            candidateEntry.meta.status = ModelStatus::Candidate;
            candidateSnapshot = candidateEntry.meta;
            candidateChanged = true;
        }
    }

    if (candidateChanged) {
        persistMetadata(candidateSnapshot);
    }
    persistAbTests();

    LOG_INFO(vdModels, "ModelRegistry: A/B test %s started (%s vs %s, split=%.2f)",
             qUtf8Printable(test.testId), qUtf8Printable(championVersion),
             qUtf8Printable(candidateVersion), trafficSplit);
    return test;
}

bool ModelRegistry::endAbTest(const QString& testId, AbTestStatus status, QString* errorOut)
{
    if (status == AbTestStatus::Active) {
        setError(errorOut, QStringLiteral("invalid_status"));
        return false;
    }
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_abTests.find(testId);
        if (it == m_abTests.end()) {
            setError(errorOut, QStringLiteral("unknown_ab_test"));
            return false;
        }
        if (it->second.status != AbTestStatus::Active) {
            setError(errorOut, QStringLiteral("ab_test_not_active"));
            return false;
        }
        it->second.status = status;
        it->second.endedAt = QDateTime::currentDateTimeUtc();
    }
    persistAbTests();
    LOG_INFO(vdModels, "ModelRegistry: A/B test %s %s",
             qUtf8Printable(testId), qUtf8Printable(abTestStatusToString(status)));
    return true;
}

std::optional<ABTest> ModelRegistry::activeAbTest(ModelType type) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::lock_guard<std::mutex> statsLock(m_statsMutex);
    for (const auto& [id, test] : m_abTests) {
        if (test.modelType == type && test.status == AbTestStatus::Active) {
            return test;
        }
    }
    return std::nullopt;
}

std::optional<ABTest> ModelRegistry::abTest(const QString& testId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::lock_guard<std::mutex> statsLock(m_statsMutex);
    auto it = m_abTests.find(testId);
    if (it == m_abTests.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ABTest> ModelRegistry::abTests() const
{
    std::vector<ABTest> out;
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::lock_guard<std::mutex> statsLock(m_statsMutex);
    out.reserve(m_abTests.size());
    for (const auto& [id, test] : m_abTests) {
        out.push_back(test);
    }
    return out;
}

void ModelRegistry::recordAbRequest(const QString& testId, AbCohort cohort, double latencyMs, bool error)
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_abTests.find(testId);
    if (it == m_abTests.end()) {
        return;
    }
    std::lock_guard<std::mutex> statsLock(m_statsMutex);
    CohortMetrics& metrics = cohort == AbCohort::Candidate
        ? it->second.candidateMetrics
        : it->second.championMetrics;
    metrics.recordRequest(latencyMs, error);
}

void ModelRegistry::recordAbOutcome(const QString& testId, AbCohort cohort, bool correct)
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_abTests.find(testId);
    if (it == m_abTests.end()) {
        return;
    }
    std::lock_guard<std::mutex> statsLock(m_statsMutex);
    CohortMetrics& metrics = cohort == AbCohort::Candidate
        ? it->second.candidateMetrics
        : it->second.championMetrics;
    metrics.recordOutcome(correct);
}

bool ModelRegistry::saveArtifacts(QString* errorOut) const
{
    if (m_modelsDir.isEmpty()) {
        return true;
    }

    std::vector<std::pair<ModelVersion, std::shared_ptr<const Classifier>>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        snapshot.reserve(m_entries.size());
        for (const auto& [id, entry] : m_entries) {
            snapshot.emplace_back(entry->meta, entry->artifact);
        }
    }

    bool ok = true;
    for (const auto& [meta, artifact] : snapshot) {
        ok = persistMetadata(meta) && ok;
        if (artifact && dynamic_cast<const IncrementalClassifier*>(artifact.get())) {
            ok = persistArtifact(meta.versionId, *artifact) && ok;
        }
    }
    ok = persistAbTests() && ok;
    if (!ok) {
        setError(errorOut, QStringLiteral("persist_failed"));
    }
    return ok;
}

bool ModelRegistry::persistMetadata(const ModelVersion& meta) const
{
    if (m_modelsDir.isEmpty()) {
        return true;
    }
    const QString path = QDir(m_modelsDir).filePath(meta.versionId + QLatin1Char('/') + kMetadataFile);
    if (!writeJsonFile(path, QJsonDocument(meta.toJson()))) {
        LOG_WARN(vdModels, "ModelRegistry: failed to write %s", qUtf8Printable(path));
        return false;
    }
    return true;
}

bool ModelRegistry::persistArtifact(const QString& versionId, const Classifier& artifact) const
{
    if (m_modelsDir.isEmpty()) {
        return true;
    }
    const QString path = QDir(m_modelsDir).filePath(versionId + QLatin1Char('/') + kArtifactFile);
    if (!writeJsonFile(path, QJsonDocument(artifact.toJson()))) {
        LOG_WARN(vdModels, "ModelRegistry: failed to write %s", qUtf8Printable(path));
        return false;
    }
    return true;
}

bool ModelRegistry::persistAbTests() const
{
    if (m_modelsDir.isEmpty()) {
        return true;
    }

    QJsonArray tests;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::lock_guard<std::mutex> statsLock(m_statsMutex);
        for (const auto& [id, test] : m_abTests) {
            tests.append(test.toJson());
        }
    }

    QJsonObject root;
    root[QStringLiteral("tests")] = tests;
    const QString path = QDir(m_modelsDir).filePath(kAbTestsFile);
    if (!writeJsonFile(path, QJsonDocument(root))) {
        LOG_WARN(vdModels, "ModelRegistry: failed to write %s", qUtf8Printable(path));
        return false;
    }
    return true;
}

} // namespace vd
