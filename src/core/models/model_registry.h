#pragma once

#include "core/models/classifier.h"
#include "core/models/evaluation.h"
#include "core/models/online_learner.h"
#include "core/models/random_forest.h"
#include "core/shared/governance_types.h"

#include <QJsonArray>
#include <QString>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace vd {

// Owns every ModelVersion, its artifact, the active pointer per ModelType and
// the A/B test records. Readers take the shared lock; promotion flips the old
// and new ACTIVE statuses and the active pointer inside one exclusive section,
// so no reader ever observes zero or two active versions for a type.
class ModelRegistry {
public:
    struct BootstrapConfig {
        int syntheticSamples = 1000;
        quint32 seed = 42;
        RandomForest::TrainConfig forest;
        OnlineLearner::Config online;
    };

    struct BootstrapReport {
        QStringList loadedVersions;
        QStringList provisionedVersions;
        std::map<ModelType, QString> failures;

        bool available(ModelType type) const { return failures.find(type) == failures.end(); }
    };

    // Produces the baseline artifact and fills in its metrics. Returns nullptr
    // with errorOut set on failure.
    using BaselineTrainer = std::function<std::shared_ptr<const Classifier>(
        const BootstrapConfig& config, ModelVersion* metadata, QString* errorOut)>;

    explicit ModelRegistry(const QString& modelsDir);
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;
    ModelRegistry(ModelRegistry&&) = delete;
    ModelRegistry& operator=(ModelRegistry&&) = delete;

    // Loads persisted versions, then provisions a baseline forest and a fresh
    // online learner for any type left without an active version. A failure
    // leaves only the affected type unavailable.
    BootstrapReport bootstrap(const BootstrapConfig& config);
    void setBaselineTrainer(BaselineTrainer trainer);
    static std::shared_ptr<const Classifier> trainSyntheticBaseline(const BootstrapConfig& config,
                                                                    ModelVersion* metadata,
                                                                    QString* errorOut);

    bool registerVersion(const ModelVersion& metadata,
                         std::shared_ptr<const Classifier> artifact,
                         QString* errorOut = nullptr);
    bool promote(const QString& versionId, QString* errorOut = nullptr);
    bool setStatus(const QString& versionId, ModelStatus status, QString* errorOut = nullptr);
    bool retire(const QString& versionId, QString* errorOut = nullptr);

    std::optional<QString> activeVersion(ModelType type) const;
    std::shared_ptr<const Classifier> artifact(const QString& versionId) const;
    std::optional<ModelVersion> version(const QString& versionId) const;
    std::vector<ModelVersion> versions() const;

    // Publishes a new snapshot for an existing version (online learning).
    bool replaceArtifact(const QString& versionId,
                         std::shared_ptr<const Classifier> artifact,
                         QString* errorOut = nullptr);
    // Same, but fails with version_not_active unless versionId is still the
    // active version of its type when the swap happens.
    bool replaceActiveArtifact(const QString& versionId,
                               std::shared_ptr<const Classifier> artifact,
                               QString* errorOut = nullptr);

    void recordPrediction(const QString& versionId);
    void recordFeedbackOutcome(const QString& versionId, Decision predicted, Decision actual);

    QJsonObject activeVersionsJson() const;
    QJsonArray versionMetricsJson() const;

    std::optional<ABTest> createAbTest(const QString& championVersion,
                                       const QString& candidateVersion,
                                       double trafficSplit,
                                       QString* errorOut = nullptr);
    bool endAbTest(const QString& testId, AbTestStatus status, QString* errorOut = nullptr);
    std::optional<ABTest> activeAbTest(ModelType type) const;
    std::optional<ABTest> abTest(const QString& testId) const;
    std::vector<ABTest> abTests() const;
    void recordAbRequest(const QString& testId, AbCohort cohort, double latencyMs, bool error);
    void recordAbOutcome(const QString& testId, AbCohort cohort, bool correct);

    // Writes metadata for every version and artifacts for incremental models.
    bool saveArtifacts(QString* errorOut = nullptr) const;

    const QString& modelsDir() const { return m_modelsDir; }

private:
    struct Entry {
        ModelVersion meta;
        std::shared_ptr<const Classifier> artifact;
        std::atomic<qint64> predictions{0};
        qint64 feedback = 0;
        ConfusionMatrix live;
    };

    void loadPersisted(BootstrapReport* report);
    void loadAbTests();
    bool provisionBaseline(const BootstrapConfig& config, BootstrapReport* report);
    bool provisionOnlineLearner(const BootstrapConfig& config, BootstrapReport* report);
    QString uniqueVersionId(const QString& preferred) const;
    bool swapArtifact(const QString& versionId, std::shared_ptr<const Classifier> artifact,
                      bool requireActive, QString* errorOut);

    bool persistMetadata(const ModelVersion& meta) const;
    bool persistArtifact(const QString& versionId, const Classifier& artifact) const;
    bool persistAbTests() const;

    QString m_modelsDir;
    BaselineTrainer m_baselineTrainer;

    std::unordered_map<QString, std::unique_ptr<Entry>> m_entries;
    std::map<ModelType, QString> m_active;
    std::map<QString, ABTest> m_abTests;
    mutable std::shared_mutex m_mutex;
    // Guards Entry::feedback, Entry::live and the A/B cohort metrics, which
    // are updated while only the shared lock is held.
    mutable std::mutex m_statsMutex;
};

} // namespace vd
