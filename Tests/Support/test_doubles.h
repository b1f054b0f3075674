#pragma once

#include "core/drift/drift_monitor.h"
#include "core/models/classifier.h"
#include "core/models/model_registry.h"
#include "core/store/record_store.h"

#include <QJsonObject>
#include <QString>

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace vd::test {

// Returns the same probabilities for every input.
class FixedClassifier : public Classifier {
public:
    FixedClassifier(ModelType type, std::vector<double> probabilities)
        : m_type(type), m_probabilities(std::move(probabilities)) {}

    ModelType modelType() const override { return m_type; }
    std::vector<double> predictProba(const FeatureArray&) const override { return m_probabilities; }
    QJsonObject toJson() const override
    {
        return QJsonObject{{QStringLiteral("type"), QStringLiteral("fixed")}};
    }

private:
    ModelType m_type;
    std::vector<double> m_probabilities;
};

class ThrowingClassifier : public Classifier {
public:
    explicit ThrowingClassifier(ModelType type = ModelType::RandomForest) : m_type(type) {}

    ModelType modelType() const override { return m_type; }
    std::vector<double> predictProba(const FeatureArray&) const override
    {
        throw std::runtime_error("model exploded");
    }
    QJsonObject toJson() const override
    {
        return QJsonObject{{QStringLiteral("type"), QStringLiteral("throwing")}};
    }

private:
    ModelType m_type;
};

// Throws a value that does not derive from std::exception.
class IntThrowingClassifier : public Classifier {
public:
    ModelType modelType() const override { return ModelType::RandomForest; }
    std::vector<double> predictProba(const FeatureArray&) const override
    {
        throw 42;
    }
    QJsonObject toJson() const override
    {
        return QJsonObject{{QStringLiteral("type"), QStringLiteral("int_throwing")}};
    }
};

class SlowClassifier : public Classifier {
public:
    SlowClassifier(int delayMs, std::vector<double> probabilities)
        : m_delayMs(delayMs), m_probabilities(std::move(probabilities)) {}

    ModelType modelType() const override { return ModelType::RandomForest; }
    std::vector<double> predictProba(const FeatureArray&) const override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(m_delayMs));
        return m_probabilities;
    }
    QJsonObject toJson() const override
    {
        return QJsonObject{{QStringLiteral("type"), QStringLiteral("slow")}};
    }

private:
    int m_delayMs = 0;
    std::vector<double> m_probabilities;
};

// Incremental classifier that records every learnOne call. Clones share the
// record so a test can observe updates applied to published snapshots.
class RecordingLearner : public IncrementalClassifier {
public:
    struct Log {
        std::mutex mutex;
        std::vector<LabeledSample> samples;

        size_t size()
        {
            std::lock_guard<std::mutex> lock(mutex);
            return samples.size();
        }
    };

    explicit RecordingLearner(std::shared_ptr<Log> log, qint64 learned = 0)
        : m_log(std::move(log)), m_learned(learned) {}

    ModelType modelType() const override { return ModelType::OnlineLearner; }
    std::vector<double> predictProba(const FeatureArray&) const override
    {
        return {0.25, 0.25, 0.25, 0.25};
    }
    QJsonObject toJson() const override
    {
        return QJsonObject{{QStringLiteral("type"), QStringLiteral("recording")}};
    }

    void learnOne(const FeatureArray& features, Decision label) override
    {
        std::lock_guard<std::mutex> lock(m_log->mutex);
        m_log->samples.push_back(LabeledSample{features, label});
        ++m_learned;
    }
    std::unique_ptr<IncrementalClassifier> clone() const override
    {
        return std::make_unique<RecordingLearner>(m_log, m_learned);
    }
    qint64 samplesLearned() const override { return m_learned; }

private:
    std::shared_ptr<Log> m_log;
    qint64 m_learned = 0;
};

// Incremental classifier whose updates throw a non-standard value.
class IntThrowingLearner : public IncrementalClassifier {
public:
    ModelType modelType() const override { return ModelType::OnlineLearner; }
    std::vector<double> predictProba(const FeatureArray&) const override
    {
        return {0.25, 0.25, 0.25, 0.25};
    }
    QJsonObject toJson() const override
    {
        return QJsonObject{{QStringLiteral("type"), QStringLiteral("int_throwing_learner")}};
    }

    void learnOne(const FeatureArray&, Decision) override { throw 42; }
    std::unique_ptr<IncrementalClassifier> clone() const override
    {
        return std::make_unique<IntThrowingLearner>();
    }
    qint64 samplesLearned() const override { return 0; }
};

inline ModelVersion makeVersion(const QString& id, ModelType type,
                                ModelStatus status = ModelStatus::Training)
{
    ModelVersion meta;
    meta.versionId = id;
    meta.modelType = type;
    meta.status = status;
    return meta;
}

// Registers and promotes a version in one step.
inline bool installActive(ModelRegistry& registry, const QString& id,
                          std::shared_ptr<const Classifier> artifact)
{
    const ModelType type = artifact->modelType();
    return registry.registerVersion(makeVersion(id, type), std::move(artifact))
        && registry.promote(id);
}

class FixedDriftScorer : public DriftScorer {
public:
    FixedDriftScorer(double score, QStringList features = {})
        : m_score(score), m_features(std::move(features)) {}

    DriftScore score(const std::vector<FeatureArray>&, const std::vector<FeatureArray>&) override
    {
        ++calls;
        DriftScore result;
        result.score = m_score;
        result.affectedFeatures = m_features;
        return result;
    }

    int calls = 0;

private:
    double m_score = 0.0;
    QStringList m_features;
};

class ThrowingDriftScorer : public DriftScorer {
public:
    explicit ThrowingDriftScorer(bool standardException = true)
        : m_standardException(standardException) {}

    DriftScore score(const std::vector<FeatureArray>&, const std::vector<FeatureArray>&) override
    {
        if (!m_standardException) {
            throw 42;
        }
        throw std::runtime_error("distance computation failed");
    }

private:
    bool m_standardException = true;
};

// Serves `current` samples for the window ending now and `reference`
// samples for the window that precedes it.
class StaticWindowSource : public FeatureWindowSource {
public:
    StaticWindowSource(int reference, int current) : m_reference(reference), m_current(current) {}

    bool window(const QString&, const QDateTime&, const QDateTime& to, int,
                std::vector<FeatureArray>* out, QString*) override
    {
        const bool isCurrent = to.secsTo(QDateTime::currentDateTimeUtc()) < 3600;
        out->assign(static_cast<size_t>(isCurrent ? m_current : m_reference), FeatureArray{});
        return true;
    }

private:
    int m_reference = 0;
    int m_current = 0;
};

class FailingFeedbackStore : public FeedbackStore, public CorrectionStore {
public:
    bool appendFeedback(const FeedbackRecord&, QString* errorOut) override
    {
        if (errorOut) {
            *errorOut = QStringLiteral("disk full");
        }
        return false;
    }
    bool appendCorrection(const CorrectionRecord&, QString* errorOut) override
    {
        if (errorOut) {
            *errorOut = QStringLiteral("disk full");
        }
        return false;
    }
};

} // namespace vd::test
