#pragma once

#include "core/features/feature_vector.h"
#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <memory>
#include <vector>

namespace vd {

struct LabeledSample {
    FeatureArray features{};
    Decision label = Decision::Monitor;
};

// Anything that can score a feature array. predictProba returns one
// probability per Decision in Decision order; implementations may throw and
// callers treat any throw as a model fault.
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual ModelType modelType() const = 0;
    virtual std::vector<double> predictProba(const FeatureArray& features) const = 0;
    virtual QJsonObject toJson() const = 0;
};

// A classifier that can be updated one sample at a time. Updates are applied
// to a private clone and published as a new snapshot, never in place on an
// instance that readers may hold.
class IncrementalClassifier : public Classifier {
public:
    virtual void learnOne(const FeatureArray& features, Decision label) = 0;
    virtual std::unique_ptr<IncrementalClassifier> clone() const = 0;
    virtual qint64 samplesLearned() const = 0;
};

// Restores a persisted classifier from its toJson() form.
std::unique_ptr<Classifier> classifierFromJson(const QJsonObject& obj, QString* errorOut = nullptr);

} // namespace vd
