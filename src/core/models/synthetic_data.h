#pragma once

#include "core/features/feature_vector.h"
#include "core/models/classifier.h"

#include <QtGlobal>

#include <random>
#include <vector>

namespace vd {

// Rule-labelled synthetic samples used to train the cold-start baseline.
class SyntheticDataGenerator {
public:
    explicit SyntheticDataGenerator(quint32 seed);

    std::vector<LabeledSample> generate(int count);

    // Labelling rule applied to every generated sample.
    static Decision labelFor(const FeatureVector& features);

private:
    double beta(double a, double b);
    FeatureVector sampleFeatures();

    std::mt19937 m_rng;
};

} // namespace vd
