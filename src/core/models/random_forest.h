#pragma once

#include "core/models/classifier.h"

#include <QtGlobal>

#include <array>
#include <memory>
#include <random>
#include <vector>

namespace vd {

// Bagged CART trees with Gini splits. Nodes are stored flat per tree; a node
// with feature < 0 is a leaf carrying class probabilities.
class RandomForest : public Classifier {
public:
    struct TrainConfig {
        int trees = 100;
        int maxDepth = 10;
        int minSamplesSplit = 2;
        int minSamplesLeaf = 1;
        int maxFeatures = 0; // 0 = sqrt(kFeatureDim)
        quint32 seed = 42;
    };

    static std::unique_ptr<RandomForest> train(const std::vector<LabeledSample>& samples,
                                               const TrainConfig& config,
                                               QString* errorOut = nullptr);

    ModelType modelType() const override { return ModelType::RandomForest; }
    std::vector<double> predictProba(const FeatureArray& features) const override;
    QJsonObject toJson() const override;

    static std::unique_ptr<RandomForest> fromJson(const QJsonObject& obj,
                                                  QString* errorOut = nullptr);

    int treeCount() const { return static_cast<int>(m_trees.size()); }

private:
    struct Node {
        int feature = -1;
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        std::array<double, kDecisionCount> proba{};
    };

    struct Tree {
        std::vector<Node> nodes;
    };

    struct SplitChoice {
        int feature = -1;
        double threshold = 0.0;
        double impurity = 0.0;
    };

    static int buildNode(Tree& tree,
                         const std::vector<LabeledSample>& samples,
                         std::vector<int> indices,
                         int depth,
                         const TrainConfig& config,
                         std::mt19937& rng);
    static SplitChoice findSplit(const std::vector<LabeledSample>& samples,
                                 const std::vector<int>& indices,
                                 const TrainConfig& config,
                                 std::mt19937& rng);
    static const Node& leafFor(const Tree& tree, const FeatureArray& features);

    std::vector<Tree> m_trees;
};

} // namespace vd
