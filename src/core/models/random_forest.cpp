#include "core/models/random_forest.h"

#include <QJsonArray>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace vd {

namespace {

using ClassCounts = std::array<int, kDecisionCount>;

ClassCounts countLabels(const std::vector<LabeledSample>& samples, const std::vector<int>& indices)
{
    ClassCounts counts{};
    for (int idx : indices) {
        ++counts[static_cast<size_t>(decisionIndex(samples[static_cast<size_t>(idx)].label))];
    }
    return counts;
}

double gini(const ClassCounts& counts, int total)
{
    if (total <= 0) {
        return 0.0;
    }
    double sumSq = 0.0;
    for (int c : counts) {
        const double p = static_cast<double>(c) / total;
        sumSq += p * p;
    }
    return 1.0 - sumSq;
}

bool isPure(const ClassCounts& counts)
{
    int nonZero = 0;
    for (int c : counts) {
        if (c > 0) {
            ++nonZero;
        }
    }
    return nonZero <= 1;
}

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

std::unique_ptr<RandomForest> RandomForest::train(const std::vector<LabeledSample>& samples,
                                                  const TrainConfig& config,
                                                  QString* errorOut)
{
    if (samples.empty()) {
        setError(errorOut, QStringLiteral("no_training_samples"));
        return nullptr;
    }
    if (config.trees <= 0 || config.maxDepth <= 0) {
        setError(errorOut, QStringLiteral("invalid_train_config"));
        return nullptr;
    }

    auto forest = std::make_unique<RandomForest>();
    forest->m_trees.reserve(static_cast<size_t>(config.trees));

    const int n = static_cast<int>(samples.size());
    for (int t = 0; t < config.trees; ++t) {
        std::mt19937 rng(config.seed + static_cast<quint32>(t) * 7919u);
        std::uniform_int_distribution<int> pick(0, n - 1);

        std::vector<int> bootstrap(static_cast<size_t>(n));
        for (int& idx : bootstrap) {
            idx = pick(rng);
        }

        Tree tree;
        buildNode(tree, samples, std::move(bootstrap), 0, config, rng);
        forest->m_trees.push_back(std::move(tree));
    }
    return forest;
}

int RandomForest::buildNode(Tree& tree,
                            const std::vector<LabeledSample>& samples,
                            std::vector<int> indices,
                            int depth,
                            const TrainConfig& config,
                            std::mt19937& rng)
{
    const int nodeIndex = static_cast<int>(tree.nodes.size());
    tree.nodes.emplace_back();

    const int total = static_cast<int>(indices.size());
    const ClassCounts counts = countLabels(samples, indices);
    for (size_t c = 0; c < counts.size(); ++c) {
        tree.nodes[static_cast<size_t>(nodeIndex)].proba[c] =
            total > 0 ? static_cast<double>(counts[c]) / total : 1.0 / kDecisionCount;
    }

    if (depth >= config.maxDepth || total < config.minSamplesSplit || isPure(counts)) {
        return nodeIndex;
    }

    const SplitChoice split = findSplit(samples, indices, config, rng);
    if (split.feature < 0) {
        return nodeIndex;
    }

    std::vector<int> leftIdx;
    std::vector<int> rightIdx;
    leftIdx.reserve(indices.size());
    rightIdx.reserve(indices.size());
    for (int idx : indices) {
        const double value = samples[static_cast<size_t>(idx)].features[static_cast<size_t>(split.feature)];
        if (value <= split.threshold) {
            leftIdx.push_back(idx);
        } else {
            rightIdx.push_back(idx);
        }
    }
    indices.clear();
    indices.shrink_to_fit();

    const int left = buildNode(tree, samples, std::move(leftIdx), depth + 1, config, rng);
    const int right = buildNode(tree, samples, std::move(rightIdx), depth + 1, config, rng);

    Node& node = tree.nodes[static_cast<size_t>(nodeIndex)];
    node.feature = split.feature;
    node.threshold = split.threshold;
    node.left = left;
    node.right = right;
    return nodeIndex;
}

RandomForest::SplitChoice RandomForest::findSplit(const std::vector<LabeledSample>& samples,
                                                  const std::vector<int>& indices,
                                                  const TrainConfig& config,
                                                  std::mt19937& rng)
{
    const int total = static_cast<int>(indices.size());
    const int maxFeatures = config.maxFeatures > 0
        ? std::min(config.maxFeatures, kFeatureDim)
        : std::max(1, static_cast<int>(std::lround(std::sqrt(static_cast<double>(kFeatureDim)))));

    std::vector<int> featureOrder(kFeatureDim);
    std::iota(featureOrder.begin(), featureOrder.end(), 0);
    std::shuffle(featureOrder.begin(), featureOrder.end(), rng);

    const double parentImpurity = gini(countLabels(samples, indices), total);
    SplitChoice best;
    best.impurity = parentImpurity;

    std::vector<int> sorted = indices;
    for (int f = 0; f < maxFeatures; ++f) {
        const size_t feature = static_cast<size_t>(featureOrder[static_cast<size_t>(f)]);
        std::sort(sorted.begin(), sorted.end(), [&](int a, int b) {
            return samples[static_cast<size_t>(a)].features[feature]
                 < samples[static_cast<size_t>(b)].features[feature];
        });

        ClassCounts leftCounts{};
        ClassCounts rightCounts = countLabels(samples, sorted);
        for (int i = 0; i < total - 1; ++i) {
            const LabeledSample& current = samples[static_cast<size_t>(sorted[static_cast<size_t>(i)])];
            const size_t label = static_cast<size_t>(decisionIndex(current.label));
            ++leftCounts[label];
            --rightCounts[label];

            const double value = current.features[feature];
            const double next = samples[static_cast<size_t>(sorted[static_cast<size_t>(i + 1)])].features[feature];
            if (next <= value) {
                continue;
            }
            const int leftN = i + 1;
            const int rightN = total - leftN;
            if (leftN < config.minSamplesLeaf || rightN < config.minSamplesLeaf) {
                continue;
            }

            const double weighted = (leftN * gini(leftCounts, leftN)
                                     + rightN * gini(rightCounts, rightN)) / total;
            if (weighted < best.impurity - 1e-12) {
                best.feature = static_cast<int>(feature);
                best.threshold = 0.5 * (value + next);
                best.impurity = weighted;
            }
        }
    }
    return best;
}

const RandomForest::Node& RandomForest::leafFor(const Tree& tree, const FeatureArray& features)
{
    size_t index = 0;
    for (;;) {
        const Node& node = tree.nodes.at(index);
        if (node.feature < 0) {
            return node;
        }
        const double value = features[static_cast<size_t>(node.feature)];
        index = static_cast<size_t>(value <= node.threshold ? node.left : node.right);
    }
}

std::vector<double> RandomForest::predictProba(const FeatureArray& features) const
{
    if (m_trees.empty()) {
        throw std::runtime_error("random forest has no trees");
    }

    std::vector<double> proba(kDecisionCount, 0.0);
    for (const Tree& tree : m_trees) {
        const Node& leaf = leafFor(tree, features);
        for (size_t c = 0; c < proba.size(); ++c) {
            proba[c] += leaf.proba[c];
        }
    }
    for (double& p : proba) {
        p /= static_cast<double>(m_trees.size());
    }
    return proba;
}

QJsonObject RandomForest::toJson() const
{
    QJsonArray trees;
    for (const Tree& tree : m_trees) {
        QJsonArray nodes;
        for (const Node& node : tree.nodes) {
            QJsonArray packed;
            packed.append(node.feature);
            packed.append(node.threshold);
            packed.append(node.left);
            packed.append(node.right);
            for (double p : node.proba) {
                packed.append(p);
            }
            nodes.append(packed);
        }
        trees.append(nodes);
    }

    QJsonObject root;
    root[QStringLiteral("type")] = modelTypeToString(ModelType::RandomForest);
    root[QStringLiteral("featureDim")] = kFeatureDim;
    root[QStringLiteral("classes")] = kDecisionCount;
    root[QStringLiteral("trees")] = trees;
    return root;
}

std::unique_ptr<RandomForest> RandomForest::fromJson(const QJsonObject& obj, QString* errorOut)
{
    if (obj.value(QStringLiteral("featureDim")).toInt() != kFeatureDim
        || obj.value(QStringLiteral("classes")).toInt() != kDecisionCount) {
        setError(errorOut, QStringLiteral("dimension_mismatch"));
        return nullptr;
    }

    const QJsonArray trees = obj.value(QStringLiteral("trees")).toArray();
    if (trees.isEmpty()) {
        setError(errorOut, QStringLiteral("no_trees"));
        return nullptr;
    }

    auto forest = std::make_unique<RandomForest>();
    forest->m_trees.reserve(static_cast<size_t>(trees.size()));
    for (const QJsonValue& treeValue : trees) {
        const QJsonArray nodes = treeValue.toArray();
        if (nodes.isEmpty()) {
            setError(errorOut, QStringLiteral("empty_tree"));
            return nullptr;
        }

        Tree tree;
        tree.nodes.reserve(static_cast<size_t>(nodes.size()));
        const int nodeCount = nodes.size();
        for (const QJsonValue& nodeValue : nodes) {
            const QJsonArray packed = nodeValue.toArray();
            if (packed.size() != 4 + kDecisionCount) {
                setError(errorOut, QStringLiteral("malformed_node"));
                return nullptr;
            }
            Node node;
            node.feature = packed.at(0).toInt(-1);
            node.threshold = packed.at(1).toDouble();
            node.left = packed.at(2).toInt(-1);
            node.right = packed.at(3).toInt(-1);
            for (int c = 0; c < kDecisionCount; ++c) {
                node.proba[static_cast<size_t>(c)] = packed.at(4 + c).toDouble();
            }
            const int self = static_cast<int>(tree.nodes.size());
            if (node.feature >= kFeatureDim
                || (node.feature >= 0
                    && (node.left <= self || node.right <= self
                        || node.left >= nodeCount || node.right >= nodeCount))) {
                setError(errorOut, QStringLiteral("malformed_node"));
                return nullptr;
            }
            tree.nodes.push_back(node);
        }
        forest->m_trees.push_back(std::move(tree));
    }
    return forest;
}

} // namespace vd
