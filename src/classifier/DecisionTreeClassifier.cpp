// =============================================================================
// src/classifier/DecisionTreeClassifier.cpp - 递归分裂 + 剪枝
// =============================================================================
#include "classifier/DecisionTreeClassifier.hpp"

// 准则
#include "criterion/GiniCriterion.hpp"
#include "criterion/EntropyCriterion.hpp"

// 分割器
#include "finder/ExhaustiveSplitFinder.hpp"
#include "finder/RandomSplitFinder.hpp"

// 剪枝器
#include "pruner/NoPruner.hpp"
#include "pruner/MinGainPrePruner.hpp"
#include "pruner/CostComplexityPruner.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <numeric>
#include <stdexcept>

std::unique_ptr<ISplitFinder> createSplitFinder(const std::string& method, uint32_t seed) {
    if (method == "exhaustive" || method == "exact") {
        return std::make_unique<ExhaustiveSplitFinder>();
    }
    else if (method == "random" || method.find("random:") == 0) {
        int k = 10;
        auto pos = method.find(':');
        if (pos != std::string::npos) {
            k = std::stoi(method.substr(pos + 1));
        }
        if (k <= 0) {
            throw std::invalid_argument("random split finder needs k > 0");
        }
        return std::make_unique<RandomSplitFinder>(k, seed);
    }
    throw std::invalid_argument("Unknown split method: " + method);
}

std::unique_ptr<ISplitCriterion> createCriterion(const std::string& name) {
    if (name == "gini")
        return std::make_unique<GiniCriterion>();
    else if (name == "entropy")
        return std::make_unique<EntropyCriterion>();
    throw std::invalid_argument("Unknown criterion: " + name);
}

std::unique_ptr<IPruner> createPruner(const std::string& type, double param) {
    if (type == "mingain") {
        return std::make_unique<MinGainPrePruner>(param);
    }
    else if (type == "cost_complexity") {
        return std::make_unique<CostComplexityPruner>(param);
    }
    else if (type == "none") {
        return std::make_unique<NoPruner>();
    }
    throw std::invalid_argument("Unknown pruner: " + type);
}

DecisionTreeClassifier::DecisionTreeClassifier(const DecisionTreeConfig& cfg)
    : cfg_(cfg), gen_(cfg.seed) {
    if (cfg_.maxDepth <= 0 || cfg_.minSamplesLeaf <= 0) {
        throw std::invalid_argument("maxDepth and minSamplesLeaf must be positive");
    }
    // 配置错误尽早暴露
    createCriterion(cfg_.criterion);
    createSplitFinder(cfg_.splitMethod, cfg_.seed);
    createPruner(cfg_.prunerType, cfg_.prunerParam);
}

std::unique_ptr<IClassifier> DecisionTreeClassifier::clone() const {
    return std::make_unique<DecisionTreeClassifier>(cfg_);
}

void DecisionTreeClassifier::fit(const std::vector<double>& X,
                                 int rowLength,
                                 const std::vector<int>& y) {
    if (y.empty() || rowLength <= 0) {
        throw std::invalid_argument("DecisionTreeClassifier: empty training data");
    }
    if (X.size() != y.size() * static_cast<size_t>(rowLength)) {
        throw std::invalid_argument("DecisionTreeClassifier: data size mismatch");
    }

    auto trainStart = std::chrono::high_resolution_clock::now();

    // 类别编码为 0..K-1
    classes_ = y;
    std::sort(classes_.begin(), classes_.end());
    classes_.erase(std::unique(classes_.begin(), classes_.end()), classes_.end());

    std::vector<int> encoded(y.size());
    for (size_t i = 0; i < y.size(); ++i) {
        encoded[i] = static_cast<int>(
            std::lower_bound(classes_.begin(), classes_.end(), y[i]) - classes_.begin());
    }

    gen_.seed(cfg_.seed);
    finder_    = createSplitFinder(cfg_.splitMethod, cfg_.seed);
    criterion_ = createCriterion(cfg_.criterion);
    pruner_    = createPruner(cfg_.prunerType, cfg_.prunerParam);

    root_ = std::make_unique<Node>();
    std::vector<int> rootIndices(y.size());
    std::iota(rootIndices.begin(), rootIndices.end(), 0);

    splitNode(root_.get(), X, rowLength, encoded, rootIndices, 0);

    // 后剪枝
    pruner_->prune(root_);

    if (cfg_.verbose) {
        auto trainEnd = std::chrono::high_resolution_clock::now();
        auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(trainEnd - trainStart);
        std::cout << "Tree training completed:" << std::endl;
        std::cout << "  Depth: " << depth() << " | Leaves: " << leafCount()
                  << " | Time: " << totalTime.count() << "ms" << std::endl;
    }
}

std::vector<int> DecisionTreeClassifier::candidateFeatures(int rowLength) {
    std::vector<int> features(rowLength);
    std::iota(features.begin(), features.end(), 0);
    if (cfg_.maxFeatures > 0 && cfg_.maxFeatures < rowLength) {
        std::shuffle(features.begin(), features.end(), gen_);
        features.resize(cfg_.maxFeatures);
        std::sort(features.begin(), features.end());
    }
    return features;
}

void DecisionTreeClassifier::splitNode(Node* node,
                                       const std::vector<double>& data,
                                       int rowLength,
                                       const std::vector<int>& encoded,
                                       std::vector<int>& indices,
                                       int depth) {
    const int numClasses = static_cast<int>(classes_.size());

    // 节点类别分布
    std::vector<double> dist(numClasses, 0.0);
    for (int idx : indices) dist[encoded[idx]] += 1.0;
    const double n = static_cast<double>(indices.size());
    for (double& d : dist) d /= n;

    node->metric  = criterion_->nodeMetric(encoded, indices, numClasses);
    node->samples = indices.size();
    node->distribution = dist;

    // **停止条件检查**
    if (depth >= cfg_.maxDepth ||
        indices.size() < 2 * static_cast<size_t>(cfg_.minSamplesLeaf) ||
        node->metric <= 0.0) {
        node->makeLeaf(std::move(dist));
        return;
    }

    const auto features = candidateFeatures(rowLength);
    auto [bestFeat, bestThr, bestGain] =
        finder_->findBestSplit(data, rowLength, encoded, numClasses, indices,
                               features, node->metric, *criterion_);

    if (bestFeat < 0 || bestGain <= 0) {
        node->makeLeaf(std::move(dist));
        return;
    }

    // **预剪枝检查**
    if (bestGain < pruner_->minGain()) {
        node->makeLeaf(std::move(dist));
        return;
    }

    // **原地分割**
    auto partitionPoint = std::partition(indices.begin(), indices.end(),
        [&](int idx) {
            return data[idx * rowLength + bestFeat] <= bestThr;
        });

    const size_t leftSize  = std::distance(indices.begin(), partitionPoint);
    const size_t rightSize = indices.size() - leftSize;

    if (leftSize < static_cast<size_t>(cfg_.minSamplesLeaf) ||
        rightSize < static_cast<size_t>(cfg_.minSamplesLeaf)) {
        node->makeLeaf(std::move(dist));
        return;
    }

    node->makeInternal(bestFeat, bestThr);

    std::vector<int> leftIndices(indices.begin(), partitionPoint);
    std::vector<int> rightIndices(partitionPoint, indices.end());

    splitNode(node->leftChild.get(),  data, rowLength, encoded, leftIndices,  depth + 1);
    splitNode(node->rightChild.get(), data, rowLength, encoded, rightIndices, depth + 1);
}

const Node* DecisionTreeClassifier::findLeaf(const double* sample) const {
    const Node* cur = root_.get();
    while (cur && !cur->isLeaf) {
        const double v = sample[cur->getFeatureIndex()];
        cur = (v <= cur->getThreshold()) ? cur->getLeft() : cur->getRight();
    }
    return cur;
}

std::vector<double> DecisionTreeClassifier::predictProba(const std::vector<double>& X,
                                                         int rowLength) const {
    checkFitted();
    const size_t k = classes_.size();
    const size_t n = rowLength > 0 ? X.size() / rowLength : 0;
    std::vector<double> proba(n * k, 0.0);

    #pragma omp parallel for schedule(static) if(n > 1000)
    for (long i = 0; i < static_cast<long>(n); ++i) {
        const Node* leaf = findLeaf(&X[i * rowLength]);
        const auto& d = leaf->getDistribution();
        std::copy(d.begin(), d.end(), proba.begin() + i * k);
    }
    return proba;
}

std::vector<double> DecisionTreeClassifier::getFeatureImportance(int numFeatures) const {
    std::vector<double> importance(numFeatures, 0.0);
    if (!root_) return importance;

    // 栈式遍历
    std::vector<const Node*> nodeStack{root_.get()};
    while (!nodeStack.empty()) {
        const Node* node = nodeStack.back();
        nodeStack.pop_back();
        if (!node || node->isLeaf) continue;

        const Node* l = node->getLeft();
        const Node* r = node->getRight();
        const int feat = node->getFeatureIndex();
        if (feat >= 0 && feat < numFeatures) {
            importance[feat] += node->metric * node->samples
                              - l->metric * l->samples
                              - r->metric * r->samples;
        }
        nodeStack.push_back(l);
        nodeStack.push_back(r);
    }

    const double total = std::accumulate(importance.begin(), importance.end(), 0.0);
    if (total > 0) {
        for (double& v : importance) v /= total;
    }
    return importance;
}

namespace {
void treeStats(const Node* node, int currentDepth, int& maxDepth, int& leafCount) {
    if (!node) return;
    if (node->isLeaf) {
        maxDepth = std::max(maxDepth, currentDepth);
        ++leafCount;
        return;
    }
    treeStats(node->getLeft(),  currentDepth + 1, maxDepth, leafCount);
    treeStats(node->getRight(), currentDepth + 1, maxDepth, leafCount);
}
} // namespace

int DecisionTreeClassifier::depth() const {
    int d = 0, leaves = 0;
    treeStats(root_.get(), 0, d, leaves);
    return d;
}

int DecisionTreeClassifier::leafCount() const {
    int d = 0, leaves = 0;
    treeStats(root_.get(), 0, d, leaves);
    return leaves;
}
