// =============================================================================
// include/classifier/DecisionTreeClassifier.hpp - CART 分类树
// =============================================================================
#ifndef CLASSIFIER_DECISION_TREE_CLASSIFIER_HPP
#define CLASSIFIER_DECISION_TREE_CLASSIFIER_HPP

#include "IClassifier.hpp"
#include "../tree/Node.hpp"
#include "../tree/ISplitFinder.hpp"
#include "../tree/ISplitCriterion.hpp"
#include "../tree/IPruner.hpp"
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

/** 单棵分类树的超参数 */
struct DecisionTreeConfig {
    int         maxDepth       = 800;
    int         minSamplesLeaf = 1;
    std::string criterion      = "gini";        // "gini" | "entropy"
    std::string splitMethod    = "exhaustive";  // "exhaustive" | "random[:k]"
    std::string prunerType     = "none";        // "none" | "mingain" | "cost_complexity"
    double      prunerParam    = 0.01;          // minGain 或 alpha
    int         maxFeatures    = -1;            // 每个节点候选特征数，-1 = 全部
    uint32_t    seed           = 42;
    bool        verbose        = false;
};

// **字符串工厂**
std::unique_ptr<ISplitFinder>    createSplitFinder(const std::string& method, uint32_t seed);
std::unique_ptr<ISplitCriterion> createCriterion(const std::string& name);
std::unique_ptr<IPruner>         createPruner(const std::string& type, double param);

class DecisionTreeClassifier : public IClassifier {
public:
    explicit DecisionTreeClassifier(const DecisionTreeConfig& cfg = DecisionTreeConfig());

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y) override;

    std::vector<double> predictProba(const std::vector<double>& X,
                                     int rowLength) const override;

    const std::vector<int>& classes() const override { return classes_; }
    bool isFitted() const override { return root_ != nullptr; }
    std::unique_ptr<IClassifier> clone() const override;

    bool hasRandomSeed() const override { return true; }
    void setRandomSeed(uint32_t seed) override { cfg_.seed = seed; }

    std::string name() const override { return "DecisionTreeClassifier"; }

    const Node* getRoot() const { return root_.get(); }
    const DecisionTreeConfig& config() const { return cfg_; }

    /** 按不纯度下降加权的特征重要性（归一化） */
    std::vector<double> getFeatureImportance(int numFeatures) const;

    int depth() const;
    int leafCount() const;

private:
    void splitNode(Node* node,
                   const std::vector<double>& data,
                   int rowLength,
                   const std::vector<int>& encoded,
                   std::vector<int>& indices,
                   int depth);

    std::vector<int> candidateFeatures(int rowLength);
    const Node* findLeaf(const double* sample) const;

    DecisionTreeConfig               cfg_;
    std::vector<int>                 classes_;
    std::unique_ptr<Node>            root_;
    std::unique_ptr<ISplitFinder>    finder_;
    std::unique_ptr<ISplitCriterion> criterion_;
    std::unique_ptr<IPruner>         pruner_;
    std::mt19937                     gen_;
};

#endif // CLASSIFIER_DECISION_TREE_CLASSIFIER_HPP
