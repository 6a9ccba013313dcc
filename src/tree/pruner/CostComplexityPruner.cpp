#include "pruner/CostComplexityPruner.hpp"
#include <cmath>

// 子树叶子数
static int countLeaves(const Node* node) {
    if (!node || node->isLeaf) return 1;
    return countLeaves(node->getLeft()) + countLeaves(node->getRight());
}

double CostComplexityPruner::pruneRec(Node* n) const {
    const double nodeCost = n->metric * static_cast<double>(n->samples);
    if (n->isLeaf) {
        return nodeCost;
    }

    const double subtreeError = pruneRec(n->getLeft()) + pruneRec(n->getRight());
    const int subtreeLeaves = countLeaves(n->getLeft()) + countLeaves(n->getRight());

    // 单叶成本 vs 子树成本
    const double leafCost = nodeCost + alpha_;
    const double subtreeCost = subtreeError + alpha_ * subtreeLeaves;

    if (leafCost <= subtreeCost) {
        // 内部节点在构建时已保存自身分布，直接折叠
        n->makeLeaf(n->distribution);
        return nodeCost;
    }
    return subtreeError;
}

void CostComplexityPruner::prune(std::unique_ptr<Node>& root) const {
    if (root) pruneRec(root.get());
}
