#pragma once

#include <memory>
#include <cstddef>
#include <vector>
#include <algorithm>

/** 分类树节点：内部节点保存 (feature, threshold)，叶子保存类别分布 */
struct Node {
    bool   isLeaf      = false;
    size_t samples     = 0;
    double metric      = 0.0;      // 节点不纯度

    int    featureIndex = -1;
    double threshold    = 0.0;

    // 叶子：按类别索引的归一化分布
    std::vector<double> distribution;

    std::unique_ptr<Node> leftChild  = nullptr;
    std::unique_ptr<Node> rightChild = nullptr;

    void makeLeaf(std::vector<double> dist) {
        isLeaf = true;
        featureIndex = -1;
        distribution = std::move(dist);
        leftChild.reset();
        rightChild.reset();
    }

    void makeInternal(int feature, double thr) {
        isLeaf = false;
        featureIndex = feature;
        threshold = thr;
        leftChild = std::make_unique<Node>();
        rightChild = std::make_unique<Node>();
    }

    int getFeatureIndex() const {
        return isLeaf ? -1 : featureIndex;
    }

    double getThreshold() const {
        return isLeaf ? 0.0 : threshold;
    }

    /** 叶子的多数类索引 */
    int getPrediction() const {
        if (!isLeaf || distribution.empty()) return -1;
        return static_cast<int>(std::max_element(distribution.begin(), distribution.end())
                                - distribution.begin());
    }

    const std::vector<double>& getDistribution() const { return distribution; }

    Node* getLeft() const {
        return isLeaf ? nullptr : leftChild.get();
    }

    Node* getRight() const {
        return isLeaf ? nullptr : rightChild.get();
    }
};
