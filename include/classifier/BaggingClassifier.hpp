#pragma once

#include "IClassifier.hpp"
#include "DecisionTreeClassifier.hpp"
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

struct BaggingConfig {
    int                numTrees    = 10;
    double             sampleRatio = 1.0;
    DecisionTreeConfig tree;
    uint32_t           seed        = 42;
    bool               verbose     = false;
};

/** Bootstrap 聚合的分类树集成，预测为各树概率的平均 */
class BaggingClassifier : public IClassifier {
public:
    explicit BaggingClassifier(const BaggingConfig& cfg = BaggingConfig());

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y) override;

    std::vector<double> predictProba(const std::vector<double>& X,
                                     int rowLength) const override;

    const std::vector<int>& classes() const override { return classes_; }
    bool isFitted() const override { return !trees_.empty(); }
    std::unique_ptr<IClassifier> clone() const override;

    bool hasRandomSeed() const override { return true; }
    void setRandomSeed(uint32_t seed) override { cfg_.seed = seed; }

    std::string name() const override { return "BaggingClassifier"; }

    int getNumTrees() const { return cfg_.numTrees; }
    double getSampleRatio() const { return cfg_.sampleRatio; }
    const std::vector<std::unique_ptr<DecisionTreeClassifier>>& trees() const { return trees_; }

    std::vector<double> getFeatureImportance(int numFeatures) const;

    /** 袋外误分类率（fit 时的训练数据） */
    double getOOBError(const std::vector<double>& data,
                       int rowLength,
                       const std::vector<int>& labels) const;

private:
    void bootstrapSample(int dataSize,
                         std::vector<int>& sampleIndices,
                         std::vector<int>& oobIndices,
                         std::mt19937& localGen) const;

    BaggingConfig cfg_;
    std::vector<int> classes_;
    std::vector<std::unique_ptr<DecisionTreeClassifier>> trees_;
    std::vector<std::vector<int>> oobIndices_;
};
