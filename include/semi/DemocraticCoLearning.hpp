// =============================================================================
// include/semi/DemocraticCoLearning.hpp - 异构分类器的民主协同学习
// =============================================================================
#ifndef SEMI_DEMOCRATIC_CO_LEARNING_HPP
#define SEMI_DEMOCRATIC_CO_LEARNING_HPP

#include "SemiSupervisedClassifier.hpp"
#include <cstdint>

struct DemocraticConfig {
    bool        expandOnlyMislabeled = true;   // false: 全体一致的实例也加入
    std::string confidenceMethod     = "bernoulli";
    double      alpha                = 0.95;
    uint32_t    seed                 = 42;
    bool        verbose              = false;
};

class DemocraticCoLearning : public CoTrainingBase {
public:
    /** 决策树、高斯朴素贝叶斯、3-NN */
    static std::vector<std::unique_ptr<IClassifier>> defaultEstimators();

    /**
     * prototype 的 n 个克隆，各自分配不同种子
     * prototype 没有种子旋钮时打印警告（克隆之间没有多样性）
     */
    static std::vector<std::unique_ptr<IClassifier>>
    makeClones(const IClassifier& prototype, int n, uint32_t seed);

    /** estimators 为空时使用 defaultEstimators() */
    explicit DemocraticCoLearning(std::vector<std::unique_ptr<IClassifier>> estimators = {},
                                  const DemocraticConfig& cfg = DemocraticConfig());

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y,
             TraceLog* trace = nullptr) override;

    /**
     * 每个类别组 (size + 0.5) / (size + 1) · 平均权重，空组为 0.5，再 softmax
     */
    std::vector<double> predictProba(const std::vector<double>& X,
                                     int rowLength) const override;

    bool isFitted() const override { return fitted_; }
    std::string name() const override { return "DemocraticCoLearning"; }

    /** 保留下来的学习器在原始标注集上的置信度权重 (> 0.5) */
    const std::vector<double>& confidences() const { return confidences_; }
    int rounds() const { return rounds_; }

private:
    std::vector<std::unique_ptr<IClassifier>> prototypes_;
    DemocraticConfig    cfg_;
    std::vector<double> confidences_;
    bool fitted_ = false;
    int  rounds_ = 0;
};

#endif // SEMI_DEMOCRATIC_CO_LEARNING_HPP
