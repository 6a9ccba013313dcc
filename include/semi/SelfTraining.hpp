#ifndef SEMI_SELF_TRAINING_HPP
#define SEMI_SELF_TRAINING_HPP

#include "SemiSupervisedClassifier.hpp"
#include <cstdint>

struct SelfTrainingConfig {
    std::string criterion     = "threshold";   // "threshold" | "k_best"
    double      threshold     = 0.75;
    int         kBest         = 10;
    int         maxIterations = 10;            // -1 = 直到没有新样本
    uint32_t    seed          = 42;            // 转交给带种子旋钮的基分类器
    bool        verbose       = false;
};

/** 经典自训练：每轮把高置信度预测直接并入标注集 */
class SelfTraining : public SemiSupervisedClassifier {
public:
    explicit SelfTraining(std::unique_ptr<IClassifier> base = nullptr,
                          const SelfTrainingConfig& cfg = SelfTrainingConfig());

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y,
             TraceLog* trace = nullptr) override;

    std::vector<double> predictProba(const std::vector<double>& X,
                                     int rowLength) const override;

    const std::vector<int>& classes() const override { return classes_; }
    bool isFitted() const override { return h_ != nullptr; }
    std::string name() const override { return "SelfTraining"; }

    const IClassifier& estimator() const;

    /** 每个未标注样本被标注时的迭代轮次，0 = 从未被标注 */
    const std::vector<int>& labeledIteration() const { return labeledIter_; }
    int iterations() const { return iterations_; }

private:
    std::unique_ptr<IClassifier> prototype_;
    std::unique_ptr<IClassifier> h_;
    SelfTrainingConfig           cfg_;
    std::vector<int>             classes_;
    std::vector<int>             labeledIter_;
    int                          iterations_ = 0;
};

#endif // SEMI_SELF_TRAINING_HPP
