// =============================================================================
// include/semi/TriTraining.hpp - 三分类器协同训练
// =============================================================================
#ifndef SEMI_TRI_TRAINING_HPP
#define SEMI_TRI_TRAINING_HPP

#include "SemiSupervisedClassifier.hpp"
#include <cstdint>

struct TriTrainingConfig {
    int      nSamples = -1;     // 每个自助样本的大小，-1 = 标注集大小
    uint32_t seed     = 42;
    bool     verbose  = false;
};

class TriTraining : public CoTrainingBase {
public:
    static constexpr int kNumLearners = 3;

    /** base 为空时使用决策树 */
    explicit TriTraining(std::unique_ptr<IClassifier> base = nullptr,
                         const TriTrainingConfig& cfg = TriTrainingConfig());

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y,
             TraceLog* trace = nullptr) override;

    std::string name() const override { return "TriTraining"; }

    /**
     * h1 与 h2 预测一致且都错的样本数 / 两者预测一致的样本数
     * 没有一致样本时按 DBL_EPSILON 安全除法
     */
    static double measureError(const std::vector<double>& X,
                               int rowLength,
                               const std::vector<int>& y,
                               const IClassifier& h1,
                               const IClassifier& h2);

    int rounds() const { return rounds_; }

private:
    std::unique_ptr<IClassifier> prototype_;
    TriTrainingConfig cfg_;
    int rounds_ = 0;
};

#endif // SEMI_TRI_TRAINING_HPP
