// =============================================================================
// include/semi/CoTraining.hpp - 双视图协同训练（仅二分类）
// =============================================================================
#ifndef SEMI_CO_TRAINING_HPP
#define SEMI_CO_TRAINING_HPP

#include "SemiSupervisedClassifier.hpp"
#include <cstdint>

struct CoTrainingConfig {
    int      maxIterations = 30;
    int      poolsize      = 75;
    int      positives     = -1;   // -1 与 negatives = -1 同时出现时按标注集比例推断
    int      negatives     = -1;
    uint32_t seed          = 42;
    bool     verbose       = false;
};

class CoTraining : public CoTrainingBase {
public:
    /** second 为空时两个视图都用 base 的克隆；base 为空时使用决策树 */
    explicit CoTraining(std::unique_ptr<IClassifier> base = nullptr,
                        std::unique_ptr<IClassifier> second = nullptr,
                        const CoTrainingConfig& cfg = CoTrainingConfig());

    /** 两个视图都是完整特征集 */
    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y,
             TraceLog* trace = nullptr) override;

    /** 两个视图为 X 的两个列子集 */
    void fitWithFeatures(const std::vector<double>& X,
                         int rowLength,
                         const std::vector<int>& y,
                         const std::vector<int>& view0,
                         const std::vector<int>& view1,
                         TraceLog* trace = nullptr);

    /** 第二视图由调用方单独提供（行与 X1 一一对应） */
    void fitWithViews(const std::vector<double>& X1, int rowLength1,
                      const std::vector<double>& X2, int rowLength2,
                      const std::vector<int>& y,
                      TraceLog* trace = nullptr);

    std::vector<double> predictProba(const std::vector<double>& X,
                                     int rowLength) const override;

    /** fitWithViews 训练后的预测入口 */
    std::vector<double> predictProba(const std::vector<double>& X1, int rowLength1,
                                     const std::vector<double>& X2, int rowLength2) const;
    std::vector<int> predict(const std::vector<double>& X1, int rowLength1,
                             const std::vector<double>& X2, int rowLength2) const;
    using SemiSupervisedClassifier::predict;

    std::string name() const override { return "CoTraining"; }

    /** 实际使用的每轮正 / 负样本数（fit 之后有效） */
    int positives() const { return positives_; }
    int negatives() const { return negatives_; }

    /** 最终标注集中原先未标注的行号（按加入顺序） */
    const std::vector<int>& addedIds() const { return addedIds_; }
    /** 与 addedIds() 对应的伪标签（原始类别值） */
    const std::vector<int>& addedLabels() const { return addedLabels_; }

private:
    void fitImpl(const std::vector<double>& X1, int rowLength1,
                 const std::vector<double>& X2, int rowLength2,
                 const std::vector<int>& y,
                 TraceLog* trace);

    std::vector<double> averageProba(const std::vector<double>& V1, int r1,
                                     const std::vector<double>& V2, int r2) const;

    std::unique_ptr<IClassifier> base_;
    std::unique_ptr<IClassifier> second_;
    CoTrainingConfig cfg_;
    int  positives_ = 0;
    int  negatives_ = 0;
    bool separateViews_ = false;
    std::vector<int> addedIds_;
    std::vector<int> addedLabels_;
};

#endif // SEMI_CO_TRAINING_HPP
