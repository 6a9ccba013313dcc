// =============================================================================
// include/semi/CoForest.hpp - 随机树森林的协同训练
// =============================================================================
#ifndef SEMI_CO_FOREST_HPP
#define SEMI_CO_FOREST_HPP

#include "SemiSupervisedClassifier.hpp"
#include "../classifier/DecisionTreeClassifier.hpp"
#include <cstdint>

struct CoForestConfig {
    int      nEstimators   = 7;
    double   threshold     = 0.75;   // 伪标签置信度下限，[0, 1)
    int      maxIterations = -1;     // -1 = 直到没有树被更新
    uint32_t seed          = 42;
    bool     verbose       = false;
};

class CoForest : public CoTrainingBase {
public:
    /** tree.splitMethod 默认改为 "random"，每棵树的种子来自引擎的随机流 */
    explicit CoForest(const CoForestConfig& cfg = CoForestConfig(),
                      DecisionTreeConfig tree = defaultTreeConfig());

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y,
             TraceLog* trace = nullptr) override;

    std::string name() const override { return "CoForest"; }

    int rounds() const { return rounds_; }

    static DecisionTreeConfig defaultTreeConfig();

private:
    /** Σ (1 − P(真实类别))，为 0 时返回 DBL_EPSILON */
    static double estimateError(const IClassifier& h,
                                const std::vector<double>& X,
                                int rowLength,
                                const std::vector<int>& y);

    CoForestConfig     cfg_;
    DecisionTreeConfig tree_;
    int rounds_ = 0;
};

#endif // SEMI_CO_FOREST_HPP
