// =============================================================================
// include/semi/Rasco.hpp - 随机子空间协同训练
// =============================================================================
#ifndef SEMI_RASCO_HPP
#define SEMI_RASCO_HPP

#include "SemiSupervisedClassifier.hpp"
#include <cstdint>
#include <random>

struct RascoConfig {
    int      maxIterations = 10;     // -1 = 直到未标注池为空
    int      nEstimators   = 30;
    bool     incremental   = true;   // true: 每类一个；false: 全局前 batchSize 个
    int      batchSize     = -1;     // -1 = 初始标注集大小
    int      subspaceSize  = -1;     // -1 = max(1, 特征数 / 2)
    uint32_t seed          = 42;
    bool     verbose       = false;
};

class Rasco : public CoTrainingBase {
public:
    /** base 为空时使用决策树 */
    explicit Rasco(std::unique_ptr<IClassifier> base = nullptr,
                   const RascoConfig& cfg = RascoConfig());

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y,
             TraceLog* trace = nullptr) override;

    std::string name() const override { return "Rasco"; }

protected:
    /** 每个估计器一个特征子集：随机排列的前 subspaceSize 个 */
    virtual std::vector<std::vector<int>>
    generateSubspaces(const std::vector<double>& XL, int rowLength,
                      const std::vector<int>& yL, int subspaceSize,
                      std::mt19937& gen);

    std::unique_ptr<IClassifier> prototype_;
    RascoConfig cfg_;
};

/** 子空间按互信息相关性偏置：每个位置抽两个特征，保留相关性更高者 */
class RelRasco : public Rasco {
public:
    explicit RelRasco(std::unique_ptr<IClassifier> base = nullptr,
                      const RascoConfig& cfg = RascoConfig())
        : Rasco(std::move(base), cfg) {}

    std::string name() const override { return "RelRasco"; }

    /** 最近一次 fit 计算的各特征相关性 */
    const std::vector<double>& relevance() const { return relevance_; }

protected:
    std::vector<std::vector<int>>
    generateSubspaces(const std::vector<double>& XL, int rowLength,
                      const std::vector<int>& yL, int subspaceSize,
                      std::mt19937& gen) override;

private:
    std::vector<double> relevance_;
};

#endif // SEMI_RASCO_HPP
