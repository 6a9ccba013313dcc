// =============================================================================
// include/semi/Setred.hpp - 基于邻域图统计检验的自训练
// =============================================================================
#ifndef SEMI_SETRED_HPP
#define SEMI_SETRED_HPP

#include "SemiSupervisedClassifier.hpp"
#include <cstdint>

struct SetredConfig {
    int      maxIterations      = 40;
    double   poolsize           = 0.25;   // 每轮抽样占剩余未标注样本的比例
    double   rejectionThreshold = 0.05;
    int      graphNeighbors     = 1;
    uint32_t seed               = 42;
    bool     verbose            = false;
};

class Setred : public SemiSupervisedClassifier {
public:
    /** base 为空时使用 3-NN */
    explicit Setred(std::unique_ptr<IClassifier> base = nullptr,
                    const SetredConfig& cfg = SetredConfig());

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y,
             TraceLog* trace = nullptr) override;

    std::vector<double> predictProba(const std::vector<double>& X,
                                     int rowLength) const override;

    const std::vector<int>& classes() const override { return classes_; }
    bool isFitted() const override { return h_ != nullptr; }
    std::string name() const override { return "Setred"; }

    const IClassifier& estimator() const;

    /** 被接受的未标注样本编号（按接受顺序） */
    const std::vector<int>& acceptedIds() const { return acceptedIds_; }

private:
    std::unique_ptr<IClassifier> prototype_;
    std::unique_ptr<IClassifier> h_;
    SetredConfig                 cfg_;
    std::vector<int>             classes_;
    std::vector<int>             acceptedIds_;
};

#endif // SEMI_SETRED_HPP
