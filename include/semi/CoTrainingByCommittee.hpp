#ifndef SEMI_CO_TRAINING_BY_COMMITTEE_HPP
#define SEMI_CO_TRAINING_BY_COMMITTEE_HPP

#include "SemiSupervisedClassifier.hpp"
#include <cstdint>

struct CommitteeConfig {
    int      maxIterations        = 100;   // -1 = 不限
    int      poolsize             = 100;
    int      minInstancesForClass = 3;
    uint32_t seed                 = 42;
    bool     verbose              = false;
};

/** 一个集成分类器同时负责提出与接受伪标签 */
class CoTrainingByCommittee : public SemiSupervisedClassifier {
public:
    /** ensemble 为空时使用 BaggingClassifier */
    explicit CoTrainingByCommittee(std::unique_ptr<IClassifier> ensemble = nullptr,
                                   const CommitteeConfig& cfg = CommitteeConfig());

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y,
             TraceLog* trace = nullptr) override;

    std::vector<double> predictProba(const std::vector<double>& X,
                                     int rowLength) const override;

    const std::vector<int>& classes() const override { return classes_; }
    bool isFitted() const override { return h_ != nullptr; }
    std::string name() const override { return "CoTrainingByCommittee"; }

    const IClassifier& ensemble() const;
    const std::vector<int>& addedIds() const { return addedIds_; }

private:
    std::unique_ptr<IClassifier> prototype_;
    std::unique_ptr<IClassifier> h_;       // 在编码标签 0..C-1 上训练
    CommitteeConfig  cfg_;
    std::vector<int> classes_;
    std::vector<int> addedIds_;
};

#endif // SEMI_CO_TRAINING_BY_COMMITTEE_HPP
