#ifndef MIN_GAIN_PRE_PRUNER_HPP
#define MIN_GAIN_PRE_PRUNER_HPP
#include "tree/IPruner.hpp"

/** 预剪枝：当不纯度下降 < minGain 时直接终止分裂 */
class MinGainPrePruner : public IPruner {
public:
    explicit MinGainPrePruner(double minGain) : minGain_(minGain) {}
    void prune(std::unique_ptr<Node>&) const override {}   // 空实现
    double minGain() const override { return minGain_; }
private:
    double minGain_;
};
#endif
