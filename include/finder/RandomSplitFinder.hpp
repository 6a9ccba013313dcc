#ifndef RANDOM_SPLIT_FINDER_HPP
#define RANDOM_SPLIT_FINDER_HPP
#include "tree/ISplitFinder.hpp"
#include <cstdint>
#include <random>
#include <tuple>
#include <vector>

/** 随机阈值切分（Extra-Trees 风格）：每个特征在 [min, max] 内随机尝试 k 个阈值 */
class RandomSplitFinder : public ISplitFinder {
public:
    explicit RandomSplitFinder(int k = 10, uint32_t seed = 42)
      : k_(k), gen_(seed) {}
    std::tuple<int, double, double> findBestSplit(
        const std::vector<double>& data,
        int rowLen,
        const std::vector<int>& labels,
        int numClasses,
        const std::vector<int>& idx,
        const std::vector<int>& features,
        double parentMetric,
        const ISplitCriterion& criterion) const override;
private:
    int               k_;
    mutable std::mt19937 gen_;  // 每次调用先串行派生各特征种子
};

#endif // RANDOM_SPLIT_FINDER_HPP
