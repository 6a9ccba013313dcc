#pragma once

#include "../tree/ISplitFinder.hpp"
#include <vector>
#include <tuple>

/** 穷举切分：对每个候选特征排序后扫描全部相邻阈值 */
class ExhaustiveSplitFinder : public ISplitFinder {
public:

    std::tuple<int, double, double>
    findBestSplit(const std::vector<double>& data,
                  int                         rowLength,
                  const std::vector<int>&     labels,
                  int                         numClasses,
                  const std::vector<int>&     indices,
                  const std::vector<int>&     features,
                  double                      currentMetric,
                  const ISplitCriterion&      criterion) const override;
};
