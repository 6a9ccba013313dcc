#pragma once

#include <tuple>
#include <vector>
#include "Node.hpp"
#include "ISplitCriterion.hpp"

class ISplitFinder {
public:
    virtual ~ISplitFinder() = default;

    /**
     * 在候选特征集合上寻找最佳切分
     * @return (featureIndex, threshold, gain)，找不到时 featureIndex = -1
     */
    virtual std::tuple<int, double, double>
    findBestSplit(const std::vector<double>& data,
                  int rowLength,
                  const std::vector<int>& labels,
                  int numClasses,
                  const std::vector<int>& indices,
                  const std::vector<int>& features,
                  double currentMetric,
                  const ISplitCriterion& criterion) const = 0;
};
