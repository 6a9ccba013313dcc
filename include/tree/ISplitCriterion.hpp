#pragma once

#include <vector>
#include <string>

/** 分类不纯度准则：输入为类别索引（0..numClasses-1） */
class ISplitCriterion {
public:
    virtual ~ISplitCriterion() = default;

    virtual double nodeMetric(const std::vector<int>& labels,
                              const std::vector<int>& indices,
                              int numClasses) const;

    /** 由类别计数直接计算不纯度，供增量式分割扫描使用 */
    virtual double impurity(const std::vector<double>& counts,
                            double total) const = 0;

    virtual std::string name() const = 0;
};
