// src/tree/criterion/SplitCriterion.cpp - 分类准则公共实现
#include "tree/ISplitCriterion.hpp"
#include "criterion/GiniCriterion.hpp"
#include "criterion/EntropyCriterion.hpp"
#include <cmath>

double ISplitCriterion::nodeMetric(const std::vector<int>& labels,
                                   const std::vector<int>& indices,
                                   int numClasses) const {
    if (indices.empty()) return 0.0;

    std::vector<double> counts(numClasses, 0.0);
    for (int idx : indices) {
        counts[labels[idx]] += 1.0;
    }
    return impurity(counts, static_cast<double>(indices.size()));
}

double GiniCriterion::impurity(const std::vector<double>& counts,
                               double total) const {
    if (total <= 0.0) return 0.0;
    double sumSq = 0.0;
    for (double c : counts) {
        const double p = c / total;
        sumSq += p * p;
    }
    // 数值精度保护
    return std::max(0.0, 1.0 - sumSq);
}

double EntropyCriterion::impurity(const std::vector<double>& counts,
                                  double total) const {
    if (total <= 0.0) return 0.0;
    double h = 0.0;
    for (double c : counts) {
        if (c > 0.0) {
            const double p = c / total;
            h -= p * std::log2(p);
        }
    }
    return h;
}
