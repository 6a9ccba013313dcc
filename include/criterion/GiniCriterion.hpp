// include/criterion/GiniCriterion.hpp
#ifndef GINI_CRITERION_HPP
#define GINI_CRITERION_HPP

#include "../tree/ISplitCriterion.hpp"

/** Gini 不纯度：1 - Σ p_k² */
class GiniCriterion : public ISplitCriterion {
public:
    double impurity(const std::vector<double>& counts,
                    double total) const override;

    std::string name() const override { return "gini"; }
};

#endif // GINI_CRITERION_HPP
