// include/criterion/EntropyCriterion.hpp
#ifndef ENTROPY_CRITERION_HPP
#define ENTROPY_CRITERION_HPP

#include "../tree/ISplitCriterion.hpp"

/** 信息熵：-Σ p_k log2 p_k */
class EntropyCriterion : public ISplitCriterion {
public:
    double impurity(const std::vector<double>& counts,
                    double total) const override;

    std::string name() const override { return "entropy"; }
};

#endif // ENTROPY_CRITERION_HPP
