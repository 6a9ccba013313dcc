#pragma once

#include "IClassifier.hpp"

/** 高斯朴素贝叶斯：每个类别每个特征独立正态，后验在对数空间计算 */
class GaussianNBClassifier : public IClassifier {
public:
    explicit GaussianNBClassifier(double varSmoothing = 1e-9);

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y) override;

    std::vector<double> predictProba(const std::vector<double>& X,
                                     int rowLength) const override;

    const std::vector<int>& classes() const override { return classes_; }
    bool isFitted() const override { return !classes_.empty(); }
    std::unique_ptr<IClassifier> clone() const override;
    std::string name() const override { return "GaussianNBClassifier"; }

private:
    double varSmoothing_;
    int rowLength_ = 0;
    std::vector<int>    classes_;
    std::vector<double> logPrior_;
    std::vector<double> mean_;   // K × rowLength
    std::vector<double> var_;    // K × rowLength
};
