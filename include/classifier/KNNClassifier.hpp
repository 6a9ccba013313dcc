#pragma once

#include "IClassifier.hpp"

/** k 近邻（欧氏距离，等权投票） */
class KNNClassifier : public IClassifier {
public:
    explicit KNNClassifier(int k = 3);

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<int>& y) override;

    std::vector<double> predictProba(const std::vector<double>& X,
                                     int rowLength) const override;

    const std::vector<int>& classes() const override { return classes_; }
    bool isFitted() const override { return !y_.empty(); }
    std::unique_ptr<IClassifier> clone() const override;
    std::string name() const override { return "KNNClassifier"; }

    int k() const { return k_; }

private:
    int k_;
    int rowLength_ = 0;
    std::vector<double> X_;
    std::vector<int>    y_;        // 编码后的类别下标
    std::vector<int>    classes_;
};
