// 测试用的可控分类器
#pragma once

#include "classifier/IClassifier.hpp"
#include "classifier/KNNClassifier.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * 总是预测训练集中出现最多的类别；记录最近一次 fit 的行数与种子
 * failOnLabel 出现在 y 中时 fit 抛出 std::runtime_error
 */
class StubClassifier : public IClassifier {
public:
    explicit StubClassifier(bool seeded = true, int failOnLabel = -1000)
        : seeded_(seeded), failOnLabel_(failOnLabel) {}

    void fit(const std::vector<double>& X, int rowLength, const std::vector<int>& y) override {
        for (int v : y) {
            if (v == failOnLabel_) throw std::runtime_error("stub: refusing label");
        }
        rows_ = y.size();
        rowLength_ = rowLength;
        columnSum_ = 0.0;
        for (double v : X) columnSum_ += v;
        classes_.clear();
        std::vector<int> counts;
        for (int v : y) {
            auto it = std::lower_bound(classes_.begin(), classes_.end(), v);
            if (it == classes_.end() || *it != v) {
                counts.insert(counts.begin() + (it - classes_.begin()), 0);
                it = classes_.insert(it, v);
            }
            ++counts[it - classes_.begin()];
        }
        majority_ = static_cast<int>(std::max_element(counts.begin(), counts.end()) - counts.begin());
        fitted_ = true;
    }

    std::vector<double> predictProba(const std::vector<double>& X, int rowLength) const override {
        checkFitted();
        const size_t n = X.size() / rowLength;
        std::vector<double> p(n * classes_.size(), 0.0);
        for (size_t i = 0; i < n; ++i) p[i * classes_.size() + majority_] = 1.0;
        return p;
    }

    const std::vector<int>& classes() const override { return classes_; }
    bool isFitted() const override { return fitted_; }
    std::unique_ptr<IClassifier> clone() const override {
        auto c = std::make_unique<StubClassifier>(seeded_, failOnLabel_);
        c->seed_ = seed_;
        return c;
    }
    bool hasRandomSeed() const override { return seeded_; }
    void setRandomSeed(uint32_t seed) override { seed_ = seed; }
    std::string name() const override { return "StubClassifier"; }

    size_t   rows() const { return rows_; }
    int      rowLength() const { return rowLength_; }
    double   columnSum() const { return columnSum_; }
    uint32_t seed() const { return seed_; }

private:
    bool     seeded_;
    int      failOnLabel_;
    bool     fitted_ = false;
    size_t   rows_ = 0;
    int      rowLength_ = 0;
    double   columnSum_ = 0.0;
    uint32_t seed_ = 0;
    int      majority_ = 0;
    std::vector<int> classes_;
};

/** 二分类下总是给出另一个类别的 1-NN：在训练集上准确率为 0 */
class FlippedClassifier : public IClassifier {
public:
    void fit(const std::vector<double>& X, int rowLength, const std::vector<int>& y) override {
        inner_.fit(X, rowLength, y);
    }

    std::vector<double> predictProba(const std::vector<double>& X, int rowLength) const override {
        auto p = inner_.predictProba(X, rowLength);
        const size_t k = inner_.classes().size();
        if (k == 2) {
            for (size_t i = 0; i < p.size(); i += 2) std::swap(p[i], p[i + 1]);
        }
        return p;
    }

    const std::vector<int>& classes() const override { return inner_.classes(); }
    bool isFitted() const override { return inner_.isFitted(); }
    std::unique_ptr<IClassifier> clone() const override {
        return std::make_unique<FlippedClassifier>();
    }
    std::string name() const override { return "FlippedClassifier"; }

private:
    KNNClassifier inner_{1};
};
