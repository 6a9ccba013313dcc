// =============================================================================
// include/semi/SemiSupervisedClassifier.hpp - 所有半监督引擎的公共接口
// =============================================================================
#ifndef SEMI_SEMI_SUPERVISED_CLASSIFIER_HPP
#define SEMI_SEMI_SUPERVISED_CLASSIFIER_HPP

#include "../classifier/IClassifier.hpp"
#include "../pipeline/DataSplit.hpp"
#include "TraceLog.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

class SemiSupervisedClassifier {
public:
    virtual ~SemiSupervisedClassifier() = default;

    /**
     * y 中等于 kUnlabeled 的行为未标注样本
     * @param trace 可选的迭代事件汇
     */
    virtual void fit(const std::vector<double>& X,
                     int rowLength,
                     const std::vector<int>& y,
                     TraceLog* trace = nullptr) = 0;

    virtual std::vector<double> predictProba(const std::vector<double>& X,
                                             int rowLength) const = 0;

    virtual std::vector<int> predict(const std::vector<double>& X,
                                     int rowLength) const;

    virtual const std::vector<int>& classes() const = 0;
    virtual bool isFitted() const = 0;
    virtual std::string name() const = 0;

    /** 准确率 */
    double score(const std::vector<double>& X,
                 int rowLength,
                 const std::vector<int>& y) const;

protected:
    void checkFitted() const;

    void record(TraceLog* trace, int iteration, const std::string& kind,
                const std::string& message,
                std::vector<std::pair<std::string, double>> values = {}) const;

    /** 非致命警告：打印到 std::cerr 并记为 "warning" 事件 */
    void warn(TraceLog* trace, int iteration, const std::string& message) const;
};

/**
 * 多假设引擎（每个假设绑定一个列子集）的公共部分：
 * predictProba = 各假设在自身投影上的概率按 classes_ 对齐后取平均
 */
class CoTrainingBase : public SemiSupervisedClassifier {
public:
    std::vector<double> predictProba(const std::vector<double>& X,
                                     int rowLength) const override;

    const std::vector<int>& classes() const override { return classes_; }
    bool isFitted() const override { return !h_.empty(); }

    const std::vector<std::unique_ptr<IClassifier>>& hypotheses() const { return h_; }
    const std::vector<std::vector<int>>& columns() const { return columns_; }

protected:
    std::vector<std::unique_ptr<IClassifier>> h_;
    std::vector<std::vector<int>>             columns_;
    std::vector<int>                          classes_;
};

/** 排序去重后的类别列表 */
std::vector<int> uniqueClasses(const std::vector<int>& y);

/** 0..n-1 */
std::vector<int> allColumns(int rowLength);

#endif // SEMI_SEMI_SUPERVISED_CLASSIFIER_HPP
