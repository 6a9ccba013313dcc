// =============================================================================
// include/classifier/IClassifier.hpp - 可训练分类器的能力接口
// =============================================================================
#ifndef CLASSIFIER_ICLASSIFIER_HPP
#define CLASSIFIER_ICLASSIFIER_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/** 在 fit 完成前调用预测时抛出 */
class NotFittedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * 所有半监督引擎只依赖这个接口：
 *   fit / predict / predictProba / classes
 * 特征矩阵为行优先扁平数组，rowLength 为特征列数。
 */
class IClassifier {
public:
    virtual ~IClassifier() = default;

    virtual void fit(const std::vector<double>& X,
                     int rowLength,
                     const std::vector<int>& y) = 0;

    /** 返回 n × classes().size() 的扁平概率矩阵，列顺序与 classes() 一致 */
    virtual std::vector<double> predictProba(const std::vector<double>& X,
                                             int rowLength) const = 0;

    /** 默认实现：predictProba 每行取 argmax */
    virtual std::vector<int> predict(const std::vector<double>& X,
                                     int rowLength) const;

    /** 升序类别列表，fit 之后稳定 */
    virtual const std::vector<int>& classes() const = 0;

    virtual bool isFitted() const = 0;

    /** 相同配置、未训练的独立副本 */
    virtual std::unique_ptr<IClassifier> clone() const = 0;

    // 随机种子旋钮（没有随机性的模型返回 false）
    virtual bool hasRandomSeed() const { return false; }
    virtual void setRandomSeed(uint32_t /*seed*/) {}

    virtual std::string name() const = 0;

protected:
    void checkFitted() const {
        if (!isFitted()) {
            throw NotFittedError(name() + " is not fitted yet");
        }
    }
};

/**
 * 把分类器 h 的概率矩阵按 target 类别顺序重排（缺失的类别概率为 0）
 */
std::vector<double> alignProba(const std::vector<double>& proba,
                               const std::vector<int>& sourceClasses,
                               const std::vector<int>& targetClasses);

#endif // CLASSIFIER_ICLASSIFIER_HPP
