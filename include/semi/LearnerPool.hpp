// =============================================================================
// include/semi/LearnerPool.hpp - 固定数量、互相独立的分类器槽位
// =============================================================================
#ifndef SEMI_LEARNER_POOL_HPP
#define SEMI_LEARNER_POOL_HPP

#include "../classifier/IClassifier.hpp"
#include <memory>
#include <random>
#include <vector>

/** 一个槽位的训练任务；X == nullptr 表示本轮跳过该槽位 */
struct FitJob {
    const std::vector<double>* X = nullptr;
    int rowLength = 0;
    const std::vector<int>* y = nullptr;
};

class LearnerPool {
public:
    LearnerPool() = default;

    /** n 个 prototype 的独立克隆 */
    LearnerPool(const IClassifier& prototype, int n);

    explicit LearnerPool(std::vector<std::unique_ptr<IClassifier>> learners);

    size_t size() const { return learners_.size(); }
    bool empty() const { return learners_.empty(); }

    IClassifier&       operator[](size_t i)       { return *learners_[i]; }
    const IClassifier& operator[](size_t i) const { return *learners_[i]; }

    /**
     * 为有随机种子旋钮的槽位串行分配不同种子
     * @return 没有种子旋钮的槽位数
     */
    int reseed(std::mt19937& gen);

    /**
     * 各槽位并行训练（OpenMP），每个 worker 只访问自己的槽位与数据；
     * 任何槽位抛出的异常在所有槽位结束后于调用线程重新抛出
     */
    void fitAll(const std::vector<FitJob>& jobs);

    /** 每个槽位在 X 的对应列投影上训练 */
    void fitAll(const std::vector<double>& X,
                int rowLength,
                const std::vector<int>& y,
                const std::vector<std::vector<int>>& columns);

    const std::vector<std::unique_ptr<IClassifier>>& learners() const { return learners_; }

    std::vector<std::unique_ptr<IClassifier>> release();

private:
    std::vector<std::unique_ptr<IClassifier>> learners_;
};

#endif // SEMI_LEARNER_POOL_HPP
