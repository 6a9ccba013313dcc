#ifndef APP_SEMI_SUPERVISED_APP_HPP
#define APP_SEMI_SUPERVISED_APP_HPP
#include <string>
#include <cstdint>
#include <vector>

class TraceLog;

/** 半监督运行参数 */
struct SemiSupervisedOptions {
    std::string dataPath;        // CSV 或 KEEL(.dat) 路径
    std::string algorithm;       // createEngine 的算法名
    std::string baseEstimator;   // "" = 引擎默认 | "tree[:crit]" | "knn[:k]" | "gnb" | ...
    double      labelRate;       // 训练集中保留标签的比例
    double      testRatio;       // 测试集比例
    bool        secure;          // 真实类别 -1 时整体平移
    uint32_t    seed;            // 随机种子
    bool        verbose;
    bool        trace;           // 打印每轮事件
};

/** 一次运行的结果 */
struct SemiSupervisedResult {
    double transductiveAccuracy = 0.0;  // 被隐藏标签的训练样本上的准确率
    double testAccuracy         = 0.0;
    double trainTimeMs          = 0.0;
    int    numLabeled           = 0;
    int    numUnlabeled         = 0;
};

/** 按扩展名选择读取器：.dat -> KEEL，其余 -> CSV */
void loadDataset(const std::string& path, bool secure,
                 std::vector<double>& X, std::vector<int>& y, int& rowLength);

/**
 * 划分、隐藏标签、训练并评估一次
 * 文件中本来就未标注的测试行不参与测试准确率
 */
SemiSupervisedResult runSemiSupervisedExperiment(const std::vector<double>& X,
                                                 const std::vector<int>& y,
                                                 int rowLength,
                                                 const std::string& algorithm,
                                                 const std::string& baseEstimator,
                                                 double labelRate,
                                                 double testRatio,
                                                 uint32_t seed,
                                                 bool verbose,
                                                 TraceLog* trace = nullptr);

/** 训练 + 评估并打印结果 */
void runSemiSupervisedApp(const SemiSupervisedOptions& opts);

#endif // APP_SEMI_SUPERVISED_APP_HPP
