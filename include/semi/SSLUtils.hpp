// =============================================================================
// include/semi/SSLUtils.hpp - 半监督引擎共用的选择 / 置信度 / 统计工具
// =============================================================================
#pragma once

#include "../classifier/IClassifier.hpp"
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace sslutils {

/** 各类别先验概率（升序类别 -> 频率） */
std::map<int, double> calculatePriorProbability(const std::vector<int>& y);

/** b == 0 时返回 a / eps */
double safeDivision(double a, double b, double eps);

/**
 * 二项比例的置信区间 (low, high)
 * method: "bernoulli" | "normal" (Wald) | "wilson" | "agresti_coull" | "beta" (Clopper-Pearson)
 * alpha 为置信水平（0.95 表示 95%）
 * @throws std::invalid_argument trials <= 0 或未知 method
 */
std::pair<double, double> proportionConfint(int successes,
                                            int trials,
                                            double alpha = 0.95,
                                            const std::string& method = "bernoulli");

/** h 在 (X, y) 上准确率的置信区间 */
std::pair<double, double> confidenceInterval(const std::vector<double>& X,
                                             int rowLength,
                                             const IClassifier& h,
                                             const std::vector<int>& y,
                                             const std::string& method = "bernoulli",
                                             double alpha = 0.95);

/**
 * 按先验比例挑选：对每个类别 c，在预测为 c 的实例中按置信度降序跳过前 extra 个，
 * 再取 floor(n · prior[c]) 个。返回下标（升序，去重）。
 */
std::vector<int> choiceWithProportion(const std::vector<double>& confidence,
                                      const std::vector<int>& predictedClass,
                                      const std::map<int, double>& prior,
                                      int extra = 0);

/** 正态分布 N(mu, sigma) 的生存函数 P(X > x) */
double normalSurvival(double x, double mu, double sigma);

/**
 * k 近邻距离图（欧氏距离，不含自身）
 * @return 每行 k 个 (邻居下标, 距离)
 */
std::vector<std::vector<std::pair<int, double>>>
kneighborsGraph(const std::vector<double>& X, int rowLength, int k);

/**
 * 每个特征与类别之间的互信息（k=3 近邻估计）
 * gen 用于加入确定性的微小抖动以打破距离平局
 */
std::vector<double> mutualInfoClassif(const std::vector<double>& X,
                                      int rowLength,
                                      const std::vector<int>& y,
                                      std::mt19937& gen,
                                      int nNeighbors = 3);

std::vector<double> softmax(const std::vector<double>& v);

double accuracyScore(const std::vector<int>& yTrue, const std::vector<int>& yPred);

/** 扁平概率矩阵每行的 (最大值, argmax 列) */
void rowMax(const std::vector<double>& proba, size_t numClasses,
            std::vector<double>& confidence, std::vector<int>& argmax);

} // namespace sslutils
