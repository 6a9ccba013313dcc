// src/tree/finder/RandomSplitFinder.cpp
#include "finder/RandomSplitFinder.hpp"
#include <limits>
#include <random>
#include <vector>
#include <algorithm>
#include <cmath>
#ifdef _OPENMP
#include <omp.h>
#endif

std::tuple<int, double, double>
RandomSplitFinder::findBestSplit(const std::vector<double>& X,
                                 int                          D,
                                 const std::vector<int>&      y,
                                 int                          numClasses,
                                 const std::vector<int>&      idx,
                                 const std::vector<int>&      features,
                                 double                       parentMetric,
                                 const ISplitCriterion&       crit) const
{
    const int nIdx  = static_cast<int>(idx.size());
    const int nFeat = static_cast<int>(features.size());
    if (nIdx < 2 || nFeat == 0) {
        return {-1, 0.0, 0.0};
    }

    // 自适应阈值：当节点样本数较小时用串行方式
    const int PARALLEL_THRESHOLD = 1000;
    const bool useParallel = (nIdx >= PARALLEL_THRESHOLD);

    // 先序列化地为每个特征生成种子，结果与线程调度无关
    std::vector<uint32_t> featureSeeds(nFeat);
    {
        std::uniform_int_distribution<uint32_t> seedDist(0, 0xFFFFFFFF);
        for (int p = 0; p < nFeat; ++p) {
            featureSeeds[p] = seedDist(gen_);
        }
    }

    std::vector<double> bestGain(nFeat, -std::numeric_limits<double>::infinity());
    std::vector<double> bestThr(nFeat, 0.0);

    auto processFeature = [&](int p) {
        const int f = features[p];

        // 1) 提取 (特征值, 类别) 并排序
        std::vector<std::pair<double, int>> vals;
        vals.reserve(nIdx);
        for (int i = 0; i < nIdx; ++i) {
            const int s = idx[i];
            vals.emplace_back(X[s * D + f], y[s]);
        }
        std::sort(vals.begin(), vals.end(),
                  [](const std::pair<double, int>& a, const std::pair<double, int>& b) {
                      return a.first < b.first;
                  });

        const double vMin = vals.front().first;
        const double vMax = vals.back().first;
        if (vMax - vMin < 1e-12) {
            return; // 该特征只有单一值，无法切分
        }

        // 2) 前缀类别计数：prefix[i*K + c] = 前 i 个样本中类别 c 的数量
        std::vector<double> prefix(static_cast<size_t>(nIdx + 1) * numClasses, 0.0);
        std::vector<double> sortedX(nIdx);
        for (int i = 0; i < nIdx; ++i) {
            sortedX[i] = vals[i].first;
            std::copy(prefix.begin() + i * numClasses,
                      prefix.begin() + (i + 1) * numClasses,
                      prefix.begin() + (i + 1) * numClasses);
            prefix[(i + 1) * numClasses + vals[i].second] += 1.0;
        }

        // 3) k_ 次随机阈值尝试
        std::mt19937 localGen(featureSeeds[p]);
        std::uniform_real_distribution<double> uni01(0.0, 1.0);
        std::vector<double> left(numClasses), right(numClasses);

        for (int r = 0; r < k_; ++r) {
            const double thr = vMin + uni01(localGen) * (vMax - vMin);
            const int pos = int(std::upper_bound(sortedX.begin(), sortedX.end(), thr)
                                - sortedX.begin());
            if (pos == 0 || pos == nIdx) continue;

            for (int c = 0; c < numClasses; ++c) {
                left[c]  = prefix[pos * numClasses + c];
                right[c] = prefix[nIdx * numClasses + c] - left[c];
            }
            const double nL = static_cast<double>(pos);
            const double nR = static_cast<double>(nIdx - pos);
            const double gain = parentMetric -
                (crit.impurity(left, nL) * nL + crit.impurity(right, nR) * nR) / nIdx;

            if (gain > bestGain[p]) {
                bestGain[p] = gain;
                bestThr[p]  = thr;
            }
        }
    };

    // **并行或串行遍历特征**
    if (useParallel) {
        #pragma omp parallel for schedule(dynamic)
        for (int p = 0; p < nFeat; ++p) {
            processFeature(p);
        }
    } else {
        for (int p = 0; p < nFeat; ++p) {
            processFeature(p);
        }
    }

    // **按特征顺序归约**
    int    globalBestFeat = -1;
    double globalBestThr  = 0.0;
    double globalBestGain = 0.0;
    for (int p = 0; p < nFeat; ++p) {
        if (bestGain[p] > globalBestGain) {
            globalBestGain = bestGain[p];
            globalBestFeat = features[p];
            globalBestThr  = bestThr[p];
        }
    }

    return {globalBestFeat, globalBestThr, globalBestGain};
}
