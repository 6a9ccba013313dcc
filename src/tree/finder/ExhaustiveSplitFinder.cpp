// src/tree/finder/ExhaustiveSplitFinder.cpp - OpenMP并行版本
#include "finder/ExhaustiveSplitFinder.hpp"
#include <algorithm>
#include <vector>
#include <cmath>
#include <tuple>
#include <limits>
#ifdef _OPENMP
#include <omp.h>
#endif

std::tuple<int, double, double>
ExhaustiveSplitFinder::findBestSplit(const std::vector<double>& data,
                                     int                        rowLength,
                                     const std::vector<int>&    labels,
                                     int                        numClasses,
                                     const std::vector<int>&    indices,
                                     const std::vector<int>&    features,
                                     double                     currentMetric,
                                     const ISplitCriterion&     criterion) const
{
    const size_t N = indices.size();
    if (N < 2 || features.empty()) return {-1, 0.0, 0.0};

    /* ---------- 父节点类别计数 ---------- */
    std::vector<double> totalCounts(numClasses, 0.0);
    for (int idx : indices) totalCounts[labels[idx]] += 1.0;

    const int nFeat = static_cast<int>(features.size());
    constexpr double EPS = 1e-12;

    // 每个候选特征位置一个结果槽，归约时按 (gain, 特征顺序) 决胜，保证线程数无关
    std::vector<double> bestGain(nFeat, 0.0);
    std::vector<double> bestThr(nFeat, 0.0);
    std::vector<char>   found(nFeat, 0);

    #pragma omp parallel
    {
        // 线程局部缓冲区（避免重复分配）
        std::vector<int>    localSortedIdx(N);
        std::vector<double> leftCounts(numClasses);
        std::vector<double> rightCounts(numClasses);

        #pragma omp for schedule(dynamic)
        for (int p = 0; p < nFeat; ++p) {
            const int f = features[p];

            /* --- 拷贝当前索引并按特征值排序 --- */
            std::copy(indices.begin(), indices.end(), localSortedIdx.begin());
            std::stable_sort(localSortedIdx.begin(), localSortedIdx.end(),
                      [&](int a, int b) {
                          return data[a * rowLength + f] < data[b * rowLength + f];
                      });

            std::fill(leftCounts.begin(), leftCounts.end(), 0.0);
            rightCounts = totalCounts;

            for (size_t i = 0; i < N - 1; ++i) {
                const int idx = localSortedIdx[i];
                leftCounts[labels[idx]]  += 1.0;
                rightCounts[labels[idx]] -= 1.0;

                const double currentVal = data[idx * rowLength + f];
                const double nextVal    = data[localSortedIdx[i + 1] * rowLength + f];
                if (!(currentVal + EPS < nextVal)) continue;

                const double nL = static_cast<double>(i + 1);
                const double nR = static_cast<double>(N) - nL;
                const double child =
                    (criterion.impurity(leftCounts, nL) * nL +
                     criterion.impurity(rightCounts, nR) * nR) / static_cast<double>(N);
                const double gain = currentMetric - child;

                if (gain > bestGain[p]) {
                    bestGain[p] = gain;
                    bestThr[p]  = 0.5 * (currentVal + nextVal);
                    found[p]    = 1;
                }
            }
        }
    }

    /* --- 串行归约 --- */
    int    globalBestFeat = -1;
    double globalBestThr  = 0.0;
    double globalBestGain = 0.0;
    for (int p = 0; p < nFeat; ++p) {
        if (found[p] && bestGain[p] > globalBestGain) {
            globalBestGain = bestGain[p];
            globalBestFeat = features[p];
            globalBestThr  = bestThr[p];
        }
    }

    return {globalBestFeat, globalBestThr, globalBestGain};
}
