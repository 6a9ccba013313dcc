// 测试用的合成数据
#pragma once

#include "pipeline/DataSplit.hpp"
#include <random>
#include <vector>

namespace testdata {

/**
 * numClasses 个高斯团，第 i 行属于类别 i % numClasses
 * 类别 c 的中心在每个特征上都是 c * separation
 */
inline void makeBlobs(int numRows, int numClasses, int rowLength,
                      double separation, double spread, uint32_t seed,
                      std::vector<double>& X, std::vector<int>& y) {
    std::mt19937 gen(seed);
    std::normal_distribution<double> noise(0.0, spread);
    X.clear();
    y.clear();
    for (int i = 0; i < numRows; ++i) {
        const int c = i % numClasses;
        for (int f = 0; f < rowLength; ++f) {
            X.push_back(c * separation + noise(gen));
        }
        y.push_back(c);
    }
}

/** 每个类别只保留前 keepPerClass 个标签，其余标为未标注 */
inline std::vector<int> keepFirstPerClass(const std::vector<int>& y, int numClasses,
                                          int keepPerClass) {
    std::vector<int> out(y);
    for (size_t i = 0; i < y.size(); ++i) {
        if (static_cast<int>(i / numClasses) >= keepPerClass) out[i] = kUnlabeled;
    }
    return out;
}

/** y 中被隐藏的行的真实标签与行号 */
inline void hiddenRows(const std::vector<int>& yTrue, const std::vector<int>& yMasked,
                       int rowLength, const std::vector<double>& X,
                       std::vector<double>& XHidden, std::vector<int>& yHidden) {
    std::vector<int> rows;
    yHidden.clear();
    for (size_t i = 0; i < yTrue.size(); ++i) {
        if (yMasked[i] == kUnlabeled) {
            rows.push_back(static_cast<int>(i));
            yHidden.push_back(yTrue[i]);
        }
    }
    XHidden = selectRows(X, rowLength, rows);
}

} // namespace testdata
