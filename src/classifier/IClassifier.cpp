#include "classifier/IClassifier.hpp"
#include <algorithm>

std::vector<int> IClassifier::predict(const std::vector<double>& X,
                                      int rowLength) const {
    checkFitted();
    const auto proba = predictProba(X, rowLength);
    const auto& cls = classes();
    const size_t k = cls.size();
    const size_t n = k > 0 ? proba.size() / k : 0;

    std::vector<int> result(n);
    for (size_t i = 0; i < n; ++i) {
        const double* row = &proba[i * k];
        const size_t best = std::max_element(row, row + k) - row;
        result[i] = cls[best];
    }
    return result;
}

std::vector<double> alignProba(const std::vector<double>& proba,
                               const std::vector<int>& sourceClasses,
                               const std::vector<int>& targetClasses) {
    const size_t ks = sourceClasses.size();
    const size_t kt = targetClasses.size();
    if (sourceClasses == targetClasses) {
        return proba;
    }

    // 源列 -> 目标列映射
    std::vector<int> mapping(ks, -1);
    for (size_t s = 0; s < ks; ++s) {
        auto it = std::lower_bound(targetClasses.begin(), targetClasses.end(),
                                   sourceClasses[s]);
        if (it != targetClasses.end() && *it == sourceClasses[s]) {
            mapping[s] = static_cast<int>(it - targetClasses.begin());
        }
    }

    const size_t n = ks > 0 ? proba.size() / ks : 0;
    std::vector<double> aligned(n * kt, 0.0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t s = 0; s < ks; ++s) {
            if (mapping[s] >= 0) {
                aligned[i * kt + mapping[s]] += proba[i * ks + s];
            }
        }
    }
    return aligned;
}
