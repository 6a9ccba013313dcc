#include "classifier/GaussianNBClassifier.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

GaussianNBClassifier::GaussianNBClassifier(double varSmoothing)
    : varSmoothing_(varSmoothing) {
    if (varSmoothing_ < 0.0) {
        throw std::invalid_argument("GaussianNBClassifier: varSmoothing must be >= 0");
    }
}

std::unique_ptr<IClassifier> GaussianNBClassifier::clone() const {
    return std::make_unique<GaussianNBClassifier>(varSmoothing_);
}

void GaussianNBClassifier::fit(const std::vector<double>& X,
                               int rowLength,
                               const std::vector<int>& y) {
    if (y.empty() || rowLength <= 0 || X.size() != y.size() * static_cast<size_t>(rowLength)) {
        throw std::invalid_argument("GaussianNBClassifier: invalid training data");
    }

    std::vector<int> cls = y;
    std::sort(cls.begin(), cls.end());
    cls.erase(std::unique(cls.begin(), cls.end()), cls.end());

    const size_t K = cls.size();
    const size_t n = y.size();
    rowLength_ = rowLength;

    std::vector<double> counts(K, 0.0);
    std::vector<double> mean(K * rowLength, 0.0);
    std::vector<double> var(K * rowLength, 0.0);

    std::vector<size_t> enc(n);
    for (size_t i = 0; i < n; ++i) {
        enc[i] = std::lower_bound(cls.begin(), cls.end(), y[i]) - cls.begin();
        counts[enc[i]] += 1.0;
        for (int j = 0; j < rowLength; ++j) {
            mean[enc[i] * rowLength + j] += X[i * rowLength + j];
        }
    }
    for (size_t c = 0; c < K; ++c) {
        for (int j = 0; j < rowLength; ++j) mean[c * rowLength + j] /= counts[c];
    }

    // 方差平滑项：varSmoothing × 全体特征方差的最大值
    double maxVar = 0.0;
    for (int j = 0; j < rowLength; ++j) {
        double m = 0.0, s = 0.0;
        for (size_t i = 0; i < n; ++i) m += X[i * rowLength + j];
        m /= n;
        for (size_t i = 0; i < n; ++i) {
            const double d = X[i * rowLength + j] - m;
            s += d * d;
        }
        maxVar = std::max(maxVar, s / n);
    }
    const double epsilon = varSmoothing_ * maxVar;

    for (size_t i = 0; i < n; ++i) {
        for (int j = 0; j < rowLength; ++j) {
            const double d = X[i * rowLength + j] - mean[enc[i] * rowLength + j];
            var[enc[i] * rowLength + j] += d * d;
        }
    }
    for (size_t c = 0; c < K; ++c) {
        for (int j = 0; j < rowLength; ++j) {
            var[c * rowLength + j] = var[c * rowLength + j] / counts[c] + epsilon;
            // 全常数特征
            if (var[c * rowLength + j] <= 0.0) var[c * rowLength + j] = 1e-300;
        }
    }

    logPrior_.assign(K, 0.0);
    for (size_t c = 0; c < K; ++c) logPrior_[c] = std::log(counts[c] / n);
    classes_ = std::move(cls);
    mean_ = std::move(mean);
    var_ = std::move(var);
}

std::vector<double> GaussianNBClassifier::predictProba(const std::vector<double>& X,
                                                       int rowLength) const {
    checkFitted();
    if (rowLength != rowLength_) {
        throw std::invalid_argument("GaussianNBClassifier: feature count differs from fit");
    }
    const size_t K = classes_.size();
    const size_t n = X.size() / rowLength;
    std::vector<double> proba(n * K);
    const double log2pi = std::log(2.0 * 3.14159265358979323846);

    for (size_t i = 0; i < n; ++i) {
        double* row = &proba[i * K];
        for (size_t c = 0; c < K; ++c) {
            double jll = logPrior_[c];
            for (int j = 0; j < rowLength; ++j) {
                const double v = var_[c * rowLength + j];
                const double d = X[i * rowLength + j] - mean_[c * rowLength + j];
                jll -= 0.5 * (log2pi + std::log(v)) + 0.5 * d * d / v;
            }
            row[c] = jll;
        }
        // log-sum-exp 归一化
        const double mx = *std::max_element(row, row + K);
        double sum = 0.0;
        for (size_t c = 0; c < K; ++c) {
            row[c] = std::exp(row[c] - mx);
            sum += row[c];
        }
        for (size_t c = 0; c < K; ++c) row[c] /= sum;
    }
    return proba;
}
