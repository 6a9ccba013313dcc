// =============================================================================
// src/semi/SSLUtils.cpp
// =============================================================================
#include "semi/SSLUtils.hpp"
#include "neighbors/BruteForceNeighbors.hpp"
#include <boost/math/distributions/normal.hpp>
#include <boost/math/special_functions/beta.hpp>
#include <boost/math/special_functions/digamma.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace sslutils {

std::map<int, double> calculatePriorProbability(const std::vector<int>& y) {
    std::map<int, double> prior;
    if (y.empty()) return prior;
    for (int label : y) prior[label] += 1.0;
    for (auto& kv : prior) kv.second /= static_cast<double>(y.size());
    return prior;
}

double safeDivision(double a, double b, double eps) {
    return b == 0.0 ? a / eps : a / b;
}

std::pair<double, double> proportionConfint(int successes,
                                            int trials,
                                            double alpha,
                                            const std::string& method) {
    if (trials <= 0) {
        throw std::invalid_argument("proportionConfint: trials must be positive");
    }
    if (successes < 0 || successes > trials) {
        throw std::invalid_argument("proportionConfint: successes out of range");
    }
    if (alpha <= 0.0 || alpha >= 1.0) {
        throw std::invalid_argument("proportionConfint: alpha must lie in (0, 1)");
    }

    const double n = static_cast<double>(trials);
    const double p = successes / n;
    const double tail = (1.0 - alpha) / 2.0;
    const boost::math::normal standard;
    const double z = boost::math::quantile(boost::math::complement(standard, tail));

    auto clip = [](double v) { return std::min(1.0, std::max(0.0, v)); };

    if (method == "bernoulli" || method == "normal") {
        const double half = z * std::sqrt(p * (1.0 - p) / n);
        return {clip(p - half), clip(p + half)};
    }
    if (method == "wilson") {
        const double z2 = z * z;
        const double denom = 1.0 + z2 / n;
        const double center = (p + z2 / (2.0 * n)) / denom;
        const double half = z * std::sqrt(p * (1.0 - p) / n + z2 / (4.0 * n * n)) / denom;
        return {center - half, center + half};
    }
    if (method == "agresti_coull") {
        const double nc = n + z * z;
        const double pc = (successes + z * z / 2.0) / nc;
        const double half = z * std::sqrt(pc * (1.0 - pc) / nc);
        return {clip(pc - half), clip(pc + half)};
    }
    if (method == "beta") {
        const double low = successes == 0 ? 0.0
            : boost::math::ibeta_inv(static_cast<double>(successes),
                                     static_cast<double>(trials - successes + 1), tail);
        const double high = successes == trials ? 1.0
            : boost::math::ibeta_inv(static_cast<double>(successes + 1),
                                     static_cast<double>(trials - successes), 1.0 - tail);
        return {low, high};
    }
    throw std::invalid_argument("Unknown confidence interval method: " + method);
}

std::pair<double, double> confidenceInterval(const std::vector<double>& X,
                                             int rowLength,
                                             const IClassifier& h,
                                             const std::vector<int>& y,
                                             const std::string& method,
                                             double alpha) {
    const auto pred = h.predict(X, rowLength);
    int successes = 0;
    for (size_t i = 0; i < y.size(); ++i) {
        if (pred[i] == y[i]) ++successes;
    }
    return proportionConfint(successes, static_cast<int>(y.size()), alpha, method);
}

std::vector<int> choiceWithProportion(const std::vector<double>& confidence,
                                      const std::vector<int>& predictedClass,
                                      const std::map<int, double>& prior,
                                      int extra) {
    const size_t n = confidence.size();
    std::vector<int> chosen;

    for (const auto& kv : prior) {
        const int c = kv.first;
        const size_t quota = static_cast<size_t>(n * kv.second);

        std::vector<int> members;
        for (size_t i = 0; i < n; ++i) {
            if (predictedClass[i] == c) members.push_back(static_cast<int>(i));
        }
        // 置信度降序，平局保持下标升序
        std::stable_sort(members.begin(), members.end(),
                         [&](int a, int b) { return confidence[a] > confidence[b]; });

        const size_t begin = std::min(members.size(), static_cast<size_t>(std::max(extra, 0)));
        const size_t end   = std::min(members.size(), begin + quota);
        chosen.insert(chosen.end(), members.begin() + begin, members.begin() + end);
    }

    std::sort(chosen.begin(), chosen.end());
    chosen.erase(std::unique(chosen.begin(), chosen.end()), chosen.end());
    return chosen;
}

double normalSurvival(double x, double mu, double sigma) {
    if (!(sigma > 0.0)) {
        throw std::invalid_argument("normalSurvival: sigma must be positive");
    }
    const boost::math::normal dist(mu, sigma);
    return boost::math::cdf(boost::math::complement(dist, x));
}

std::vector<std::vector<std::pair<int, double>>>
kneighborsGraph(const std::vector<double>& X, int rowLength, int k) {
    const int n = rowLength > 0 ? static_cast<int>(X.size() / rowLength) : 0;
    if (k <= 0) {
        throw std::invalid_argument("kneighborsGraph: k must be positive");
    }
    std::vector<std::vector<std::pair<int, double>>> graph(n);

    #pragma omp parallel for schedule(dynamic) if(n > 500)
    for (int i = 0; i < n; ++i) {
        graph[i] = nearestNeighbors(&X[static_cast<size_t>(i) * rowLength], X, rowLength, k, i);
    }
    return graph;
}

namespace {

// 单个连续特征与离散类别的互信息（近邻计数估计）
double miContinuousDiscrete(const std::vector<double>& c,
                            const std::vector<int>& d,
                            int nNeighbors) {
    const size_t n = c.size();
    std::map<int, std::vector<size_t>> byLabel;
    for (size_t i = 0; i < n; ++i) byLabel[d[i]].push_back(i);

    std::vector<double> radius(n, 0.0);
    std::vector<int>    kAll(n, 0);
    std::vector<int>    labelCounts(n, 0);
    std::vector<char>   mask(n, 0);

    for (const auto& kv : byLabel) {
        const auto& members = kv.second;
        const int count = static_cast<int>(members.size());
        if (count <= 1) continue;
        const int k = std::min(nNeighbors, count - 1);

        std::vector<double> dist(members.size() - 1);
        for (size_t a = 0; a < members.size(); ++a) {
            size_t w = 0;
            for (size_t b = 0; b < members.size(); ++b) {
                if (a == b) continue;
                dist[w++] = std::abs(c[members[a]] - c[members[b]]);
            }
            std::nth_element(dist.begin(), dist.begin() + (k - 1), dist.end());
            const size_t i = members[a];
            radius[i] = std::nextafter(dist[k - 1], 0.0);
            kAll[i] = k;
            labelCounts[i] = count;
            mask[i] = 1;
        }
    }

    std::vector<size_t> kept;
    for (size_t i = 0; i < n; ++i) {
        if (mask[i]) kept.push_back(i);
    }
    const size_t nKept = kept.size();
    if (nKept == 0) return 0.0;

    double sumK = 0.0, sumLabel = 0.0, sumM = 0.0;
    for (size_t a : kept) {
        int m = 0;
        for (size_t b : kept) {
            if (std::abs(c[a] - c[b]) <= radius[a]) ++m;
        }
        sumK     += boost::math::digamma(static_cast<double>(kAll[a]));
        sumLabel += boost::math::digamma(static_cast<double>(labelCounts[a]));
        sumM     += boost::math::digamma(static_cast<double>(m));
    }

    const double mi = boost::math::digamma(static_cast<double>(nKept))
                    + sumK / nKept - sumLabel / nKept - sumM / nKept;
    return std::max(0.0, mi);
}

} // namespace

std::vector<double> mutualInfoClassif(const std::vector<double>& X,
                                      int rowLength,
                                      const std::vector<int>& y,
                                      std::mt19937& gen,
                                      int nNeighbors) {
    const size_t n = y.size();
    if (rowLength <= 0 || X.size() != n * rowLength) {
        throw std::invalid_argument("mutualInfoClassif: data size mismatch");
    }

    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<double> mi(rowLength, 0.0);
    std::vector<double> col(n);

    for (int f = 0; f < rowLength; ++f) {
        // 按标准差缩放（不中心化）
        double mean = 0.0;
        for (size_t i = 0; i < n; ++i) mean += X[i * rowLength + f];
        mean /= n;
        double var = 0.0;
        for (size_t i = 0; i < n; ++i) {
            const double d = X[i * rowLength + f] - mean;
            var += d * d;
        }
        double sd = std::sqrt(var / n);
        if (sd == 0.0) sd = 1.0;

        double meanAbs = 0.0;
        for (size_t i = 0; i < n; ++i) {
            col[i] = X[i * rowLength + f] / sd;
            meanAbs += std::abs(col[i]);
        }
        meanAbs /= n;

        // 微小抖动打破平局
        const double scale = 1e-10 * std::max(1.0, meanAbs);
        for (size_t i = 0; i < n; ++i) {
            col[i] += scale * noise(gen);
        }
        mi[f] = miContinuousDiscrete(col, y, nNeighbors);
    }
    return mi;
}

std::vector<double> softmax(const std::vector<double>& v) {
    if (v.empty()) return {};
    const double mx = *std::max_element(v.begin(), v.end());
    std::vector<double> out(v.size());
    double sum = 0.0;
    for (size_t i = 0; i < v.size(); ++i) {
        out[i] = std::exp(v[i] - mx);
        sum += out[i];
    }
    for (double& o : out) o /= sum;
    return out;
}

double accuracyScore(const std::vector<int>& yTrue, const std::vector<int>& yPred) {
    if (yTrue.size() != yPred.size()) {
        throw std::invalid_argument("accuracyScore: size mismatch");
    }
    if (yTrue.empty()) return 0.0;
    size_t hit = 0;
    for (size_t i = 0; i < yTrue.size(); ++i) {
        if (yTrue[i] == yPred[i]) ++hit;
    }
    return static_cast<double>(hit) / yTrue.size();
}

void rowMax(const std::vector<double>& proba, size_t numClasses,
            std::vector<double>& confidence, std::vector<int>& argmax) {
    const size_t n = numClasses > 0 ? proba.size() / numClasses : 0;
    confidence.resize(n);
    argmax.resize(n);
    for (size_t i = 0; i < n; ++i) {
        const double* row = &proba[i * numClasses];
        const size_t best = std::max_element(row, row + numClasses) - row;
        confidence[i] = row[best];
        argmax[i] = static_cast<int>(best);
    }
}

} // namespace sslutils
