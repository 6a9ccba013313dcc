#include "neighbors/BruteForceNeighbors.hpp"
#include <algorithm>
#include <cmath>

double euclideanDistance(const double* a, const double* b, int rowLength) {
    double s = 0.0;
    for (int j = 0; j < rowLength; ++j) {
        const double d = a[j] - b[j];
        s += d * d;
    }
    return std::sqrt(s);
}

std::vector<std::pair<int, double>>
nearestNeighbors(const double* query,
                 const std::vector<double>& data,
                 int rowLength,
                 int k,
                 int excludeIndex) {
    const int n = rowLength > 0 ? static_cast<int>(data.size() / rowLength) : 0;
    std::vector<std::pair<int, double>> all;
    all.reserve(n);
    for (int i = 0; i < n; ++i) {
        if (i == excludeIndex) continue;
        all.emplace_back(i, euclideanDistance(query, &data[static_cast<size_t>(i) * rowLength], rowLength));
    }

    const size_t kk = std::min(static_cast<size_t>(std::max(k, 0)), all.size());
    auto byDistance = [](const std::pair<int, double>& a, const std::pair<int, double>& b) {
        return a.second < b.second || (a.second == b.second && a.first < b.first);
    };
    std::partial_sort(all.begin(), all.begin() + kk, all.end(), byDistance);
    all.resize(kk);
    return all;
}
