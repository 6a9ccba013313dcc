#include "classifier/KNNClassifier.hpp"
#include "neighbors/BruteForceNeighbors.hpp"
#include <algorithm>
#include <stdexcept>

KNNClassifier::KNNClassifier(int k) : k_(k) {
    if (k_ <= 0) {
        throw std::invalid_argument("KNNClassifier: k must be positive");
    }
}

std::unique_ptr<IClassifier> KNNClassifier::clone() const {
    return std::make_unique<KNNClassifier>(k_);
}

void KNNClassifier::fit(const std::vector<double>& X,
                        int rowLength,
                        const std::vector<int>& y) {
    if (y.empty() || rowLength <= 0 || X.size() != y.size() * static_cast<size_t>(rowLength)) {
        throw std::invalid_argument("KNNClassifier: invalid training data");
    }

    classes_ = y;
    std::sort(classes_.begin(), classes_.end());
    classes_.erase(std::unique(classes_.begin(), classes_.end()), classes_.end());

    X_ = X;
    rowLength_ = rowLength;
    y_.resize(y.size());
    for (size_t i = 0; i < y.size(); ++i) {
        y_[i] = static_cast<int>(
            std::lower_bound(classes_.begin(), classes_.end(), y[i]) - classes_.begin());
    }
}

std::vector<double> KNNClassifier::predictProba(const std::vector<double>& X,
                                                int rowLength) const {
    checkFitted();
    if (rowLength != rowLength_) {
        throw std::invalid_argument("KNNClassifier: feature count differs from fit");
    }
    const size_t k = classes_.size();
    const size_t n = X.size() / rowLength;
    std::vector<double> proba(n * k, 0.0);

    #pragma omp parallel for schedule(static) if(n > 200)
    for (long i = 0; i < static_cast<long>(n); ++i) {
        const auto nn = nearestNeighbors(&X[i * rowLength], X_, rowLength_, k_);
        const double w = 1.0 / static_cast<double>(nn.size());
        for (const auto& p : nn) {
            proba[i * k + y_[p.first]] += w;
        }
    }
    return proba;
}
