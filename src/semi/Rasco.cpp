// =============================================================================
// src/semi/Rasco.cpp
// =============================================================================
#include "semi/Rasco.hpp"
#include "semi/LearnerPool.hpp"
#include "semi/SSLUtils.hpp"
#include "classifier/DecisionTreeClassifier.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <stdexcept>

Rasco::Rasco(std::unique_ptr<IClassifier> base, const RascoConfig& cfg)
    : prototype_(std::move(base)), cfg_(cfg) {
    if (!prototype_) prototype_ = std::make_unique<DecisionTreeClassifier>();

    if (cfg_.maxIterations == 0 || cfg_.maxIterations < -1) {
        throw std::invalid_argument("Rasco: maxIterations must be positive or -1");
    }
    if (cfg_.nEstimators <= 0) {
        throw std::invalid_argument("Rasco: nEstimators must be positive");
    }
    if (cfg_.batchSize == 0 || cfg_.batchSize < -1) {
        throw std::invalid_argument("Rasco: batchSize must be positive or -1");
    }
    if (cfg_.subspaceSize == 0 || cfg_.subspaceSize < -1) {
        throw std::invalid_argument("Rasco: subspaceSize must be positive or -1");
    }
}

std::vector<std::vector<int>>
Rasco::generateSubspaces(const std::vector<double>& /*XL*/, int rowLength,
                         const std::vector<int>& /*yL*/, int subspaceSize,
                         std::mt19937& gen) {
    std::vector<std::vector<int>> idxs;
    for (int e = 0; e < cfg_.nEstimators; ++e) {
        std::vector<int> features = allColumns(rowLength);
        std::shuffle(features.begin(), features.end(), gen);
        features.resize(subspaceSize);
        idxs.push_back(std::move(features));
    }
    return idxs;
}

std::vector<std::vector<int>>
RelRasco::generateSubspaces(const std::vector<double>& XL, int rowLength,
                            const std::vector<int>& yL, int subspaceSize,
                            std::mt19937& gen) {
    relevance_ = sslutils::mutualInfoClassif(XL, rowLength, yL, gen);

    std::uniform_int_distribution<int> pick(0, rowLength - 1);
    std::vector<std::vector<int>> idxs;
    for (int e = 0; e < cfg_.nEstimators; ++e) {
        std::vector<int> subspace;
        for (int s = 0; s < subspaceSize; ++s) {
            const int f1 = pick(gen);
            const int f2 = pick(gen);
            subspace.push_back(relevance_[f1] > relevance_[f2] ? f1 : f2);
        }
        idxs.push_back(std::move(subspace));
    }
    return idxs;
}

void Rasco::fit(const std::vector<double>& X,
                int rowLength,
                const std::vector<int>& y,
                TraceLog* trace) {
    LabeledSplit split = splitLabeled(X, rowLength, y);
    h_.clear();
    columns_.clear();
    classes_ = uniqueClasses(split.y_label);

    const int subspaceSize = cfg_.subspaceSize == -1
        ? std::max(1, rowLength / 2) : cfg_.subspaceSize;
    if (subspaceSize > rowLength) {
        throw std::invalid_argument("Rasco: subspaceSize exceeds the number of features");
    }
    const size_t batchSize = cfg_.batchSize == -1
        ? split.numLabeled() : static_cast<size_t>(cfg_.batchSize);

    std::mt19937 gen(cfg_.seed);
    std::vector<double> XL = split.X_label;
    std::vector<int>    yL = split.y_label;

    const auto subspaces = generateSubspaces(XL, rowLength, yL, subspaceSize, gen);

    LearnerPool pool(*prototype_, cfg_.nEstimators);
    pool.reseed(gen);
    pool.fitAll(XL, rowLength, yL, subspaces);

    std::vector<int> remaining(split.numUnlabeled());
    std::iota(remaining.begin(), remaining.end(), 0);

    const size_t K = classes_.size();
    int it = 0;
    while (true) {
        if ((cfg_.maxIterations != -1 && it >= cfg_.maxIterations) || remaining.empty()) {
            break;
        }
        ++it;

        // **K 个子空间概率的平均**
        const auto Xu = selectRows(split.X_unlabel, rowLength, remaining);
        std::vector<double> avg(remaining.size() * K, 0.0);
        for (size_t e = 0; e < pool.size(); ++e) {
            const auto view = selectColumns(Xu, rowLength, subspaces[e]);
            const auto p = alignProba(pool[e].predictProba(view, subspaceSize),
                                      pool[e].classes(), classes_);
            for (size_t j = 0; j < avg.size(); ++j) avg[j] += p[j];
        }
        for (double& v : avg) v /= static_cast<double>(pool.size());

        std::vector<double> confidence;
        std::vector<int> predicted;
        sslutils::rowMax(avg, K, confidence, predicted);

        std::vector<int> sorted(remaining.size());
        std::iota(sorted.begin(), sorted.end(), 0);
        std::stable_sort(sorted.begin(), sorted.end(),
                         [&](int a, int b) { return confidence[a] < confidence[b]; });

        std::vector<int> chosen;   // remaining 中的位置
        if (cfg_.incremental) {
            for (size_t c = 0; c < K; ++c) {
                int best = -1;
                for (auto r = sorted.rbegin(); r != sorted.rend(); ++r) {
                    if (predicted[*r] == static_cast<int>(c)) { best = *r; break; }
                }
                if (best < 0) {
                    warn(trace, it, "convergence warning, the class " +
                                    std::to_string(classes_[c]) + " not predicted");
                    continue;
                }
                chosen.push_back(best);
            }
        } else {
            const size_t take = std::min(batchSize, sorted.size());
            chosen.assign(sorted.end() - take, sorted.end());
        }

        std::vector<char> taken(remaining.size(), 0);
        for (int pos : chosen) {
            appendRow(XL, Xu, rowLength, pos);
            yL.push_back(classes_[predicted[pos]]);
            taken[pos] = 1;
        }
        std::vector<int> next;
        for (size_t i = 0; i < remaining.size(); ++i) {
            if (!taken[i]) next.push_back(remaining[i]);
        }
        remaining.swap(next);

        pool.fitAll(XL, rowLength, yL, subspaces);

        record(trace, it, "iteration", "pseudo-labels added",
               {{"accepted", static_cast<double>(chosen.size())},
                {"labeled", static_cast<double>(yL.size())},
                {"unlabeled", static_cast<double>(remaining.size())}});
        if (cfg_.verbose) {
            std::cout << name() << " iteration " << it << ": added " << chosen.size()
                      << " | labeled " << yL.size() << " | unlabeled "
                      << remaining.size() << std::endl;
        }
    }

    h_ = pool.release();
    columns_ = subspaces;
}
