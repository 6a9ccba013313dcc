// =============================================================================
// src/semi/Setred.cpp
// =============================================================================
#include "semi/Setred.hpp"
#include "semi/SSLUtils.hpp"
#include "classifier/KNNClassifier.hpp"
#include "neighbors/BruteForceNeighbors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>
#include <stdexcept>

Setred::Setred(std::unique_ptr<IClassifier> base, const SetredConfig& cfg)
    : prototype_(std::move(base)), cfg_(cfg) {
    if (!prototype_) prototype_ = std::make_unique<KNNClassifier>(3);

    if (cfg_.maxIterations <= 0) {
        throw std::invalid_argument("Setred: maxIterations must be positive");
    }
    if (!(cfg_.poolsize > 0.0 && cfg_.poolsize <= 1.0)) {
        throw std::invalid_argument("Setred: poolsize must lie in (0, 1]");
    }
    if (cfg_.rejectionThreshold < 0.0 || cfg_.rejectionThreshold > 1.0) {
        throw std::invalid_argument("Setred: rejectionThreshold must lie in [0, 1]");
    }
    if (cfg_.graphNeighbors <= 0) {
        throw std::invalid_argument("Setred: graphNeighbors must be positive");
    }
}

const IClassifier& Setred::estimator() const {
    checkFitted();
    return *h_;
}

void Setred::fit(const std::vector<double>& X,
                 int rowLength,
                 const std::vector<int>& y,
                 TraceLog* trace) {
    auto start = std::chrono::high_resolution_clock::now();

    LabeledSplit split = splitLabeled(X, rowLength, y);
    classes_ = uniqueClasses(split.y_label);
    acceptedIds_.clear();
    h_.reset();

    std::mt19937 gen(cfg_.seed);
    const size_t candidatesPerIteration = split.numLabeled();
    // 先验只由初始标注集估计一次
    const auto prior = sslutils::calculatePriorProbability(split.y_label);

    std::vector<double> XL = split.X_label;
    std::vector<int>    yL = split.y_label;

    std::vector<int> remaining(split.numUnlabeled());
    std::iota(remaining.begin(), remaining.end(), 0);

    auto h = prototype_->clone();

    for (int it = 1; it <= cfg_.maxIterations; ++it) {
        if (remaining.empty()) {
            record(trace, it, "final", "unlabeled pool exhausted");
            break;
        }

        h->fit(XL, rowLength, yL);

        // **1. 无放回抽样 U_**
        const size_t poolSize = std::min(remaining.size(),
            std::max<size_t>(1, static_cast<size_t>(remaining.size() * cfg_.poolsize)));
        std::vector<int> sample(remaining);
        for (size_t i = 0; i < poolSize; ++i) {
            std::uniform_int_distribution<size_t> pick(i, sample.size() - 1);
            std::swap(sample[i], sample[pick(gen)]);
        }
        sample.resize(poolSize);

        const auto Xu = selectRows(split.X_unlabel, rowLength, sample);
        const auto proba = h->predictProba(Xu, rowLength);
        std::vector<double> confidence;
        std::vector<int> argmax;
        sslutils::rowMax(proba, h->classes().size(), confidence, argmax);

        // **2. 置信度最高的 |L0| 个作为候选**
        std::vector<int> order(poolSize);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&](int a, int b) { return confidence[a] < confidence[b]; });
        const size_t m = std::min(candidatesPerIteration, poolSize);
        std::vector<int> candidates(order.end() - m, order.end());

        // **3. labeled ∪ L_ 上的近邻图，只保留候选行**
        std::vector<double> preL = XL;
        preL.reserve(XL.size() + m * rowLength);
        for (int c : candidates) appendRow(preL, Xu, rowLength, c);
        const int nL = static_cast<int>(yL.size());

        std::vector<int> acceptedPositions;
        for (size_t r = 0; r < m; ++r) {
            const int row = nL + static_cast<int>(r);
            const int label = h->classes()[argmax[candidates[r]]];
            const double pWrong = 1.0 - prior.at(label);

            const auto neighbors = nearestNeighbors(&preL[static_cast<size_t>(row) * rowLength],
                                                    preL, rowLength, cfg_.graphNeighbors, row);

            // **4. 加权 Bernoulli 统计量**
            std::bernoulli_distribution wrong(pWrong);
            double sumW = 0.0, sumW2 = 0.0, J = 0.0;
            for (const auto& nb : neighbors) {
                const double w = nb.second != 0.0 ? 1.0 / nb.second : 0.0;
                sumW  += w;
                sumW2 += w * w;
                if (wrong(gen)) J += w;
            }
            const double mu0    = pWrong * sumW;
            const double sigma0 = std::sqrt(pWrong * (1.0 - pWrong) * sumW2);

            const double z = sigma0 != 0.0 ? (J - mu0) / sigma0 : 0.0;
            const double o = sigma0 != 0.0 ? sslutils::normalSurvival(std::abs(z), mu0, sigma0) : 0.0;

            if (o < cfg_.rejectionThreshold && z < mu0) {
                acceptedPositions.push_back(candidates[r]);
            }
        }

        // **5. 接受的样本并入标注集并移出未标注池**
        std::vector<int> acceptedIds;
        for (int pos : acceptedPositions) {
            appendRow(XL, Xu, rowLength, pos);
            yL.push_back(h->classes()[argmax[pos]]);
            acceptedIds.push_back(sample[pos]);
        }
        std::vector<int> sortedAccepted(acceptedIds);
        std::sort(sortedAccepted.begin(), sortedAccepted.end());
        remaining.erase(std::remove_if(remaining.begin(), remaining.end(),
                            [&](int id) {
                                return std::binary_search(sortedAccepted.begin(),
                                                          sortedAccepted.end(), id);
                            }),
                        remaining.end());
        acceptedIds_.insert(acceptedIds_.end(), acceptedIds.begin(), acceptedIds.end());

        record(trace, it, "iteration", "candidates tested",
               {{"candidates", static_cast<double>(m)},
                {"accepted", static_cast<double>(acceptedIds.size())},
                {"labeled", static_cast<double>(yL.size())},
                {"unlabeled", static_cast<double>(remaining.size())}});

        if (cfg_.verbose) {
            std::cout << "Setred iteration " << it << ": accepted " << acceptedIds.size()
                      << "/" << m << " | labeled " << yL.size()
                      << " | unlabeled " << remaining.size() << std::endl;
        }
    }

    h->fit(XL, rowLength, yL);
    h_ = std::move(h);

    if (cfg_.verbose) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start);
        std::cout << "Setred finished: " << acceptedIds_.size() << " pseudo-labels in "
                  << ms.count() << "ms" << std::endl;
    }
}

std::vector<double> Setred::predictProba(const std::vector<double>& X,
                                         int rowLength) const {
    checkFitted();
    return alignProba(h_->predictProba(X, rowLength), h_->classes(), classes_);
}
