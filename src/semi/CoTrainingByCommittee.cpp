#include "semi/CoTrainingByCommittee.hpp"
#include "semi/SSLUtils.hpp"
#include "classifier/BaggingClassifier.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <random>
#include <stdexcept>

CoTrainingByCommittee::CoTrainingByCommittee(std::unique_ptr<IClassifier> ensemble,
                                             const CommitteeConfig& cfg)
    : prototype_(std::move(ensemble)), cfg_(cfg) {
    if (!prototype_) prototype_ = std::make_unique<BaggingClassifier>();

    if (cfg_.maxIterations == 0 || cfg_.maxIterations < -1) {
        throw std::invalid_argument("CoTrainingByCommittee: maxIterations must be positive or -1");
    }
    if (cfg_.poolsize <= 0) {
        throw std::invalid_argument("CoTrainingByCommittee: poolsize must be positive");
    }
    if (cfg_.minInstancesForClass < 0) {
        throw std::invalid_argument("CoTrainingByCommittee: minInstancesForClass must be >= 0");
    }
}

const IClassifier& CoTrainingByCommittee::ensemble() const {
    checkFitted();
    return *h_;
}

void CoTrainingByCommittee::fit(const std::vector<double>& X,
                                int rowLength,
                                const std::vector<int>& y,
                                TraceLog* trace) {
    LabeledSplit split = splitLabeled(X, rowLength, y);
    classes_ = uniqueClasses(split.y_label);
    addedIds_.clear();
    h_.reset();

    const int numClasses = static_cast<int>(classes_.size());
    std::vector<double> XL = split.X_label;
    std::vector<int> yL(split.y_label.size());
    for (size_t i = 0; i < yL.size(); ++i) {
        yL[i] = static_cast<int>(std::lower_bound(classes_.begin(), classes_.end(),
                                                  split.y_label[i]) - classes_.begin());
    }
    const auto prior = sslutils::calculatePriorProbability(yL);

    std::mt19937 gen(cfg_.seed);
    std::vector<int> permutation(split.numUnlabeled());
    std::iota(permutation.begin(), permutation.end(), 0);
    std::shuffle(permutation.begin(), permutation.end(), gen);

    auto h = prototype_->clone();
    if (h->hasRandomSeed()) h->setRandomSeed(gen());
    h->fit(XL, rowLength, yL);

    const std::vector<int> encodedClasses = [&] {
        std::vector<int> c(numClasses);
        std::iota(c.begin(), c.end(), 0);
        return c;
    }();

    for (int it = 1; cfg_.maxIterations == -1 || it <= cfg_.maxIterations; ++it) {
        if (permutation.empty()) {
            record(trace, it, "final", "unlabeled pool exhausted");
            break;
        }

        const size_t window = std::min(permutation.size(), static_cast<size_t>(cfg_.poolsize));
        const std::vector<int> ids(permutation.begin(), permutation.begin() + window);
        const auto Xw = selectRows(split.X_unlabel, rowLength, ids);

        std::vector<double> confidence;
        std::vector<int> predicted;
        sslutils::rowMax(alignProba(h->predictProba(Xw, rowLength), h->classes(), encodedClasses),
                         numClasses, confidence, predicted);

        std::vector<char> added(window, 0);

        // 多样性下限：每个类别置信度最高的 minInstancesForClass 个
        for (int c = 0; c < numClasses; ++c) {
            std::vector<int> members;
            for (size_t i = 0; i < window; ++i) {
                if (predicted[i] == c) members.push_back(static_cast<int>(i));
            }
            std::stable_sort(members.begin(), members.end(),
                             [&](int a, int b) { return confidence[a] > confidence[b]; });
            const size_t k = std::min(members.size(),
                                      static_cast<size_t>(cfg_.minInstancesForClass));
            for (size_t j = 0; j < k; ++j) added[members[j]] = 1;
        }

        // 按先验比例补充
        for (int pos : sslutils::choiceWithProportion(confidence, predicted, prior,
                                                      cfg_.minInstancesForClass)) {
            added[pos] = 1;
        }

        size_t numAdded = 0;
        for (size_t i = 0; i < window; ++i) {
            if (!added[i]) continue;
            appendRow(XL, split.X_unlabel, rowLength, ids[i]);
            yL.push_back(predicted[i]);
            addedIds_.push_back(ids[i]);
            ++numAdded;
        }
        if (numAdded == 0) {
            record(trace, it, "final", "no instance selected");
            break;
        }

        // 已标注的移出排列，其余保持原顺序
        std::vector<int> rest;
        rest.reserve(permutation.size() - numAdded);
        for (size_t i = 0; i < permutation.size(); ++i) {
            if (i < window && added[i]) continue;
            rest.push_back(permutation[i]);
        }
        permutation.swap(rest);

        h->fit(XL, rowLength, yL);

        record(trace, it, "iteration", "pseudo-labels added",
               {{"accepted", static_cast<double>(numAdded)},
                {"labeled", static_cast<double>(yL.size())},
                {"unlabeled", static_cast<double>(permutation.size())}});
        if (cfg_.verbose) {
            std::cout << "CoTrainingByCommittee iteration " << it << ": added " << numAdded
                      << " | labeled " << yL.size() << " | remaining "
                      << permutation.size() << std::endl;
        }
    }

    h_ = std::move(h);
}

std::vector<double> CoTrainingByCommittee::predictProba(const std::vector<double>& X,
                                                        int rowLength) const {
    checkFitted();
    std::vector<int> encoded(classes_.size());
    std::iota(encoded.begin(), encoded.end(), 0);
    // 编码后的列顺序与 classes_ 一致
    return alignProba(h_->predictProba(X, rowLength), h_->classes(), encoded);
}
