#include "semi/SelfTraining.hpp"
#include "semi/SSLUtils.hpp"
#include "classifier/DecisionTreeClassifier.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <stdexcept>

SelfTraining::SelfTraining(std::unique_ptr<IClassifier> base, const SelfTrainingConfig& cfg)
    : prototype_(std::move(base)), cfg_(cfg) {
    if (!prototype_) prototype_ = std::make_unique<DecisionTreeClassifier>();

    if (cfg_.criterion != "threshold" && cfg_.criterion != "k_best") {
        throw std::invalid_argument("SelfTraining: criterion must be 'threshold' or 'k_best'");
    }
    if (cfg_.criterion == "threshold" && (cfg_.threshold < 0.0 || cfg_.threshold >= 1.0)) {
        throw std::invalid_argument("SelfTraining: threshold must lie in [0, 1)");
    }
    if (cfg_.criterion == "k_best" && cfg_.kBest <= 0) {
        throw std::invalid_argument("SelfTraining: kBest must be positive");
    }
    if (cfg_.maxIterations == 0 || cfg_.maxIterations < -1) {
        throw std::invalid_argument("SelfTraining: maxIterations must be positive or -1");
    }
}

const IClassifier& SelfTraining::estimator() const {
    checkFitted();
    return *h_;
}

void SelfTraining::fit(const std::vector<double>& X,
                       int rowLength,
                       const std::vector<int>& y,
                       TraceLog* trace) {
    LabeledSplit split = splitLabeled(X, rowLength, y);
    classes_ = uniqueClasses(split.y_label);
    h_.reset();

    std::vector<double> XL = split.X_label;
    std::vector<int>    yL = split.y_label;

    std::vector<int> remaining(split.numUnlabeled());
    std::iota(remaining.begin(), remaining.end(), 0);
    labeledIter_.assign(remaining.size(), 0);

    auto h = prototype_->clone();
    if (h->hasRandomSeed()) h->setRandomSeed(cfg_.seed);

    iterations_ = 0;
    while (!remaining.empty() &&
           (cfg_.maxIterations == -1 || iterations_ < cfg_.maxIterations)) {
        ++iterations_;
        h->fit(XL, rowLength, yL);

        const auto Xu = selectRows(split.X_unlabel, rowLength, remaining);
        std::vector<double> confidence;
        std::vector<int> argmax;
        sslutils::rowMax(h->predictProba(Xu, rowLength), h->classes().size(),
                         confidence, argmax);

        std::vector<int> selected;
        if (cfg_.criterion == "threshold") {
            for (size_t i = 0; i < remaining.size(); ++i) {
                if (confidence[i] > cfg_.threshold) selected.push_back(static_cast<int>(i));
            }
        } else {
            std::vector<int> order(remaining.size());
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(),
                             [&](int a, int b) { return confidence[a] > confidence[b]; });
            order.resize(std::min(order.size(), static_cast<size_t>(cfg_.kBest)));
            std::sort(order.begin(), order.end());
            selected = std::move(order);
        }

        if (selected.empty()) {
            record(trace, iterations_, "final", "no new pseudo-labels");
            break;
        }

        std::vector<char> taken(remaining.size(), 0);
        for (int pos : selected) {
            appendRow(XL, Xu, rowLength, pos);
            yL.push_back(h->classes()[argmax[pos]]);
            labeledIter_[remaining[pos]] = iterations_;
            taken[pos] = 1;
        }
        std::vector<int> next;
        for (size_t i = 0; i < remaining.size(); ++i) {
            if (!taken[i]) next.push_back(remaining[i]);
        }
        remaining.swap(next);

        record(trace, iterations_, "iteration", "pseudo-labels added",
               {{"accepted", static_cast<double>(selected.size())},
                {"labeled", static_cast<double>(yL.size())},
                {"unlabeled", static_cast<double>(remaining.size())}});
        if (cfg_.verbose) {
            std::cout << "SelfTraining iteration " << iterations_ << ": added "
                      << selected.size() << " | labeled " << yL.size() << std::endl;
        }
    }

    h->fit(XL, rowLength, yL);
    h_ = std::move(h);
}

std::vector<double> SelfTraining::predictProba(const std::vector<double>& X,
                                               int rowLength) const {
    checkFitted();
    return alignProba(h_->predictProba(X, rowLength), h_->classes(), classes_);
}
