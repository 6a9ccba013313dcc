// =============================================================================
// src/semi/CoTraining.cpp
// =============================================================================
#include "semi/CoTraining.hpp"
#include "semi/LearnerPool.hpp"
#include "classifier/DecisionTreeClassifier.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <numeric>
#include <random>
#include <stdexcept>

namespace {

const std::vector<int> kBinary{0, 1};

// 按 col 列概率升序取最后 k 个，且概率 > 0.5
std::vector<int> topConfident(const std::vector<double>& proba, int col, int k) {
    const size_t n = proba.size() / 2;
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](int a, int b) { return proba[a * 2 + col] < proba[b * 2 + col]; });

    std::vector<int> picked;
    const size_t from = n > static_cast<size_t>(k) ? n - k : 0;
    for (size_t i = from; i < n; ++i) {
        if (proba[order[i] * 2 + col] > 0.5) picked.push_back(order[i]);
    }
    return picked;
}

void checkView(const std::vector<int>& view, int rowLength) {
    if (view.empty()) {
        throw std::invalid_argument("CoTraining: empty feature view");
    }
    for (int c : view) {
        if (c < 0 || c >= rowLength) {
            throw std::invalid_argument("CoTraining: feature index out of range");
        }
    }
}

} // namespace

CoTraining::CoTraining(std::unique_ptr<IClassifier> base,
                       std::unique_ptr<IClassifier> second,
                       const CoTrainingConfig& cfg)
    : base_(std::move(base)), second_(std::move(second)), cfg_(cfg) {
    if (!base_) base_ = std::make_unique<DecisionTreeClassifier>();

    if ((cfg_.positives == -1) != (cfg_.negatives == -1)) {
        throw std::invalid_argument(
            "CoTraining supports either both positives and negatives being specified, or neither");
    }
    if (cfg_.positives != -1 && (cfg_.positives <= 0 || cfg_.negatives <= 0)) {
        throw std::invalid_argument("CoTraining: positives and negatives must be positive");
    }
    if (cfg_.maxIterations <= 0 || cfg_.poolsize <= 0) {
        throw std::invalid_argument("CoTraining: maxIterations and poolsize must be positive");
    }
}

void CoTraining::fit(const std::vector<double>& X,
                     int rowLength,
                     const std::vector<int>& y,
                     TraceLog* trace) {
    fitWithFeatures(X, rowLength, y, allColumns(rowLength), allColumns(rowLength), trace);
}

void CoTraining::fitWithFeatures(const std::vector<double>& X,
                                 int rowLength,
                                 const std::vector<int>& y,
                                 const std::vector<int>& view0,
                                 const std::vector<int>& view1,
                                 TraceLog* trace) {
    checkView(view0, rowLength);
    checkView(view1, rowLength);
    if (X.size() != y.size() * static_cast<size_t>(rowLength)) {
        throw std::invalid_argument("CoTraining: data size mismatch");
    }
    const auto X1 = selectColumns(X, rowLength, view0);
    const auto X2 = selectColumns(X, rowLength, view1);
    fitImpl(X1, static_cast<int>(view0.size()), X2, static_cast<int>(view1.size()), y, trace);
    separateViews_ = false;
    columns_ = {view0, view1};
}

void CoTraining::fitWithViews(const std::vector<double>& X1, int rowLength1,
                              const std::vector<double>& X2, int rowLength2,
                              const std::vector<int>& y,
                              TraceLog* trace) {
    fitImpl(X1, rowLength1, X2, rowLength2, y, trace);
    separateViews_ = true;
    columns_ = {allColumns(rowLength1), allColumns(rowLength2)};
}

void CoTraining::fitImpl(const std::vector<double>& X1, int rowLength1,
                         const std::vector<double>& X2, int rowLength2,
                         const std::vector<int>& y,
                         TraceLog* trace) {
    if (rowLength1 <= 0 || rowLength2 <= 0 ||
        X1.size() != y.size() * static_cast<size_t>(rowLength1) ||
        X2.size() != y.size() * static_cast<size_t>(rowLength2)) {
        throw std::invalid_argument("CoTraining: view sizes do not match y");
    }

    std::vector<int> L, U;
    for (size_t i = 0; i < y.size(); ++i) {
        (y[i] == kUnlabeled ? U : L).push_back(static_cast<int>(i));
    }
    if (U.empty()) throw std::invalid_argument("CoTraining: y contains no unlabeled samples");
    if (L.empty()) throw std::invalid_argument("CoTraining: y contains no labeled samples");

    std::vector<int> labeledY;
    for (int i : L) labeledY.push_back(y[i]);
    const auto cls = uniqueClasses(labeledY);
    if (cls.size() > 2) {
        throw std::invalid_argument("CoTraining does not support multiclass");
    }
    if (cls.size() < 2) {
        throw std::invalid_argument("CoTraining needs both classes among the labeled samples");
    }

    h_.clear();
    addedIds_.clear();
    addedLabels_.clear();
    classes_ = cls;

    // 编码：classes_[0] -> 0（负类），classes_[1] -> 1（正类）
    std::vector<int> yEnc(y.size(), kUnlabeled);
    int numPos = 0, numNeg = 0;
    for (int i : L) {
        yEnc[i] = (y[i] == classes_[1]) ? 1 : 0;
        (yEnc[i] == 1 ? numPos : numNeg) += 1;
    }

    positives_ = cfg_.positives;
    negatives_ = cfg_.negatives;
    if (positives_ == -1) {
        const double ratio = static_cast<double>(numNeg) / numPos;
        if (ratio > 1) {
            positives_ = 1;
            negatives_ = static_cast<int>(std::lround(ratio));
        } else {
            negatives_ = 1;
            positives_ = static_cast<int>(std::lround(1.0 / ratio));
        }
    }

    std::mt19937 gen(cfg_.seed);
    std::shuffle(U.begin(), U.end(), gen);

    // U_ 取 U 的末尾
    const size_t take = std::min(U.size(), static_cast<size_t>(cfg_.poolsize));
    std::vector<int> pool(U.end() - take, U.end());
    U.resize(U.size() - take);

    std::vector<std::unique_ptr<IClassifier>> learners;
    learners.push_back(base_->clone());
    learners.push_back(second_ ? second_->clone() : base_->clone());
    LearnerPool hs(std::move(learners));

    auto fitBoth = [&]() {
        std::vector<int> yL(L.size());
        for (size_t i = 0; i < L.size(); ++i) yL[i] = yEnc[L[i]];
        const auto XL1 = selectRows(X1, rowLength1, L);
        const auto XL2 = selectRows(X2, rowLength2, L);
        hs.fitAll({FitJob{&XL1, rowLength1, &yL}, FitJob{&XL2, rowLength2, &yL}});
    };

    int it = 0;
    while (it != cfg_.maxIterations && !U.empty()) {
        ++it;
        fitBoth();

        const auto XU1 = selectRows(X1, rowLength1, pool);
        const auto XU2 = selectRows(X2, rowLength2, pool);
        const auto p1 = alignProba(hs[0].predictProba(XU1, rowLength1), hs[0].classes(), kBinary);
        const auto p2 = alignProba(hs[1].predictProba(XU2, rowLength2), hs[1].classes(), kBinary);

        // 位置 -> 伪标签；同一样本同时被选为正负时负类覆盖
        std::map<int, int> chosen;
        size_t numP = 0, numN = 0;
        for (const auto* P : {&p1, &p2}) {
            for (int pos : topConfident(*P, 1, positives_)) { chosen[pos] = 1; ++numP; }
        }
        for (const auto* P : {&p1, &p2}) {
            for (int pos : topConfident(*P, 0, negatives_)) { chosen[pos] = 0; ++numN; }
        }

        std::vector<char> taken(pool.size(), 0);
        for (const auto& kv : chosen) {
            const int id = pool[kv.first];
            L.push_back(id);
            yEnc[id] = kv.second;
            addedIds_.push_back(id);
            addedLabels_.push_back(classes_[kv.second]);
            taken[kv.first] = 1;
        }
        std::vector<int> nextPool;
        for (size_t i = 0; i < pool.size(); ++i) {
            if (!taken[i]) nextPool.push_back(pool[i]);
        }
        pool.swap(nextPool);

        // 从 U 末尾补充同样数量
        for (size_t added = 0; added < chosen.size() && !U.empty(); ++added) {
            pool.push_back(U.back());
            U.pop_back();
        }

        record(trace, it, "iteration", "pseudo-labels added",
               {{"positives", static_cast<double>(numP)},
                {"negatives", static_cast<double>(numN)},
                {"accepted", static_cast<double>(chosen.size())},
                {"labeled", static_cast<double>(L.size())},
                {"unlabeled", static_cast<double>(U.size() + pool.size())}});
        if (cfg_.verbose) {
            std::cout << "CoTraining iteration " << it << ": +" << numP << " positives, +"
                      << numN << " negatives | labeled " << L.size() << std::endl;
        }
    }

    fitBoth();
    h_ = hs.release();
}

std::vector<double> CoTraining::averageProba(const std::vector<double>& V1, int r1,
                                             const std::vector<double>& V2, int r2) const {
    const auto p1 = alignProba(h_[0]->predictProba(V1, r1), h_[0]->classes(), kBinary);
    const auto p2 = alignProba(h_[1]->predictProba(V2, r2), h_[1]->classes(), kBinary);
    if (p1.size() != p2.size()) {
        throw std::invalid_argument("CoTraining: views have different row counts");
    }
    std::vector<double> proba(p1.size());
    for (size_t i = 0; i < proba.size(); ++i) proba[i] = 0.5 * (p1[i] + p2[i]);
    return proba;
}

std::vector<double> CoTraining::predictProba(const std::vector<double>& X,
                                             int rowLength) const {
    checkFitted();
    if (separateViews_) {
        throw std::invalid_argument("CoTraining was fitted with two views; pass both");
    }
    const auto V1 = selectColumns(X, rowLength, columns_[0]);
    const auto V2 = selectColumns(X, rowLength, columns_[1]);
    return averageProba(V1, static_cast<int>(columns_[0].size()),
                        V2, static_cast<int>(columns_[1].size()));
}

std::vector<double> CoTraining::predictProba(const std::vector<double>& X1, int rowLength1,
                                             const std::vector<double>& X2, int rowLength2) const {
    checkFitted();
    if (!separateViews_) {
        return predictProba(X1, rowLength1);
    }
    return averageProba(X1, rowLength1, X2, rowLength2);
}

std::vector<int> CoTraining::predict(const std::vector<double>& X1, int rowLength1,
                                     const std::vector<double>& X2, int rowLength2) const {
    const auto proba = predictProba(X1, rowLength1, X2, rowLength2);
    std::vector<int> out(proba.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = proba[i * 2 + 1] > proba[i * 2] ? classes_[1] : classes_[0];
    }
    return out;
}
