#include "semi/TriTraining.hpp"
#include "semi/LearnerPool.hpp"
#include "semi/SSLUtils.hpp"
#include "classifier/DecisionTreeClassifier.hpp"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>
#include <set>
#include <stdexcept>

TriTraining::TriTraining(std::unique_ptr<IClassifier> base, const TriTrainingConfig& cfg)
    : prototype_(std::move(base)), cfg_(cfg) {
    if (!prototype_) prototype_ = std::make_unique<DecisionTreeClassifier>();
    if (cfg_.nSamples == 0 || cfg_.nSamples < -1) {
        throw std::invalid_argument("TriTraining: nSamples must be positive or -1");
    }
}

double TriTraining::measureError(const std::vector<double>& X,
                                 int rowLength,
                                 const std::vector<int>& y,
                                 const IClassifier& h1,
                                 const IClassifier& h2) {
    const auto y1 = h1.predict(X, rowLength);
    const auto y2 = h2.predict(X, rowLength);
    int error = 0, coincidence = 0;
    for (size_t i = 0; i < y.size(); ++i) {
        if (y1[i] != y2[i]) continue;
        ++coincidence;
        if (y2[i] != y[i]) ++error;
    }
    return sslutils::safeDivision(error, coincidence, DBL_EPSILON);
}

void TriTraining::fit(const std::vector<double>& X,
                      int rowLength,
                      const std::vector<int>& y,
                      TraceLog* trace) {
    LabeledSplit split = splitLabeled(X, rowLength, y);
    h_.clear();
    columns_.clear();
    classes_ = uniqueClasses(split.y_label);
    rounds_ = 0;

    const size_t nL = split.numLabeled();
    const size_t nU = split.numUnlabeled();
    const size_t nSamples = cfg_.nSamples == -1 ? nL : static_cast<size_t>(cfg_.nSamples);
    std::mt19937 gen(cfg_.seed);

    // **每类第一个出现的样本作为代表，保证每个自助样本覆盖全部类别**
    std::vector<int> representatives;
    {
        std::set<int> seen;
        for (size_t i = 0; i < nL && seen.size() < classes_.size(); ++i) {
            if (seen.insert(split.y_label[i]).second) {
                representatives.push_back(static_cast<int>(i));
            }
        }
    }

    LearnerPool pool(*prototype_, kNumLearners);
    pool.reseed(gen);

    std::vector<std::vector<double>> XS(kNumLearners);
    std::vector<std::vector<int>>    yS(kNumLearners);
    std::vector<FitJob> jobs(kNumLearners);
    std::uniform_int_distribution<size_t> draw(0, nL - 1);
    for (int i = 0; i < kNumLearners; ++i) {
        std::vector<int> rows(representatives);
        for (size_t s = 0; s < nSamples; ++s) rows.push_back(static_cast<int>(draw(gen)));
        XS[i] = selectRows(split.X_label, rowLength, rows);
        for (int r : rows) yS[i].push_back(split.y_label[r]);
        jobs[i] = FitJob{&XS[i], rowLength, &yS[i]};
    }
    pool.fitAll(jobs);

    std::vector<double> ePrev(kNumLearners, 0.5);
    std::vector<double> lPrev(kNumLearners, 0.0);

    bool changed = true;
    while (changed) {
        changed = false;
        ++rounds_;

        // 本轮所有决定都基于轮初的假设
        std::vector<double> e(kNumLearners, 0.0);
        std::vector<std::vector<int>> candIds(kNumLearners);
        std::vector<std::vector<int>> candLabels(kNumLearners);
        std::vector<char> update(kNumLearners, 0);

        for (int i = 0; i < kNumLearners; ++i) {
            // 另外两个学习器，保持槽位顺序
            const IClassifier& a = i == 0 ? pool[1] : pool[0];
            const IClassifier& b = i == 2 ? pool[1] : pool[2];
            e[i] = measureError(split.X_label, rowLength, split.y_label, a, b);
            if (ePrev[i] <= e[i]) continue;

            const auto pa = nU ? a.predict(split.X_unlabel, rowLength) : std::vector<int>();
            const auto pb = nU ? b.predict(split.X_unlabel, rowLength) : std::vector<int>();
            for (size_t u = 0; u < nU; ++u) {
                if (pa[u] == pb[u]) {
                    candIds[i].push_back(static_cast<int>(u));
                    candLabels[i].push_back(pa[u]);
                }
            }

            const double ratio = sslutils::safeDivision(e[i], ePrev[i] - e[i], DBL_EPSILON);
            if (lPrev[i] == 0.0) {
                lPrev[i] = std::floor(ratio + 1.0);
            }
            const double nCand = static_cast<double>(candIds[i].size());
            if (lPrev[i] >= nCand) continue;

            if (e[i] * nCand < ePrev[i] * lPrev[i]) {
                update[i] = 1;
            } else if (lPrev[i] > ratio) {
                // 无放回子采样到 ceil(e'·l'/e − 1) 个
                const double target = std::ceil(
                    sslutils::safeDivision(ePrev[i] * lPrev[i], e[i], DBL_EPSILON) - 1.0);
                const size_t keep = static_cast<size_t>(
                    std::max(0.0, std::min(target, nCand)));
                std::vector<int> order(candIds[i].size());
                std::iota(order.begin(), order.end(), 0);
                for (size_t s = 0; s < keep; ++s) {
                    std::uniform_int_distribution<size_t> pick(s, order.size() - 1);
                    std::swap(order[s], order[pick(gen)]);
                }
                order.resize(keep);
                std::vector<int> ids, labels;
                for (int o : order) {
                    ids.push_back(candIds[i][o]);
                    labels.push_back(candLabels[i][o]);
                }
                candIds[i].swap(ids);
                candLabels[i].swap(labels);
                update[i] = 1;
            }
        }

        // **被接受的学习器在 L ∪ 候选上并行重训**
        std::vector<std::vector<double>> XT(kNumLearners);
        std::vector<std::vector<int>>    yT(kNumLearners);
        std::vector<FitJob> refit(kNumLearners);
        for (int i = 0; i < kNumLearners; ++i) {
            if (!update[i]) continue;
            XT[i] = split.X_label;
            yT[i] = split.y_label;
            for (size_t c = 0; c < candIds[i].size(); ++c) {
                appendRow(XT[i], split.X_unlabel, rowLength, candIds[i][c]);
                yT[i].push_back(candLabels[i][c]);
            }
            refit[i] = FitJob{&XT[i], rowLength, &yT[i]};
        }
        pool.fitAll(refit);

        int updated = 0;
        for (int i = 0; i < kNumLearners; ++i) {
            if (!update[i]) continue;
            ePrev[i] = e[i];
            lPrev[i] = static_cast<double>(candIds[i].size());
            changed = true;
            ++updated;
            record(trace, rounds_, "iteration", "learner " + std::to_string(i) + " updated",
                   {{"learner", static_cast<double>(i)},
                    {"error", e[i]},
                    {"accepted", static_cast<double>(candIds[i].size())},
                    {"labeled", static_cast<double>(nL + candIds[i].size())}});
        }
        if (cfg_.verbose) {
            std::cout << "TriTraining round " << rounds_ << ": " << updated
                      << " learner(s) updated" << std::endl;
        }
    }
    record(trace, rounds_, "final", "no learner changed",
           {{"rounds", static_cast<double>(rounds_)}});

    h_ = pool.release();
    columns_.assign(kNumLearners, allColumns(rowLength));
}
