#include "semi/DemocraticCoLearning.hpp"
#include "semi/LearnerPool.hpp"
#include "semi/SSLUtils.hpp"
#include "classifier/DecisionTreeClassifier.hpp"
#include "classifier/GaussianNBClassifier.hpp"
#include "classifier/KNNClassifier.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <random>
#include <stdexcept>

std::vector<std::unique_ptr<IClassifier>> DemocraticCoLearning::defaultEstimators() {
    std::vector<std::unique_ptr<IClassifier>> est;
    est.push_back(std::make_unique<DecisionTreeClassifier>());
    est.push_back(std::make_unique<GaussianNBClassifier>());
    est.push_back(std::make_unique<KNNClassifier>(3));
    return est;
}

std::vector<std::unique_ptr<IClassifier>>
DemocraticCoLearning::makeClones(const IClassifier& prototype, int n, uint32_t seed) {
    if (n <= 0) {
        throw std::invalid_argument("DemocraticCoLearning: number of clones must be positive");
    }
    if (!prototype.hasRandomSeed()) {
        std::cerr << "Warning: DemocraticCoLearning: " << prototype.name()
                  << " has no random seed, the " << n << " clones will be identical"
                  << std::endl;
    }
    std::mt19937 gen(seed);
    std::uniform_int_distribution<uint32_t> draw(0, 100000);
    std::vector<std::unique_ptr<IClassifier>> est;
    for (int i = 0; i < n; ++i) {
        auto c = prototype.clone();
        if (c->hasRandomSeed()) c->setRandomSeed(draw(gen));
        est.push_back(std::move(c));
    }
    return est;
}

DemocraticCoLearning::DemocraticCoLearning(std::vector<std::unique_ptr<IClassifier>> estimators,
                                           const DemocraticConfig& cfg)
    : prototypes_(std::move(estimators)), cfg_(cfg) {
    if (prototypes_.empty()) prototypes_ = defaultEstimators();
    for (const auto& p : prototypes_) {
        if (!p) throw std::invalid_argument("DemocraticCoLearning: null estimator");
    }
    if (cfg_.alpha <= 0.0 || cfg_.alpha >= 1.0) {
        throw std::invalid_argument("DemocraticCoLearning: alpha must lie in (0, 1)");
    }
    // 提前校验 method 名称
    sslutils::proportionConfint(1, 2, cfg_.alpha, cfg_.confidenceMethod);
}

namespace {

/** 加权 one-hot 投票，平局取第一个类别 */
std::vector<int> weightedVote(const std::vector<std::vector<int>>& predictions,
                              const std::vector<double>& weights,
                              const std::vector<int>& classes) {
    const size_t n = predictions.empty() ? 0 : predictions[0].size();
    std::vector<int> out(n);
    for (size_t u = 0; u < n; ++u) {
        std::vector<double> score(classes.size(), 0.0);
        for (size_t i = 0; i < predictions.size(); ++i) {
            const auto pos = std::lower_bound(classes.begin(), classes.end(),
                                              predictions[i][u]) - classes.begin();
            score[pos] += weights[i];
        }
        out[u] = classes[std::max_element(score.begin(), score.end()) - score.begin()];
    }
    return out;
}

/** 多数投票，平局取最小标签 */
std::vector<int> plurality(const std::vector<std::vector<int>>& predictions) {
    const size_t n = predictions.empty() ? 0 : predictions[0].size();
    std::vector<int> out(n);
    for (size_t u = 0; u < n; ++u) {
        std::map<int, int> votes;
        for (const auto& p : predictions) ++votes[p[u]];
        int best = votes.begin()->first, bestCount = 0;
        for (const auto& kv : votes) {
            if (kv.second > bestCount) { best = kv.first; bestCount = kv.second; }
        }
        out[u] = best;
    }
    return out;
}

} // namespace

void DemocraticCoLearning::fit(const std::vector<double>& X,
                               int rowLength,
                               const std::vector<int>& y,
                               TraceLog* trace) {
    LabeledSplit split = splitLabeled(X, rowLength, y);
    h_.clear();
    columns_.clear();
    confidences_.clear();
    fitted_ = false;
    classes_ = uniqueClasses(split.y_label);

    std::vector<std::unique_ptr<IClassifier>> clones;
    for (const auto& p : prototypes_) clones.push_back(p->clone());
    LearnerPool pool(std::move(clones));
    const size_t N = pool.size();
    const size_t nU = split.numUnlabeled();

    std::vector<std::vector<double>> L(N, split.X_label);
    std::vector<std::vector<int>>    Ly(N, split.y_label);
    std::vector<std::vector<char>>   added(N, std::vector<char>(nU, 0));
    std::vector<double> e(N, 0.0);

    rounds_ = 0;
    bool changed = true;
    while (changed) {
        changed = false;
        ++rounds_;

        std::vector<FitJob> jobs(N);
        for (size_t i = 0; i < N; ++i) jobs[i] = FitJob{&L[i], rowLength, &Ly[i]};
        pool.fitAll(jobs);

        std::vector<std::vector<int>> predictions(N);
        for (size_t i = 0; i < N; ++i) predictions[i] = pool[i].predict(split.X_unlabel, rowLength);
        const auto majority = plurality(predictions);

        std::vector<double> weights(N);
        for (size_t i = 0; i < N; ++i) {
            const auto ci = sslutils::confidenceInterval(split.X_label, rowLength, pool[i],
                                                         split.y_label, cfg_.confidenceMethod,
                                                         cfg_.alpha);
            weights[i] = (ci.first + ci.second) / 2.0;
        }
        const auto weighted = weightedVote(predictions, weights, classes_);

        std::vector<std::vector<int>> proposal(N);
        for (size_t i = 0; i < N; ++i) {
            for (size_t u = 0; u < nU; ++u) {
                if (added[i][u]) continue;
                bool take = weighted[u] == majority[u] && predictions[i][u] != weighted[u];
                if (!cfg_.expandOnlyMislabeled) {
                    bool unanimous = true;
                    for (size_t j = 1; j < N; ++j) {
                        if (predictions[j][u] != predictions[j - 1][u]) { unanimous = false; break; }
                    }
                    take = take || unanimous;
                }
                if (take) proposal[i].push_back(static_cast<int>(u));
            }
        }

        // **e' 因子：各学习器在自身 L[i] 上置信区间下界的平均**
        double lowerSum = 0.0;
        for (size_t i = 0; i < N; ++i) {
            lowerSum += sslutils::confidenceInterval(L[i], rowLength, pool[i], Ly[i],
                                                     cfg_.confidenceMethod, cfg_.alpha).first;
        }
        const double eFactor = 1.0 - lowerSum / static_cast<double>(N);

        for (size_t i = 0; i < N; ++i) {
            if (proposal[i].empty()) continue;
            const double li = static_cast<double>(Ly[i].size());
            const double ni = static_cast<double>(proposal[i].size());
            const double qi = li * std::pow(1.0 - 2.0 * (e[i] / li), 2);
            const double eNew = eFactor * ni;
            const double qNew = (li + ni) * std::pow(1.0 - 2.0 * (e[i] + eNew) / (li + ni), 2);

            record(trace, rounds_, "iteration", "learner " + std::to_string(i) + " gate",
                   {{"learner", static_cast<double>(i)}, {"q", qi}, {"q_new", qNew},
                    {"candidates", ni}, {"accepted", qNew > qi ? ni : 0.0}});
            if (qNew <= qi) continue;

            for (int u : proposal[i]) {
                appendRow(L[i], split.X_unlabel, rowLength, u);
                Ly[i].push_back(weighted[u]);
                added[i][u] = 1;
            }
            e[i] += eNew;
            changed = true;
        }

        if (cfg_.verbose) {
            std::cout << "DemocraticCoLearning round " << rounds_ << ":";
            for (size_t i = 0; i < N; ++i) std::cout << " |L" << i << "|=" << Ly[i].size();
            std::cout << std::endl;
        }
    }

    // 最终权重：原始标注集上准确率区间的中点，只保留 > 0.5 的学习器
    std::vector<std::unique_ptr<IClassifier>> learners = pool.release();
    for (auto& h : learners) {
        const auto ci = sslutils::confidenceInterval(split.X_label, rowLength, *h, split.y_label,
                                                     cfg_.confidenceMethod, cfg_.alpha);
        const double w = (ci.first + ci.second) / 2.0;
        if (w > 0.5) {
            confidences_.push_back(w);
            h_.push_back(std::move(h));
        }
    }
    if (h_.empty()) {
        warn(trace, rounds_, "no learner has confidence above 0.5, predictions are uniform");
    }
    columns_.assign(h_.size(), allColumns(rowLength));
    record(trace, rounds_, "final", "co-learning finished",
           {{"rounds", static_cast<double>(rounds_)},
            {"kept", static_cast<double>(h_.size())}});
    fitted_ = true;
}

std::vector<double> DemocraticCoLearning::predictProba(const std::vector<double>& X,
                                                       int rowLength) const {
    checkFitted();
    const size_t k = classes_.size();
    const size_t n = rowLength > 0 ? X.size() / rowLength : 0;

    std::vector<std::vector<int>> predictions;
    for (const auto& h : h_) predictions.push_back(h->predict(X, rowLength));

    std::vector<double> proba(n * k);
    for (size_t r = 0; r < n; ++r) {
        std::vector<double> sum(k, 0.0);
        std::vector<int> size(k, 0);
        for (size_t i = 0; i < h_.size(); ++i) {
            const auto pos = std::lower_bound(classes_.begin(), classes_.end(),
                                              predictions[i][r]) - classes_.begin();
            sum[pos] += confidences_[i];
            ++size[pos];
        }
        std::vector<double> cg(k);
        for (size_t c = 0; c < k; ++c) {
            cg[c] = size[c] == 0 ? 0.5
                  : ((size[c] + 0.5) / (size[c] + 1.0)) * (sum[c] / size[c]);
        }
        const auto p = sslutils::softmax(cg);
        std::copy(p.begin(), p.end(), proba.begin() + r * k);
    }
    return proba;
}
