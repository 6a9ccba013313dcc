#include "semi/CoForest.hpp"
#include "semi/LearnerPool.hpp"
#include "semi/SSLUtils.hpp"
#include <algorithm>
#include <cfloat>
#include <iostream>
#include <numeric>
#include <random>
#include <stdexcept>

DecisionTreeConfig CoForest::defaultTreeConfig() {
    DecisionTreeConfig tree;
    tree.splitMethod = "random";
    return tree;
}

CoForest::CoForest(const CoForestConfig& cfg, DecisionTreeConfig tree)
    : cfg_(cfg), tree_(std::move(tree)) {
    if (cfg_.nEstimators <= 0) {
        throw std::invalid_argument("CoForest: nEstimators must be positive");
    }
    if (cfg_.threshold < 0.0 || cfg_.threshold >= 1.0) {
        throw std::invalid_argument("CoForest: threshold must lie in [0, 1)");
    }
    if (cfg_.maxIterations == 0 || cfg_.maxIterations < -1) {
        throw std::invalid_argument("CoForest: maxIterations must be positive or -1");
    }
}

double CoForest::estimateError(const IClassifier& h,
                               const std::vector<double>& X,
                               int rowLength,
                               const std::vector<int>& y) {
    const auto& cls = h.classes();
    const auto proba = h.predictProba(X, rowLength);
    double err = 0.0;
    for (size_t j = 0; j < y.size(); ++j) {
        const auto pos = std::lower_bound(cls.begin(), cls.end(), y[j]) - cls.begin();
        err += 1.0 - proba[j * cls.size() + pos];
    }
    return err == 0.0 ? DBL_EPSILON : err;
}

void CoForest::fit(const std::vector<double>& X,
                   int rowLength,
                   const std::vector<int>& y,
                   TraceLog* trace) {
    LabeledSplit split = splitLabeled(X, rowLength, y);
    h_.clear();
    columns_.clear();
    classes_ = uniqueClasses(split.y_label);
    rounds_ = 0;

    const size_t nU = split.numUnlabeled();
    const size_t N  = static_cast<size_t>(cfg_.nEstimators);
    std::mt19937 gen(cfg_.seed);

    LearnerPool pool(DecisionTreeClassifier(tree_), cfg_.nEstimators);
    pool.reseed(gen);
    pool.fitAll(split.X_label, rowLength, split.y_label,
                std::vector<std::vector<int>>(N, allColumns(rowLength)));

    std::vector<double> errors(N, 0.5);
    std::vector<double> weights(N, 0.0);
    for (size_t i = 0; i < N; ++i) {
        std::vector<double> conf;
        std::vector<int> arg;
        sslutils::rowMax(pool[i].predictProba(split.X_label, rowLength),
                         pool[i].classes().size(), conf, arg);
        weights[i] = std::accumulate(conf.begin(), conf.end(), 0.0);
    }

    bool changing = true;
    while (changing && (cfg_.maxIterations == -1 || rounds_ < cfg_.maxIterations)) {
        changing = false;
        ++rounds_;

        // 决定串行做出（随机流只在这里推进），重训并行
        std::vector<std::vector<double>> XT(N);
        std::vector<std::vector<int>>    yT(N);
        std::vector<FitJob> jobs(N);
        int updated = 0;

        for (size_t i = 0; i < N; ++i) {
            const IClassifier& hi = pool[i];
            const double ei = errors[i];
            const double wi = weights[i];
            const double eiT = estimateError(hi, split.X_label, rowLength, split.y_label);
            double wiT = wi;

            if (eiT < ei) {
                std::vector<int> perm(nU);
                std::iota(perm.begin(), perm.end(), 0);
                std::shuffle(perm.begin(), perm.end(), gen);
                const double want = ei * wi / eiT;
                const size_t take = want >= static_cast<double>(nU)
                    ? nU : static_cast<size_t>(want);
                perm.resize(take);

                const auto Ui = selectRows(split.X_unlabel, rowLength, perm);
                std::vector<double> conf;
                std::vector<int> arg;
                sslutils::rowMax(hi.predictProba(Ui, rowLength), hi.classes().size(), conf, arg);

                XT[i] = split.X_label;
                yT[i] = split.y_label;
                wiT = 0.0;
                for (size_t r = 0; r < perm.size(); ++r) {
                    if (conf[r] <= cfg_.threshold) continue;
                    wiT += conf[r];
                    appendRow(XT[i], Ui, rowLength, static_cast<int>(r));
                    yT[i].push_back(hi.classes()[arg[r]]);
                }

                if (eiT * wiT < ei * wi) {
                    jobs[i] = FitJob{&XT[i], rowLength, &yT[i]};
                    changing = true;
                    ++updated;
                    record(trace, rounds_, "iteration", "tree " + std::to_string(i) + " refit",
                           {{"learner", static_cast<double>(i)},
                            {"error", eiT},
                            {"accepted", static_cast<double>(yT[i].size() - split.numLabeled())},
                            {"labeled", static_cast<double>(yT[i].size())}});
                }
            }
            errors[i]  = eiT;
            weights[i] = wiT;
        }
        pool.fitAll(jobs);

        if (cfg_.verbose) {
            std::cout << "CoForest round " << rounds_ << ": " << updated
                      << " tree(s) refit" << std::endl;
        }
    }
    record(trace, rounds_, "final", changing ? "iteration cap reached" : "no tree changed",
           {{"rounds", static_cast<double>(rounds_)}});

    h_ = pool.release();
    columns_.assign(N, allColumns(rowLength));
}
