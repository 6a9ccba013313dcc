#include "semi/LearnerPool.hpp"
#include "pipeline/DataSplit.hpp"
#include <exception>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

LearnerPool::LearnerPool(const IClassifier& prototype, int n) {
    if (n <= 0) {
        throw std::invalid_argument("LearnerPool: size must be positive");
    }
    learners_.reserve(n);
    for (int i = 0; i < n; ++i) {
        learners_.push_back(prototype.clone());
    }
}

LearnerPool::LearnerPool(std::vector<std::unique_ptr<IClassifier>> learners)
    : learners_(std::move(learners)) {
    for (const auto& l : learners_) {
        if (!l) throw std::invalid_argument("LearnerPool: null classifier");
    }
}

int LearnerPool::reseed(std::mt19937& gen) {
    int withoutSeed = 0;
    for (auto& l : learners_) {
        const uint32_t s = gen();
        if (l->hasRandomSeed()) {
            l->setRandomSeed(s);
        } else {
            ++withoutSeed;
        }
    }
    return withoutSeed;
}

void LearnerPool::fitAll(const std::vector<FitJob>& jobs) {
    if (jobs.size() != learners_.size()) {
        throw std::invalid_argument("LearnerPool::fitAll: one job per slot required");
    }
    const int n = static_cast<int>(learners_.size());
    std::vector<std::exception_ptr> errors(n);

    #pragma omp parallel for schedule(dynamic, 1) if(n > 1)
    for (int i = 0; i < n; ++i) {
        const FitJob& job = jobs[i];
        if (!job.X) continue;
        try {
            learners_[i]->fit(*job.X, job.rowLength, *job.y);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

void LearnerPool::fitAll(const std::vector<double>& X,
                         int rowLength,
                         const std::vector<int>& y,
                         const std::vector<std::vector<int>>& columns) {
    if (columns.size() != learners_.size()) {
        throw std::invalid_argument("LearnerPool::fitAll: one column set per slot required");
    }
    // 投影在调用线程中准备好，worker 只读
    std::vector<std::vector<double>> views(columns.size());
    std::vector<FitJob> jobs(columns.size());
    for (size_t i = 0; i < columns.size(); ++i) {
        views[i] = selectColumns(X, rowLength, columns[i]);
        jobs[i] = FitJob{&views[i], static_cast<int>(columns[i].size()), &y};
    }
    fitAll(jobs);
}

std::vector<std::unique_ptr<IClassifier>> LearnerPool::release() {
    return std::move(learners_);
}
