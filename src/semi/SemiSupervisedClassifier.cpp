#include "semi/SemiSupervisedClassifier.hpp"
#include "semi/SSLUtils.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>

std::vector<int> uniqueClasses(const std::vector<int>& y) {
    std::vector<int> cls(y);
    std::sort(cls.begin(), cls.end());
    cls.erase(std::unique(cls.begin(), cls.end()), cls.end());
    return cls;
}

std::vector<int> allColumns(int rowLength) {
    std::vector<int> cols(rowLength);
    std::iota(cols.begin(), cols.end(), 0);
    return cols;
}

std::vector<int> SemiSupervisedClassifier::predict(const std::vector<double>& X,
                                                   int rowLength) const {
    checkFitted();
    const auto proba = predictProba(X, rowLength);
    const auto& cls = classes();
    std::vector<double> conf;
    std::vector<int> arg;
    sslutils::rowMax(proba, cls.size(), conf, arg);

    std::vector<int> out(arg.size());
    for (size_t i = 0; i < arg.size(); ++i) out[i] = cls[arg[i]];
    return out;
}

double SemiSupervisedClassifier::score(const std::vector<double>& X,
                                       int rowLength,
                                       const std::vector<int>& y) const {
    return sslutils::accuracyScore(y, predict(X, rowLength));
}

void SemiSupervisedClassifier::checkFitted() const {
    if (!isFitted()) {
        throw NotFittedError(name() + " is not fitted yet");
    }
}

void SemiSupervisedClassifier::record(TraceLog* trace, int iteration,
                                      const std::string& kind,
                                      const std::string& message,
                                      std::vector<std::pair<std::string, double>> values) const {
    if (trace) {
        trace->record(name(), iteration, kind, message, std::move(values));
    }
}

void SemiSupervisedClassifier::warn(TraceLog* trace, int iteration,
                                    const std::string& message) const {
    std::cerr << "Warning: " << name() << ": " << message << std::endl;
    record(trace, iteration, "warning", message);
}

std::vector<double> CoTrainingBase::predictProba(const std::vector<double>& X,
                                                 int rowLength) const {
    checkFitted();
    const size_t k = classes_.size();
    const size_t n = rowLength > 0 ? X.size() / rowLength : 0;
    std::vector<double> proba(n * k, 0.0);

    for (size_t i = 0; i < h_.size(); ++i) {
        const auto view = selectColumns(X, rowLength, columns_[i]);
        const auto p = alignProba(h_[i]->predictProba(view, static_cast<int>(columns_[i].size())),
                                  h_[i]->classes(), classes_);
        for (size_t j = 0; j < proba.size(); ++j) proba[j] += p[j];
    }

    const double inv = 1.0 / static_cast<double>(h_.size());
    for (double& v : proba) v *= inv;
    return proba;
}
