// =============================================================================
// src/classifier/BaggingClassifier.cpp - OpenMP 并行 bootstrap 树
// =============================================================================
#include "classifier/BaggingClassifier.hpp"
#include "pipeline/DataSplit.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

BaggingClassifier::BaggingClassifier(const BaggingConfig& cfg)
    : cfg_(cfg) {
    if (cfg_.numTrees <= 0) {
        throw std::invalid_argument("BaggingClassifier: numTrees must be positive");
    }
    if (cfg_.sampleRatio <= 0.0) {
        throw std::invalid_argument("BaggingClassifier: sampleRatio must be positive");
    }
}

std::unique_ptr<IClassifier> BaggingClassifier::clone() const {
    return std::make_unique<BaggingClassifier>(cfg_);
}

// **有放回采样，同时记录袋外样本**
void BaggingClassifier::bootstrapSample(int dataSize,
                                        std::vector<int>& sampleIndices,
                                        std::vector<int>& oobIndices,
                                        std::mt19937& localGen) const {
    const int sampleSize = std::max(1, static_cast<int>(dataSize * cfg_.sampleRatio));

    sampleIndices.clear();
    sampleIndices.reserve(sampleSize);
    std::vector<bool> sampledBits(dataSize, false);

    std::uniform_int_distribution<int> dist(0, dataSize - 1);
    for (int i = 0; i < sampleSize; ++i) {
        const int idx = dist(localGen);
        sampleIndices.push_back(idx);
        sampledBits[idx] = true;
    }

    oobIndices.clear();
    for (int i = 0; i < dataSize; ++i) {
        if (!sampledBits[i]) {
            oobIndices.push_back(i);
        }
    }
}

void BaggingClassifier::fit(const std::vector<double>& data,
                            int rowLength,
                            const std::vector<int>& labels) {
    const int dataSize = static_cast<int>(labels.size());

    // **数据验证**
    if (dataSize == 0 || rowLength <= 0) {
        throw std::invalid_argument("BaggingClassifier: empty training data");
    }
    if (data.size() != static_cast<size_t>(dataSize) * rowLength) {
        throw std::invalid_argument("BaggingClassifier: data size mismatch");
    }

    classes_ = labels;
    std::sort(classes_.begin(), classes_.end());
    classes_.erase(std::unique(classes_.begin(), classes_.end()), classes_.end());

    const int numTrees = cfg_.numTrees;
    if (cfg_.verbose) {
        std::cout << "Training " << numTrees << " trees on " << dataSize
                  << " samples, " << rowLength << " features" << std::endl;
    }

    // 每棵树的种子串行生成，结果与线程数无关
    std::mt19937 seedGen(cfg_.seed);
    std::vector<uint32_t> treeSeeds(numTrees);
    for (int t = 0; t < numTrees; ++t) {
        treeSeeds[t] = seedGen();
    }

    std::vector<std::unique_ptr<DecisionTreeClassifier>> trees(numTrees);
    std::vector<std::vector<int>> oob(numTrees);
    std::vector<std::exception_ptr> errors(numTrees);
    std::atomic<int> completedTrees(0);

    #pragma omp parallel if(numTrees > 1)
    {
        // **线程局部数据缓冲区**
        std::vector<int> sampleIndices, oobIndices;

        #pragma omp for schedule(dynamic, 1)
        for (int t = 0; t < numTrees; ++t) {
            try {
                std::mt19937 localGen(treeSeeds[t]);
                bootstrapSample(dataSize, sampleIndices, oobIndices, localGen);

                std::vector<double> subData = selectRows(data, rowLength, sampleIndices);
                std::vector<int> subLabels(sampleIndices.size());
                for (size_t i = 0; i < sampleIndices.size(); ++i) {
                    subLabels[i] = labels[sampleIndices[i]];
                }

                DecisionTreeConfig treeCfg = cfg_.tree;
                treeCfg.seed = treeSeeds[t];
                treeCfg.verbose = false;
                auto tree = std::make_unique<DecisionTreeClassifier>(treeCfg);
                tree->fit(subData, rowLength, subLabels);

                trees[t] = std::move(tree);
                oob[t] = oobIndices;
            } catch (...) {
                errors[t] = std::current_exception();
            }

            const int completed = ++completedTrees;
            if (cfg_.verbose && completed % std::max(1, numTrees / 10) == 0) {
                #pragma omp critical(progress_output)
                {
                    std::cout << "Completed " << completed << "/" << numTrees
                              << " trees (" << std::fixed << std::setprecision(1)
                              << 100.0 * completed / numTrees << "%)" << std::endl;
                }
            }
        }
    }

    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    trees_ = std::move(trees);
    oobIndices_ = std::move(oob);
}

std::vector<double> BaggingClassifier::predictProba(const std::vector<double>& X,
                                                    int rowLength) const {
    checkFitted();
    const size_t k = classes_.size();
    const size_t n = rowLength > 0 ? X.size() / rowLength : 0;
    std::vector<double> proba(n * k, 0.0);

    // 各树类别可能少于集成类别，先对齐再累加
    for (const auto& tree : trees_) {
        const auto p = alignProba(tree->predictProba(X, rowLength),
                                  tree->classes(), classes_);
        for (size_t i = 0; i < proba.size(); ++i) {
            proba[i] += p[i];
        }
    }

    const double inv = 1.0 / static_cast<double>(trees_.size());
    for (double& v : proba) v *= inv;
    return proba;
}

std::vector<double> BaggingClassifier::getFeatureImportance(int numFeatures) const {
    std::vector<double> importance(numFeatures, 0.0);
    for (const auto& tree : trees_) {
        const auto imp = tree->getFeatureImportance(numFeatures);
        for (int f = 0; f < numFeatures; ++f) {
            importance[f] += imp[f];
        }
    }

    // **归一化**
    const double total = std::accumulate(importance.begin(), importance.end(), 0.0);
    if (total > 0) {
        for (double& v : importance) v /= total;
    }
    return importance;
}

double BaggingClassifier::getOOBError(const std::vector<double>& data,
                                      int rowLength,
                                      const std::vector<int>& labels) const {
    if (trees_.empty() || oobIndices_.empty()) return 0.0;

    const int dataSize = static_cast<int>(labels.size());
    const size_t k = classes_.size();
    std::vector<double> votes(static_cast<size_t>(dataSize) * k, 0.0);
    std::vector<int> oobCounts(dataSize, 0);

    for (size_t t = 0; t < trees_.size(); ++t) {
        const auto& oobSet = oobIndices_[t];
        if (oobSet.empty()) continue;

        const auto sub = selectRows(data, rowLength, oobSet);
        const auto p = alignProba(trees_[t]->predictProba(sub, rowLength),
                                  trees_[t]->classes(), classes_);
        for (size_t j = 0; j < oobSet.size(); ++j) {
            const int idx = oobSet[j];
            for (size_t c = 0; c < k; ++c) {
                votes[idx * k + c] += p[j * k + c];
            }
            ++oobCounts[idx];
        }
    }

    int wrong = 0, validCount = 0;
    for (int i = 0; i < dataSize; ++i) {
        if (oobCounts[i] == 0) continue;
        const double* row = &votes[i * k];
        const size_t best = std::max_element(row, row + k) - row;
        if (classes_[best] != labels[i]) ++wrong;
        ++validCount;
    }
    return validCount > 0 ? static_cast<double>(wrong) / validCount : 0.0;
}
