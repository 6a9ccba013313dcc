#include "app/SemiSupervisedApp.hpp"
#include "semi/EngineFactory.hpp"
#include "semi/SSLUtils.hpp"
#include "semi/TraceLog.hpp"
#include "functions/io/DataIO.hpp"
#include "pipeline/DataSplit.hpp"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <stdexcept>

void loadDataset(const std::string& path, bool secure,
                 std::vector<double>& X, std::vector<int>& y, int& rowLength) {
    DataIO io;
    const bool keel = path.size() >= 4 && path.compare(path.size() - 4, 4, ".dat") == 0;
    auto data = keel ? io.readKEEL(path, rowLength, secure)
                     : io.readCSV(path, rowLength, secure);
    X = std::move(data.first);
    y = std::move(data.second);
}

SemiSupervisedResult runSemiSupervisedExperiment(const std::vector<double>& X,
                                                 const std::vector<int>& y,
                                                 int rowLength,
                                                 const std::string& algorithm,
                                                 const std::string& baseEstimator,
                                                 double labelRate,
                                                 double testRatio,
                                                 uint32_t seed,
                                                 bool verbose,
                                                 TraceLog* trace) {
    // 1. 划分训练 / 测试
    DataParams dp;
    if (!splitDataset(X, y, rowLength, dp, testRatio, seed)) {
        throw std::runtime_error("Failed to split dataset");
    }

    // 2. 隐藏训练标签
    const auto yMasked = maskLabels(dp.y_train, labelRate, seed);

    SemiSupervisedResult result;
    std::vector<int> hidden;
    for (size_t i = 0; i < yMasked.size(); ++i) {
        if (yMasked[i] == kUnlabeled) {
            ++result.numUnlabeled;
            if (dp.y_train[i] != kUnlabeled) hidden.push_back(static_cast<int>(i));
        } else {
            ++result.numLabeled;
        }
    }

    // 3. 训练（测量时间）
    auto engine = createEngine(algorithm, baseEstimator, seed, verbose);
    auto trainStart = std::chrono::high_resolution_clock::now();
    engine->fit(dp.X_train, dp.rowLength, yMasked, trace);
    auto trainEnd = std::chrono::high_resolution_clock::now();
    result.trainTimeMs = std::chrono::duration<double, std::milli>(trainEnd - trainStart).count();

    // 4. 评估
    if (!hidden.empty()) {
        std::vector<int> yHidden;
        for (int i : hidden) yHidden.push_back(dp.y_train[i]);
        result.transductiveAccuracy =
            engine->score(selectRows(dp.X_train, dp.rowLength, hidden), dp.rowLength, yHidden);
    }

    std::vector<int> testRows, yTest;
    for (size_t i = 0; i < dp.y_test.size(); ++i) {
        if (dp.y_test[i] == kUnlabeled) continue;
        testRows.push_back(static_cast<int>(i));
        yTest.push_back(dp.y_test[i]);
    }
    if (!testRows.empty()) {
        result.testAccuracy =
            engine->score(selectRows(dp.X_test, dp.rowLength, testRows), dp.rowLength, yTest);
    }
    return result;
}

void runSemiSupervisedApp(const SemiSupervisedOptions& opts) {
    auto totalStart = std::chrono::high_resolution_clock::now();

    // 1. 读数据
    std::vector<double> X;
    std::vector<int> y;
    int rowLength = 0;
    loadDataset(opts.dataPath, opts.secure, X, y, rowLength);
    std::cout << "Dataset loaded: " << y.size() << " samples, "
              << rowLength << " features" << std::endl;

    // 2. 运行
    TraceLog trace(opts.trace);
    auto result = runSemiSupervisedExperiment(X, y, rowLength, opts.algorithm,
                                              opts.baseEstimator, opts.labelRate,
                                              opts.testRatio, opts.seed, opts.verbose,
                                              &trace);

    auto totalEnd = std::chrono::high_resolution_clock::now();
    auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(totalEnd - totalStart);

    // 3. 输出结果
    std::cout << "\n=== Semi-Supervised Results ===" << std::endl;
    std::cout << "Algorithm: " << opts.algorithm
              << " | Base: " << (opts.baseEstimator.empty() ? "default" : opts.baseEstimator)
              << std::endl;
    std::cout << "Labeled: " << result.numLabeled
              << " | Unlabeled: " << result.numUnlabeled << std::endl;
    std::cout << "Iterations: " << trace.count("iteration")
              << " | Warnings: " << trace.count("warning") << std::endl;
    std::cout << "Transductive Accuracy: " << std::fixed << std::setprecision(4)
              << result.transductiveAccuracy
              << " | Test Accuracy: " << result.testAccuracy << std::endl;
    std::cout << "Train Time: " << static_cast<long>(result.trainTimeMs) << "ms"
              << " | Total Time: " << totalTime.count() << "ms" << std::endl;
}
