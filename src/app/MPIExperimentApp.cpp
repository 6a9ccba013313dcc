#include "app/MPIExperimentApp.hpp"
#include "app/SemiSupervisedApp.hpp"

#include <mpi.h>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <cmath>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

// 每个网格单元归约的字段
enum RunField { kDone = 0, kFailed, kTestAcc, kTransAcc, kTrainMs, kNumFields };

/** rank 0 的数据广播到所有进程 */
void broadcastDataset(std::vector<double>& X, std::vector<int>& y, int& rowLength) {
    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    int numSamples = rank == 0 ? static_cast<int>(y.size()) : 0;
    MPI_Bcast(&rowLength, 1, MPI_INT, 0, MPI_COMM_WORLD);
    MPI_Bcast(&numSamples, 1, MPI_INT, 0, MPI_COMM_WORLD);
    if (numSamples <= 0 || rowLength <= 0) {
        throw std::runtime_error("Invalid dataset dimensions after broadcast");
    }

    if (rank != 0) {
        X.resize(static_cast<size_t>(numSamples) * rowLength);
        y.resize(numSamples);
    }
    MPI_Bcast(X.data(), numSamples * rowLength, MPI_DOUBLE, 0, MPI_COMM_WORLD);
    MPI_Bcast(y.data(), numSamples, MPI_INT, 0, MPI_COMM_WORLD);
}

} // namespace

GlobalExperimentResult runMPIExperimentApp(const MPIExperimentOptions& opts) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    if (rank == 0 && opts.verbose) {
        std::cout << "=== MPI Semi-Supervised Experiment ===" << std::endl;
        std::cout << "MPI processes: " << size << std::endl;
        #ifdef _OPENMP
        std::cout << "OpenMP threads per process: " << omp_get_max_threads() << std::endl;
        #endif
    }

    // 1. 数据加载（只有主进程读文件）
    std::vector<double> X;
    std::vector<int> y;
    int rowLength = 0;
    if (rank == 0) {
        loadDataset(opts.dataPath, opts.secure, X, y, rowLength);
        std::cout << "Dataset loaded: " << y.size() << " samples, "
                  << rowLength << " features" << std::endl;
    }
    broadcastDataset(X, y, rowLength);

    // 2. 本进程负责的网格单元
    const int numAlgorithms = static_cast<int>(opts.algorithms.size());
    const int numRuns = numAlgorithms * opts.repetitions;
    std::vector<double> local(static_cast<size_t>(numRuns) * kNumFields, 0.0);

    auto computeStart = std::chrono::high_resolution_clock::now();
    int myRuns = 0;
    for (int run = 0; run < numRuns; ++run) {
        if (ownerOfRun(run, size) != rank) continue;
        ++myRuns;

        const std::string& algorithm = opts.algorithms[run / opts.repetitions];
        const uint32_t seed = opts.seed + static_cast<uint32_t>(run % opts.repetitions);
        double* cell = &local[static_cast<size_t>(run) * kNumFields];
        try {
            auto r = runSemiSupervisedExperiment(X, y, rowLength, algorithm,
                                                 opts.baseEstimator, opts.labelRate,
                                                 opts.testRatio, seed, false);
            cell[kDone]     = 1.0;
            cell[kTestAcc]  = r.testAccuracy;
            cell[kTransAcc] = r.transductiveAccuracy;
            cell[kTrainMs]  = r.trainTimeMs;
        } catch (const std::exception& e) {
            // 单次运行失败（例如二分类引擎遇到多分类数据）只记为失败
            cell[kFailed] = 1.0;
            std::cerr << "Warning: process " << rank << ": " << algorithm
                      << " (seed " << seed << ") failed: " << e.what() << std::endl;
        }
        if (opts.verbose) {
            std::cout << "Process " << rank << " finished " << algorithm
                      << " seed " << seed << std::endl;
        }
    }
    auto computeEnd = std::chrono::high_resolution_clock::now();
    double localTime = std::chrono::duration<double, std::milli>(computeEnd - computeStart).count();

    // 3. 归约到主进程
    std::vector<double> global(local.size(), 0.0);
    MPI_Reduce(local.data(), global.data(), static_cast<int>(local.size()),
               MPI_DOUBLE, MPI_SUM, 0, MPI_COMM_WORLD);

    GlobalExperimentResult result;
    result.numProcesses = size;
    result.perProcessTime.resize(size);
    result.perProcessRuns.resize(size);
    MPI_Gather(&localTime, 1, MPI_DOUBLE,
               result.perProcessTime.data(), 1, MPI_DOUBLE, 0, MPI_COMM_WORLD);
    MPI_Gather(&myRuns, 1, MPI_INT,
               result.perProcessRuns.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);

    if (rank != 0) return result;

    // 4. 汇总：均值 ± 样本标准差
    for (int a = 0; a < numAlgorithms; ++a) {
        AlgorithmSummary s;
        s.algorithm = opts.algorithms[a];
        double sumTest = 0.0, sumTrans = 0.0, sumTime = 0.0;
        for (int r = 0; r < opts.repetitions; ++r) {
            const double* cell = &global[static_cast<size_t>(a * opts.repetitions + r) * kNumFields];
            if (cell[kDone] > 0.5) {
                ++s.runs;
                sumTest  += cell[kTestAcc];
                sumTrans += cell[kTransAcc];
                sumTime  += cell[kTrainMs];
            } else if (cell[kFailed] > 0.5) {
                ++s.failures;
            }
        }
        if (s.runs > 0) {
            s.meanTestAcc     = sumTest / s.runs;
            s.meanTransAcc    = sumTrans / s.runs;
            s.meanTrainTimeMs = sumTime / s.runs;
            double varTest = 0.0, varTrans = 0.0;
            for (int r = 0; r < opts.repetitions; ++r) {
                const double* cell = &global[static_cast<size_t>(a * opts.repetitions + r) * kNumFields];
                if (cell[kDone] < 0.5) continue;
                varTest  += (cell[kTestAcc] - s.meanTestAcc) * (cell[kTestAcc] - s.meanTestAcc);
                varTrans += (cell[kTransAcc] - s.meanTransAcc) * (cell[kTransAcc] - s.meanTransAcc);
            }
            if (s.runs > 1) {
                s.stdTestAcc  = std::sqrt(varTest / (s.runs - 1));
                s.stdTransAcc = std::sqrt(varTrans / (s.runs - 1));
            }
        }
        result.summaries.push_back(s);
    }
    return result;
}
