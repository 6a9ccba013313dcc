#include "app/MPIExperimentApp.hpp"
#include "semi/EngineFactory.hpp"
#include <mpi.h>
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sstream>

void printUsage(const char* programName) {
    std::cout << "Usage: mpirun -np <num_processes> " << programName << " [options]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  <dataPath>      - Path to CSV or KEEL (.dat) data file" << std::endl;
    std::cout << "  <algorithms>    - Comma separated list or 'all' (default: all)" << std::endl;
    std::cout << "  <repetitions>   - Runs per algorithm, seeds seed..seed+r-1 (default: 10)" << std::endl;
    std::cout << "  <labelRate>     - Fraction of training labels kept (default: 0.1)" << std::endl;
    std::cout << "  <baseEstimator> - Base classifier or 'default' (default: default)" << std::endl;
    std::cout << "  <seed>          - Base random seed (default: 42)" << std::endl;
    std::cout << "  <verbose>       - 0 or 1 (default: 0)" << std::endl;
    std::cout << "\nExample:" << std::endl;
    std::cout << "  mpirun -np 4 " << programName << " iris.csv setred,tritraining 20 0.1" << std::endl;
}

std::vector<std::string> splitList(const std::string& text) {
    if (text == "all") return engineNames();
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int mpiRank, mpiSize;
    MPI_Comm_rank(MPI_COMM_WORLD, &mpiRank);
    MPI_Comm_size(MPI_COMM_WORLD, &mpiSize);

    // Set default parameters
    MPIExperimentOptions opts;
    opts.dataPath      = "../data/iris.csv";
    opts.algorithms    = engineNames();
    opts.baseEstimator = "";
    opts.repetitions   = 10;
    opts.labelRate     = 0.1;
    opts.testRatio     = 0.2;
    opts.secure        = true;
    opts.seed          = 42;
    opts.verbose       = false;

    try {
        if (argc < 2) {
            if (mpiRank == 0) {
                std::cout << "Warning: No arguments provided. Using defaults." << std::endl;
                printUsage(argv[0]);
            }
        } else {
            if (argc >= 2) opts.dataPath = argv[1];
            if (argc >= 3) opts.algorithms = splitList(argv[2]);
            if (argc >= 4) opts.repetitions = std::stoi(argv[3]);
            if (argc >= 5) opts.labelRate = std::stod(argv[4]);
            if (argc >= 6) opts.baseEstimator = std::string(argv[5]) == "default" ? "" : argv[5];
            if (argc >= 7) opts.seed = static_cast<uint32_t>(std::stoul(argv[6]));
            if (argc >= 8) opts.verbose = std::stoi(argv[7]) != 0;
        }
    } catch (const std::exception& e) {
        if (mpiRank == 0) {
            std::cerr << "Error: invalid argument: " << e.what() << std::endl;
            printUsage(argv[0]);
        }
        MPI_Finalize();
        return 1;
    }

    // Validate parameters
    if (opts.repetitions <= 0 || opts.algorithms.empty()) {
        if (mpiRank == 0) {
            std::cerr << "Error: need at least one algorithm and one repetition!" << std::endl;
        }
        MPI_Finalize();
        return 1;
    }
    for (const auto& a : opts.algorithms) {
        const auto& known = engineNames();
        if (std::find(known.begin(), known.end(), a) == known.end()) {
            if (mpiRank == 0) std::cerr << "Error: unknown algorithm " << a << std::endl;
            MPI_Finalize();
            return 1;
        }
    }

    // Master process prints configuration
    if (mpiRank == 0) {
        std::cout << "=== MPI Experiment Parameters ===" << std::endl;
        std::cout << "MPI Processes: " << mpiSize << std::endl;
        std::cout << "Data: " << opts.dataPath << std::endl;
        std::cout << "Algorithms:";
        for (const auto& a : opts.algorithms) std::cout << " " << a;
        std::cout << std::endl;
        std::cout << "Repetitions: " << opts.repetitions
                  << " | Label Rate: " << opts.labelRate << std::endl;
        std::cout << "Base: " << (opts.baseEstimator.empty() ? "default" : opts.baseEstimator)
                  << " | Seed: " << opts.seed << std::endl;
        std::cout << "=================================" << std::endl;
    }

    try {
        auto result = runMPIExperimentApp(opts);

        if (mpiRank == 0) {
            std::cout << "\n=== Semi-Supervised Comparison ===" << std::endl;
            std::cout << std::left << std::setw(16) << "Algorithm"
                      << std::setw(22) << "Test Acc"
                      << std::setw(22) << "Transductive Acc"
                      << std::setw(12) << "Time(ms)" << "Runs" << std::endl;
            for (const auto& s : result.summaries) {
                std::ostringstream test, trans;
                test << std::fixed << std::setprecision(4) << s.meanTestAcc
                     << " +- " << s.stdTestAcc;
                trans << std::fixed << std::setprecision(4) << s.meanTransAcc
                      << " +- " << s.stdTransAcc;
                std::cout << std::left << std::setw(16) << s.algorithm
                          << std::setw(22) << test.str()
                          << std::setw(22) << trans.str()
                          << std::setw(12) << std::fixed << std::setprecision(1)
                          << s.meanTrainTimeMs
                          << s.runs;
                if (s.failures > 0) std::cout << " (" << s.failures << " failed)";
                std::cout << std::endl;
            }

            std::cout << "\nPer-process load:" << std::endl;
            for (int p = 0; p < result.numProcesses; ++p) {
                std::cout << "  Process " << p << ": " << result.perProcessRuns[p]
                          << " runs, " << std::fixed << std::setprecision(1)
                          << result.perProcessTime[p] << "ms" << std::endl;
            }
        }
        MPI_Barrier(MPI_COMM_WORLD);
    } catch (const std::exception& e) {
        std::cerr << "Process " << mpiRank << " error: " << e.what() << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 1);
    }

    MPI_Finalize();
    return 0;
}
