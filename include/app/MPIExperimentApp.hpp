#pragma once

#include <string>
#include <cstdint>
#include <vector>

struct MPIExperimentOptions {
    std::string              dataPath;
    std::vector<std::string> algorithms;     // 参与对比的算法
    std::string              baseEstimator;  // "" = 引擎默认
    int                      repetitions;    // 每个算法的重复次数（种子 = seed + r）
    double                   labelRate;
    double                   testRatio;
    bool                     secure;
    uint32_t                 seed;
    bool                     verbose;
};

// 每个算法的汇总（只在 rank 0 有效）
struct AlgorithmSummary {
    std::string algorithm;
    int    runs            = 0;   // 成功完成的次数
    int    failures        = 0;
    double meanTestAcc     = 0.0;
    double stdTestAcc      = 0.0;
    double meanTransAcc    = 0.0;
    double stdTransAcc     = 0.0;
    double meanTrainTimeMs = 0.0;
};

struct GlobalExperimentResult {
    std::vector<AlgorithmSummary> summaries;
    int numProcesses = 0;
    std::vector<double> perProcessTime;   // 每个进程的计算时间(ms)
    std::vector<int>    perProcessRuns;
};

/**
 * rank 0 读取数据并广播；(算法 × 重复) 网格按轮转分配到各进程，
 * 结果归约到 rank 0 汇总为均值 ± 标准差
 * MPI_Init / MPI_Finalize 由 main 负责
 */
GlobalExperimentResult runMPIExperimentApp(const MPIExperimentOptions& opts);

/** 第 runIndex 个网格单元属于哪个进程 */
inline int ownerOfRun(int runIndex, int size) { return runIndex % size; }
