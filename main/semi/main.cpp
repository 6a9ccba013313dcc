#include "app/SemiSupervisedApp.hpp"
#include "semi/EngineFactory.hpp"
#include <iostream>

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName
              << " <dataPath> [algorithm] [baseEstimator|default] [labelRate]"
                 " [testRatio] [seed] [verbose] [trace] [secure]" << std::endl;
    std::cout << "Algorithms:";
    for (const auto& n : engineNames()) std::cout << " " << n;
    std::cout << std::endl;
}

int main(int argc, char** argv) {
    // 1. 设定默认参数
    SemiSupervisedOptions opts;
    opts.dataPath      = "../data/iris.csv";
    opts.algorithm     = "tritraining";
    opts.baseEstimator = "";
    opts.labelRate     = 0.1;
    opts.testRatio     = 0.2;
    opts.secure        = true;
    opts.seed          = 42;
    opts.verbose       = false;
    opts.trace         = false;

    // 2. 参数解析
    if (argc < 2) {
        std::cout << "Warning: No arguments provided. Using defaults." << std::endl;
        printUsage(argv[0]);
    }
    try {
        if (argc >= 2)  opts.dataPath = argv[1];
        if (argc >= 3)  opts.algorithm = argv[2];
        if (argc >= 4)  opts.baseEstimator = std::string(argv[3]) == "default" ? "" : argv[3];
        if (argc >= 5)  opts.labelRate = std::stod(argv[4]);
        if (argc >= 6)  opts.testRatio = std::stod(argv[5]);
        if (argc >= 7)  opts.seed = static_cast<uint32_t>(std::stoul(argv[6]));
        if (argc >= 8)  opts.verbose = std::stoi(argv[7]) != 0;
        if (argc >= 9)  opts.trace = std::stoi(argv[8]) != 0;
        if (argc >= 10) opts.secure = std::stoi(argv[9]) != 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid argument: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    // 3. 输出参数
    std::cout << "=== Semi-Supervised Parameters ===" << std::endl;
    std::cout << "Data: " << opts.dataPath << std::endl;
    std::cout << "Algorithm: " << opts.algorithm
              << " | Base: " << (opts.baseEstimator.empty() ? "default" : opts.baseEstimator)
              << std::endl;
    std::cout << "Label Rate: " << opts.labelRate << " | Test Ratio: " << opts.testRatio
              << std::endl;
    std::cout << "Seed: " << opts.seed << " | Secure: " << (opts.secure ? "yes" : "no")
              << std::endl;

    // 4. 运行
    try {
        runSemiSupervisedApp(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
