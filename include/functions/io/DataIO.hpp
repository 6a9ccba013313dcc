// =============================================================================
// include/functions/io/DataIO.hpp - CSV / KEEL 数据读取
// =============================================================================
#pragma once

#include <vector>
#include <string>
#include <utility>

class DataIO {
public:
    /**
     * 读取带表头的 CSV，最后一列（或 targetCol）为类别
     * 类别 "unlabeled" 读作 -1 哨兵；secure=true 且存在真实类别 -1 时所有真实类别 +2
     * @param rowLength 输出：特征列数
     */
    std::pair<std::vector<double>, std::vector<int>>
    readCSV(const std::string& filename, int& rowLength,
            bool secure = true, int targetCol = -1);

    /** 读取 KEEL .dat 文件（@attribute / @outputs / @data） */
    std::pair<std::vector<double>, std::vector<int>>
    readKEEL(const std::string& filename, int& rowLength, bool secure = true);

    void writeResults(const std::vector<int>& results,
                      const std::string& filename);

    bool validateData(const std::vector<double>& flattenedFeatures,
                      const std::vector<int>& labels,
                      int rowLength);

    // 真实类别中存在 -1 时整体 +2，哨兵位置保持 -1
    static void secureLabels(std::vector<int>& labels,
                             const std::vector<char>& isUnlabeled);
};
