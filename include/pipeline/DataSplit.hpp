#ifndef PIPELINE_DATASPLIT_HPP
#define PIPELINE_DATASPLIT_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

/** 未标注样本的标签哨兵值 */
constexpr int kUnlabeled = -1;

/** 已标注 / 未标注两部分（均为行优先扁平矩阵） */
struct LabeledSplit {
    std::vector<double> X_label;
    std::vector<int>    y_label;
    std::vector<double> X_unlabel;
    int rowLength = 0;

    size_t numLabeled()   const { return y_label.size(); }
    size_t numUnlabeled() const { return rowLength > 0 ? X_unlabel.size() / rowLength : 0; }
};

/**
 * 按哨兵值拆分数据集
 * @throws std::invalid_argument 没有未标注行、没有已标注行或尺寸不一致
 */
LabeledSplit splitLabeled(const std::vector<double>& X,
                          int rowLength,
                          const std::vector<int>& y,
                          int sentinel = kUnlabeled);

struct DataParams {
    std::vector<double> X_train;
    std::vector<int>    y_train;
    std::vector<double> X_test;
    std::vector<int>    y_test;
    int rowLength = 0; // number of features
};

/**
 * 打乱后按 (1-testRatio)/testRatio 划分 X（扁平化）和 y
 * @param rowLength 特征列数
 */
bool splitDataset(const std::vector<double>& X,
                  const std::vector<int>& y,
                  int rowLength,
                  DataParams& out,
                  double testRatio = 0.2,
                  uint32_t seed = 42);

/**
 * 隐藏部分训练标签：保留 labelRate 比例（每个类别至少一个），其余置为 kUnlabeled
 * 原本就是 kUnlabeled 的行保持不变
 */
std::vector<int> maskLabels(const std::vector<int>& y,
                            double labelRate,
                            uint32_t seed);

// **行/列选择工具**
std::vector<double> selectRows(const std::vector<double>& X,
                               int rowLength,
                               const std::vector<int>& rows);

std::vector<double> selectColumns(const std::vector<double>& X,
                                  int rowLength,
                                  const std::vector<int>& columns);

void appendRow(std::vector<double>& dst,
               const std::vector<double>& src,
               int rowLength,
               int row);

#endif // PIPELINE_DATASPLIT_HPP
