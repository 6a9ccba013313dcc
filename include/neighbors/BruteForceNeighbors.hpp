#pragma once

#include <utility>
#include <vector>

/**
 * 暴力欧氏近邻搜索
 * @return 按 (距离, 下标) 升序的前 k 个 (index, distance)，excludeIndex 处的行跳过
 */
std::vector<std::pair<int, double>>
nearestNeighbors(const double* query,
                 const std::vector<double>& data,
                 int rowLength,
                 int k,
                 int excludeIndex = -1);

double euclideanDistance(const double* a, const double* b, int rowLength);
