#include "pipeline/DataSplit.hpp"
#include <algorithm>
#include <map>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>

LabeledSplit splitLabeled(const std::vector<double>& X,
                          int rowLength,
                          const std::vector<int>& y,
                          int sentinel) {
    if (rowLength <= 0 || X.size() != y.size() * static_cast<size_t>(rowLength)) {
        throw std::invalid_argument("splitLabeled: X has " + std::to_string(X.size()) +
                                    " values, expected " + std::to_string(y.size()) +
                                    " rows of " + std::to_string(rowLength));
    }

    LabeledSplit out;
    out.rowLength = rowLength;
    for (size_t i = 0; i < y.size(); ++i) {
        if (y[i] == sentinel) {
            appendRow(out.X_unlabel, X, rowLength, static_cast<int>(i));
        } else {
            appendRow(out.X_label, X, rowLength, static_cast<int>(i));
            out.y_label.push_back(y[i]);
        }
    }

    if (out.X_unlabel.empty()) {
        throw std::invalid_argument("splitLabeled: y contains no unlabeled samples");
    }
    if (out.y_label.empty()) {
        throw std::invalid_argument("splitLabeled: y contains no labeled samples");
    }
    return out;
}

bool splitDataset(const std::vector<double>& X,
                  const std::vector<int>& y,
                  int rowLength,
                  DataParams& out,
                  double testRatio,
                  uint32_t seed) {
    const size_t totalRows = y.size();
    if (rowLength <= 0 || X.size() != totalRows * rowLength || totalRows < 2) {
        return false;
    }

    std::vector<int> order(totalRows);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 gen(seed);
    std::shuffle(order.begin(), order.end(), gen);

    size_t testRows = static_cast<size_t>(totalRows * testRatio);
    testRows = std::min(std::max<size_t>(testRows, 1), totalRows - 1);
    const size_t trainRows = totalRows - testRows;

    out.rowLength = rowLength;
    out.X_train.clear(); out.y_train.clear();
    out.X_test.clear();  out.y_test.clear();
    for (size_t i = 0; i < totalRows; ++i) {
        const int r = order[i];
        if (i < trainRows) {
            appendRow(out.X_train, X, rowLength, r);
            out.y_train.push_back(y[r]);
        } else {
            appendRow(out.X_test, X, rowLength, r);
            out.y_test.push_back(y[r]);
        }
    }
    return true;
}

std::vector<int> maskLabels(const std::vector<int>& y,
                            double labelRate,
                            uint32_t seed) {
    if (labelRate <= 0.0 || labelRate >= 1.0) {
        throw std::invalid_argument("maskLabels: labelRate must lie in (0, 1)");
    }

    std::vector<int> order(y.size());
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 gen(seed);
    std::shuffle(order.begin(), order.end(), gen);

    const size_t keep = std::max<size_t>(1, static_cast<size_t>(y.size() * labelRate));
    std::vector<char> kept(y.size(), 0);

    // 每个类别先保留一个
    std::map<int, bool> seen;
    size_t numKept = 0;
    for (int idx : order) {
        if (y[idx] == kUnlabeled) continue;
        if (!seen[y[idx]]) {
            seen[y[idx]] = true;
            kept[idx] = 1;
            ++numKept;
        }
    }
    for (int idx : order) {
        if (numKept >= keep) break;
        if (!kept[idx] && y[idx] != kUnlabeled) {
            kept[idx] = 1;
            ++numKept;
        }
    }

    std::vector<int> masked(y);
    for (size_t i = 0; i < y.size(); ++i) {
        if (!kept[i]) masked[i] = kUnlabeled;
    }
    return masked;
}

std::vector<double> selectRows(const std::vector<double>& X,
                               int rowLength,
                               const std::vector<int>& rows) {
    std::vector<double> out(rows.size() * rowLength);
    for (size_t i = 0; i < rows.size(); ++i) {
        const double* src = &X[static_cast<size_t>(rows[i]) * rowLength];
        std::copy(src, src + rowLength, out.begin() + i * rowLength);
    }
    return out;
}

std::vector<double> selectColumns(const std::vector<double>& X,
                                  int rowLength,
                                  const std::vector<int>& columns) {
    const size_t n = rowLength > 0 ? X.size() / rowLength : 0;
    const size_t m = columns.size();
    std::vector<double> out(n * m);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < m; ++j) {
            out[i * m + j] = X[i * rowLength + columns[j]];
        }
    }
    return out;
}

void appendRow(std::vector<double>& dst,
               const std::vector<double>& src,
               int rowLength,
               int row) {
    const auto begin = src.begin() + static_cast<size_t>(row) * rowLength;
    dst.insert(dst.end(), begin, begin + rowLength);
}
