// =============================================================================
// src/functions/io/DataIO.cpp
// =============================================================================
#include "functions/io/DataIO.hpp"
#include "pipeline/DataSplit.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> splitLine(const std::string& line, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string value;
    while (std::getline(ss, value, sep)) {
        out.push_back(trim(value));
    }
    return out;
}

double parseDouble(const std::string& value, const std::string& filename, size_t lineNo) {
    try {
        size_t used = 0;
        const double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error(filename + ":" + std::to_string(lineNo) +
                                 ": cannot parse '" + value + "' as number");
    }
}

int parseLabel(const std::string& value, const std::string& filename, size_t lineNo) {
    const double v = parseDouble(value, filename, lineNo);
    if (v != std::floor(v)) {
        throw std::runtime_error(filename + ":" + std::to_string(lineNo) +
                                 ": class label '" + value + "' is not an integer");
    }
    return static_cast<int>(v);
}

} // namespace

void DataIO::secureLabels(std::vector<int>& labels,
                          const std::vector<char>& isUnlabeled) {
    bool hasMinusOne = false;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (!isUnlabeled[i] && labels[i] == -1) {
            hasMinusOne = true;
            break;
        }
    }
    if (!hasMinusOne) return;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (!isUnlabeled[i]) labels[i] += 2;
    }
}

std::pair<std::vector<double>, std::vector<int>>
DataIO::readCSV(const std::string& filename, int& rowLength,
                bool secure, int targetCol) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    std::vector<double> flattenedFeatures;
    std::vector<int> labels;
    std::vector<char> isUnlabeled;

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("Empty file: " + filename);
    }
    const size_t numCols = splitLine(line, ',').size();
    if (numCols < 2) {
        throw std::runtime_error("Malformed header in " + filename);
    }
    const size_t target = targetCol < 0 ? numCols + targetCol : static_cast<size_t>(targetCol);
    if (target >= numCols) {
        throw std::invalid_argument("readCSV: target column out of range");
    }
    rowLength = static_cast<int>(numCols) - 1;

    size_t lineNo = 1;
    while (std::getline(file, line)) {
        ++lineNo;
        if (trim(line).empty()) continue;

        const auto cells = splitLine(line, ',');
        if (cells.size() != numCols) {
            throw std::runtime_error(filename + ":" + std::to_string(lineNo) +
                                     ": expected " + std::to_string(numCols) + " columns");
        }
        for (size_t c = 0; c < numCols; ++c) {
            if (c == target) continue;
            flattenedFeatures.push_back(parseDouble(cells[c], filename, lineNo));
        }
        if (cells[target] == "unlabeled") {
            labels.push_back(kUnlabeled);
            isUnlabeled.push_back(1);
        } else {
            labels.push_back(parseLabel(cells[target], filename, lineNo));
            isUnlabeled.push_back(0);
        }
    }

    if (secure) secureLabels(labels, isUnlabeled);

    std::cout << "Loaded " << labels.size() << " samples with "
              << rowLength << " features each" << std::endl;
    return {std::move(flattenedFeatures), std::move(labels)};
}

std::pair<std::vector<double>, std::vector<int>>
DataIO::readKEEL(const std::string& filename, int& rowLength, bool secure) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    struct Attribute {
        std::string name;
        std::vector<std::string> nominal;   // 空 = 数值属性
    };
    std::vector<Attribute> attributes;
    std::string targetName;

    std::string line;
    size_t lineNo = 0;
    bool inData = false;
    while (!inData && std::getline(file, line)) {
        ++lineNo;
        const std::string t = trim(line);
        if (t.rfind("@attribute", 0) == 0) {
            std::istringstream ss(t.substr(10));
            Attribute att;
            ss >> att.name;
            std::string rest;
            std::getline(ss, rest);
            rest = trim(rest);
            const auto lb = rest.find('{');
            if (lb != std::string::npos) {
                const auto rb = rest.find('}', lb);
                if (rb == std::string::npos) {
                    throw std::runtime_error(filename + ":" + std::to_string(lineNo) +
                                             ": unterminated nominal attribute");
                }
                att.nominal = splitLine(rest.substr(lb + 1, rb - lb - 1), ',');
            }
            attributes.push_back(att);
        } else if (t.rfind("@outputs", 0) == 0) {
            targetName = trim(t.substr(8));
        } else if (t.rfind("@data", 0) == 0) {
            inData = true;
        }
    }
    if (!inData || attributes.size() < 2) {
        throw std::runtime_error("Malformed KEEL header in " + filename);
    }

    size_t target = attributes.size() - 1;
    if (!targetName.empty()) {
        auto it = std::find_if(attributes.begin(), attributes.end(),
                               [&](const Attribute& a) { return a.name == targetName; });
        if (it == attributes.end()) {
            throw std::runtime_error("KEEL output '" + targetName + "' is not declared");
        }
        target = static_cast<size_t>(it - attributes.begin());
    }
    rowLength = static_cast<int>(attributes.size()) - 1;

    auto nominalCode = [&](const Attribute& att, const std::string& v) -> int {
        auto it = std::find(att.nominal.begin(), att.nominal.end(), v);
        if (it == att.nominal.end()) {
            throw std::runtime_error(filename + ":" + std::to_string(lineNo) +
                                     ": value '" + v + "' not declared for " + att.name);
        }
        return static_cast<int>(it - att.nominal.begin());
    };

    std::vector<double> flattenedFeatures;
    std::vector<int> labels;
    std::vector<char> isUnlabeled;

    while (std::getline(file, line)) {
        ++lineNo;
        if (trim(line).empty()) continue;
        const auto cells = splitLine(line, ',');
        if (cells.size() != attributes.size()) {
            throw std::runtime_error(filename + ":" + std::to_string(lineNo) + ": expected " +
                                     std::to_string(attributes.size()) + " columns");
        }
        for (size_t c = 0; c < cells.size(); ++c) {
            const Attribute& att = attributes[c];
            if (c == target) {
                if (cells[c] == "unlabeled") {
                    labels.push_back(kUnlabeled);
                    isUnlabeled.push_back(1);
                } else {
                    labels.push_back(att.nominal.empty()
                                     ? parseLabel(cells[c], filename, lineNo)
                                     : nominalCode(att, cells[c]));
                    isUnlabeled.push_back(0);
                }
            } else if (att.nominal.empty()) {
                flattenedFeatures.push_back(parseDouble(cells[c], filename, lineNo));
            } else {
                flattenedFeatures.push_back(nominalCode(att, cells[c]));
            }
        }
    }

    if (secure) secureLabels(labels, isUnlabeled);

    std::cout << "Loaded " << labels.size() << " samples with "
              << rowLength << " features each" << std::endl;
    return {std::move(flattenedFeatures), std::move(labels)};
}

void DataIO::writeResults(const std::vector<int>& results,
                          const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file: " + filename);
    }
    for (const auto& r : results) {
        file << r << '\n';
    }
}

bool DataIO::validateData(const std::vector<double>& flattenedFeatures,
                          const std::vector<int>& labels,
                          int rowLength) {
    if (labels.empty()) {
        std::cerr << "Error: No labels found" << std::endl;
        return false;
    }

    const size_t expectedFeatureCount = labels.size() * rowLength;
    if (flattenedFeatures.size() != expectedFeatureCount) {
        std::cerr << "Error: Feature count mismatch. Expected: "
                  << expectedFeatureCount << ", Got: " << flattenedFeatures.size() << std::endl;
        return false;
    }

    const auto invalidFeature = std::find_if(flattenedFeatures.begin(), flattenedFeatures.end(),
        [](double val) { return !std::isfinite(val); });
    if (invalidFeature != flattenedFeatures.end()) {
        std::cerr << "Warning: Found non-finite feature values" << std::endl;
    }
    return true;
}
