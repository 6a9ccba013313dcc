#pragma once

#include "IClassifier.hpp"
#include <cstdint>
#include <memory>
#include <string>

/**
 * 按名称构造基分类器
 *   "tree" | "tree:entropy" | "randomtree" | "knn[:k]" | "gnb" | "bagging[:n]"
 * @throws std::invalid_argument 未知名称
 */
std::unique_ptr<IClassifier> createClassifier(const std::string& name, uint32_t seed = 42);
