#pragma once

#include "SemiSupervisedClassifier.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/**
 * 按名称构造半监督引擎
 * algorithm: "setred" | "selftraining" | "cotraining" | "committee" | "rasco" |
 *            "relrasco" | "tritraining" | "democratic" | "coforest"
 * base: createClassifier 可识别的基分类器名称，空串 = 引擎默认
 * @throws std::invalid_argument 未知名称
 */
std::unique_ptr<SemiSupervisedClassifier>
createEngine(const std::string& algorithm,
             const std::string& base = "",
             uint32_t seed = 42,
             bool verbose = false);

/** createEngine 支持的全部算法名 */
const std::vector<std::string>& engineNames();
