#include "classifier/ClassifierFactory.hpp"
#include "classifier/DecisionTreeClassifier.hpp"
#include "classifier/BaggingClassifier.hpp"
#include "classifier/KNNClassifier.hpp"
#include "classifier/GaussianNBClassifier.hpp"
#include <stdexcept>

namespace {
// "name:param" 中的参数部分
std::string paramOf(const std::string& name) {
    const auto pos = name.find(':');
    return pos == std::string::npos ? std::string() : name.substr(pos + 1);
}
} // namespace

std::unique_ptr<IClassifier> createClassifier(const std::string& name, uint32_t seed) {
    const std::string base = name.substr(0, name.find(':'));
    const std::string param = paramOf(name);

    if (base == "tree") {
        DecisionTreeConfig cfg;
        cfg.seed = seed;
        if (!param.empty()) cfg.criterion = param;
        return std::make_unique<DecisionTreeClassifier>(cfg);
    }
    else if (base == "randomtree") {
        DecisionTreeConfig cfg;
        cfg.seed = seed;
        cfg.splitMethod = param.empty() ? "random" : "random:" + param;
        return std::make_unique<DecisionTreeClassifier>(cfg);
    }
    else if (base == "knn") {
        return std::make_unique<KNNClassifier>(param.empty() ? 3 : std::stoi(param));
    }
    else if (base == "gnb") {
        return std::make_unique<GaussianNBClassifier>();
    }
    else if (base == "bagging") {
        BaggingConfig cfg;
        cfg.seed = seed;
        if (!param.empty()) cfg.numTrees = std::stoi(param);
        return std::make_unique<BaggingClassifier>(cfg);
    }
    throw std::invalid_argument("Unknown classifier: " + name);
}
