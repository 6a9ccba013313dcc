#include "semi/EngineFactory.hpp"
#include "semi/CoForest.hpp"
#include "semi/CoTraining.hpp"
#include "semi/CoTrainingByCommittee.hpp"
#include "semi/DemocraticCoLearning.hpp"
#include "semi/Rasco.hpp"
#include "semi/SelfTraining.hpp"
#include "semi/Setred.hpp"
#include "semi/TriTraining.hpp"
#include "classifier/ClassifierFactory.hpp"
#include <stdexcept>

const std::vector<std::string>& engineNames() {
    static const std::vector<std::string> names = {
        "setred", "selftraining", "cotraining", "committee", "rasco",
        "relrasco", "tritraining", "democratic", "coforest"};
    return names;
}

std::unique_ptr<SemiSupervisedClassifier>
createEngine(const std::string& algorithm,
             const std::string& base,
             uint32_t seed,
             bool verbose) {
    auto makeBase = [&]() -> std::unique_ptr<IClassifier> {
        return base.empty() ? nullptr : createClassifier(base, seed);
    };

    if (algorithm == "setred") {
        SetredConfig cfg;
        cfg.seed = seed;
        cfg.verbose = verbose;
        return std::make_unique<Setred>(makeBase(), cfg);
    }
    if (algorithm == "selftraining") {
        SelfTrainingConfig cfg;
        cfg.seed = seed;
        cfg.verbose = verbose;
        return std::make_unique<SelfTraining>(makeBase(), cfg);
    }
    if (algorithm == "cotraining") {
        CoTrainingConfig cfg;
        cfg.seed = seed;
        cfg.verbose = verbose;
        return std::make_unique<CoTraining>(makeBase(), nullptr, cfg);
    }
    if (algorithm == "committee") {
        CommitteeConfig cfg;
        cfg.seed = seed;
        cfg.verbose = verbose;
        return std::make_unique<CoTrainingByCommittee>(makeBase(), cfg);
    }
    if (algorithm == "rasco" || algorithm == "relrasco") {
        RascoConfig cfg;
        cfg.seed = seed;
        cfg.verbose = verbose;
        if (algorithm == "rasco") return std::make_unique<Rasco>(makeBase(), cfg);
        return std::make_unique<RelRasco>(makeBase(), cfg);
    }
    if (algorithm == "tritraining") {
        TriTrainingConfig cfg;
        cfg.seed = seed;
        cfg.verbose = verbose;
        return std::make_unique<TriTraining>(makeBase(), cfg);
    }
    if (algorithm == "democratic") {
        DemocraticConfig cfg;
        cfg.seed = seed;
        cfg.verbose = verbose;
        if (base.empty()) return std::make_unique<DemocraticCoLearning>(
            DemocraticCoLearning::defaultEstimators(), cfg);
        return std::make_unique<DemocraticCoLearning>(
            DemocraticCoLearning::makeClones(*createClassifier(base, seed), 3, seed), cfg);
    }
    if (algorithm == "coforest") {
        CoForestConfig cfg;
        cfg.seed = seed;
        cfg.verbose = verbose;
        return std::make_unique<CoForest>(cfg);
    }
    throw std::invalid_argument("Unknown semi-supervised algorithm: " + algorithm);
}
