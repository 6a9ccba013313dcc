/** test_self_training.cpp
    Plain self-training with the threshold and k_best criteria.
*/

#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include "semi/SelfTraining.hpp"
#include "classifier/GaussianNBClassifier.hpp"
#include "classifier/KNNClassifier.hpp"
#include "TestData.hpp"

#include <boost/test/unit_test.hpp>
#include <stdexcept>

BOOST_AUTO_TEST_CASE( test_self_training_config_errors )
{
    SelfTrainingConfig cfg;
    cfg.criterion = "top";
    BOOST_CHECK_THROW(SelfTraining(nullptr, cfg), std::invalid_argument);
    cfg = SelfTrainingConfig();
    cfg.threshold = 1.0;
    BOOST_CHECK_THROW(SelfTraining(nullptr, cfg), std::invalid_argument);
    cfg = SelfTrainingConfig();
    cfg.criterion = "k_best";
    cfg.kBest = 0;
    BOOST_CHECK_THROW(SelfTraining(nullptr, cfg), std::invalid_argument);
    // kBest 只在 k_best 准则下检查
    cfg.criterion = "threshold";
    BOOST_CHECK_NO_THROW(SelfTraining(nullptr, cfg));
}

BOOST_AUTO_TEST_CASE( test_self_training_k_best_adds_k_per_iteration )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(60, 2, 2, 6.0, 0.5, 1, X, y);
    const auto masked = testdata::keepFirstPerClass(y, 2, 3);

    SelfTrainingConfig cfg;
    cfg.criterion = "k_best";
    cfg.kBest = 7;
    cfg.maxIterations = 3;
    TraceLog trace;
    SelfTraining model(std::make_unique<GaussianNBClassifier>(), cfg);
    model.fit(X, 2, masked, &trace);

    BOOST_CHECK_EQUAL(model.iterations(), 3);
    const auto its = trace.filter("iteration");
    BOOST_REQUIRE_EQUAL(its.size(), 3u);
    for (size_t i = 0; i < its.size(); ++i) {
        BOOST_CHECK_EQUAL(its[i].value("accepted"), 7.0);
        BOOST_CHECK_EQUAL(its[i].value("labeled"), 6.0 + 7.0 * (i + 1));
    }

    int labeled = 0;
    for (int it : model.labeledIteration()) {
        BOOST_CHECK_GE(it, 0);
        BOOST_CHECK_LE(it, 3);
        if (it > 0) ++labeled;
    }
    BOOST_CHECK_EQUAL(labeled, 21);
}

BOOST_AUTO_TEST_CASE( test_self_training_threshold_stops_when_nothing_passes )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(40, 2, 2, 6.0, 0.5, 2, X, y);
    const auto masked = testdata::keepFirstPerClass(y, 2, 2);

    // 3-NN 在两类各 2 个样本时置信度至多 2/3
    SelfTrainingConfig cfg;
    cfg.threshold = 0.9;
    TraceLog trace;
    SelfTraining model(std::make_unique<KNNClassifier>(3), cfg);
    model.fit(X, 2, masked, &trace);

    BOOST_CHECK_EQUAL(trace.count("iteration"), 0u);
    BOOST_CHECK_EQUAL(trace.count("final"), 1u);
    BOOST_CHECK_EQUAL(trace.filter("final")[0].message, "no new pseudo-labels");
    BOOST_CHECK(model.isFitted());
}

BOOST_AUTO_TEST_CASE( test_self_training_labels_everything_on_easy_data )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(80, 2, 3, 8.0, 0.3, 9, X, y);
    const auto masked = testdata::keepFirstPerClass(y, 2, 4);

    SelfTrainingConfig cfg;
    cfg.maxIterations = -1;
    SelfTraining model(std::make_unique<GaussianNBClassifier>(), cfg);
    model.fit(X, 3, masked);

    for (int it : model.labeledIteration()) BOOST_CHECK_GT(it, 0);
    std::vector<double> XH;
    std::vector<int> yH;
    testdata::hiddenRows(y, masked, 3, X, XH, yH);
    BOOST_CHECK_EQUAL(model.score(XH, 3, yH), 1.0);
}
