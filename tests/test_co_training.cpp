/** test_co_training.cpp
    Two-view binary co-training.
*/

#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include "semi/CoTraining.hpp"
#include "classifier/GaussianNBClassifier.hpp"
#include "classifier/KNNClassifier.hpp"
#include "TestData.hpp"

#include <boost/test/unit_test.hpp>
#include <set>
#include <stdexcept>

BOOST_AUTO_TEST_CASE( test_co_training_config_errors )
{
    CoTrainingConfig cfg;
    cfg.positives = 2;
    BOOST_CHECK_THROW(CoTraining(nullptr, nullptr, cfg), std::invalid_argument);
    cfg.negatives = 0;
    BOOST_CHECK_THROW(CoTraining(nullptr, nullptr, cfg), std::invalid_argument);
    cfg = CoTrainingConfig();
    cfg.poolsize = 0;
    BOOST_CHECK_THROW(CoTraining(nullptr, nullptr, cfg), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE( test_co_training_rejects_bad_labels )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(30, 3, 2, 5.0, 0.5, 1, X, y);

    CoTraining model;
    // 三个类别
    BOOST_CHECK_THROW(model.fit(X, 2, testdata::keepFirstPerClass(y, 3, 2)),
                      std::invalid_argument);

    // 只有一个类别被标注
    std::vector<int> single(y.size(), kUnlabeled);
    single[0] = 0;
    single[3] = 0;
    BOOST_CHECK_THROW(model.fit(X, 2, single), std::invalid_argument);

    // 没有未标注样本
    std::vector<int> binary(y);
    for (int& v : binary) v = v % 2;
    BOOST_CHECK_THROW(model.fit(X, 2, binary), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE( test_co_training_infers_ratio )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(100, 2, 2, 6.0, 0.5, 4, X, y);

    // 负类 6 个，正类 3 个
    std::vector<int> masked(y.size(), kUnlabeled);
    int neg = 0, pos = 0;
    for (size_t i = 0; i < y.size(); ++i) {
        if (y[i] == 0 && neg < 6) { masked[i] = 0; ++neg; }
        if (y[i] == 1 && pos < 3) { masked[i] = 1; ++pos; }
    }

    CoTrainingConfig cfg;
    cfg.maxIterations = 5;
    CoTraining model(std::make_unique<GaussianNBClassifier>(), nullptr, cfg);
    model.fit(X, 2, masked);
    BOOST_CHECK_EQUAL(model.positives(), 1);
    BOOST_CHECK_EQUAL(model.negatives(), 2);
}

BOOST_AUTO_TEST_CASE( test_co_training_two_feature_views )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(200, 2, 4, 4.0, 0.7, 8, X, y);
    for (int& v : y) v = (v == 0) ? -5 : 5;
    std::vector<int> masked(y);
    for (size_t i = 10; i < masked.size(); ++i) masked[i] = kUnlabeled;

    CoTrainingConfig cfg;
    cfg.positives = 2;
    cfg.negatives = 2;
    cfg.poolsize = 40;
    cfg.maxIterations = 10;
    TraceLog trace;
    CoTraining model(std::make_unique<GaussianNBClassifier>(),
                     std::make_unique<KNNClassifier>(3), cfg);
    model.fitWithFeatures(X, 4, masked, {0, 1}, {2, 3}, &trace);

    BOOST_CHECK_EQUAL(model.hypotheses().size(), 2u);
    BOOST_CHECK((model.columns()[0] == std::vector<int>{0, 1}));
    BOOST_CHECK((model.columns()[1] == std::vector<int>{2, 3}));
    BOOST_CHECK((model.classes() == std::vector<int>{-5, 5}));

    std::set<int> unique(model.addedIds().begin(), model.addedIds().end());
    BOOST_CHECK_EQUAL(unique.size(), model.addedIds().size());
    for (int id : model.addedIds()) BOOST_CHECK_EQUAL(masked[id], kUnlabeled);

    for (const auto& e : trace.filter("iteration")) {
        BOOST_CHECK_LE(e.value("positives"), 4.0);
        BOOST_CHECK_LE(e.value("negatives"), 4.0);
        BOOST_CHECK_LE(e.value("accepted"), e.value("positives") + e.value("negatives"));
    }

    std::vector<double> XH;
    std::vector<int> yH;
    testdata::hiddenRows(y, masked, 4, X, XH, yH);
    BOOST_CHECK_GT(model.score(XH, 4, yH), 0.9);
    for (int p : model.predict(XH, 4)) BOOST_CHECK(p == -5 || p == 5);
}

BOOST_AUTO_TEST_CASE( test_co_training_separate_views )
{
    std::vector<double> A, B;
    std::vector<int> y, yb;
    testdata::makeBlobs(80, 2, 2, 6.0, 0.5, 12, A, y);
    testdata::makeBlobs(80, 2, 3, 6.0, 0.5, 13, B, yb);
    const auto masked = testdata::keepFirstPerClass(y, 2, 4);

    CoTrainingConfig cfg;
    cfg.maxIterations = 4;
    CoTraining model(std::make_unique<GaussianNBClassifier>(), nullptr, cfg);
    model.fitWithViews(A, 2, B, 3, masked);

    const auto pred = model.predict(A, 2, B, 3);
    BOOST_REQUIRE_EQUAL(pred.size(), y.size());
    int correct = 0;
    for (size_t i = 0; i < y.size(); ++i) correct += (pred[i] == y[i]);
    BOOST_CHECK_GT(correct, 76);

    // 分开视图训练后单视图入口不可用
    BOOST_CHECK_THROW(model.predictProba(A, 2), std::invalid_argument);
    BOOST_CHECK_THROW(model.predict(A, 2, B, 2), std::exception);
}
