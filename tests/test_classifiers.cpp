/** test_classifiers.cpp
    Tree components and the concrete classifiers behind the engines.
*/

#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include "classifier/BaggingClassifier.hpp"
#include "classifier/ClassifierFactory.hpp"
#include "classifier/DecisionTreeClassifier.hpp"
#include "classifier/GaussianNBClassifier.hpp"
#include "classifier/KNNClassifier.hpp"
#include "criterion/EntropyCriterion.hpp"
#include "criterion/GiniCriterion.hpp"
#include "finder/ExhaustiveSplitFinder.hpp"
#include "finder/RandomSplitFinder.hpp"
#include "semi/SSLUtils.hpp"
#include "TestData.hpp"

#include <boost/test/unit_test.hpp>
#include <numeric>
#include <stdexcept>
#include <tuple>

namespace {

void checkRowsSumToOne(const std::vector<double>& proba, size_t k)
{
    for (size_t i = 0; i < proba.size() / k; ++i) {
        double s = 0.0;
        for (size_t c = 0; c < k; ++c) s += proba[i * k + c];
        BOOST_CHECK_CLOSE(s, 1.0, 1e-6);
    }
}

} // namespace

BOOST_AUTO_TEST_CASE( test_impurity_criteria )
{
    GiniCriterion gini;
    EntropyCriterion entropy;
    BOOST_CHECK_CLOSE(gini.impurity({5, 5}, 10), 0.5, 1e-9);
    BOOST_CHECK_CLOSE(entropy.impurity({5, 5}, 10), 1.0, 1e-9);
    BOOST_CHECK_EQUAL(gini.impurity({10, 0}, 10), 0.0);
    BOOST_CHECK_EQUAL(entropy.impurity({0, 10}, 10), 0.0);

    std::vector<int> labels = {0, 0, 1, 1};
    std::vector<int> idx = {0, 1, 2, 3};
    BOOST_CHECK_CLOSE(gini.nodeMetric(labels, idx, 2), 0.5, 1e-9);
}

BOOST_AUTO_TEST_CASE( test_split_finders_find_the_boundary )
{
    // 特征 1 完全分开两类，特征 0 无信息
    std::vector<double> data = {5, 0.0,
                                1, 1.0,
                                5, 4.0,
                                1, 5.0};
    std::vector<int> labels = {0, 0, 1, 1};
    std::vector<int> idx = {0, 1, 2, 3};
    std::vector<int> features = {0, 1};
    GiniCriterion gini;

    ExhaustiveSplitFinder exhaustive;
    auto best = exhaustive.findBestSplit(data, 2, labels, 2, idx, features, 0.5, gini);
    BOOST_CHECK_EQUAL(std::get<0>(best), 1);
    BOOST_CHECK_CLOSE(std::get<1>(best), 2.5, 1e-9);
    BOOST_CHECK_CLOSE(std::get<2>(best), 0.5, 1e-9);

    RandomSplitFinder random(50, 3);
    auto r = random.findBestSplit(data, 2, labels, 2, idx, features, 0.5, gini);
    BOOST_CHECK_EQUAL(std::get<0>(r), 1);
    BOOST_CHECK(std::get<1>(r) > 1.0 && std::get<1>(r) <= 4.0);
}

BOOST_AUTO_TEST_CASE( test_decision_tree_fit_predict )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(60, 3, 2, 8.0, 0.5, 1, X, y);
    // 非连续、含负数的类别
    for (int& v : y) v = v * 5 - 3;

    DecisionTreeClassifier tree;
    BOOST_CHECK(!tree.isFitted());
    BOOST_CHECK_THROW(tree.predict(X, 2), NotFittedError);

    tree.fit(X, 2, y);
    BOOST_CHECK(tree.isFitted());
    std::vector<int> expectedClasses = {-3, 2, 7};
    BOOST_CHECK_EQUAL_COLLECTIONS(tree.classes().begin(), tree.classes().end(),
                                  expectedClasses.begin(), expectedClasses.end());

    const auto pred = tree.predict(X, 2);
    BOOST_CHECK_EQUAL(sslutils::accuracyScore(y, pred), 1.0);
    checkRowsSumToOne(tree.predictProba(X, 2), 3);
    BOOST_CHECK(tree.depth() >= 2);
    BOOST_CHECK_EQUAL(tree.leafCount(), 3);

    const auto imp = tree.getFeatureImportance(2);
    BOOST_CHECK_CLOSE(std::accumulate(imp.begin(), imp.end(), 0.0), 1.0, 1e-6);

    auto copy = tree.clone();
    BOOST_CHECK(!copy->isFitted());
    BOOST_CHECK_EQUAL(copy->name(), "DecisionTreeClassifier");
}

BOOST_AUTO_TEST_CASE( test_decision_tree_config_errors )
{
    DecisionTreeConfig bad;
    bad.criterion = "mse";
    BOOST_CHECK_THROW(DecisionTreeClassifier{bad}, std::invalid_argument);
    BOOST_CHECK_THROW(createSplitFinder("histogram", 1), std::invalid_argument);
    BOOST_CHECK_THROW(createPruner("reduced_error", 0.1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE( test_cost_complexity_pruning_collapses_tree )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(40, 2, 2, 1.0, 1.0, 9, X, y);

    DecisionTreeConfig cfg;
    cfg.prunerType = "cost_complexity";
    cfg.prunerParam = 1e6;
    DecisionTreeClassifier tree(cfg);
    tree.fit(X, 2, y);
    BOOST_CHECK_EQUAL(tree.leafCount(), 1);
    checkRowsSumToOne(tree.predictProba(X, 2), 2);
}

BOOST_AUTO_TEST_CASE( test_bagging_classifier )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(80, 2, 3, 6.0, 0.7, 4, X, y);

    BaggingConfig cfg;
    cfg.numTrees = 8;
    cfg.seed = 17;
    BaggingClassifier bag(cfg);
    bag.fit(X, 3, y);
    BOOST_CHECK_EQUAL(bag.trees().size(), 8u);
    BOOST_CHECK(sslutils::accuracyScore(y, bag.predict(X, 3)) > 0.95);
    BOOST_CHECK(bag.getOOBError(X, 3, y) < 0.1);
    checkRowsSumToOne(bag.predictProba(X, 3), 2);

    // 相同种子可复现
    BaggingClassifier again(cfg);
    again.fit(X, 3, y);
    BOOST_CHECK(bag.predictProba(X, 3) == again.predictProba(X, 3));
}

BOOST_AUTO_TEST_CASE( test_knn_classifier )
{
    std::vector<double> X = {0.0, 0.1, 0.2, 5.0, 5.1, 5.2};
    std::vector<int> y = {1, 1, 1, 4, 4, 4};
    KNNClassifier knn(3);
    BOOST_CHECK(!knn.hasRandomSeed());
    knn.fit(X, 1, y);

    auto proba = knn.predictProba({0.05, 5.05, 2.0}, 1);
    BOOST_CHECK_CLOSE(proba[0], 1.0, 1e-9);
    BOOST_CHECK_CLOSE(proba[3], 1.0, 1e-9);
    auto pred = knn.predict({0.05, 5.05}, 1);
    BOOST_CHECK_EQUAL(pred[0], 1);
    BOOST_CHECK_EQUAL(pred[1], 4);

    BOOST_CHECK_THROW(knn.predict({0.0, 1.0}, 2), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE( test_gaussian_nb )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(60, 3, 2, 6.0, 0.8, 2, X, y);

    GaussianNBClassifier gnb;
    gnb.fit(X, 2, y);
    BOOST_CHECK(sslutils::accuracyScore(y, gnb.predict(X, 2)) > 0.95);
    checkRowsSumToOne(gnb.predictProba(X, 2), 3);
}

BOOST_AUTO_TEST_CASE( test_classifier_factory )
{
    BOOST_CHECK_EQUAL(createClassifier("tree")->name(), "DecisionTreeClassifier");
    BOOST_CHECK_EQUAL(createClassifier("tree:entropy")->name(), "DecisionTreeClassifier");
    BOOST_CHECK(createClassifier("randomtree:5")->hasRandomSeed());
    BOOST_CHECK(!createClassifier("knn:5")->hasRandomSeed());
    BOOST_CHECK(!createClassifier("gnb")->hasRandomSeed());
    BOOST_CHECK(createClassifier("bagging:4")->hasRandomSeed());
    BOOST_CHECK_THROW(createClassifier("svm"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE( test_align_proba )
{
    std::vector<double> proba = {0.3, 0.7,
                                 0.9, 0.1};
    auto aligned = alignProba(proba, {2, 5}, {1, 2, 5});
    std::vector<double> expected = {0.0, 0.3, 0.7,
                                    0.0, 0.9, 0.1};
    BOOST_CHECK_EQUAL_COLLECTIONS(aligned.begin(), aligned.end(),
                                  expected.begin(), expected.end());
}
