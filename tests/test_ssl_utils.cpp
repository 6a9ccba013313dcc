/** test_ssl_utils.cpp
    Priors, proportion intervals, proportional choice and the neighbour based helpers.
*/

#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include "semi/SSLUtils.hpp"
#include "classifier/KNNClassifier.hpp"
#include "TestData.hpp"

#include <boost/test/unit_test.hpp>
#include <numeric>
#include <stdexcept>

using namespace sslutils;

BOOST_AUTO_TEST_CASE( test_prior_probability )
{
    auto prior = calculatePriorProbability({0, 0, 1, 2});
    BOOST_REQUIRE_EQUAL(prior.size(), 3u);
    BOOST_CHECK_CLOSE(prior[0], 0.5, 1e-9);
    BOOST_CHECK_CLOSE(prior[1], 0.25, 1e-9);
    BOOST_CHECK_CLOSE(prior[2], 0.25, 1e-9);
    BOOST_CHECK(calculatePriorProbability({}).empty());
}

BOOST_AUTO_TEST_CASE( test_safe_division )
{
    BOOST_CHECK_EQUAL(safeDivision(3.0, 2.0, 1e-3), 1.5);
    BOOST_CHECK_EQUAL(safeDivision(1.0, 0.0, 0.5), 2.0);
    BOOST_CHECK_EQUAL(safeDivision(0.0, 0.0, 0.5), 0.0);
}

BOOST_AUTO_TEST_CASE( test_proportion_confint_methods )
{
    auto wald = proportionConfint(8, 10, 0.95, "normal");
    BOOST_CHECK_CLOSE(wald.first, 0.552082, 1e-3);
    BOOST_CHECK_EQUAL(wald.second, 1.0);

    auto bern = proportionConfint(8, 10, 0.95, "bernoulli");
    BOOST_CHECK_EQUAL(bern.first, wald.first);

    auto wilson = proportionConfint(8, 10, 0.95, "wilson");
    BOOST_CHECK_CLOSE(wilson.first, 0.490163, 0.05);
    BOOST_CHECK_CLOSE(wilson.second, 0.943318, 0.05);

    auto cp = proportionConfint(8, 10, 0.95, "beta");
    BOOST_CHECK_CLOSE(cp.first, 0.443905, 0.05);
    BOOST_CHECK_CLOSE(cp.second, 0.974789, 0.05);

    auto ac = proportionConfint(8, 10, 0.95, "agresti_coull");
    BOOST_CHECK(ac.first > 0.4 && ac.first < wald.first);
    BOOST_CHECK(ac.second <= 1.0);

    auto none = proportionConfint(0, 5, 0.95, "beta");
    BOOST_CHECK_EQUAL(none.first, 0.0);
    auto all = proportionConfint(5, 5, 0.95, "bernoulli");
    BOOST_CHECK_EQUAL(all.first, 1.0);
    BOOST_CHECK_EQUAL(all.second, 1.0);
}

BOOST_AUTO_TEST_CASE( test_proportion_confint_errors )
{
    BOOST_CHECK_THROW(proportionConfint(0, 0), std::invalid_argument);
    BOOST_CHECK_THROW(proportionConfint(3, 2), std::invalid_argument);
    BOOST_CHECK_THROW(proportionConfint(1, 2, 1.5), std::invalid_argument);
    BOOST_CHECK_THROW(proportionConfint(1, 2, 0.95, "jeffreys"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE( test_confidence_interval_of_classifier )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(40, 2, 2, 10.0, 0.5, 7, X, y);

    KNNClassifier knn(1);
    knn.fit(X, 2, y);
    auto ci = confidenceInterval(X, 2, knn, y);
    BOOST_CHECK_EQUAL(ci.first, 1.0);
    BOOST_CHECK_EQUAL(ci.second, 1.0);
}

BOOST_AUTO_TEST_CASE( test_choice_with_proportion )
{
    std::vector<double> conf = {0.9, 0.8, 0.7, 0.6, 0.95, 0.5};
    std::vector<int> pred    = {0,   0,   0,   0,   1,    1};
    std::map<int, double> prior = {{0, 0.5}, {1, 0.5}};

    auto chosen = choiceWithProportion(conf, pred, prior);
    std::vector<int> expected = {0, 1, 2, 4, 5};
    BOOST_CHECK_EQUAL_COLLECTIONS(chosen.begin(), chosen.end(), expected.begin(), expected.end());

    // 跳过每个类别置信度最高的 extra 个
    auto skipped = choiceWithProportion(conf, pred, prior, 1);
    std::vector<int> expectedSkip = {1, 2, 3, 5};
    BOOST_CHECK_EQUAL_COLLECTIONS(skipped.begin(), skipped.end(),
                                  expectedSkip.begin(), expectedSkip.end());
}

BOOST_AUTO_TEST_CASE( test_normal_survival )
{
    BOOST_CHECK_CLOSE(normalSurvival(0.0, 0.0, 1.0), 0.5, 1e-9);
    BOOST_CHECK_CLOSE(normalSurvival(1.959964, 0.0, 1.0), 0.025, 1e-3);
    BOOST_CHECK_CLOSE(normalSurvival(3.0, 1.0, 2.0), normalSurvival(1.0, 0.0, 1.0), 1e-9);
    BOOST_CHECK_THROW(normalSurvival(0.0, 0.0, 0.0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE( test_kneighbors_graph )
{
    std::vector<double> X = {0.0, 1.0, 3.0};
    auto g = kneighborsGraph(X, 1, 1);
    BOOST_REQUIRE_EQUAL(g.size(), 3u);
    BOOST_CHECK_EQUAL(g[0][0].first, 1);
    BOOST_CHECK_EQUAL(g[0][0].second, 1.0);
    BOOST_CHECK_EQUAL(g[1][0].first, 0);
    BOOST_CHECK_EQUAL(g[2][0].first, 1);
    BOOST_CHECK_EQUAL(g[2][0].second, 2.0);
    BOOST_CHECK_THROW(kneighborsGraph(X, 1, 0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE( test_mutual_info_ranks_informative_feature )
{
    // 特征 0 决定类别，特征 1 为噪声
    std::mt19937 dataGen(5);
    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<double> X;
    std::vector<int> y;
    for (int i = 0; i < 120; ++i) {
        const int c = i % 2;
        X.push_back(c * 6.0 + noise(dataGen));
        X.push_back(noise(dataGen));
        y.push_back(c);
    }

    std::mt19937 gen(1);
    auto mi = mutualInfoClassif(X, 2, y, gen);
    BOOST_REQUIRE_EQUAL(mi.size(), 2u);
    BOOST_CHECK(mi[0] > mi[1]);
    BOOST_CHECK(mi[0] > 0.3);
    BOOST_CHECK(mi[1] >= 0.0);

    std::mt19937 again(1);
    auto mi2 = mutualInfoClassif(X, 2, y, again);
    BOOST_CHECK_EQUAL(mi[0], mi2[0]);
    BOOST_CHECK_EQUAL(mi[1], mi2[1]);
}

BOOST_AUTO_TEST_CASE( test_softmax_accuracy_rowmax )
{
    auto s = softmax({0.5, 0.5, 0.5, 0.5});
    for (double v : s) BOOST_CHECK_CLOSE(v, 0.25, 1e-9);
    auto t = softmax({1.0, 2.0});
    BOOST_CHECK_CLOSE(t[0] + t[1], 1.0, 1e-9);
    BOOST_CHECK(t[1] > t[0]);

    BOOST_CHECK_CLOSE(accuracyScore({1, 2, 3, 4}, {1, 2, 0, 4}), 75.0 / 100.0, 1e-9);
    BOOST_CHECK_THROW(accuracyScore({1}, {1, 2}), std::invalid_argument);

    std::vector<double> conf;
    std::vector<int> arg;
    rowMax({0.2, 0.8, 0.6, 0.4}, 2, conf, arg);
    BOOST_CHECK_EQUAL(arg[0], 1);
    BOOST_CHECK_EQUAL(arg[1], 0);
    BOOST_CHECK_CLOSE(conf[1], 0.6, 1e-9);
}
