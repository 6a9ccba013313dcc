/** test_engine_properties.cpp
    Behaviour shared by every engine plus the boundary cases of the individual algorithms.
*/

#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include "semi/EngineFactory.hpp"
#include "semi/CoTraining.hpp"
#include "semi/DemocraticCoLearning.hpp"
#include "semi/Rasco.hpp"
#include "semi/Setred.hpp"
#include "semi/TriTraining.hpp"
#include "classifier/DecisionTreeClassifier.hpp"
#include "classifier/GaussianNBClassifier.hpp"
#include "StubClassifier.hpp"
#include "TestData.hpp"

#include <boost/test/unit_test.hpp>
#include <stdexcept>

namespace {

// 所有引擎都能处理的二分类数据
struct BinaryData {
    std::vector<double> X;
    std::vector<int>    y;
    std::vector<int>    masked;

    BinaryData() {
        testdata::makeBlobs(80, 2, 4, 3.0, 0.8, 61, X, y);
        masked = testdata::keepFirstPerClass(y, 2, 6);
    }
};

} // namespace

BOOST_AUTO_TEST_CASE( test_every_engine_requires_fit )
{
    std::vector<double> X = {0.0, 1.0, 2.0, 3.0};
    for (const auto& name : engineNames()) {
        auto engine = createEngine(name);
        BOOST_CHECK_MESSAGE(!engine->isFitted(), name);
        BOOST_CHECK_THROW(engine->predictProba(X, 4), NotFittedError);
        BOOST_CHECK_THROW(engine->predict(X, 4), NotFittedError);
    }
    BOOST_CHECK_THROW(createEngine("label_propagation"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE( test_every_engine_is_deterministic )
{
    BinaryData d;
    for (const auto& name : engineNames()) {
        auto a = createEngine(name, "", 7);
        auto b = createEngine(name, "", 7);
        a->fit(d.X, 4, d.masked);
        b->fit(d.X, 4, d.masked);

        BOOST_CHECK_MESSAGE(a->isFitted(), name);
        BOOST_CHECK_MESSAGE(a->predictProba(d.X, 4) == b->predictProba(d.X, 4), name);
        BOOST_CHECK_MESSAGE((a->classes() == std::vector<int>{0, 1}), name);

        // 预测标签只来自训练时的类别
        for (int p : a->predict(d.X, 4)) BOOST_CHECK(p == 0 || p == 1);
    }
}

BOOST_AUTO_TEST_CASE( test_every_engine_accepts_a_base_estimator )
{
    BinaryData d;
    for (const auto& name : engineNames()) {
        auto engine = createEngine(name, "gnb", 3);
        engine->fit(d.X, 4, d.masked);
        std::vector<double> XH;
        std::vector<int> yH;
        testdata::hiddenRows(d.y, d.masked, 4, d.X, XH, yH);
        BOOST_CHECK_MESSAGE(engine->score(XH, 4, yH) > 0.8, name);
    }
}

BOOST_AUTO_TEST_CASE( test_tri_training_always_wrong_pair_stops )
{
    BinaryData d;
    TraceLog trace;
    TriTraining model(std::make_unique<FlippedClassifier>());
    model.fit(d.X, 4, d.masked, &trace);

    // 另外两个学习器的误差为 1.0，不低于初始的 0.5
    BOOST_CHECK_EQUAL(model.rounds(), 1);
    BOOST_CHECK_EQUAL(trace.count("iteration"), 0u);
}

BOOST_AUTO_TEST_CASE( test_setred_zero_threshold_never_accepts )
{
    BinaryData d;
    SetredConfig cfg;
    cfg.rejectionThreshold = 0.0;
    TraceLog trace;
    Setred model(nullptr, cfg);
    model.fit(d.X, 4, d.masked, &trace);

    BOOST_CHECK(model.acceptedIds().empty());
    BOOST_CHECK_EQUAL(trace.count("iteration"), static_cast<size_t>(cfg.maxIterations));
    for (const auto& e : trace.filter("iteration")) {
        BOOST_CHECK_EQUAL(e.value("accepted"), 0.0);
        BOOST_CHECK_EQUAL(e.value("labeled"), 12.0);
    }
}

BOOST_AUTO_TEST_CASE( test_rasco_incremental_at_most_one_per_class )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(120, 4, 4, 2.0, 1.0, 62, X, y);
    const auto masked = testdata::keepFirstPerClass(y, 4, 2);

    RascoConfig cfg;
    cfg.nEstimators = 6;
    cfg.maxIterations = -1;
    TraceLog trace;
    Rasco model(std::make_unique<GaussianNBClassifier>(), cfg);
    model.fit(X, 4, masked, &trace);

    double labeled = 8.0;
    for (const auto& e : trace.filter("iteration")) {
        BOOST_CHECK_LE(e.value("accepted"), 4.0);
        labeled += e.value("accepted");
        BOOST_CHECK_EQUAL(e.value("labeled"), labeled);
    }
    // 没有被预测到的类别会记录一条警告
    for (const auto& w : trace.filter("warning")) {
        BOOST_CHECK(w.message.find("not predicted") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE( test_co_training_one_positive_one_negative )
{
    BinaryData d;
    CoTrainingConfig cfg;
    cfg.positives = 1;
    cfg.negatives = 1;
    cfg.poolsize = 20;
    TraceLog trace;
    CoTraining model(std::make_unique<GaussianNBClassifier>(), nullptr, cfg);
    model.fit(d.X, 4, d.masked, &trace);

    BOOST_CHECK_EQUAL(model.positives(), 1);
    BOOST_CHECK_EQUAL(model.negatives(), 1);
    double labeled = 12.0;
    for (const auto& e : trace.filter("iteration")) {
        // 每个视图至多一正一负
        BOOST_CHECK_LE(e.value("positives"), 2.0);
        BOOST_CHECK_LE(e.value("negatives"), 2.0);
        BOOST_CHECK_LE(e.value("accepted"), 4.0);
        labeled += e.value("accepted");
        BOOST_CHECK_EQUAL(e.value("labeled"), labeled);
    }
}

BOOST_AUTO_TEST_CASE( test_democratic_agreement_means_single_round )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(60, 2, 2, 8.0, 0.3, 63, X, y);
    const auto masked = testdata::keepFirstPerClass(y, 2, 4);

    // 三个学习器在未标注集上完全一致：没有被误标的候选
    TraceLog trace;
    DemocraticCoLearning model(DemocraticCoLearning::makeClones(DecisionTreeClassifier(), 3, 1));
    model.fit(X, 2, masked, &trace);

    BOOST_CHECK_EQUAL(model.rounds(), 1);
    BOOST_CHECK_EQUAL(trace.count("iteration"), 0u);
    BOOST_CHECK_EQUAL(model.hypotheses().size(), 3u);
}

BOOST_AUTO_TEST_CASE( test_democratic_gate_rejects_noisy_expansion )
{
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(60, 2, 2, 8.0, 0.3, 42, X, y);
    const auto masked = testdata::keepFirstPerClass(y, 2, 6);

    // 两个多数类桩把加权投票拉向类别 0：GNB 在类别 1 的行上成为被"误标"的一方
    std::vector<std::unique_ptr<IClassifier>> est;
    est.push_back(std::make_unique<GaussianNBClassifier>());
    est.push_back(std::make_unique<StubClassifier>());
    est.push_back(std::make_unique<StubClassifier>());
    TraceLog trace;
    DemocraticCoLearning model(std::move(est));
    model.fit(X, 2, masked, &trace);

    const auto gates = trace.filter("iteration");
    BOOST_REQUIRE(!gates.empty());
    for (const auto& e : gates) {
        BOOST_CHECK_GT(e.value("candidates"), 0.0);
        BOOST_CHECK_LE(e.value("q_new"), e.value("q"));
        BOOST_CHECK_EQUAL(e.value("accepted"), 0.0);
    }
    BOOST_CHECK_EQUAL(model.rounds(), 1);
}

BOOST_AUTO_TEST_CASE( test_setred_zero_variance_follows_z_sign )
{
    // 每个点都有重复：近邻距离为 0，权重为 0，σ0 = 0 时 z = μ0 = 0
    std::vector<double> X;
    std::vector<int> y;
    for (int copy = 0; copy < 13; ++copy) {
        X.insert(X.end(), {0.0, 0.0});
        y.push_back(copy < 3 ? 0 : kUnlabeled);
        X.insert(X.end(), {5.0, 5.0});
        y.push_back(copy < 3 ? 1 : kUnlabeled);
    }

    SetredConfig cfg;
    cfg.rejectionThreshold = 1.0;
    cfg.maxIterations = 5;
    TraceLog trace;
    Setred model(nullptr, cfg);
    model.fit(X, 2, y, &trace);

    BOOST_CHECK(model.acceptedIds().empty());
    const auto its = trace.filter("iteration");
    BOOST_CHECK_EQUAL(its.size(), 5u);
    for (const auto& e : its) {
        BOOST_CHECK_GT(e.value("candidates"), 0.0);
        BOOST_CHECK_EQUAL(e.value("accepted"), 0.0);
    }
}

BOOST_AUTO_TEST_CASE( test_co_training_pseudo_labels_on_separable_data )
{
    // 类别 1 的两个特征都在 8 附近，类别 0 在 0 附近：x0 + x1 > 8 即为正类
    std::vector<double> X;
    std::vector<int> y;
    testdata::makeBlobs(80, 2, 2, 8.0, 0.3, 64, X, y);
    for (int& v : y) v = (v == 0) ? 3 : 9;
    std::vector<int> masked(y);
    for (size_t i = 8; i < masked.size(); ++i) masked[i] = kUnlabeled;

    CoTrainingConfig cfg;
    cfg.positives = 1;
    cfg.negatives = 1;
    cfg.poolsize = 20;
    CoTraining model(std::make_unique<GaussianNBClassifier>(), nullptr, cfg);
    model.fitWithFeatures(X, 2, masked, {0}, {1});

    const auto& ids = model.addedIds();
    const auto& labels = model.addedLabels();
    BOOST_REQUIRE_EQUAL(ids.size(), labels.size());
    BOOST_CHECK(!ids.empty());
    for (size_t k = 0; k < ids.size(); ++k) {
        const double s = X[ids[k] * 2] + X[ids[k] * 2 + 1];
        BOOST_CHECK_EQUAL(labels[k], s > 8.0 ? 9 : 3);
        BOOST_CHECK_EQUAL(labels[k], y[ids[k]]);
    }
}
