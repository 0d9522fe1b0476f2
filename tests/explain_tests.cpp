#include "TestFixtures.hpp"

#include "fraudshield/explain/ExplanationGenerator.hpp"
#include "fraudshield/explain/ShapleyEngine.hpp"

#include <boost/test/unit_test.hpp>

#include <numeric>

using namespace fraudshield;
using namespace fraudshield::test;

namespace {

// Splits on amount and device, with an interaction on hour.
std::shared_ptr<const StaticRiskScorer> interactingScorer() {
    Tree a;
    a.nodes = {
        TreeNode{0, 0.1, 1, 2, true, 0.0},
        TreeNode{-1, 0.0, -1, -1, true, -0.6},
        TreeNode{1, 0.2, 3, 4, true, 0.0},
        TreeNode{-1, 0.0, -1, -1, true, 1.4},
        TreeNode{-1, 0.0, -1, -1, true, 0.5},
    };
    Tree b;
    b.nodes = {
        TreeNode{3, 0.5, 1, 2, true, 0.0},
        TreeNode{-1, 0.0, -1, -1, true, 0.8},
        TreeNode{-1, 0.0, -1, -1, true, -0.3},
    };
    return std::make_shared<const StaticRiskScorer>(
        std::make_shared<const TreeEnsemble>(std::vector<Tree>{a, b}, 4, -1.0));
}

const FeatureVector kRisky{0.45, 0.1, 0.0, 0.0};

RuleOutcome unknownDevice() {
    RuleOutcome rule;
    rule.rule = "Unknown Device";
    rule.description = "transaction from an unrecognised device";
    rule.triggered = true;
    rule.floor = 0.95;
    return rule;
}

// Textbook Shapley value of one player: sum over coalitions S without i of
// |S|! (n-|S|-1)! / n! * (f(S + i) - f(S)).
double referenceShapley(int n, int index, const ShapleyEngine::ValueFn& f) {
    auto factorial = [](int k) {
        double r = 1.0;
        for (int j = 2; j <= k; ++j) r *= j;
        return r;
    };

    double sum = 0.0;
    for (uint32_t m = 0; m < (1u << n); ++m) {
        if (m & (1u << index)) continue;

        std::vector<bool> without(n, false);
        int size = 0;
        for (int i = 0; i < n; ++i) {
            without[i] = (m >> i) & 1u;
            size += without[i] ? 1 : 0;
        }
        std::vector<bool> with = without;
        with[index] = true;

        const double w = factorial(size) * factorial(n - size - 1) / factorial(n);
        sum += w * (f(with) - f(without));
    }
    return sum;
}

}

BOOST_AUTO_TEST_SUITE(explain_tests)

BOOST_AUTO_TEST_CASE(exact_attributions_sum_to_score_gap)
{
    auto scorer = interactingScorer();
    auto params = smallParams();
    ExplanationGenerator gen(scorer, params);

    const auto phi = gen.featureAttributions(kRisky);
    const double sum = std::accumulate(phi.begin(), phi.end(), 0.0);
    const double gap = scorer->probability(kRisky) - scorer->probability(params->baseline());

    BOOST_CHECK_SMALL(sum - gap, 1e-12);
    // time_since_last is never split on
    BOOST_CHECK_SMALL(phi[2], 1e-15);
}

BOOST_AUTO_TEST_CASE(sampled_attributions_sum_to_score_gap)
{
    auto scorer = interactingScorer();
    auto params = smallParams();
    ExplanationConfig cfg;
    cfg.max_exact_features = 2;
    cfg.sample_permutations = 64;
    ExplanationGenerator gen(scorer, params, cfg);

    const auto phi = gen.featureAttributions(kRisky);
    const double sum = std::accumulate(phi.begin(), phi.end(), 0.0);
    const double gap = scorer->probability(kRisky) - scorer->probability(params->baseline());
    BOOST_CHECK_SMALL(sum - gap, 1e-12);

    // fixed seed, fixed answer
    const auto again = gen.featureAttributions(kRisky);
    for (std::size_t i = 0; i < phi.size(); ++i) {
        BOOST_CHECK_EQUAL(phi[i], again[i]);
    }
}

BOOST_AUTO_TEST_CASE(single_player_matches_full_enumeration)
{
    ShapleyEngine engine;
    auto f = [](const std::vector<bool>& m) {
        // x0 * x1 + 2 * x2
        return (m[0] && m[1] ? 1.0 : 0.0) + (m[2] ? 2.0 : 0.0);
    };

    const auto all = engine.computeAllExact(3, f);
    BOOST_CHECK_CLOSE(all[0], 0.5, 1e-9);
    BOOST_CHECK_CLOSE(all[1], 0.5, 1e-9);
    BOOST_CHECK_CLOSE(all[2], 2.0, 1e-9);

    for (int i = 0; i < 3; ++i) {
        BOOST_CHECK_CLOSE(referenceShapley(3, i, f), all[i], 1e-9);
    }
}

BOOST_AUTO_TEST_CASE(rules_merge_and_rank)
{
    ExplanationConfig cfg;
    cfg.top_k = 3;
    ExplanationGenerator gen(interactingScorer(), smallParams(), cfg);

    const auto factors = gen.explain(kRisky, {unknownDevice()});
    BOOST_REQUIRE(!factors.empty());
    BOOST_CHECK(factors.size() <= 3u);
    BOOST_CHECK_EQUAL(factors[0].name, "Unknown Device");
    BOOST_CHECK_CLOSE(factors[0].value, 0.95, 1e-9);

    for (std::size_t i = 1; i < factors.size(); ++i) {
        BOOST_CHECK(std::fabs(factors[i - 1].value) >= std::fabs(factors[i].value));
    }
}

BOOST_AUTO_TEST_CASE(constant_model_yields_only_rules)
{
    ExplanationGenerator gen(
        std::make_shared<const StaticRiskScorer>(constantTree(0.2)), smallParams());
    BOOST_CHECK(gen.explain(kRisky, {}).empty());

    const auto factors = gen.explain(kRisky, {unknownDevice()});
    BOOST_REQUIRE_EQUAL(factors.size(), 1u);
    BOOST_CHECK_EQUAL(factors[0].name, "Unknown Device");
}

BOOST_AUTO_TEST_CASE(attribution_failure_keeps_rules)
{
    ExplanationGenerator gen(interactingScorer(), smallParams());
    std::vector<FactorAttribution> out;

    BOOST_CHECK_NO_THROW(out = gen.explain(FeatureVector{1.0, 2.0}, {}));
    BOOST_CHECK(out.empty());

    BOOST_CHECK_NO_THROW(out = gen.explain(FeatureVector{1.0, 2.0}, {unknownDevice()}));
    BOOST_REQUIRE_EQUAL(out.size(), 1u);
    BOOST_CHECK_EQUAL(out[0].name, "Unknown Device");
    BOOST_CHECK_CLOSE(out[0].value, 0.95, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
