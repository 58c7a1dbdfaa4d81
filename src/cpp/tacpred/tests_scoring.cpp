#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "candidates.hpp"
#include "inference.hpp"
#include "losses.hpp"
#include "metrics.hpp"
#include "config.hpp"
#include "normalizer.hpp"
#include "ragged.hpp"

using tacpred::RaggedTensor;

namespace
{

constexpr float kInf = std::numeric_limits<float>::infinity();

using Rows3 = std::vector<std::vector<std::vector<float>>>;
using Rows2 = std::vector<std::vector<int64_t>>;

double probabilityMass(const tacpred::NormalizedScores& scores)
{
    return (scores.local.exp().sum() + scores.global.exp().sum()).item<double>();
}

} // namespace

// ============================================================================
// Joint normalization
// ============================================================================

TEST_CASE("joint normalization gives one distribution per slot")
{
    auto local = torch::tensor({1.0f, 2.0f, 3.0f}).reshape({1, 1, 3});
    auto global = torch::tensor({0.5f, -1.0f, 2.0f, 4.0f}).reshape({1, 1, 4});

    auto scores = tacpred::normalizeJointly(local, global);
    CHECK(scores.local.sizes() == local.sizes());
    CHECK(scores.global.sizes() == global.sizes());
    CHECK(probabilityMass(scores) == doctest::Approx(1.0).epsilon(1e-5));
    // the shift is shared, so differences within a pool are kept
    CHECK((scores.local[0][0][2] - scores.local[0][0][1]).item<float>() == doctest::Approx(1.0F));
}

TEST_CASE("joint normalization is stable for large scores")
{
    auto local = torch::tensor({1000.0f, 999.0f}).reshape({1, 1, 2});
    auto global = torch::tensor({998.0f}).reshape({1, 1, 1});

    auto scores = tacpred::normalizeJointly(local, global);
    CHECK(!scores.local.isnan().any().item<bool>());
    CHECK(probabilityMass(scores) == doctest::Approx(1.0).epsilon(1e-5));
}

TEST_CASE("unavailable global entries get zero probability")
{
    auto ids = RaggedTensor::fromNested(Rows2{{0, 2}});
    auto mask = tacpred::globalAvailabilityMask(ids, 4);
    REQUIRE(mask.sizes() == torch::IntArrayRef({1, 4}));
    CHECK(mask[0][0].item<float>() == 0.0f);
    CHECK(std::isinf(mask[0][1].item<float>()));

    auto local = torch::tensor({0.3f}).reshape({1, 1, 1});
    auto global = torch::tensor({1.0f, 5.0f, 2.0f, 7.0f}).reshape({1, 1, 4}) + mask.unsqueeze(1);

    auto scores = tacpred::normalizeJointly(local, global);
    auto probs = scores.global.exp();
    CHECK(probs[0][0][1].item<float>() == 0.0f);
    CHECK(probs[0][0][3].item<float>() == 0.0f);
    CHECK(probabilityMass(scores) == doctest::Approx(1.0).epsilon(1e-5));

    CHECK_THROWS_AS(tacpred::globalAvailabilityMask(RaggedTensor::fromNested(Rows2{{4}}), 4), std::out_of_range);
}

TEST_CASE("a slot without candidates gets -inf instead of NaN")
{
    auto local = torch::full({1, 1, 2}, -kInf);
    auto global = torch::full({1, 1, 1}, -kInf);

    auto scores = tacpred::normalizeJointly(local, global);
    CHECK(!scores.local.isnan().any().item<bool>());
    CHECK(!scores.global.isnan().any().item<bool>());
    CHECK(std::isinf(scores.local[0][0][0].item<float>()));

    auto empty = tacpred::normalizeJointly(torch::zeros({2, 1, 0}), torch::zeros({2, 1, 0}));
    CHECK(empty.local.numel() == 0);
    CHECK(empty.global.numel() == 0);
}

TEST_CASE("joint normalization has finite gradients on empty slots")
{
    auto local = torch::tensor({1.0f, -kInf}).reshape({1, 2, 1}).requires_grad_(true);
    auto global = torch::full({1, 2, 1}, -kInf).requires_grad_(true);

    auto scores = tacpred::normalizeJointly(local, global);
    scores.local[0][0][0].backward();
    CHECK(!local.grad().isnan().any().item<bool>());
}

TEST_CASE("ragged joint normalization matches per-slot distributions")
{
    auto local = RaggedTensor::fromNested(Rows3{{{1.0f, 2.0f}, {}}, {{0.5f}}});
    auto global = RaggedTensor::fromNested(Rows3{{{0.0f}, {}}, {{}}});

    auto [l, g] = tacpred::normalizeJointly(local, global);
    CHECK(torch::equal(l.values().rowSplits(), local.values().rowSplits()));
    CHECK(torch::equal(g.values().rowSplits(), global.values().rowSplits()));

    auto lv = l.values().toNestedFloat();
    auto gv = g.values().toNestedFloat();
    const double slot0 = std::exp(lv[0][0]) + std::exp(lv[0][1]) + std::exp(gv[0][0]);
    CHECK(slot0 == doctest::Approx(1.0).epsilon(1e-5));
    CHECK(lv[2][0] == doctest::Approx(0.0F));

    auto dense = tacpred::normalizeJointly(torch::tensor({1.0f, 2.0f}).reshape({1, 1, 2}),
                                           torch::tensor({0.0f}).reshape({1, 1, 1}));
    CHECK(lv[0][1] == doctest::Approx(dense.local[0][0][1].item<float>()));
}

// ============================================================================
// Losses
// ============================================================================

TEST_CASE("argument loss aggregation policies")
{
    const float a = -std::log(0.5f);
    const float b = -std::log(0.75f);
    auto labels = RaggedTensor::fromNested(Rows2{{0, 1}, {-1}});
    auto scores = RaggedTensor::fromNested(Rows3{
        {{std::log(0.5f), std::log(0.5f)}, {std::log(0.25f), std::log(0.75f)}},
        {{0.0f}},
    });

    auto summed = tacpred::argumentLoss(labels, scores, tacpred::AggregationPolicy::SUM_OVER_SEQUENCE);
    REQUIRE(summed.size(0) == 2);
    CHECK(summed[0].item<float>() == doctest::Approx(a + b));
    CHECK(summed[1].item<float>() == 0.0f);

    auto flat = tacpred::argumentLoss(labels, scores, tacpred::AggregationPolicy::FLAT);
    REQUIRE(flat.size(0) == 2);
    CHECK(flat[0].item<float>() == doctest::Approx(a));
    CHECK(flat[1].item<float>() == doctest::Approx(b));
}

TEST_CASE("all-sentinel labels give an empty loss")
{
    auto labels = RaggedTensor::fromNested(Rows2{{-1, -1}});
    auto scores = RaggedTensor::fromNested(Rows3{{{0.0f}, {0.0f}}});

    auto flat = tacpred::argumentLoss(labels, scores, tacpred::AggregationPolicy::FLAT);
    CHECK(flat.numel() == 0);
    CHECK(tacpred::meanLoss(flat).item<float>() == 0.0f);

    auto local = tacpred::localArgumentLoss(labels, torch::zeros({1, 2, 3}));
    CHECK(local.numel() == 0);
}

TEST_CASE("local argument loss is cross-entropy over unnormalized scores")
{
    auto labels = RaggedTensor::fromNested(Rows2{{1}});
    auto loss = tacpred::localArgumentLoss(labels, torch::zeros({1, 1, 2}));
    REQUIRE(loss.numel() == 1);
    CHECK(loss[0].item<float>() == doctest::Approx(std::log(2.0f)));
}

TEST_CASE("tactic loss and the weighted total")
{
    auto logits = torch::tensor({0.0f, 0.0f, 0.0f, 0.0f}).reshape({1, 4});
    auto loss = tacpred::tacticLoss(logits, torch::tensor({2}, torch::kInt64));
    CHECK(loss[0].item<float>() == doctest::Approx(std::log(4.0f)));

    CHECK(tacpred::definitionNormSquaredLoss(torch::tensor({3.0f, 4.0f}).reshape({1, 2}))[0].item<float>()
          == doctest::Approx(25.0F));

    std::map<std::string, torch::Tensor> losses{{"a", torch::tensor({1.0f, 3.0f})}, {"b", torch::zeros({0})}};
    std::map<std::string, float> weights{{"a", 2.0f}, {"b", 5.0f}};
    CHECK(tacpred::weightedLoss(losses, weights).item<float>() == doctest::Approx(4.0F));
    CHECK_THROWS_AS(tacpred::weightedLoss({}, weights), std::invalid_argument);
}

// ============================================================================
// Metrics
// ============================================================================

TEST_CASE("strict sequence accuracy needs the right pool at every slot")
{
    auto local_labels = RaggedTensor::fromNested(Rows2{{3, -1}});
    auto global_labels = RaggedTensor::fromNested(Rows2{{-1, 7}});

    std::vector<float> global_slot0(10, -6.0f);
    global_slot0[0] = -5.0f;
    std::vector<float> global_slot1(10, -6.0f);
    global_slot1[7] = -0.2f;
    auto global_scores = RaggedTensor::fromNested(Rows3{{global_slot0, global_slot1}});

    SUBCASE("local then global")
    {
        auto local_scores = RaggedTensor::fromNested(Rows3{{
            {-3.0f, -3.0f, -3.0f, -0.1f, -3.0f},
            {-5.0f, -5.0f, -5.0f, -5.0f, -5.0f},
        }});
        auto acc = tacpred::globalSequenceAccuracy(local_labels, local_scores, global_labels, global_scores);
        CHECK(acc[0].item<float>() == 1.0f);
    }
    SUBCASE("second slot predicted from the wrong pool")
    {
        auto local_scores = RaggedTensor::fromNested(Rows3{{
            {-3.0f, -3.0f, -3.0f, -0.1f, -3.0f},
            {-0.1f, -5.0f, -5.0f, -5.0f, -5.0f},
        }});
        auto acc = tacpred::globalSequenceAccuracy(local_labels, local_scores, global_labels, global_scores);
        CHECK(acc[0].item<float>() == 0.0f);
    }
}

TEST_CASE("a missing argument is never counted correct")
{
    auto local_labels = RaggedTensor::fromNested(Rows2{{-1}, {}});
    auto global_labels = RaggedTensor::fromNested(Rows2{{-1}, {}});
    auto local_scores = RaggedTensor::fromNested(Rows3{{{0.0f}}, {}});
    auto global_scores = RaggedTensor::fromNested(Rows3{{{-1.0f}}, {}});

    auto acc = tacpred::globalSequenceAccuracy(local_labels, local_scores, global_labels, global_scores);
    CHECK(acc[0].item<float>() == 0.0f);
    CHECK(acc[1].item<float>() == 1.0f); // no arguments
}

TEST_CASE("local sequence accuracy")
{
    auto labels = RaggedTensor::fromNested(Rows2{{1, 0}, {0, -1}, {}});
    auto dense = torch::zeros({3, 2, 2});
    dense[0][0][1] = 1.0f;
    dense[0][1][0] = 1.0f;
    dense[1][0][0] = 1.0f;

    auto acc = tacpred::localSequenceAccuracy(labels, dense);
    CHECK(acc[0].item<float>() == 1.0f);
    CHECK(acc[1].item<float>() == 0.0f);
    CHECK(acc[2].item<float>() == 1.0f);
}

TEST_CASE("argument accuracy skips sentinels")
{
    tacpred::ArgumentAccuracy accuracy("global_arguments_logits_accuracy");
    auto labels = RaggedTensor::fromNested(Rows2{{1, -1}, {0}});
    auto scores = RaggedTensor::fromNested(Rows3{{{0.1f, 0.9f}, {0.5f}}, {{0.2f, 0.3f, 0.1f}}});

    accuracy.update(labels, scores);
    CHECK(accuracy.count() == 2);
    CHECK(accuracy.result() == doctest::Approx(0.5));
}

TEST_CASE("tactic accuracy compares the arg-max")
{
    auto logits = torch::tensor({0.1f, 0.9f, 0.8f, 0.2f}).reshape({2, 2});
    auto acc = tacpred::tacticAccuracy(torch::tensor({1, 1}, torch::kInt64), logits);
    CHECK(acc[0].item<float>() == 1.0f);
    CHECK(acc[1].item<float>() == 0.0f);
}

TEST_CASE("metric callbacks reset running values")
{
    tacpred::MeanMetric mean("arguments_seq_accuracy");
    tacpred::SparseCategoricalAccuracy accuracy;
    CHECK(accuracy.name() == "accuracy");

    mean.update(torch::tensor({1.0f, 0.0f}));
    accuracy.update(torch::tensor({0}, torch::kInt64), torch::tensor({2.0f, 1.0f}).reshape({1, 2}));
    CHECK(mean.result() == doctest::Approx(0.5));
    CHECK(accuracy.result() == doctest::Approx(1.0));

    tacpred::MetricsCallback callbacks({&mean, &accuracy});
    callbacks.onEpochBegin(1);
    CHECK(mean.count() == 0);
    CHECK(mean.result() == 0.0);
    CHECK(accuracy.result() == 0.0);
}

// ============================================================================
// Similarity
// ============================================================================

TEST_CASE("both query-key methods give the same scores")
{
    auto queries = RaggedTensor::fromNested(Rows3{{{1.0f, 0.0f}, {0.0f, 1.0f}}, {{1.0f, 1.0f}}});
    auto keys = RaggedTensor::fromNested(Rows3{{{1.0f, 2.0f}, {3.0f, 4.0f}, {5.0f, 6.0f}}, {}});

    auto broadcast = tacpred::queryKeyMul(queries, keys, tacpred::QueryKeyMethod::BROADCAST_RAGGED);
    auto dense = tacpred::queryKeyMul(queries, keys, tacpred::QueryKeyMethod::RAGGED_TO_DENSE_TO_RAGGED);

    auto expected = std::vector<std::vector<float>>{{1.0f, 3.0f, 5.0f}, {2.0f, 4.0f, 6.0f}, {}};
    CHECK(broadcast.values().toNestedFloat() == expected);
    CHECK(dense.values().toNestedFloat() == expected);
    CHECK(torch::equal(broadcast.rowSplits(), dense.rowSplits()));
}

TEST_CASE("unit normalization leaves zero vectors at zero")
{
    auto x = tacpred::unitNormalize(torch::tensor({3.0f, 4.0f, 0.0f, 0.0f}).reshape({2, 2}));
    CHECK(x[0][0].item<float>() == doctest::Approx(0.6F));
    CHECK(x[0][1].item<float>() == doctest::Approx(0.8F));
    CHECK(x[1][0].item<float>() == 0.0f);
    CHECK(!x.isnan().any().item<bool>());
}

// ============================================================================
// Inference expansion
// ============================================================================

TEST_CASE("top-K never returns a masked tactic")
{
    tacpred::InferenceExpander expander(3);
    auto logits = torch::tensor({1.0f, 5.0f, 100.0f, 2.0f, 3.0f}).reshape({1, 5});
    auto mask = torch::tensor({1, 1, 0, 1, 1}, torch::kInt64).reshape({1, 5}) != 0;

    auto [indices, logprobs] = expander.topKTactics(logits, mask);
    REQUIRE(indices.sizes() == torch::IntArrayRef({1, 3}));
    CHECK(indices[0][0].item<int64_t>() == 1);
    CHECK(indices[0][1].item<int64_t>() == 4);
    CHECK(indices[0][2].item<int64_t>() == 3);
    CHECK(logprobs[0][0].item<float>() >= logprobs[0][1].item<float>());
    CHECK(logprobs[0][1].item<float>() >= logprobs[0][2].item<float>());

    CHECK_THROWS_AS(tacpred::InferenceExpander(0), std::invalid_argument);
    CHECK_THROWS_AS(tacpred::InferenceExpander(6).topKTactics(logits, mask), std::invalid_argument);
}

TEST_CASE("top-K pads with -inf when too few tactics are permitted")
{
    tacpred::InferenceExpander expander(2);
    auto mask = torch::tensor({0, 1, 0}, torch::kInt64).reshape({1, 3}) != 0;
    auto [indices, logprobs] = expander.topKTactics(torch::zeros({1, 3}), mask);

    CHECK(indices[0][0].item<int64_t>() == 1);
    CHECK(logprobs[0][0].item<float>() == doctest::Approx(0.0F));
    CHECK(std::isinf(logprobs[0][1].item<float>()));
}

TEST_CASE("hypotheses are laid out hypothesis-major")
{
    tacpred::InferenceExpander expander(2);
    auto top_k = torch::tensor({10, 11, 20, 21}, torch::kInt64).reshape({2, 2});
    auto flat = expander.flattenHypotheses(top_k);
    CHECK(torch::equal(flat, torch::tensor({10, 20, 11, 21}, torch::kInt64)));

    auto dense = torch::arange(4, torch::kFloat32).reshape({4, 1, 1});
    auto unflat = expander.unflatten(dense);
    REQUIRE(unflat.sizes() == torch::IntArrayRef({2, 2, 1, 1}));
    CHECK(unflat[1][0][0][0].item<float>() == 2.0f);
}

TEST_CASE("available globals are gathered in listed order")
{
    tacpred::InferenceExpander expander(1);
    auto logits = torch::tensor({0.0f, 1.0f, 2.0f, 3.0f, 4.0f, 5.0f}).reshape({1, 2, 1, 3});
    auto ids = RaggedTensor::fromNested(Rows2{{2, 0}, {1}});

    auto gathered = expander.gatherAvailableGlobal(logits, ids);
    REQUIRE(gathered.sizes() == torch::IntArrayRef({1, 2, 1, 2}));
    CHECK(gathered[0][0][0][0].item<float>() == 2.0f);
    CHECK(gathered[0][0][0][1].item<float>() == 0.0f);
    CHECK(gathered[0][1][0][0].item<float>() == 4.0f);
    CHECK(std::isinf(gathered[0][1][0][1].item<float>()));
}

TEST_CASE("segment sums over value rows")
{
    auto sums = tacpred::segmentSum(torch::tensor({1.0f, 2.0f, 4.0f}), torch::tensor({0, 0, 2}, torch::kInt64), 3);
    CHECK(sums[0].item<float>() == 3.0f);
    CHECK(sums[1].item<float>() == 0.0f);
    CHECK(sums[2].item<float>() == 4.0f);
}

TEST_CASE("dense scores pad arguments with 0 and candidates with -inf")
{
    auto scores = RaggedTensor::fromNested(Rows3{{{1.0f}}, {{2.0f, 3.0f}, {4.0f}}});
    auto dense = tacpred::scoresToDense(scores, 3);

    REQUIRE(dense.sizes() == torch::IntArrayRef({2, 2, 3}));
    CHECK(dense[0][0][0].item<float>() == 1.0f);
    CHECK(std::isinf(dense[0][0][2].item<float>()));
    CHECK(dense[0][1][0].item<float>() == 0.0f);
    CHECK(dense[1][1][0].item<float>() == 4.0f);
}

TEST_CASE("tactic masks")
{
    tacpred::GraphConstants constants;
    constants.tactic_num = 3;
    constants.node_label_num = 1;
    constants.tactic_index_to_numargs = {0, 2, 1};

    auto only = tacpred::tacticOnlyMask(constants, 2);
    REQUIRE(only.sizes() == torch::IntArrayRef({2, 3}));
    CHECK(only[1][0].item<bool>());
    CHECK(!only[1][1].item<bool>());

    auto no_context = torch::tensor({1, 0}, torch::kInt64) != 0;
    auto context = tacpred::contextTacticMask(constants, no_context);
    CHECK(context.sum().item<int64_t>() == 4);
    CHECK(!context[0][2].item<bool>());
    CHECK(context[1][2].item<bool>());

    auto permitted = torch::tensor({1, 1, 0}, torch::kInt64) != 0;
    auto combined = tacpred::combineTacticMasks(context, permitted);
    CHECK(combined.sum().item<int64_t>() == 3);
    CHECK(!combined[1][2].item<bool>());

    CHECK(torch::equal(tacpred::combineTacticMasks(context, torch::Tensor()), context));
    CHECK_THROWS_AS(tacpred::combineTacticMasks(context, torch::ones({4}, torch::kBool)), std::invalid_argument);
}
