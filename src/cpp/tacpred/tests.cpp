#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "config.hpp"
#include "proof_state.hpp"
#include "ragged.hpp"

using tacpred::RaggedTensor;

namespace
{

constexpr float kInf = std::numeric_limits<float>::infinity();

} // namespace

TEST_CASE("fromDense and toDense agree on padded rows")
{
    auto dense = torch::tensor({1.0f, 2.0f, 0.0f, 3.0f, 0.0f, 0.0f}).reshape({2, 3});
    auto rows = RaggedTensor::fromDense(dense, torch::tensor({2, 1}, torch::kInt64));

    CHECK(rows.nrows() == 2);
    CHECK(rows.numValues() == 3);
    CHECK(torch::equal(rows.toDense(0.0), dense.slice(1, 0, 2)));
    CHECK(rows.toNestedFloat() == std::vector<std::vector<float>>{{1.0f, 2.0f}, {3.0f}});

    CHECK_THROWS_AS(RaggedTensor::fromDense(dense, torch::tensor({4, 0}, torch::kInt64)), std::invalid_argument);
}

TEST_CASE("toDense pads each ragged level with its own fill")
{
    // [batch, None(args), None(candidates)]
    auto scores = RaggedTensor::fromNested(std::vector<std::vector<std::vector<float>>>{
        {{1.0f, 2.0f}, {3.0f}},
        {},
    });
    REQUIRE(scores.raggedRank() == 2);

    auto dense = scores.toDense({0.0, -kInf}, {0, 4});
    REQUIRE(dense.sizes() == torch::IntArrayRef({2, 2, 4}));
    CHECK(dense[0][0][1].item<float>() == 2.0f);
    CHECK(std::isinf(dense[0][1][1].item<float>()));
    CHECK(dense[1][0][0].item<float>() == 0.0f);
}

TEST_CASE("gatherRows and tile keep the replicated row order")
{
    auto rows = RaggedTensor::fromNested(std::vector<std::vector<int64_t>>{{1, 2}, {}, {3}});

    auto picked = rows.gatherRows(torch::tensor({2, 0, 2}, torch::kInt64));
    CHECK(picked.toNestedInt() == std::vector<std::vector<int64_t>>{{3}, {1, 2}, {3}});

    auto tiled = rows.tile(2);
    CHECK(tiled.nrows() == 6);
    CHECK(tiled.toNestedInt() == std::vector<std::vector<int64_t>>{{1, 2}, {}, {3}, {1, 2}, {}, {3}});
}

TEST_CASE("segmentMaxArgmax takes the first maximum and handles empty rows")
{
    auto rows = RaggedTensor::fromNested(std::vector<std::vector<float>>{{1.0f, 3.0f, 3.0f}, {}, {-1.0f}});
    auto [max, argmax] = tacpred::segmentMaxArgmax(rows);

    CHECK(max[0].item<float>() == 3.0f);
    CHECK(std::isinf(max[1].item<float>()));
    CHECK(max[1].item<float>() < 0);
    CHECK(max[2].item<float>() == -1.0f);
    CHECK(argmax[0].item<int64_t>() == 1);
    CHECK(argmax[1].item<int64_t>() == 0);
    CHECK(argmax[2].item<int64_t>() == 0);
}

TEST_CASE("filterValid drops sentinel positions")
{
    auto labels = RaggedTensor::fromNested(std::vector<std::vector<int64_t>>{{1, -1}, {-1}, {0}});
    auto scores = RaggedTensor::fromNested(std::vector<std::vector<std::vector<float>>>{
        {{0.1f, 0.9f}, {0.5f}},
        {{0.3f, 0.7f}},
        {{0.2f, 0.3f, 0.4f}},
    });

    auto [valid_labels, valid_scores] = tacpred::filterValid(labels, scores);
    CHECK(valid_labels.toNestedInt() == std::vector<std::vector<int64_t>>{{1}, {}, {0}});
    REQUIRE(valid_scores.nrows() == 3);
    CHECK(torch::equal(valid_scores.rowLengths(), torch::tensor({1, 0, 1}, torch::kInt64)));
    CHECK(valid_scores.values().toNestedFloat() == std::vector<std::vector<float>>{{0.1f, 0.9f}, {0.2f, 0.3f, 0.4f}});
}

TEST_CASE("filterValid on an all-sentinel batch leaves empty rows")
{
    auto labels = RaggedTensor::fromNested(std::vector<std::vector<int64_t>>{{-1, -1}});
    auto scores = RaggedTensor::fromNested(std::vector<std::vector<std::vector<float>>>{{{0.5f}, {0.5f}}});

    auto [valid_labels, valid_scores] = tacpred::filterValid(labels, scores);
    CHECK(valid_labels.numValues() == 0);
    CHECK(valid_scores.values().nrows() == 0);
    CHECK(valid_scores.nrows() == 1);
}

TEST_CASE("gatherByLabel picks the labelled candidate")
{
    auto scores = RaggedTensor::fromNested(std::vector<std::vector<std::vector<float>>>{
        {{0.1f, 0.2f, 0.3f}, {0.4f}},
        {{0.5f, 0.6f}},
    });
    auto labels = RaggedTensor::fromNested(std::vector<std::vector<int64_t>>{{2, 0}, {1}});

    auto picked = tacpred::gatherByLabel(scores, labels);
    CHECK(picked.toNestedFloat() == std::vector<std::vector<float>>{{0.3f, 0.4f}, {0.6f}});
}

TEST_CASE("gatherByLabel rejects labels outside their row")
{
    auto scores = RaggedTensor::fromNested(std::vector<std::vector<std::vector<float>>>{{{0.1f, 0.2f}}});
    CHECK_THROWS_AS(tacpred::gatherByLabel(scores, RaggedTensor::fromNested(std::vector<std::vector<int64_t>>{{2}})),
                    std::out_of_range);
    CHECK_THROWS_AS(tacpred::gatherByLabel(scores, RaggedTensor::fromNested(std::vector<std::vector<int64_t>>{{-1}})),
                    std::out_of_range);
}

TEST_CASE("task config reads required and optional keys")
{
    const std::string json = R"({
        "prediction_task_type": "global_argument_prediction",
        "hidden_size": 8,
        "tactic_embedding_size": 4,
        "dynamic_global_context": true,
        "arguments_loss_coefficient": 0.5,
        "query_key_method": "ragged_to_dense_to_ragged"
    })";

    auto config = tacpred::TaskConfig::fromJson(json);
    CHECK(config.kind == tacpred::TaskKind::GLOBAL_ARGUMENT);
    CHECK(config.hidden_size == 8);
    CHECK(config.tactic_embedding_size == 4);
    CHECK(config.dynamic_global_context);
    CHECK(!config.global_cosine_similarity);
    CHECK(!config.sum_loss_over_tactic);
    CHECK(config.arguments_loss_coefficient == doctest::Approx(0.5F));
    CHECK(config.query_key_method == tacpred::QueryKeyMethod::RAGGED_TO_DENSE_TO_RAGGED);
}

TEST_CASE("task config rejects unknown names and missing keys")
{
    CHECK_THROWS_WITH_AS(tacpred::parseTaskKind("tactic_and_everything"),
                         "tactic_and_everything is not a valid prediction task type", std::invalid_argument);
    CHECK_THROWS_AS(tacpred::parseQueryKeyMethod("outer_product"), std::invalid_argument);
    CHECK_THROWS_AS(tacpred::TaskConfig::fromJson(R"({"prediction_task_type": "base_tactic_prediction"})"),
                    std::runtime_error);
    CHECK_THROWS_AS(tacpred::TaskConfig::fromJson(R"({"prediction_task_type": "base_tactic_prediction",
                                                     "hidden_size": 0, "tactic_embedding_size": 4})"),
                    std::invalid_argument);
}

TEST_CASE("graph constants validate the arity table")
{
    auto constants = tacpred::GraphConstants::fromJson(R"({
        "tactic_num": 3,
        "node_label_num": 10,
        "tactic_index_to_numargs": [0, 2, 1],
        "global_context": [7, 8]
    })");
    CHECK(constants.maxArguments() == 2);
    CHECK(constants.globalContextSize() == 2);

    CHECK_THROWS_AS(tacpred::GraphConstants::fromJson(R"({"tactic_num": 3, "node_label_num": 10,
                                                          "tactic_index_to_numargs": [0, 2]})"),
                    std::invalid_argument);
    CHECK_THROWS_AS(tacpred::GraphConstants::fromJson(R"({"tactic_num": 1, "node_label_num": 4,
                                                          "tactic_index_to_numargs": [0],
                                                          "global_context": [4]})"),
                    std::invalid_argument);
}

TEST_CASE("graph constants reject malformed arrays")
{
    CHECK_THROWS_WITH_AS(tacpred::GraphConstants::fromJson(R"({"tactic_num": 2, "node_label_num": 4,
                                                               "tactic_index_to_numargs": [0, 1 )"),
                         "Unterminated array for config key: tactic_index_to_numargs", std::runtime_error);
    CHECK_THROWS_WITH_AS(tacpred::GraphConstants::fromJson(R"({"tactic_num": 3, "node_label_num": 4,
                                                               "tactic_index_to_numargs": [0 1 2]})"),
                         "Expected ',' or ']' in array for config key: tactic_index_to_numargs",
                         std::runtime_error);

    auto constants = tacpred::GraphConstants::fromJson(R"({"tactic_num": 1, "node_label_num": 4,
                                                           "tactic_index_to_numargs": [ 0 ],
                                                           "global_context": []})");
    CHECK(constants.tactic_index_to_numargs == std::vector<int64_t>{0});
    CHECK(constants.globalContextSize() == 0);
}

TEST_CASE("batch lowers arguments into local and global label rows")
{
    tacpred::ProofState restricted;
    restricted.tactic = 1;
    restricted.node_labels = {4, 5, 6};
    restricted.local_context = {2, 0};
    restricted.global_context_ids = std::vector<int64_t>{5, 2, 9};
    restricted.arguments = {tacpred::LocalRef{1}, tacpred::GlobalRef{9}, tacpred::MissingArgument{}};

    tacpred::ProofState open;
    open.tactic = 0;
    open.node_labels = {1};

    tacpred::Batch batch({restricted, open});
    auto tensors = batch.toTensors(10);

    CHECK(tensors.batchSize() == 2);
    CHECK(tensors.local_arguments.toNestedInt() == std::vector<std::vector<int64_t>>{{1, -1, -1}, {}});
    // global labels are positions within the available ids
    CHECK(tensors.global_arguments.toNestedInt() == std::vector<std::vector<int64_t>>{{-1, 2, -1}, {}});
    CHECK(tensors.local_context_ids.toNestedInt() == std::vector<std::vector<int64_t>>{{2, 0}, {}});
    auto available = tensors.global_context_ids.toNestedInt();
    CHECK(available[0] == std::vector<int64_t>{5, 2, 9});
    CHECK(available[1].size() == 10);
}

TEST_CASE("batch rejects arguments outside their pools")
{
    tacpred::ProofState state;
    state.tactic = 0;
    state.node_labels = {3, 4};
    state.local_context = {0, 1};

    SUBCASE("local index past the local context")
    {
        state.arguments = {tacpred::LocalRef{2}};
        CHECK_THROWS_AS(tacpred::Batch({state}).toTensors(10), std::invalid_argument);
    }
    SUBCASE("global id that is not available")
    {
        state.global_context_ids = std::vector<int64_t>{1, 2};
        state.arguments = {tacpred::GlobalRef{3}};
        CHECK_THROWS_AS(tacpred::Batch({state}).toTensors(10), std::invalid_argument);
    }
    SUBCASE("available id listed twice")
    {
        state.global_context_ids = std::vector<int64_t>{1, 1};
        CHECK_THROWS_WITH_AS(tacpred::Batch({state}).toTensors(10), "proof state 0: global id 1 listed twice",
                             std::invalid_argument);
    }
    SUBCASE("available id outside the vocabulary")
    {
        state.global_context_ids = std::vector<int64_t>{10};
        CHECK_THROWS_AS(tacpred::Batch({state}).toTensors(10), std::invalid_argument);
    }
    SUBCASE("local context node outside the graph")
    {
        state.local_context = {5};
        CHECK_THROWS_AS(tacpred::Batch({state}).toTensors(10), std::invalid_argument);
    }
}
