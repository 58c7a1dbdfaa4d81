#include <doctest/doctest.h>

#include <cmath>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "candidates.hpp"
#include "config.hpp"
#include "encoder.hpp"
#include "losses.hpp"
#include "predictor.hpp"
#include "proof_state.hpp"
#include "task.hpp"

using tacpred::GlobalRef;
using tacpred::LocalRef;
using tacpred::MissingArgument;
using tacpred::ProofState;
using tacpred::TaskKind;

namespace
{

// 5 tactics: 0 and 3 take no arguments, 1 and 4 take one, 2 takes two.
tacpred::GraphConstants smallConstants()
{
    tacpred::GraphConstants constants;
    constants.tactic_num = 5;
    constants.node_label_num = 12;
    constants.tactic_index_to_numargs = {0, 1, 2, 0, 1};
    constants.global_context = {8, 9, 10, 11};
    return constants;
}

tacpred::TaskConfig smallConfig(TaskKind kind)
{
    tacpred::TaskConfig config;
    config.kind = kind;
    config.hidden_size = 8;
    config.tactic_embedding_size = 4;
    config.dynamic_global_context = true;
    return config;
}

ProofState makeState(int64_t tactic, std::vector<int64_t> nodes, std::vector<int64_t> local,
                     std::vector<tacpred::ArgumentTarget> arguments)
{
    ProofState state;
    state.tactic = tactic;
    state.node_labels = std::move(nodes);
    state.local_context = std::move(local);
    state.arguments = std::move(arguments);
    return state;
}

// Local, global, restricted-global and missing arguments, plus a state without any.
tacpred::Batch mixedBatch()
{
    ProofState s0 = makeState(2, {0, 1, 2, 3}, {1, 3}, {LocalRef{1}, GlobalRef{2}});
    ProofState s1 = makeState(0, {4, 5}, {}, {});
    ProofState s2 = makeState(1, {6, 7, 1}, {0}, {GlobalRef{3}});
    s2.global_context_ids = std::vector<int64_t>{0, 3};
    ProofState s3 = makeState(4, {2}, {}, {MissingArgument{}});
    s3.global_context_ids = std::vector<int64_t>{1};
    return tacpred::Batch({s0, s1, s2, s3});
}

struct Fixture
{
    tacpred::GraphConstants constants = smallConstants();
    std::shared_ptr<tacpred::EmbeddingEncoderImpl> encoder;
    std::shared_ptr<tacpred::PredictionTask> task;

    explicit Fixture(const tacpred::TaskConfig& config)
    {
        torch::manual_seed(0);
        encoder = std::make_shared<tacpred::EmbeddingEncoderImpl>(constants, config.hidden_size,
                                                                  config.tactic_embedding_size, false);
        task = tacpred::makePredictionTask(config, constants, encoder);
    }

    tacpred::BatchTensors tensors(const tacpred::Batch& batch) const
    {
        return batch.toTensors(constants.globalContextSize());
    }
};

bool hasGradient(const std::vector<torch::Tensor>& parameters)
{
    for (const auto& p : parameters)
    {
        if (p.grad().defined() && p.grad().abs().sum().item<float>() > 0)
            return true;
    }
    return false;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("the factory builds every task kind")
{
    for (TaskKind kind : {TaskKind::BASE_TACTIC, TaskKind::LOCAL_ARGUMENT, TaskKind::GLOBAL_ARGUMENT})
    {
        Fixture f(smallConfig(kind));
        CHECK(f.task->kind() == kind);
        CHECK(!f.task->trainableParameters().empty());
    }
}

TEST_CASE("the factory rejects a mismatched encoder")
{
    auto config = smallConfig(TaskKind::GLOBAL_ARGUMENT);
    auto constants = smallConstants();
    auto encoder = std::make_shared<tacpred::EmbeddingEncoderImpl>(constants, 16, 4, false);

    CHECK_THROWS_AS(tacpred::makePredictionTask(config, constants, encoder), std::invalid_argument);
    CHECK_THROWS_AS(tacpred::makePredictionTask(config, constants, nullptr), std::invalid_argument);
}

// ============================================================================
// Training forward
// ============================================================================

TEST_CASE("global task scores both pools as one distribution")
{
    Fixture f(smallConfig(TaskKind::GLOBAL_ARGUMENT));
    auto batch = f.tensors(mixedBatch());
    auto outputs = f.task->trainForward(batch);

    REQUIRE(outputs.local_arguments_logits);
    REQUIRE(outputs.global_arguments_logits);
    auto local = outputs.local_arguments_logits->values();
    auto global = outputs.global_arguments_logits->values();
    CHECK(torch::equal(local.rowLengths(), torch::tensor({2, 2, 1, 0}, torch::kInt64)));
    CHECK(torch::equal(global.rowLengths(), torch::tensor({4, 4, 2, 1}, torch::kInt64)));

    auto local_rows = local.toNestedFloat();
    auto global_rows = global.toNestedFloat();
    for (size_t slot = 0; slot < local_rows.size(); ++slot)
    {
        double mass = 0.0;
        for (float v : local_rows[slot])
            mass += std::exp(v);
        for (float v : global_rows[slot])
            mass += std::exp(v);
        CHECK(mass == doctest::Approx(1.0).epsilon(1e-4));
    }
    // the only available global of the last state takes all the mass
    CHECK(global_rows[3][0] == doctest::Approx(0.0F).epsilon(1e-4));
}

TEST_CASE("global task losses backpropagate into the encoder")
{
    auto config = smallConfig(TaskKind::GLOBAL_ARGUMENT);

    SUBCASE("dot product, flat loss") {}
    SUBCASE("cosine similarity, loss summed per example")
    {
        config.global_cosine_similarity = true;
        config.sum_loss_over_tactic = true;
        config.query_key_method = tacpred::QueryKeyMethod::RAGGED_TO_DENSE_TO_RAGGED;
    }

    Fixture f(config);
    auto batch = f.tensors(mixedBatch());
    auto outputs = f.task->trainForward(batch);

    auto losses = f.task->losses(batch, outputs);
    CHECK(losses.size() == 3);
    CHECK(losses.count("tactic_logits") == 1);
    CHECK(losses.count("local_arguments_logits") == 1);
    CHECK(losses.count("global_arguments_logits") == 1);

    auto loss = tacpred::totalLoss(*f.task, batch, outputs);
    CHECK(std::isfinite(loss.item<float>()));
    loss.backward();
    CHECK(hasGradient(f.encoder->trainableParameters()));
}

TEST_CASE("global task metrics and their reset")
{
    Fixture f(smallConfig(TaskKind::GLOBAL_ARGUMENT));
    auto batch = f.tensors(mixedBatch());
    auto outputs = f.task->trainForward(batch);
    f.task->updateMetrics(batch, outputs);

    auto results = f.task->metricResults();
    for (const char* key : {"tactic_logits_accuracy", "local_arguments_logits_accuracy",
                            "global_arguments_logits_accuracy", "arguments_seq_accuracy", "strict_accuracy"})
    {
        REQUIRE(results.count(key) == 1);
        CHECK(results[key] >= 0.0);
        CHECK(results[key] <= 1.0);
    }
    // the state without arguments is always right, the one with a missing argument never
    CHECK(results["arguments_seq_accuracy"] >= 0.25);
    CHECK(results["arguments_seq_accuracy"] <= 0.75);

    f.task->callbacks().onTestBegin();
    for (const auto& result : f.task->metricResults())
        CHECK(result.second == 0.0);
}

TEST_CASE("local task keeps unnormalized dense scores")
{
    Fixture f(smallConfig(TaskKind::LOCAL_ARGUMENT));
    auto batch = f.tensors(mixedBatch());
    auto outputs = f.task->trainForward(batch);

    CHECK(outputs.local_scores.sizes() == torch::IntArrayRef({4, 2, 2}));
    CHECK(!outputs.global_arguments_logits);

    auto losses = f.task->losses(batch, outputs);
    CHECK(losses.size() == 2);
    // only the local label of the first state is not a sentinel
    CHECK(losses["local_arguments_logits"].numel() == 1);

    f.task->updateMetrics(batch, outputs);
    auto results = f.task->metricResults();
    CHECK(results.count("local_arguments_logits_accuracy") == 1);
    CHECK(results.count("strict_accuracy") == 1);
}

TEST_CASE("tactic task only trains the tactic head")
{
    Fixture f(smallConfig(TaskKind::BASE_TACTIC));
    auto batch = f.tensors(mixedBatch());
    auto outputs = f.task->trainForward(batch);

    CHECK(outputs.tactic_logits.sizes() == torch::IntArrayRef({4, 5}));
    auto losses = f.task->losses(batch, outputs);
    REQUIRE(losses.size() == 1);
    CHECK(losses["tactic_logits"].numel() == 4);

    f.task->updateMetrics(batch, outputs);
    CHECK(f.task->metricResults().count("tactic_logits_accuracy") == 1);
}

TEST_CASE("training rejects inconsistent labels")
{
    Fixture f(smallConfig(TaskKind::GLOBAL_ARGUMENT));

    SUBCASE("argument count differs from the arity")
    {
        auto batch = f.tensors(tacpred::Batch({makeState(2, {0, 1}, {0}, {LocalRef{0}})}));
        CHECK_THROWS_WITH_AS(f.task->trainForward(batch), "proof state 0: tactic 2 takes 2 arguments but 1 are labelled",
                             std::invalid_argument);
    }
    SUBCASE("tactic id out of range")
    {
        auto batch = f.tensors(tacpred::Batch({makeState(7, {0, 1}, {}, {})}));
        CHECK_THROWS_AS(f.task->trainForward(batch), std::invalid_argument);
    }
    SUBCASE("node label out of range")
    {
        auto batch = f.tensors(tacpred::Batch({makeState(0, {12}, {}, {})}));
        CHECK_THROWS_AS(f.task->trainForward(batch), std::invalid_argument);
    }
}

// ============================================================================
// Candidate pools
// ============================================================================

TEST_CASE("an empty batch passes through training and inference")
{
    for (TaskKind kind : {TaskKind::GLOBAL_ARGUMENT, TaskKind::LOCAL_ARGUMENT})
    {
        CAPTURE(tacpred::taskKindName(kind));
        Fixture f(smallConfig(kind));
        tacpred::Batch empty;
        auto batch = f.tensors(empty);
        CHECK(batch.batchSize() == 0);

        auto outputs = f.task->trainForward(batch);
        CHECK(outputs.tactic_logits.size(0) == 0);
        for (const auto& loss : f.task->losses(batch, outputs))
            CHECK(loss.second.numel() == 0);

        auto loss = tacpred::totalLoss(*f.task, batch, outputs);
        CHECK(std::isfinite(loss.item<float>()));
        CHECK(loss.item<float>() == doctest::Approx(0.0));

        f.task->updateMetrics(batch, outputs);
        for (const auto& result : f.task->metricResults())
            CHECK(result.second == 0.0);

        tacpred::Predictor predictor(f.task, f.constants, 2);
        CHECK(predictor.predict(empty).empty());
    }
}

TEST_CASE("tactics without arguments train on the tactic loss alone")
{
    for (TaskKind kind : {TaskKind::GLOBAL_ARGUMENT, TaskKind::LOCAL_ARGUMENT})
    {
        for (bool sum_over_tactic : {false, true})
        {
            CAPTURE(tacpred::taskKindName(kind));
            CAPTURE(sum_over_tactic);
            auto config = smallConfig(kind);
            config.sum_loss_over_tactic = sum_over_tactic;
            Fixture f(config);
            tacpred::Batch states({makeState(0, {0, 1}, {0}, {}), makeState(3, {2}, {}, {})});
            auto batch = f.tensors(states);

            auto outputs = f.task->trainForward(batch);
            auto losses = f.task->losses(batch, outputs);
            REQUIRE(losses.count("tactic_logits") == 1);
            CHECK(losses["tactic_logits"].numel() == 2);
            for (const auto& loss : losses)
            {
                if (loss.first != "tactic_logits")
                {
                    CHECK(tacpred::meanLoss(loss.second).item<float>() == doctest::Approx(0.0));
                }
            }

            auto loss = tacpred::totalLoss(*f.task, batch, outputs);
            CHECK(std::isfinite(loss.item<float>()));
            CHECK(loss.item<float>()
                  == doctest::Approx(tacpred::meanLoss(losses["tactic_logits"]).item<float>()).epsilon(1e-5));

            // no argument slots: every argument sequence is trivially right
            f.task->updateMetrics(batch, outputs);
            CHECK(f.task->metricResults()["arguments_seq_accuracy"] == doctest::Approx(1.0));

            tacpred::Predictor predictor(f.task, f.constants, 2);
            auto predictions = predictor.predict(states);
            REQUIRE(predictions.size() == 2);
            CHECK(predictions[0].size() == 2);
            REQUIRE(predictions[1].size() == 2);
            if (kind == TaskKind::LOCAL_ARGUMENT)
            {
                for (const auto& h : predictions[1])
                    CHECK((h.tactic == 0 || h.tactic == 3));
            }
        }
    }
}

TEST_CASE("global pool rows follow the listed available ids")
{
    auto constants = smallConstants();
    auto encoder = std::make_shared<tacpred::EmbeddingEncoderImpl>(constants, 8, 4, false);
    tacpred::GlobalCandidatePoolImpl pool(encoder, 8, 4, false, true, tacpred::QueryKeyMethod::BROADCAST_RAGGED);

    ProofState state = makeState(1, {0}, {}, {GlobalRef{0}});
    state.global_context_ids = std::vector<int64_t>{2, 0};
    auto batch = tacpred::Batch({state}).toTensors(4);

    auto dense = torch::tensor({10.0f, 11.0f, 12.0f, 13.0f}).reshape({1, 1, 4});
    auto rows = pool.toRagged(dense, batch, torch::tensor({1}, torch::kInt64));
    CHECK(rows.values().toNestedFloat() == std::vector<std::vector<float>>{{12.0f, 10.0f}});
}

TEST_CASE("dynamic global context masks unavailable entries")
{
    auto constants = smallConstants();
    auto encoder = std::make_shared<tacpred::EmbeddingEncoderImpl>(constants, 8, 4, false);
    tacpred::GlobalCandidatePoolImpl pool(encoder, 8, 4, true, true, tacpred::QueryKeyMethod::BROADCAST_RAGGED);
    CHECK(pool.temperature().item<float>() == doctest::Approx(1.0F));

    ProofState state = makeState(1, {0, 1}, {}, {GlobalRef{3}});
    state.global_context_ids = std::vector<int64_t>{3};
    auto batch = tacpred::Batch({state}).toTensors(4);

    auto graph = encoder->encode(batch);
    auto counts = torch::tensor({1}, torch::kInt64);
    auto states = encoder->argumentStates(graph, batch.tactic, counts);
    auto dense = pool.denseScores(graph, batch, states);

    REQUIRE(dense.sizes() == torch::IntArrayRef({1, 1, 4}));
    CHECK(std::isinf(dense[0][0][0].item<float>()));
    CHECK(std::isfinite(dense[0][0][3].item<float>()));
}

// ============================================================================
// Inference
// ============================================================================

TEST_CASE("global task inference lays out K hypotheses per state")
{
    Fixture f(smallConfig(TaskKind::GLOBAL_ARGUMENT));
    auto batch = f.tensors(mixedBatch());
    torch::NoGradGuard no_grad;
    auto out = f.task->inferenceForward(batch, torch::Tensor(), 3);

    CHECK(out.tactic.sizes() == torch::IntArrayRef({3, 4}));
    CHECK(out.tactic_logits.sizes() == torch::IntArrayRef({3, 4}));
    REQUIRE(out.local_arguments_logits.dim() == 4);
    REQUIRE(out.global_arguments_logits.dim() == 4);
    CHECK(out.local_arguments_logits.size(0) == 3);
    CHECK(out.local_arguments_logits.size(1) == 4);
    CHECK(out.local_arguments_logits.size(2) >= 1);
    CHECK(out.local_arguments_logits.size(2) <= 2);
    CHECK(out.local_arguments_logits.size(3) == 2);
    CHECK(out.global_arguments_logits.size(3) == 4);

    for (int64_t i = 0; i < 4; ++i)
    {
        CHECK(out.tactic_logits[0][i].item<float>() >= out.tactic_logits[1][i].item<float>());
        CHECK(out.tactic_logits[1][i].item<float>() >= out.tactic_logits[2][i].item<float>());
    }
}

TEST_CASE("predictor maps global positions back to vocabulary ids")
{
    Fixture f(smallConfig(TaskKind::GLOBAL_ARGUMENT));
    tacpred::Predictor predictor(f.task, f.constants, 3);
    auto predictions = predictor.predict(mixedBatch());
    REQUIRE(predictions.size() == 4);

    for (const auto& hypotheses : predictions)
    {
        CHECK(hypotheses.size() == 3);
        for (const auto& h : hypotheses)
            CHECK(h.arguments.size() == static_cast<size_t>(f.constants.tactic_index_to_numargs[h.tactic]));
    }

    for (const auto& h : predictions[0])
    {
        for (const auto& argument : h.arguments)
        {
            CHECK(argument.local_logprobs.size() == 2);
            CHECK(argument.global_logprobs.size() == 4);
            double mass = 0.0;
            for (float v : argument.local_logprobs)
                mass += std::exp(v);
            for (float v : argument.global_logprobs)
                mass += std::exp(v);
            CHECK(mass == doctest::Approx(1.0).epsilon(1e-4));
        }
    }
    for (const auto& h : predictions[2])
    {
        for (const auto& argument : h.arguments)
        {
            CHECK(argument.global_logprobs.size() == 2);
            if (const auto* global = std::get_if<GlobalRef>(&argument.best))
            {
                CHECK((global->id == 0 || global->id == 3));
            }
        }
    }
    for (const auto& h : predictions[3])
    {
        for (const auto& argument : h.arguments)
        {
            CHECK(argument.local_logprobs.empty());
            REQUIRE(std::holds_alternative<GlobalRef>(argument.best));
            CHECK(std::get<GlobalRef>(argument.best).id == 1);
            CHECK(argument.best_logprob == doctest::Approx(0.0F).epsilon(1e-4));
        }
    }
}

TEST_CASE("predictor honours an external tactic mask")
{
    Fixture f(smallConfig(TaskKind::GLOBAL_ARGUMENT));
    tacpred::Predictor predictor(f.task, f.constants, 3);
    auto permitted = torch::tensor({0, 1, 1, 0, 0}, torch::kInt64) != 0;

    for (const auto& hypotheses : predictor.predict(mixedBatch(), permitted))
    {
        CHECK(hypotheses.size() == 2);
        for (const auto& h : hypotheses)
            CHECK((h.tactic == 1 || h.tactic == 2));
    }
}

TEST_CASE("local task only offers zero-argument tactics without local context")
{
    Fixture f(smallConfig(TaskKind::LOCAL_ARGUMENT));
    tacpred::Predictor predictor(f.task, f.constants, 3);
    auto predictions = predictor.predict(mixedBatch());

    CHECK(predictions[0].size() == 3);
    REQUIRE(predictions[1].size() == 2);
    std::set<int64_t> tactics{predictions[1][0].tactic, predictions[1][1].tactic};
    CHECK(tactics == std::set<int64_t>{0, 3});

    for (const auto& h : predictions[0])
    {
        for (const auto& argument : h.arguments)
        {
            CHECK(argument.global_logprobs.empty());
            CHECK(std::holds_alternative<LocalRef>(argument.best));
            double mass = 0.0;
            for (float v : argument.local_logprobs)
                mass += std::exp(v);
            CHECK(mass == doctest::Approx(1.0).epsilon(1e-4));
        }
    }
}

TEST_CASE("tactic task predicts zero-argument tactics only")
{
    Fixture f(smallConfig(TaskKind::BASE_TACTIC));
    tacpred::Predictor predictor(f.task, f.constants, 2);

    for (const auto& hypotheses : predictor.predict(mixedBatch()))
    {
        REQUIRE(hypotheses.size() == 2);
        for (const auto& h : hypotheses)
        {
            CHECK((h.tactic == 0 || h.tactic == 3));
            CHECK(h.arguments.empty());
        }
    }

    CHECK_THROWS_AS(tacpred::Predictor(f.task, f.constants, 6), std::invalid_argument);
}
