#include "task.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "candidates.hpp"
#include "inference.hpp"
#include "losses.hpp"
#include "normalizer.hpp"

namespace tacpred
{

namespace
{

std::string metricKey(const char* output_name, const Metric& metric)
{
    return std::string(output_name) + "_" + metric.name();
}

torch::Tensor arityTable(const GraphConstants& constants)
{
    return torch::tensor(constants.tactic_index_to_numargs, torch::TensorOptions().dtype(torch::kInt64));
}

void checkTactics(const torch::Tensor& tactic, int64_t tactic_num)
{
    if (tactic.numel() == 0)
        return;
    const int64_t lo = tactic.min().item<int64_t>();
    const int64_t hi = tactic.max().item<int64_t>();
    if (lo < 0 || hi >= tactic_num)
        throw std::invalid_argument("tactic id " + std::to_string(lo < 0 ? lo : hi) + " outside "
                                    + std::to_string(tactic_num) + " tactics");
}

torch::Tensor argumentCounts(const torch::Tensor& arity, const torch::Tensor& tactic)
{
    return arity.to(tactic.device()).index_select(0, tactic.to(torch::kInt64));
}

void checkArity(const BatchTensors& batch, const torch::Tensor& counts)
{
    for (const RaggedTensor* labels : {&batch.local_arguments, &batch.global_arguments})
    {
        auto labelled = labels->rowLengths().to(counts.device());
        if (torch::equal(labelled, counts))
            continue;
        const int64_t i = torch::nonzero(labelled != counts)[0][0].item<int64_t>();
        throw std::invalid_argument("proof state " + std::to_string(i) + ": tactic "
                                    + std::to_string(batch.tactic[i].item<int64_t>()) + " takes "
                                    + std::to_string(counts[i].item<int64_t>()) + " arguments but "
                                    + std::to_string(labelled[i].item<int64_t>()) + " are labelled");
    }
}

const RaggedTensor& requireOutput(const std::optional<RaggedTensor>& value, const char* name)
{
    if (!value)
        throw std::invalid_argument(std::string("missing model output: ") + name);
    return *value;
}

std::vector<torch::Tensor> concat(std::vector<torch::Tensor> a, const std::vector<torch::Tensor>& b)
{
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

// ============================================================================
// Tactic only
// ============================================================================

class TacticPredictionTask : public PredictionTask
{
public:
    TacticPredictionTask(TaskConfig config, GraphConstants constants, std::shared_ptr<ProofStateEncoder> encoder)
        : config_(std::move(config))
        , constants_(std::move(constants))
        , encoder_(std::move(encoder))
    {
    }

    TaskKind kind() const override { return TaskKind::BASE_TACTIC; }
    const TaskConfig& config() const override { return config_; }

    TrainOutputs trainForward(const BatchTensors& batch) override
    {
        checkTactics(batch.tactic, constants_.tactic_num);
        TrainOutputs out;
        out.tactic_logits = encoder_->tacticLogits(encoder_->encode(batch));
        return out;
    }

    InferenceOutputs inferenceForward(const BatchTensors& batch, const torch::Tensor& permitted,
                                      int64_t tactic_expand_bound) override
    {
        InferenceExpander expander(tactic_expand_bound);
        auto logits = encoder_->tacticLogits(encoder_->encode(batch));
        auto mask = combineTacticMasks(tacticOnlyMask(constants_, batch.batchSize()).to(logits.device()), permitted);
        auto [indices, values] = expander.topKTactics(logits, mask);

        InferenceOutputs out;
        out.tactic = indices.t();
        out.tactic_logits = values.t();
        return out;
    }

    std::map<std::string, torch::Tensor> losses(const BatchTensors& batch, const TrainOutputs& outputs) const override
    {
        return {{output::kTacticLogits, tacticLoss(outputs.tactic_logits, batch.tactic)}};
    }

    std::map<std::string, float> lossWeights() const override { return {{output::kTacticLogits, 1.0f}}; }

    void updateMetrics(const BatchTensors& batch, const TrainOutputs& outputs) override
    {
        tactic_accuracy_.update(batch.tactic, outputs.tactic_logits);
    }

    std::map<std::string, double> metricResults() const override
    {
        return {{metricKey(output::kTacticLogits, tactic_accuracy_), tactic_accuracy_.result()}};
    }

    MetricsCallback callbacks() override { return MetricsCallback({&tactic_accuracy_}); }

    std::vector<torch::Tensor> trainableParameters() override { return encoder_->trainableParameters(); }

private:
    TaskConfig config_;
    GraphConstants constants_;
    std::shared_ptr<ProofStateEncoder> encoder_;

    SparseCategoricalAccuracy tactic_accuracy_;
};

// ============================================================================
// Tactic + local arguments
// ============================================================================

class LocalArgumentPredictionTask : public PredictionTask
{
public:
    LocalArgumentPredictionTask(TaskConfig config, GraphConstants constants,
                                std::shared_ptr<ProofStateEncoder> encoder)
        : config_(std::move(config))
        , constants_(std::move(constants))
        , encoder_(std::move(encoder))
        , arity_(arityTable(constants_))
        , local_pool_(encoder_->hiddenSize(), /*project=*/false, config_.query_key_method)
    {
    }

    TaskKind kind() const override { return TaskKind::LOCAL_ARGUMENT; }
    const TaskConfig& config() const override { return config_; }

    TrainOutputs trainForward(const BatchTensors& batch) override
    {
        checkTactics(batch.tactic, constants_.tactic_num);
        auto counts = argumentCounts(arity_, batch.tactic);
        checkArity(batch, counts);

        EncodedGraph graph = encoder_->encode(batch);
        TrainOutputs out;
        out.tactic_logits = encoder_->tacticLogits(graph);
        RaggedTensor states = encoder_->argumentStates(graph, batch.tactic, counts);
        out.local_scores = local_pool_->denseScores(graph, batch, states);
        return out;
    }

    InferenceOutputs inferenceForward(const BatchTensors& batch, const torch::Tensor& permitted,
                                      int64_t tactic_expand_bound) override
    {
        InferenceExpander expander(tactic_expand_bound);
        EncodedGraph graph = encoder_->encode(batch);
        auto logits = encoder_->tacticLogits(graph);

        auto no_context = batch.local_context_ids.rowLengths() == 0;
        auto mask = combineTacticMasks(contextTacticMask(constants_, no_context).to(logits.device()), permitted);
        auto [indices, values] = expander.topKTactics(logits, mask);

        auto tactic = expander.flattenHypotheses(indices);
        BatchTensors replicated = expander.replicate(batch);
        EncodedGraph replicated_graph = expander.replicate(graph);
        RaggedTensor states = encoder_->argumentStates(replicated_graph, tactic, argumentCounts(arity_, tactic));
        auto local = local_pool_->denseScores(replicated_graph, replicated, states);
        // softmax over the local context alone; a slot without candidates stays -inf
        auto no_global = torch::empty({local.size(0), local.size(1), 0}, local.options());
        NormalizedScores normalized = normalizeJointly(local, no_global);

        InferenceOutputs out;
        out.tactic = indices.t();
        out.tactic_logits = values.t();
        out.local_arguments_logits = expander.unflatten(normalized.local);
        return out;
    }

    std::map<std::string, torch::Tensor> losses(const BatchTensors& batch, const TrainOutputs& outputs) const override
    {
        return {{output::kTacticLogits, tacticLoss(outputs.tactic_logits, batch.tactic)},
                {output::kLocalArgumentsLogits, localArgumentLoss(batch.local_arguments, outputs.local_scores)}};
    }

    std::map<std::string, float> lossWeights() const override
    {
        return {{output::kTacticLogits, 1.0f}, {output::kLocalArgumentsLogits, config_.arguments_loss_coefficient}};
    }

    void updateMetrics(const BatchTensors& batch, const TrainOutputs& outputs) override
    {
        tactic_accuracy_.update(batch.tactic, outputs.tactic_logits);
        auto [labels, rows] = filterValidDense(batch.local_arguments, outputs.local_scores);
        argument_accuracy_.update(labels, rows);

        auto tactic_correct = tacticAccuracy(batch.tactic, outputs.tactic_logits);
        auto sequence_correct = localSequenceAccuracy(batch.local_arguments, outputs.local_scores);
        arguments_seq_accuracy_.update(sequence_correct);
        strict_accuracy_.update(sequence_correct * tactic_correct);
    }

    std::map<std::string, double> metricResults() const override
    {
        return {{metricKey(output::kTacticLogits, tactic_accuracy_), tactic_accuracy_.result()},
                {metricKey(output::kLocalArgumentsLogits, argument_accuracy_), argument_accuracy_.result()},
                {output::kArgumentsSeqAccuracy, arguments_seq_accuracy_.result()},
                {output::kStrictAccuracy, strict_accuracy_.result()}};
    }

    MetricsCallback callbacks() override
    {
        return MetricsCallback({&tactic_accuracy_, &argument_accuracy_, &arguments_seq_accuracy_, &strict_accuracy_});
    }

    std::vector<torch::Tensor> trainableParameters() override
    {
        return concat(encoder_->trainableParameters(), local_pool_->trainableParameters());
    }

private:
    TaskConfig config_;
    GraphConstants constants_;
    std::shared_ptr<ProofStateEncoder> encoder_;
    torch::Tensor arity_;
    LocalCandidatePool local_pool_;

    SparseCategoricalAccuracy tactic_accuracy_;
    SparseCategoricalAccuracy argument_accuracy_;
    MeanMetric arguments_seq_accuracy_{output::kArgumentsSeqAccuracy};
    MeanMetric strict_accuracy_{output::kStrictAccuracy};
};

// ============================================================================
// Tactic + local and global arguments
// ============================================================================

class GlobalArgumentPredictionTask : public PredictionTask
{
public:
    GlobalArgumentPredictionTask(TaskConfig config, GraphConstants constants,
                                 std::shared_ptr<ProofStateEncoder> encoder)
        : config_(std::move(config))
        , constants_(std::move(constants))
        , encoder_(std::move(encoder))
        , arity_(arityTable(constants_))
        , policy_(config_.sum_loss_over_tactic ? AggregationPolicy::SUM_OVER_SEQUENCE : AggregationPolicy::FLAT)
        , local_pool_(encoder_->hiddenSize(), /*project=*/true, config_.query_key_method)
        , global_pool_(encoder_, encoder_->hiddenSize(), constants_.globalContextSize(),
                       config_.global_cosine_similarity, config_.dynamic_global_context, config_.query_key_method)
    {
    }

    TaskKind kind() const override { return TaskKind::GLOBAL_ARGUMENT; }
    const TaskConfig& config() const override { return config_; }

    TrainOutputs trainForward(const BatchTensors& batch) override
    {
        checkTactics(batch.tactic, constants_.tactic_num);
        auto counts = argumentCounts(arity_, batch.tactic);
        checkArity(batch, counts);

        EncodedGraph graph = encoder_->encode(batch);
        TrainOutputs out;
        out.tactic_logits = encoder_->tacticLogits(graph);
        RaggedTensor states = encoder_->argumentStates(graph, batch.tactic, counts);

        NormalizedScores normalized = normalizeJointly(local_pool_->denseScores(graph, batch, states),
                                                       global_pool_->denseScores(graph, batch, states));
        out.local_arguments_logits = local_pool_->toRagged(normalized.local, batch, counts);
        out.global_arguments_logits = global_pool_->toRagged(normalized.global, batch, counts);
        return out;
    }

    InferenceOutputs inferenceForward(const BatchTensors& batch, const torch::Tensor& permitted,
                                      int64_t tactic_expand_bound) override
    {
        InferenceExpander expander(tactic_expand_bound);
        EncodedGraph graph = encoder_->encode(batch);
        auto logits = encoder_->tacticLogits(graph);

        auto no_context = batch.local_context_ids.rowLengths() == 0;
        if (constants_.globalContextSize() > 0)
            no_context = torch::zeros_like(no_context);
        auto mask = combineTacticMasks(contextTacticMask(constants_, no_context).to(logits.device()), permitted);
        auto [indices, values] = expander.topKTactics(logits, mask);

        auto tactic = expander.flattenHypotheses(indices);
        BatchTensors replicated = expander.replicate(batch);
        EncodedGraph replicated_graph = expander.replicate(graph);
        RaggedTensor states = encoder_->argumentStates(replicated_graph, tactic, argumentCounts(arity_, tactic));

        NormalizedScores normalized =
            normalizeJointly(local_pool_->denseScores(replicated_graph, replicated, states),
                             global_pool_->denseScores(replicated_graph, replicated, states));

        InferenceOutputs out;
        out.tactic = indices.t();
        out.tactic_logits = values.t();
        out.local_arguments_logits = expander.unflatten(normalized.local);
        out.global_arguments_logits =
            expander.gatherAvailableGlobal(expander.unflatten(normalized.global), batch.global_context_ids);
        return out;
    }

    std::map<std::string, torch::Tensor> losses(const BatchTensors& batch, const TrainOutputs& outputs) const override
    {
        const auto& local = requireOutput(outputs.local_arguments_logits, output::kLocalArgumentsLogits);
        const auto& global = requireOutput(outputs.global_arguments_logits, output::kGlobalArgumentsLogits);
        return {{output::kTacticLogits, tacticLoss(outputs.tactic_logits, batch.tactic)},
                {output::kLocalArgumentsLogits, argumentLoss(batch.local_arguments, local, policy_)},
                {output::kGlobalArgumentsLogits, argumentLoss(batch.global_arguments, global, policy_)}};
    }

    std::map<std::string, float> lossWeights() const override
    {
        return {{output::kTacticLogits, 1.0f},
                {output::kLocalArgumentsLogits, config_.arguments_loss_coefficient},
                {output::kGlobalArgumentsLogits, config_.arguments_loss_coefficient}};
    }

    void updateMetrics(const BatchTensors& batch, const TrainOutputs& outputs) override
    {
        const auto& local = requireOutput(outputs.local_arguments_logits, output::kLocalArgumentsLogits);
        const auto& global = requireOutput(outputs.global_arguments_logits, output::kGlobalArgumentsLogits);

        tactic_accuracy_.update(batch.tactic, outputs.tactic_logits);
        local_accuracy_.update(batch.local_arguments, local);
        global_accuracy_.update(batch.global_arguments, global);

        auto tactic_correct = tacticAccuracy(batch.tactic, outputs.tactic_logits);
        auto sequence_correct = globalSequenceAccuracy(batch.local_arguments, local, batch.global_arguments, global);
        arguments_seq_accuracy_.update(sequence_correct);
        strict_accuracy_.update(sequence_correct * tactic_correct);
    }

    std::map<std::string, double> metricResults() const override
    {
        return {{metricKey(output::kTacticLogits, tactic_accuracy_), tactic_accuracy_.result()},
                {metricKey(output::kLocalArgumentsLogits, local_accuracy_), local_accuracy_.result()},
                {metricKey(output::kGlobalArgumentsLogits, global_accuracy_), global_accuracy_.result()},
                {output::kArgumentsSeqAccuracy, arguments_seq_accuracy_.result()},
                {output::kStrictAccuracy, strict_accuracy_.result()}};
    }

    MetricsCallback callbacks() override
    {
        return MetricsCallback({&tactic_accuracy_, &local_accuracy_, &global_accuracy_, &arguments_seq_accuracy_,
                                &strict_accuracy_});
    }

    std::vector<torch::Tensor> trainableParameters() override
    {
        auto params = concat(encoder_->trainableParameters(), local_pool_->trainableParameters());
        return concat(std::move(params), global_pool_->trainableParameters());
    }

private:
    TaskConfig config_;
    GraphConstants constants_;
    std::shared_ptr<ProofStateEncoder> encoder_;
    torch::Tensor arity_;
    AggregationPolicy policy_;
    LocalCandidatePool local_pool_;
    GlobalCandidatePool global_pool_;

    SparseCategoricalAccuracy tactic_accuracy_;
    ArgumentAccuracy local_accuracy_;
    ArgumentAccuracy global_accuracy_;
    MeanMetric arguments_seq_accuracy_{output::kArgumentsSeqAccuracy};
    MeanMetric strict_accuracy_{output::kStrictAccuracy};
};

const char* onOff(bool flag)
{
    return flag ? "on" : "off";
}

} // anonymous namespace

torch::Tensor totalLoss(const PredictionTask& task, const BatchTensors& batch, const TrainOutputs& outputs)
{
    return weightedLoss(task.losses(batch, outputs), task.lossWeights());
}

std::unique_ptr<PredictionTask> makePredictionTask(const TaskConfig& config, const GraphConstants& constants,
                                                   std::shared_ptr<ProofStateEncoder> encoder)
{
    if (!encoder)
        throw std::invalid_argument("makePredictionTask: no encoder");
    constants.validate();
    if (encoder->hiddenSize() != config.hidden_size)
        throw std::invalid_argument("encoder hidden size " + std::to_string(encoder->hiddenSize())
                                    + " does not match hidden_size " + std::to_string(config.hidden_size));

    std::unique_ptr<PredictionTask> task;
    switch (config.kind)
    {
    case TaskKind::BASE_TACTIC:
        task = std::make_unique<TacticPredictionTask>(config, constants, std::move(encoder));
        break;
    case TaskKind::LOCAL_ARGUMENT:
        task = std::make_unique<LocalArgumentPredictionTask>(config, constants, std::move(encoder));
        break;
    case TaskKind::GLOBAL_ARGUMENT:
        task = std::make_unique<GlobalArgumentPredictionTask>(config, constants, std::move(encoder));
        break;
    }
    if (!task)
        throw std::invalid_argument("unknown prediction task kind");

    std::cout << "[PredictionTask] " << taskKindName(config.kind) << ": " << constants.tactic_num << " tactics, "
              << constants.globalContextSize() << " global definitions, hidden " << config.hidden_size;
    if (config.kind != TaskKind::BASE_TACTIC)
        std::cout << ", arguments loss x" << config.arguments_loss_coefficient;
    if (config.kind == TaskKind::GLOBAL_ARGUMENT)
        std::cout << ", dynamic global context " << onOff(config.dynamic_global_context) << ", cosine similarity "
                  << onOff(config.global_cosine_similarity) << ", sum loss over tactic "
                  << onOff(config.sum_loss_over_tactic);
    std::cout << std::endl;
    return task;
}

} // namespace tacpred
