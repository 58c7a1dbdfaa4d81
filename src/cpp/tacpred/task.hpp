#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "config.hpp"
#include "encoder.hpp"
#include "metrics.hpp"
#include "proof_state.hpp"
#include "ragged.hpp"

namespace tacpred
{

/// Names of the model outputs, used as keys of losses, weights and metrics.
namespace output
{
constexpr const char* kTactic = "tactic";
constexpr const char* kTacticLogits = "tactic_logits";
constexpr const char* kLocalArgumentsLogits = "local_arguments_logits";
constexpr const char* kGlobalArgumentsLogits = "global_arguments_logits";
constexpr const char* kArgumentsSeqAccuracy = "arguments_seq_accuracy";
constexpr const char* kStrictAccuracy = "strict_accuracy";
} // namespace output

/// Outputs of a training-style forward pass on the ground-truth tactics.
struct TrainOutputs
{
    torch::Tensor tactic_logits; // [batch, tactic_num]

    /// Local task: unnormalized scores [batch, max(args), max(local context)].
    torch::Tensor local_scores;

    /// Global task: log-probabilities over both pools,
    /// [batch, None(args), None(local context)] and [batch, None(args), None(available globals)].
    std::optional<RaggedTensor> local_arguments_logits;
    std::optional<RaggedTensor> global_arguments_logits;
};

/// Outputs of an inference pass. Hypothesis k of example i is [k][i].
struct InferenceOutputs
{
    torch::Tensor tactic;        // [K, batch] int64
    torch::Tensor tactic_logits; // [K, batch] log-probabilities

    /// [K, batch, max(args), max(local context)] log-probabilities (argument tasks).
    torch::Tensor local_arguments_logits;
    /// [K, batch, max(args), max(available globals)] log-probabilities (global task).
    torch::Tensor global_arguments_logits;
};

/// A prediction task: which heads are active, how they are scored and trained.
/// The variants share no construction state; each builds its own pools and metrics.
class PredictionTask
{
public:
    virtual ~PredictionTask() = default;

    virtual TaskKind kind() const = 0;
    virtual const TaskConfig& config() const = 0;

    /// Throws std::invalid_argument when a tactic id is out of range or the
    /// labelled argument count differs from the tactic's arity.
    virtual TrainOutputs trainForward(const BatchTensors& batch) = 0;

    /// Top-K tactic hypotheses with their argument scores. `permitted` is an
    /// external tactic mask ([tactic_num] or [batch, tactic_num]) or undefined.
    virtual InferenceOutputs inferenceForward(const BatchTensors& batch, const torch::Tensor& permitted,
                                              int64_t tactic_expand_bound) = 0;

    /// Per-item losses keyed by output name.
    virtual std::map<std::string, torch::Tensor> losses(const BatchTensors& batch,
                                                        const TrainOutputs& outputs) const = 0;
    virtual std::map<std::string, float> lossWeights() const = 0;

    virtual void updateMetrics(const BatchTensors& batch, const TrainOutputs& outputs) = 0;
    /// Running values keyed "<output>_<metric>" or by the sequence metric name.
    virtual std::map<std::string, double> metricResults() const = 0;
    virtual MetricsCallback callbacks() = 0;

    virtual std::vector<torch::Tensor> trainableParameters() = 0;
};

/// Weighted sum of the task's mean losses; differentiable.
torch::Tensor totalLoss(const PredictionTask& task, const BatchTensors& batch, const TrainOutputs& outputs);

/// Builds the task named by `config.kind` on top of `encoder`.
std::unique_ptr<PredictionTask> makePredictionTask(const TaskConfig& config, const GraphConstants& constants,
                                                   std::shared_ptr<ProofStateEncoder> encoder);

} // namespace tacpred
