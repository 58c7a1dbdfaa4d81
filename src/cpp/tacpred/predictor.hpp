#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <torch/torch.h>

#include "config.hpp"
#include "proof_state.hpp"
#include "task.hpp"

namespace tacpred
{

/// Scores of one argument slot of a hypothesis.
struct ArgumentPrediction
{
    std::vector<float> local_logprobs;  // one per local context entry
    std::vector<float> global_logprobs; // one per available global id, in the listed order
    ArgumentTarget best;                // MissingArgument when the slot has no candidate
    float best_logprob = 0.0f;
};

struct TacticHypothesis
{
    int64_t tactic = 0;
    float logprob = 0.0f;
    std::vector<ArgumentPrediction> arguments;
};

/// Inference driver: proof states in, ranked tactic hypotheses out.
class Predictor
{
public:
    Predictor(std::shared_ptr<PredictionTask> task, GraphConstants constants, int64_t tactic_expand_bound);

    /// One list per proof state, best first. Hypotheses whose tactic is not
    /// permitted (log-probability -inf) are dropped, so a list may hold fewer
    /// than tactic_expand_bound entries. `permitted` is [tactic_num] or
    /// [batch, tactic_num] bool, or undefined to permit everything.
    std::vector<std::vector<TacticHypothesis>> predict(const Batch& batch,
                                                       const torch::Tensor& permitted = torch::Tensor());

    int64_t tacticExpandBound() const { return tactic_expand_bound_; }

private:
    std::shared_ptr<PredictionTask> task_;
    GraphConstants constants_;
    int64_t tactic_expand_bound_;
};

} // namespace tacpred
