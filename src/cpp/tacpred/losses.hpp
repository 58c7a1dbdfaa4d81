#pragma once

#include <map>
#include <string>

#include <torch/torch.h>

#include "ragged.hpp"

namespace tacpred
{

enum class AggregationPolicy
{
    SUM_OVER_SEQUENCE, // one value per example
    FLAT,              // one value per labelled argument
};

/// Cross-entropy of tactic logits [batch, tactic_num] against tactic ids [batch].
/// Returns [batch].
torch::Tensor tacticLoss(const torch::Tensor& tactic_logits, const torch::Tensor& tactic);

/// Softmax cross-entropy over unnormalized dense local scores
/// [batch, max(args), context]. One value per non-sentinel label; zero-length
/// when nothing is labelled, zeros when the batch has no local context.
torch::Tensor localArgumentLoss(const RaggedTensor& labels, const torch::Tensor& dense_scores);

/// Negative log-probability of every labelled argument under normalized scores
/// [batch, None(args), None(candidates)].
///
/// SUM_OVER_SEQUENCE returns [batch] (0 for examples without labels), FLAT
/// returns one value per non-sentinel label.
torch::Tensor argumentLoss(const RaggedTensor& labels, const RaggedTensor& normalized_scores,
                           AggregationPolicy policy);

/// Squared L2 norm of each predicted definition embedding (the target is zero).
torch::Tensor definitionNormSquaredLoss(const torch::Tensor& predicted);

/// Mean of a per-item loss vector; 0 for an empty one.
torch::Tensor meanLoss(const torch::Tensor& losses);

/// sum over outputs of weight * meanLoss. Outputs without a weight count once.
torch::Tensor weightedLoss(const std::map<std::string, torch::Tensor>& losses,
                           const std::map<std::string, float>& weights);

} // namespace tacpred
