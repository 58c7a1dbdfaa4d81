#pragma once

#include <cstdint>
#include <utility>

#include <torch/torch.h>

#include "config.hpp"
#include "encoder.hpp"
#include "proof_state.hpp"
#include "ragged.hpp"

namespace tacpred
{

// ============================================================================
// Tactic masks ([batch, tactic_num] bool)
// ============================================================================

/// true for the tactics that take no arguments: [tactic_num].
torch::Tensor noArgumentTacticsMask(const GraphConstants& constants);

/// Every example may only use zero-argument tactics.
torch::Tensor tacticOnlyMask(const GraphConstants& constants, int64_t batch_size);

/// Examples flagged in `no_context` ([batch] bool) may only use zero-argument
/// tactics; the others may use every tactic.
torch::Tensor contextTacticMask(const GraphConstants& constants, const torch::Tensor& no_context);

/// AND of a task mask [batch, tactic_num] with an external permission mask that
/// is undefined (everything permitted), [tactic_num] or [batch, tactic_num].
torch::Tensor combineTacticMasks(const torch::Tensor& task_mask, const torch::Tensor& permitted);

// ============================================================================
// InferenceExpander
// ============================================================================

/// Expands each proof state into its top-K tactic hypotheses and lays out the
/// replicated batch: hypothesis k of example i is row k * batch + i.
class InferenceExpander
{
public:
    explicit InferenceExpander(int64_t tactic_expand_bound);

    int64_t tacticExpandBound() const { return k_; }

    /// Masked log-softmax followed by top-K: (indices, log-probabilities), both
    /// [batch, K], log-probabilities non-increasing along K. Masked tactics get
    /// -inf and are only returned when fewer than K tactics are permitted.
    std::pair<torch::Tensor, torch::Tensor> topKTactics(const torch::Tensor& tactic_logits,
                                                        const torch::Tensor& mask) const;

    /// [batch, K] -> [K * batch] in replicated row order.
    torch::Tensor flattenHypotheses(const torch::Tensor& top_k) const;

    BatchTensors replicate(const BatchTensors& batch) const { return batch.tile(k_); }
    EncodedGraph replicate(const EncodedGraph& graph) const { return graph.tile(k_); }

    /// [K * batch, args, candidates] -> [K, batch, args, candidates].
    torch::Tensor unflatten(const torch::Tensor& dense) const;

    /// Keeps, per example, the global vocabulary entries it lists as available,
    /// in that order: [K, batch, args, global_context_size] ->
    /// [K, batch, args, max(available)], padded with -inf.
    torch::Tensor gatherAvailableGlobal(const torch::Tensor& logits, const RaggedTensor& global_context_ids) const;

private:
    int64_t k_;
};

} // namespace tacpred
