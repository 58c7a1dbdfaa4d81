#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "ragged.hpp"

namespace tacpred
{

/// Ground truth of one argument slot.
struct MissingArgument
{
};

/// Index into the proof state's local context.
struct LocalRef
{
    int64_t index{0};
};

/// Id of an entry of the global vocabulary.
struct GlobalRef
{
    int64_t id{0};
};

using ArgumentTarget = std::variant<MissingArgument, LocalRef, GlobalRef>;

/// One training or inference example.
struct ProofState
{
    int64_t tactic{0};
    std::vector<int64_t> node_labels;
    /// Node indices (into node_labels) that may be referenced as local arguments.
    std::vector<int64_t> local_context;
    /// Available global ids; nullopt means the whole vocabulary is available.
    std::optional<std::vector<int64_t>> global_context_ids;
    std::vector<ArgumentTarget> arguments;
};

/// Tensor view of a batch of proof states.
///
/// Argument labels use kSentinel for "missing" and for "belongs to the other
/// pool". Global labels are positions within the example's available global
/// ids, so they address the same rows as the global candidate scores.
struct BatchTensors
{
    torch::Tensor tactic;                  // [batch] int64
    RaggedTensor node_labels;              // [batch, None(nodes)]
    RaggedTensor local_context_ids;        // [batch, None(local context)]
    RaggedTensor global_context_ids;       // [batch, None(available globals)]
    RaggedTensor local_arguments;          // [batch, None(args)]
    RaggedTensor global_arguments;         // [batch, None(args)]

    int64_t batchSize() const { return tactic.size(0); }

    /// Repeats every field `times` times (row k * batch + i is example i).
    BatchTensors tile(int64_t times) const;
};

class Batch
{
public:
    Batch() = default;
    explicit Batch(std::vector<ProofState> states);

    void add(ProofState state) { states_.push_back(std::move(state)); }

    size_t size() const { return states_.size(); }
    bool empty() const { return states_.empty(); }
    const ProofState& operator[](size_t i) const { return states_[i]; }
    const std::vector<ProofState>& states() const { return states_; }

    /// Lowers the batch to tensors. Throws std::invalid_argument when a local
    /// context entry is not a node of its graph, a local argument is outside
    /// the local context, or a global argument is not available.
    BatchTensors toTensors(int64_t global_context_size) const;

private:
    std::vector<ProofState> states_;
};

} // namespace tacpred
