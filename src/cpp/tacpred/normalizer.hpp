#pragma once

#include <cstdint>
#include <utility>

#include <torch/torch.h>

#include "ragged.hpp"

namespace tacpred
{

/// Log-probabilities of the local and global candidates of every argument slot.
struct NormalizedScores
{
    torch::Tensor local;  // same shape as the local input
    torch::Tensor global; // same shape as the global input
};

/// Normalizes local [..., local_width] and global [..., global_width] scores into
/// one distribution per argument slot: log(sum exp local + sum exp global) is
/// subtracted from both, with the max over both pools as the shared shift.
///
/// Either width may be 0. A slot without any finite score in either pool gets
/// -inf everywhere (it has no distribution) instead of NaN.
NormalizedScores normalizeJointly(const torch::Tensor& local, const torch::Tensor& global);

/// Ragged variant: both inputs are [batch, None(args), None(candidates)] with the
/// same argument rows. Returns the normalized scores with the input shapes.
std::pair<RaggedTensor, RaggedTensor> normalizeJointly(const RaggedTensor& local, const RaggedTensor& global);

/// 0 for available and -inf for unavailable vocabulary entries:
/// [batch, global_context_size] from the per-example available ids.
torch::Tensor globalAvailabilityMask(const RaggedTensor& global_context_ids, int64_t global_context_size);

} // namespace tacpred
