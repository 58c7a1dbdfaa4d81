#include "normalizer.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace tacpred
{

namespace
{

constexpr double kNegInf = -std::numeric_limits<double>::infinity();

torch::Tensor rowMax(const torch::Tensor& x)
{
    if (x.size(-1) == 0)
    {
        auto shape = x.sizes().vec();
        shape.pop_back();
        return torch::full(shape, kNegInf, x.options());
    }
    return std::get<0>(x.max(-1));
}

// Subtracts the joint log-normalizer. `shift` is the detached per-slot max,
// `total` the per-slot sum of exp(score - shift) over both pools.
torch::Tensor applyNormalizer(const torch::Tensor& x, const torch::Tensor& shift, const torch::Tensor& total)
{
    auto empty = total <= 0;
    auto safe_total = torch::where(empty, torch::ones_like(total), total);
    auto log_norm = shift + torch::log(safe_total);
    return torch::where(empty, torch::full_like(x, kNegInf), x - log_norm);
}

} // anonymous namespace

NormalizedScores normalizeJointly(const torch::Tensor& local, const torch::Tensor& global)
{
    if (local.dim() != global.dim() || local.dim() < 1
        || local.sizes().slice(0, local.dim() - 1) != global.sizes().slice(0, global.dim() - 1))
        throw std::invalid_argument("normalizeJointly: local " + std::to_string(local.dim()) + "-d and global "
                                    + std::to_string(global.dim()) + "-d scores do not share their argument slots");

    auto max_logit = torch::maximum(rowMax(local.detach()), rowMax(global.detach()));
    auto shift = torch::where(torch::isfinite(max_logit), max_logit, torch::zeros_like(max_logit)).unsqueeze(-1);

    auto total = torch::exp(local - shift).sum(-1, /*keepdim=*/true)
               + torch::exp(global - shift).sum(-1, /*keepdim=*/true);
    return NormalizedScores{applyNormalizer(local, shift, total), applyNormalizer(global, shift, total)};
}

std::pair<RaggedTensor, RaggedTensor> normalizeJointly(const RaggedTensor& local, const RaggedTensor& global)
{
    if (local.raggedRank() != 2 || global.raggedRank() != 2)
        throw std::invalid_argument("normalizeJointly: scores must be [batch, None(args), None(candidates)]");
    if (!torch::equal(local.rowSplits(), global.rowSplits()))
        throw std::invalid_argument("normalizeJointly: local and global argument counts disagree");

    RaggedTensor local_rows = local.values();   // [batch-args, None(local)]
    RaggedTensor global_rows = global.values(); // [batch-args, None(global)]
    const int64_t slots = local_rows.nrows();
    auto local_ids = local_rows.valueRowids();
    auto global_ids = global_rows.valueRowids();

    auto max_logit = torch::maximum(segmentMaxArgmax(local_rows).first, segmentMaxArgmax(global_rows).first);
    auto shift = torch::where(torch::isfinite(max_logit), max_logit, torch::zeros_like(max_logit));

    auto local_shift = shift.index_select(0, local_ids);
    auto global_shift = shift.index_select(0, global_ids);
    auto total = segmentSum(torch::exp(local_rows.flat_values - local_shift), local_ids, slots)
               + segmentSum(torch::exp(global_rows.flat_values - global_shift), global_ids, slots);

    auto local_out = applyNormalizer(local_rows.flat_values, local_shift, total.index_select(0, local_ids));
    auto global_out = applyNormalizer(global_rows.flat_values, global_shift, total.index_select(0, global_ids));
    return {local.withFlatValues(local_out), global.withFlatValues(global_out)};
}

torch::Tensor globalAvailabilityMask(const RaggedTensor& global_context_ids, int64_t global_context_size)
{
    const auto& ids = global_context_ids.flat_values;
    if (ids.numel() > 0 && (ids.min().item<int64_t>() < 0 || ids.max().item<int64_t>() >= global_context_size))
        throw std::out_of_range("globalAvailabilityMask: available id outside a vocabulary of "
                                + std::to_string(global_context_size));

    auto ones = torch::zeros({global_context_ids.nrows(), global_context_size},
                             torch::TensorOptions().dtype(torch::kFloat32).device(ids.device()));
    ones.index_put_({global_context_ids.valueRowids(), ids}, torch::ones({ids.size(0)}, ones.options()));
    return torch::log(ones);
}

} // namespace tacpred
