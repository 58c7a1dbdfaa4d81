#include "inference.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace tacpred
{

namespace
{

constexpr double kNegInf = -std::numeric_limits<double>::infinity();

} // anonymous namespace

// ============================================================================
// Tactic masks
// ============================================================================

torch::Tensor noArgumentTacticsMask(const GraphConstants& constants)
{
    auto numargs = torch::tensor(constants.tactic_index_to_numargs, torch::TensorOptions().dtype(torch::kInt64));
    return numargs == 0;
}

torch::Tensor tacticOnlyMask(const GraphConstants& constants, int64_t batch_size)
{
    return noArgumentTacticsMask(constants).unsqueeze(0).expand({batch_size, constants.tactic_num}).clone();
}

torch::Tensor contextTacticMask(const GraphConstants& constants, const torch::Tensor& no_context)
{
    auto no_arguments = noArgumentTacticsMask(constants).to(no_context.device()).unsqueeze(0);
    auto all_tactics = torch::ones_like(no_arguments);
    return torch::where(no_context.to(torch::kBool).unsqueeze(1), no_arguments, all_tactics);
}

torch::Tensor combineTacticMasks(const torch::Tensor& task_mask, const torch::Tensor& permitted)
{
    if (!permitted.defined())
        return task_mask;
    auto p = permitted.to(task_mask.device()).to(torch::kBool);
    if (p.dim() == 1)
        p = p.unsqueeze(0);
    if (p.dim() != 2 || p.size(1) != task_mask.size(1) || (p.size(0) != 1 && p.size(0) != task_mask.size(0)))
        throw std::invalid_argument("tactic mask must be [tactic_num] or [batch, tactic_num] with "
                                    + std::to_string(task_mask.size(1)) + " tactics");
    return task_mask & p;
}

// ============================================================================
// InferenceExpander
// ============================================================================

InferenceExpander::InferenceExpander(int64_t tactic_expand_bound)
    : k_(tactic_expand_bound)
{
    if (k_ < 1)
        throw std::invalid_argument("tactic_expand_bound must be positive, got " + std::to_string(k_));
}

std::pair<torch::Tensor, torch::Tensor> InferenceExpander::topKTactics(const torch::Tensor& tactic_logits,
                                                                      const torch::Tensor& mask) const
{
    if (tactic_logits.dim() != 2 || !mask.sizes().equals(tactic_logits.sizes()))
        throw std::invalid_argument("topKTactics: logits and mask must both be [batch, tactic_num]");
    if (k_ > tactic_logits.size(1))
        throw std::invalid_argument("topKTactics: cannot expand " + std::to_string(k_) + " hypotheses from "
                                    + std::to_string(tactic_logits.size(1)) + " tactics");

    auto permitted = mask.to(torch::kBool);
    auto masked = tactic_logits.masked_fill(~permitted, kNegInf);
    auto log_norm = torch::logsumexp(masked, -1, /*keepdim=*/true);
    // an example without permitted tactics has log_norm = -inf; keep its row at -inf instead of NaN
    auto log_probs = torch::where(permitted, masked - log_norm, torch::full_like(masked, kNegInf));

    auto top = log_probs.topk(k_, -1, /*largest=*/true, /*sorted=*/true);
    return {std::get<1>(top), std::get<0>(top)};
}

torch::Tensor InferenceExpander::flattenHypotheses(const torch::Tensor& top_k) const
{
    if (top_k.dim() != 2 || top_k.size(1) != k_)
        throw std::invalid_argument("flattenHypotheses: expected [batch, " + std::to_string(k_) + "]");
    return top_k.t().reshape({-1});
}

torch::Tensor InferenceExpander::unflatten(const torch::Tensor& dense) const
{
    if (dense.dim() != 3 || dense.size(0) % k_ != 0)
        throw std::invalid_argument("unflatten: expected [K * batch, args, candidates] with K = " + std::to_string(k_));
    return dense.reshape({k_, dense.size(0) / k_, dense.size(1), dense.size(2)});
}

torch::Tensor InferenceExpander::gatherAvailableGlobal(const torch::Tensor& logits,
                                                       const RaggedTensor& global_context_ids) const
{
    if (logits.dim() != 4 || logits.size(0) != k_ || logits.size(1) != global_context_ids.nrows())
        throw std::invalid_argument("gatherAvailableGlobal: expected [K, batch, args, global_context_size] for "
                                    + std::to_string(global_context_ids.nrows()) + " examples");

    const auto& ids = global_context_ids.flat_values;
    if (ids.numel() > 0 && ids.max().item<int64_t>() >= logits.size(3))
        throw std::out_of_range("gatherAvailableGlobal: available id outside the "
                                + std::to_string(logits.size(3)) + " scored entries");

    // [batch, max(available)] with a validity mask for the padding
    auto index = global_context_ids.toDense(0.0).to(logits.device());
    auto valid = global_context_ids.withFlatValues(torch::ones_like(ids, torch::kBool)).toDense(0.0)
                     .to(logits.device());

    const int64_t width = index.size(1);
    auto expanded = index.view({1, index.size(0), 1, width}).expand({k_, index.size(0), logits.size(2), width});
    auto gathered = logits.gather(3, expanded.contiguous());
    auto keep = valid.view({1, index.size(0), 1, width}).expand_as(gathered);
    return gathered.masked_fill(~keep, kNegInf);
}

} // namespace tacpred
