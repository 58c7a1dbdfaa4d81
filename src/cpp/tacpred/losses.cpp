#include "losses.hpp"

#include <stdexcept>
#include <string>

namespace tacpred
{

torch::Tensor tacticLoss(const torch::Tensor& tactic_logits, const torch::Tensor& tactic)
{
    if (tactic_logits.dim() != 2 || tactic.dim() != 1 || tactic_logits.size(0) != tactic.size(0))
        throw std::invalid_argument("tacticLoss: expected logits [batch, tactic_num] and tactics [batch]");
    return torch::nn::functional::cross_entropy(
        tactic_logits, tactic.to(torch::kInt64),
        torch::nn::functional::CrossEntropyFuncOptions().reduction(torch::kNone));
}

torch::Tensor localArgumentLoss(const RaggedTensor& labels, const torch::Tensor& dense_scores)
{
    auto [valid_labels, rows] = filterValidDense(labels, dense_scores);
    if (rows.numel() == 0)
        return torch::zeros({valid_labels.size(0)}, dense_scores.options());
    return torch::nn::functional::cross_entropy(
        rows, valid_labels, torch::nn::functional::CrossEntropyFuncOptions().reduction(torch::kNone));
}

torch::Tensor argumentLoss(const RaggedTensor& labels, const RaggedTensor& normalized_scores,
                           AggregationPolicy policy)
{
    auto [valid_labels, valid_scores] = filterValid(labels, normalized_scores);
    RaggedTensor losses = gatherByLabel(valid_scores, valid_labels);
    auto values = -losses.flat_values;

    if (policy == AggregationPolicy::SUM_OVER_SEQUENCE)
        return segmentSum(values, losses.valueRowids(), losses.nrows());
    return values;
}

torch::Tensor definitionNormSquaredLoss(const torch::Tensor& predicted)
{
    return (predicted * predicted).sum(-1);
}

torch::Tensor meanLoss(const torch::Tensor& losses)
{
    if (losses.numel() == 0)
        return torch::zeros({}, losses.options());
    return losses.mean();
}

torch::Tensor weightedLoss(const std::map<std::string, torch::Tensor>& losses,
                           const std::map<std::string, float>& weights)
{
    torch::Tensor total;
    for (const auto& [name, loss] : losses)
    {
        auto it = weights.find(name);
        const float weight = it == weights.end() ? 1.0f : it->second;
        auto term = meanLoss(loss) * weight;
        total = total.defined() ? total + term : term;
    }
    if (!total.defined())
        throw std::invalid_argument("weightedLoss: no losses to combine");
    return total;
}

} // namespace tacpred
