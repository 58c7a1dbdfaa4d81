#include "metrics.hpp"

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
// Running metrics
// ============================================================================

void MeanMetric::update(const torch::Tensor& values)
{
    if (values.numel() == 0)
        return;
    auto v = values.detach().to(torch::kCPU).to(torch::kFloat64);
    total_ += v.sum().item<double>();
    count_ += v.numel();
}

void MeanMetric::reset()
{
    total_ = 0.0;
    count_ = 0;
}

double MeanMetric::result() const
{
    return count_ > 0 ? total_ / static_cast<double>(count_) : 0.0;
}

void SparseCategoricalAccuracy::update(const torch::Tensor& labels, const torch::Tensor& scores)
{
    if (scores.dim() != 2 || labels.dim() != 1 || labels.size(0) != scores.size(0))
        throw std::invalid_argument("SparseCategoricalAccuracy: expected labels [n] and scores [n, classes]");
    if (labels.numel() == 0 || scores.size(1) == 0)
        return;
    auto predicted = scores.detach().argmax(-1);
    MeanMetric::update((predicted == labels.to(torch::kInt64)).to(torch::kFloat32));
}

void ArgumentAccuracy::update(const RaggedTensor& labels, const RaggedTensor& scores)
{
    auto [valid_labels, valid_scores] = filterValid(labels, scores);
    // [valid args, max(candidates)]
    auto rows = valid_scores.values().toDense(kNegInf);
    SparseCategoricalAccuracy::update(valid_labels.flat_values, rows);
}

void MetricsCallback::resetAll()
{
    for (Metric* metric : metrics_)
        metric->reset();
}

// ============================================================================
// Per-example accuracies
// ============================================================================

torch::Tensor tacticAccuracy(const torch::Tensor& tactic, const torch::Tensor& tactic_logits)
{
    if (tactic_logits.dim() != 2 || tactic_logits.size(0) != tactic.size(0))
        throw std::invalid_argument("tacticAccuracy: expected logits [batch, tactic_num] and tactics [batch]");
    return (tactic_logits.detach().argmax(-1) == tactic.to(torch::kInt64)).to(torch::kFloat32);
}

torch::Tensor localSequenceAccuracy(const RaggedTensor& labels, const torch::Tensor& dense_scores)
{
    const int64_t n = labels.nrows();
    auto truth = labels.toDense(0.0); // [batch, max(args)]
    if (dense_scores.dim() != 3 || dense_scores.size(0) != n || dense_scores.size(1) != truth.size(1))
        throw std::invalid_argument("localSequenceAccuracy: scores must be [batch, max(args), context] with "
                                    + std::to_string(truth.size(1)) + " argument slots");

    if (truth.size(1) == 0)
        return torch::ones({n}, torch::kFloat32);

    auto predicted = dense_scores.size(2) > 0 ? dense_scores.detach().argmax(-1) : torch::zeros_like(truth);
    auto all_equal = (truth == predicted).all(-1);
    auto all_labelled = std::get<0>(truth.min(-1)) > kSentinel;
    return (all_equal & all_labelled).to(torch::kFloat32);
}

torch::Tensor globalSequenceAccuracy(const RaggedTensor& local_labels, const RaggedTensor& local_scores,
                                     const RaggedTensor& global_labels, const RaggedTensor& global_scores)
{
    if (!torch::equal(local_labels.rowSplits(), global_labels.rowSplits())
        || !torch::equal(local_labels.rowSplits(), local_scores.rowSplits())
        || !torch::equal(global_labels.rowSplits(), global_scores.rowSplits()))
        throw std::invalid_argument("globalSequenceAccuracy: argument counts of labels and scores disagree");

    auto [local_best, local_pred] = segmentMaxArgmax(local_scores.values());
    auto [global_best, global_pred] = segmentMaxArgmax(global_scores.values());

    const auto& local_true = local_labels.flat_values;
    const auto& global_true = global_labels.flat_values;

    // the other pool's label is the sentinel, so the larger of the two is the label
    auto true_is_local = local_true >= global_true;
    auto true_index = torch::where(true_is_local, local_true, global_true);
    auto pred_is_local = local_best >= global_best;
    auto pred_index = torch::where(pred_is_local, local_pred, global_pred);

    // a missing argument has index -1 and never matches a prediction
    auto wrong = (true_is_local != pred_is_local) | (true_index != pred_index);
    auto wrong_per_example = segmentSum(wrong.to(torch::kInt64), local_labels.valueRowids(), local_labels.nrows());
    return (wrong_per_example == 0).to(torch::kFloat32);
}

} // namespace tacpred
