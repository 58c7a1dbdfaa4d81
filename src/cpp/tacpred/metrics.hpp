#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "ragged.hpp"

namespace tacpred
{

/// Running metric over a pass. reset() starts a new pass.
class Metric
{
public:
    explicit Metric(std::string name) : name_(std::move(name)) {}
    virtual ~Metric() = default;

    const std::string& name() const { return name_; }

    virtual void reset() = 0;
    virtual double result() const = 0;

private:
    std::string name_;
};

/// Mean of every value seen since the last reset (0 before any update).
class MeanMetric : public Metric
{
public:
    using Metric::Metric;

    void update(const torch::Tensor& values);
    void reset() override;
    double result() const override;

    int64_t count() const { return count_; }

private:
    double total_ = 0.0;
    int64_t count_ = 0;
};

/// Fraction of rows whose arg-max matches the label.
class SparseCategoricalAccuracy : public MeanMetric
{
public:
    explicit SparseCategoricalAccuracy(std::string name = "accuracy") : MeanMetric(std::move(name)) {}

    /// labels: [n], scores: [n, classes].
    void update(const torch::Tensor& labels, const torch::Tensor& scores);
};

/// Per-argument accuracy over [batch, None(args), None(candidates)] scores.
/// Sentinel labels are skipped exactly as in argumentLoss.
class ArgumentAccuracy : public SparseCategoricalAccuracy
{
public:
    using SparseCategoricalAccuracy::SparseCategoricalAccuracy;

    void update(const RaggedTensor& labels, const RaggedTensor& scores);
};

/// 1 where the arg-max tactic equals the label: [batch] float.
torch::Tensor tacticAccuracy(const torch::Tensor& tactic, const torch::Tensor& tactic_logits);

/// Local-only sequence accuracy: [batch] float, 1 when every argument equals
/// the arg-max over dense local scores [batch, max(args), context]. A row with
/// a sentinel label never counts; with no context the prediction is index 0.
torch::Tensor localSequenceAccuracy(const RaggedTensor& labels, const torch::Tensor& dense_scores);

/// Local/global sequence accuracy: [batch] float. At every argument the pool
/// with the larger best score is the prediction (ties go to local) and must
/// match the pool of the label along with the index. An argument with no label
/// in either pool is never correct.
torch::Tensor globalSequenceAccuracy(const RaggedTensor& local_labels, const RaggedTensor& local_scores,
                                     const RaggedTensor& global_labels, const RaggedTensor& global_scores);

/// Resets a set of running metrics at the lifecycle boundaries of a driver.
class MetricsCallback
{
public:
    explicit MetricsCallback(std::vector<Metric*> metrics) : metrics_(std::move(metrics)) {}

    void onTrainBegin() { resetAll(); }
    void onTestBegin() { resetAll(); }
    void onPredictBegin() { resetAll(); }
    void onEpochBegin(int64_t epoch) { (void)epoch; resetAll(); }

private:
    void resetAll();

    std::vector<Metric*> metrics_;
};

} // namespace tacpred
