#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "tacpred/config.hpp"
#include "tacpred/encoder.hpp"
#include "tacpred/losses.hpp"
#include "tacpred/normalizer.hpp"
#include "tacpred/predictor.hpp"
#include "tacpred/proof_state.hpp"
#include "tacpred/ragged.hpp"
#include "tacpred/task.hpp"

namespace py = pybind11;

namespace
{

// Reference encoder + task + predictor behind one Python object.
class TacticPredictor
{
public:
    TacticPredictor(const std::string& task_config_path, const std::string& graph_constants_path,
                    int64_t tactic_expand_bound, int64_t seed)
        : config_(tacpred::loadTaskConfig(task_config_path))
        , constants_(tacpred::loadGraphConstants(graph_constants_path))
    {
        torch::manual_seed(seed);
        auto encoder = std::make_shared<tacpred::EmbeddingEncoderImpl>(
            constants_, config_.hidden_size, config_.tactic_embedding_size, config_.unit_norm_embs);
        task_ = tacpred::makePredictionTask(config_, constants_, encoder);
        predictor_ = std::make_unique<tacpred::Predictor>(task_, constants_, tactic_expand_bound);
    }

    py::list predict(const std::vector<tacpred::ProofState>& states,
                     const std::optional<std::vector<bool>>& permitted)
    {
        torch::Tensor mask;
        if (permitted)
        {
            std::vector<int64_t> flags(permitted->begin(), permitted->end());
            mask = torch::tensor(flags, torch::TensorOptions().dtype(torch::kInt64)) != 0;
        }

        py::list result;
        for (const auto& hypotheses : predictor_->predict(tacpred::Batch(states), mask))
        {
            py::list per_state;
            for (const auto& hypothesis : hypotheses)
            {
                py::dict h;
                h["tactic"] = hypothesis.tactic;
                h["logprob"] = hypothesis.logprob;
                py::list arguments;
                for (const auto& argument : hypothesis.arguments)
                {
                    py::dict a;
                    a["local_logprobs"] = argument.local_logprobs;
                    a["global_logprobs"] = argument.global_logprobs;
                    a["best"] = argument.best;
                    a["best_logprob"] = argument.best_logprob;
                    arguments.append(std::move(a));
                }
                h["arguments"] = std::move(arguments);
                per_state.append(std::move(h));
            }
            result.append(std::move(per_state));
        }
        return result;
    }

    /// Mean losses, total loss and running metrics on a labelled batch.
    py::dict evaluate(const std::vector<tacpred::ProofState>& states)
    {
        torch::NoGradGuard no_grad;
        tacpred::BatchTensors tensors = tacpred::Batch(states).toTensors(constants_.globalContextSize());
        tacpred::TrainOutputs outputs = task_->trainForward(tensors);

        py::dict result;
        for (const auto& [name, loss] : task_->losses(tensors, outputs))
            result[py::str(name + "_loss")] = tacpred::meanLoss(loss).item<float>();
        result["loss"] = tacpred::totalLoss(*task_, tensors, outputs).item<float>();

        task_->updateMetrics(tensors, outputs);
        for (const auto& [name, value] : task_->metricResults())
            result[py::str(name)] = value;
        return result;
    }

    void resetMetrics() { task_->callbacks().onTestBegin(); }

private:
    tacpred::TaskConfig config_;
    tacpred::GraphConstants constants_;
    std::shared_ptr<tacpred::PredictionTask> task_;
    std::unique_ptr<tacpred::Predictor> predictor_;
};

// Both pools as per-slot rows: wraps the rows into a single example.
py::tuple normalize_jointly(const std::vector<std::vector<float>>& local,
                            const std::vector<std::vector<float>>& global)
{
    auto local_rows = tacpred::RaggedTensor::fromNested(std::vector<std::vector<std::vector<float>>>{local});
    auto global_rows = tacpred::RaggedTensor::fromNested(std::vector<std::vector<std::vector<float>>>{global});
    auto [l, g] = tacpred::normalizeJointly(local_rows, global_rows);
    return py::make_tuple(l.values().toNestedFloat(), g.values().toNestedFloat());
}

std::vector<float> argument_loss(const std::vector<std::vector<int64_t>>& labels,
                                 const std::vector<std::vector<std::vector<float>>>& normalized_scores,
                                 bool sum_over_sequence)
{
    auto losses = tacpred::argumentLoss(
        tacpred::RaggedTensor::fromNested(labels), tacpred::RaggedTensor::fromNested(normalized_scores),
        sum_over_sequence ? tacpred::AggregationPolicy::SUM_OVER_SEQUENCE : tacpred::AggregationPolicy::FLAT);
    auto host = losses.to(torch::kFloat32).contiguous();
    return std::vector<float>(host.data_ptr<float>(), host.data_ptr<float>() + host.numel());
}

py::tuple filter_valid_scores(const std::vector<std::vector<int64_t>>& labels,
                              const std::vector<std::vector<std::vector<float>>>& scores)
{
    auto [valid_labels, valid_scores] =
        tacpred::filterValid(tacpred::RaggedTensor::fromNested(labels), tacpred::RaggedTensor::fromNested(scores));
    return py::make_tuple(valid_labels.toNestedInt(), valid_scores.values().toNestedFloat());
}

} // namespace

PYBIND11_MODULE(_tacpred, m)
{
    m.doc() = "libtorch tactic and argument prediction: ragged scoring, losses and top-K inference";

    py::class_<tacpred::MissingArgument>(m, "MissingArgument")
        .def(py::init<>());
    py::class_<tacpred::LocalRef>(m, "LocalRef")
        .def(py::init<int64_t>(), py::arg("index"))
        .def_readwrite("index", &tacpred::LocalRef::index);
    py::class_<tacpred::GlobalRef>(m, "GlobalRef")
        .def(py::init<int64_t>(), py::arg("id"))
        .def_readwrite("id", &tacpred::GlobalRef::id);

    py::class_<tacpred::ProofState>(m, "ProofState")
        .def(py::init<>())
        .def_readwrite("tactic", &tacpred::ProofState::tactic)
        .def_readwrite("node_labels", &tacpred::ProofState::node_labels,
                       "Node label ids. Reading returns a copy: assign a whole list, append has no effect.")
        .def_readwrite("local_context", &tacpred::ProofState::local_context,
                       "Node indices of the local context. Reading returns a copy: assign a whole list.")
        .def_readwrite("global_context_ids", &tacpred::ProofState::global_context_ids,
                       "Available global ids, each listed once; None makes the whole vocabulary available.\n"
                       "Reading returns a copy: assign a whole list.")
        .def_readwrite("arguments", &tacpred::ProofState::arguments,
                       "One MissingArgument, LocalRef or GlobalRef per argument slot.\n"
                       "Reading returns a copy: assign a whole list.");

    py::class_<TacticPredictor>(m, "TacticPredictor")
        .def(py::init<const std::string&, const std::string&, int64_t, int64_t>(),
             py::arg("task_config_path"),
             py::arg("graph_constants_path"),
             py::arg("tactic_expand_bound") = 3,
             py::arg("seed") = 0,
             "Build the reference encoder and the configured prediction task.")
        .def("predict", &TacticPredictor::predict,
             py::arg("states"),
             py::arg("permitted") = std::nullopt,
             "Ranked tactic hypotheses (dicts) for every proof state.\n"
             "WARNING: Not thread-safe. Do not call from multiple threads.")
        .def("evaluate", &TacticPredictor::evaluate,
             py::arg("states"),
             "Mean losses and running metrics on labelled proof states.")
        .def("reset_metrics", &TacticPredictor::resetMetrics);

    m.def("normalize_jointly", &normalize_jointly,
          py::arg("local"),
          py::arg("global"),
          "Normalize per-slot local and global score rows into one distribution per slot.");
    m.def("argument_loss", &argument_loss,
          py::arg("labels"),
          py::arg("normalized_scores"),
          py::arg("sum_over_sequence"),
          "Negative log-likelihood of the labelled arguments (-1 labels are skipped).");
    m.def("filter_valid_scores", &filter_valid_scores,
          py::arg("labels"),
          py::arg("scores"),
          "(labels, rows) of the argument slots whose label is not -1: the kept labels per example\n"
          "and, in the same order, one score row per kept slot.");
}
