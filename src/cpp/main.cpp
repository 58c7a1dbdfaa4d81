#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "tacpred/config.hpp"
#include "tacpred/encoder.hpp"
#include "tacpred/predictor.hpp"
#include "tacpred/proof_state.hpp"
#include "tacpred/task.hpp"

namespace
{

// A few small proof states covering local, global and missing arguments.
tacpred::Batch make_demo_batch(const tacpred::GraphConstants& constants, int64_t size)
{
    tacpred::Batch batch;
    for (int64_t i = 0; i < size; ++i)
    {
        tacpred::ProofState state;
        state.tactic = i % constants.tactic_num;
        const int64_t num_nodes = 3 + i % 4;
        for (int64_t n = 0; n < num_nodes; ++n)
            state.node_labels.push_back((i * 7 + n * 3) % constants.node_label_num);
        for (int64_t n = 0; n < num_nodes && n < 1 + i % 3; ++n)
            state.local_context.push_back(n);

        const int64_t arity = constants.tactic_index_to_numargs[state.tactic];
        for (int64_t a = 0; a < arity; ++a)
        {
            const int64_t choice = (i + a) % 3;
            if (choice == 0 && !state.local_context.empty())
                state.arguments.push_back(tacpred::LocalRef{a % static_cast<int64_t>(state.local_context.size())});
            else if (choice == 1 && constants.globalContextSize() > 0)
                state.arguments.push_back(tacpred::GlobalRef{(i + a) % constants.globalContextSize()});
            else
                state.arguments.push_back(tacpred::MissingArgument{});
        }
        batch.add(std::move(state));
    }
    return batch;
}

std::string describe(const tacpred::ArgumentTarget& target)
{
    if (const auto* local = std::get_if<tacpred::LocalRef>(&target))
        return "local " + std::to_string(local->index);
    if (const auto* global = std::get_if<tacpred::GlobalRef>(&target))
        return "global " + std::to_string(global->id);
    return "<none>";
}

void print_summary(const std::vector<std::vector<tacpred::TacticHypothesis>>& predictions)
{
    for (size_t i = 0; i < predictions.size(); ++i)
    {
        std::cout << "proof state " << i << ":" << '\n';
        for (const auto& hypothesis : predictions[i])
        {
            std::cout << "  tactic " << hypothesis.tactic << " (" << std::fixed << std::setprecision(3)
                      << hypothesis.logprob << ")";
            for (const auto& argument : hypothesis.arguments)
                std::cout << " [" << describe(argument.best) << "]";
            std::cout << '\n';
        }
    }
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 3)
    {
        std::cerr << "Usage: " << argv[0] << " <task_config.json> <graph_constants.json> [tactic_expand_bound]"
                  << std::endl;
        return 1;
    }

    try
    {
        torch::manual_seed(0);

        tacpred::TaskConfig config = tacpred::loadTaskConfig(argv[1]);
        tacpred::GraphConstants constants = tacpred::loadGraphConstants(argv[2]);
        const int64_t tactic_expand_bound = argc > 3 ? std::stoll(argv[3]) : 3;

        auto encoder = std::make_shared<tacpred::EmbeddingEncoderImpl>(
            constants, config.hidden_size, config.tactic_embedding_size, config.unit_norm_embs);
        std::shared_ptr<tacpred::PredictionTask> task = tacpred::makePredictionTask(config, constants, encoder);

        tacpred::Batch batch = make_demo_batch(constants, 6);
        tacpred::BatchTensors tensors = batch.toTensors(constants.globalContextSize());

        tacpred::MetricsCallback callbacks = task->callbacks();
        callbacks.onTrainBegin();

        tacpred::TrainOutputs outputs = task->trainForward(tensors);
        torch::Tensor loss = tacpred::totalLoss(*task, tensors, outputs);
        loss.backward();
        task->updateMetrics(tensors, outputs);

        std::cout << "[train] loss: " << loss.item<float>() << '\n';
        for (const auto& [name, value] : task->metricResults())
            std::cout << "[train] " << name << ": " << value << '\n';

        callbacks.onPredictBegin();
        tacpred::Predictor predictor(task, constants, tactic_expand_bound);
        print_summary(predictor.predict(batch));
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
