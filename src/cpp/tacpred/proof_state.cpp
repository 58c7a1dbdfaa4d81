#include "proof_state.hpp"

#include <numeric>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace tacpred
{

BatchTensors BatchTensors::tile(int64_t times) const
{
    BatchTensors out;
    out.tactic = tactic.repeat({times});
    out.node_labels = node_labels.tile(times);
    out.local_context_ids = local_context_ids.tile(times);
    out.global_context_ids = global_context_ids.tile(times);
    out.local_arguments = local_arguments.tile(times);
    out.global_arguments = global_arguments.tile(times);
    return out;
}

Batch::Batch(std::vector<ProofState> states)
    : states_(std::move(states))
{
}

BatchTensors Batch::toTensors(int64_t global_context_size) const
{
    std::vector<int64_t> tactics;
    std::vector<std::vector<int64_t>> node_labels;
    std::vector<std::vector<int64_t>> local_context;
    std::vector<std::vector<int64_t>> global_context;
    std::vector<std::vector<int64_t>> local_arguments;
    std::vector<std::vector<int64_t>> global_arguments;

    for (size_t i = 0; i < states_.size(); ++i)
    {
        const ProofState& state = states_[i];
        const std::string where = "proof state " + std::to_string(i) + ": ";
        const auto num_nodes = static_cast<int64_t>(state.node_labels.size());

        for (int64_t node : state.local_context)
        {
            if (node < 0 || node >= num_nodes)
                throw std::invalid_argument(where + "local context node " + std::to_string(node)
                                            + " is not one of its " + std::to_string(num_nodes) + " nodes");
        }

        std::vector<int64_t> available;
        if (state.global_context_ids)
        {
            available = *state.global_context_ids;
        }
        else
        {
            available.resize(global_context_size);
            std::iota(available.begin(), available.end(), 0);
        }

        std::unordered_map<int64_t, int64_t> position_of;
        for (size_t p = 0; p < available.size(); ++p)
        {
            const int64_t id = available[p];
            if (id < 0 || id >= global_context_size)
                throw std::invalid_argument(where + "global id " + std::to_string(id) + " outside the vocabulary of "
                                            + std::to_string(global_context_size));
            if (!position_of.emplace(id, static_cast<int64_t>(p)).second)
                throw std::invalid_argument(where + "global id " + std::to_string(id) + " listed twice");
        }

        std::vector<int64_t> local_row;
        std::vector<int64_t> global_row;
        for (const ArgumentTarget& target : state.arguments)
        {
            if (const auto* local = std::get_if<LocalRef>(&target))
            {
                if (local->index < 0 || local->index >= static_cast<int64_t>(state.local_context.size()))
                    throw std::invalid_argument(where + "local argument " + std::to_string(local->index)
                                                + " outside a local context of "
                                                + std::to_string(state.local_context.size()));
                local_row.push_back(local->index);
                global_row.push_back(kSentinel);
            }
            else if (const auto* global = std::get_if<GlobalRef>(&target))
            {
                auto it = position_of.find(global->id);
                if (it == position_of.end())
                    throw std::invalid_argument(where + "global argument " + std::to_string(global->id)
                                                + " is not available");
                local_row.push_back(kSentinel);
                global_row.push_back(it->second);
            }
            else
            {
                local_row.push_back(kSentinel);
                global_row.push_back(kSentinel);
            }
        }

        tactics.push_back(state.tactic);
        node_labels.push_back(state.node_labels);
        local_context.push_back(state.local_context);
        global_context.push_back(std::move(available));
        local_arguments.push_back(std::move(local_row));
        global_arguments.push_back(std::move(global_row));
    }

    BatchTensors out;
    out.tactic = tactics.empty() ? torch::zeros({0}, torch::kInt64)
                                 : torch::tensor(tactics, torch::TensorOptions().dtype(torch::kInt64));
    out.node_labels = RaggedTensor::fromNested(node_labels);
    out.local_context_ids = RaggedTensor::fromNested(local_context);
    out.global_context_ids = RaggedTensor::fromNested(global_context);
    out.local_arguments = RaggedTensor::fromNested(local_arguments);
    out.global_arguments = RaggedTensor::fromNested(global_arguments);
    return out;
}

} // namespace tacpred
