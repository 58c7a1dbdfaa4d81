#include "predictor.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace tacpred
{

namespace
{

// Index of the first largest entry, or -1 for an empty row.
int64_t bestIndex(const std::vector<float>& row)
{
    int64_t best = -1;
    for (size_t c = 0; c < row.size(); ++c)
    {
        if (best < 0 || row[c] > row[best])
            best = static_cast<int64_t>(c);
    }
    return best;
}

torch::Tensor toHost(const torch::Tensor& t)
{
    return t.defined() ? t.detach().to(torch::kCPU).to(torch::kFloat32).contiguous() : t;
}

// Entry [k][i][a][c] of a contiguous float [K, batch, args, candidates] tensor.
float valueAt(const torch::Tensor& t, int64_t k, int64_t i, int64_t a, int64_t c)
{
    const float* data = t.data_ptr<float>();
    return data[((k * t.size(1) + i) * t.size(2) + a) * t.size(3) + c];
}

} // anonymous namespace

Predictor::Predictor(std::shared_ptr<PredictionTask> task, GraphConstants constants, int64_t tactic_expand_bound)
    : task_(std::move(task))
    , constants_(std::move(constants))
    , tactic_expand_bound_(tactic_expand_bound)
{
    if (!task_)
        throw std::invalid_argument("Predictor needs a prediction task");
    if (tactic_expand_bound_ < 1 || tactic_expand_bound_ > constants_.tactic_num)
        throw std::invalid_argument("tactic_expand_bound must be in [1, " + std::to_string(constants_.tactic_num)
                                    + "], got " + std::to_string(tactic_expand_bound_));
    std::cout << "[Predictor] " << taskKindName(task_->kind()) << ", top " << tactic_expand_bound_
              << " tactics per proof state" << std::endl;
}

std::vector<std::vector<TacticHypothesis>> Predictor::predict(const Batch& batch, const torch::Tensor& permitted)
{
    torch::NoGradGuard no_grad;

    BatchTensors tensors = batch.toTensors(constants_.globalContextSize());
    InferenceOutputs out = task_->inferenceForward(tensors, permitted, tactic_expand_bound_);

    auto tactics = out.tactic.to(torch::kCPU).to(torch::kInt64).contiguous();
    auto tactic_logprobs = toHost(out.tactic_logits);
    auto local = toHost(out.local_arguments_logits);
    auto global = toHost(out.global_arguments_logits);
    const auto available = tensors.global_context_ids.toNestedInt();

    auto tactic_acc = tactics.accessor<int64_t, 2>();
    auto logprob_acc = tactic_logprobs.accessor<float, 2>();

    std::vector<std::vector<TacticHypothesis>> results(batch.size());
    for (size_t i = 0; i < batch.size(); ++i)
    {
        const ProofState& state = batch[i];
        const auto local_size = static_cast<int64_t>(state.local_context.size());
        const auto global_size = static_cast<int64_t>(available[i].size());
        if (local.defined() && local.size(3) < local_size)
            throw std::invalid_argument("local scores narrower than the local context of proof state "
                                        + std::to_string(i));
        if (global.defined() && global.size(3) < global_size)
            throw std::invalid_argument("global scores narrower than the available globals of proof state "
                                        + std::to_string(i));

        for (int64_t k = 0; k < tactic_expand_bound_; ++k)
        {
            const float logprob = logprob_acc[k][i];
            if (std::isinf(logprob) && logprob < 0)
                continue;

            TacticHypothesis hypothesis;
            hypothesis.tactic = tactic_acc[k][i];
            hypothesis.logprob = logprob;

            const int64_t arity = constants_.tactic_index_to_numargs.at(hypothesis.tactic);
            if (local.defined())
            {
                for (int64_t a = 0; a < arity; ++a)
                {
                    ArgumentPrediction argument;
                    for (int64_t c = 0; c < local_size; ++c)
                        argument.local_logprobs.push_back(valueAt(local, k, i, a, c));
                    if (global.defined())
                    {
                        for (int64_t p = 0; p < global_size; ++p)
                            argument.global_logprobs.push_back(valueAt(global, k, i, a, p));
                    }

                    const int64_t best_local = bestIndex(argument.local_logprobs);
                    const int64_t best_global = bestIndex(argument.global_logprobs);
                    if (best_local >= 0
                        && (best_global < 0 || argument.local_logprobs[best_local] >= argument.global_logprobs[best_global]))
                    {
                        argument.best = LocalRef{best_local};
                        argument.best_logprob = argument.local_logprobs[best_local];
                    }
                    else if (best_global >= 0)
                    {
                        argument.best = GlobalRef{available[i][best_global]};
                        argument.best_logprob = argument.global_logprobs[best_global];
                    }
                    else
                    {
                        argument.best = MissingArgument{};
                        argument.best_logprob = -std::numeric_limits<float>::infinity();
                    }
                    hypothesis.arguments.push_back(std::move(argument));
                }
            }
            results[i].push_back(std::move(hypothesis));
        }
    }
    return results;
}

} // namespace tacpred
