#include "encoder.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tacpred
{

EncodedGraph EncodedGraph::tile(int64_t times) const
{
    return EncodedGraph{node_hidden.tile(times), graph_hidden.repeat({times, 1})};
}

EmbeddingEncoderImpl::EmbeddingEncoderImpl(const GraphConstants& constants, int hidden_size,
                                           int tactic_embedding_size, bool unit_norm_embs)
    : hidden_size_(hidden_size)
    , unit_norm_embs_(unit_norm_embs)
{
    constants.validate();
    const int64_t max_arguments = std::max<int64_t>(1, constants.maxArguments());

    node_embedding_ = register_module("node_embedding",
        torch::nn::Embedding(constants.node_label_num, hidden_size));
    tactic_embedding_ = register_module("tactic_embedding",
        torch::nn::Embedding(constants.tactic_num, tactic_embedding_size));
    position_embedding_ = register_module("position_embedding",
        torch::nn::Embedding(max_arguments, hidden_size));
    tactic_head_ = register_module("tactic_head", torch::nn::Linear(hidden_size, tactic_embedding_size));
    arguments_head_ = register_module("arguments_head",
        torch::nn::Linear(hidden_size + tactic_embedding_size, hidden_size));

    auto labels = constants.global_context.empty()
        ? torch::zeros({0}, torch::kInt64)
        : torch::tensor(constants.global_context, torch::TensorOptions().dtype(torch::kInt64));
    global_labels_ = register_buffer("global_labels", labels);
}

torch::Tensor EmbeddingEncoderImpl::nodeEmbeddings() const
{
    auto weight = node_embedding_->weight;
    if (!unit_norm_embs_)
        return weight;
    return torch::nn::functional::normalize(weight, torch::nn::functional::NormalizeFuncOptions().dim(-1));
}

EncodedGraph EmbeddingEncoderImpl::encode(const BatchTensors& batch)
{
    const auto& labels = batch.node_labels;
    const int64_t label_num = node_embedding_->weight.size(0);
    if (labels.numValues() > 0
        && (labels.flat_values.min().item<int64_t>() < 0 || labels.flat_values.max().item<int64_t>() >= label_num))
        throw std::invalid_argument("encode: node label outside " + std::to_string(label_num) + " node labels");
    auto hidden = nodeEmbeddings().index_select(0, labels.flat_values);

    const int64_t n = labels.nrows();
    auto counts = labels.rowLengths().clamp_min(1).to(hidden.scalar_type()).unsqueeze(1);
    auto pooled = segmentSum(hidden, labels.valueRowids(), n) / counts;

    return EncodedGraph{labels.withFlatValues(hidden), pooled};
}

torch::Tensor EmbeddingEncoderImpl::tacticLogits(const EncodedGraph& graph)
{
    auto embedding = tactic_head_(graph.graph_hidden);
    return torch::matmul(embedding, tactic_embedding_->weight.t());
}

RaggedTensor EmbeddingEncoderImpl::argumentStates(const EncodedGraph& graph, const torch::Tensor& tactic,
                                                  const torch::Tensor& num_arguments)
{
    const int64_t n = graph.batchSize();
    if (tactic.size(0) != n || num_arguments.size(0) != n)
        throw std::invalid_argument("argumentStates: " + std::to_string(tactic.size(0)) + " tactics and "
                                    + std::to_string(num_arguments.size(0)) + " argument counts for "
                                    + std::to_string(n) + " graphs");

    auto counts = num_arguments.to(torch::kInt64);
    auto index_options = torch::TensorOptions().dtype(torch::kInt64).device(counts.device());
    auto rowids = torch::repeat_interleave(torch::arange(n, index_options), counts);
    auto splits = torch::cat({torch::zeros({1}, index_options), torch::cumsum(counts, 0)});
    auto positions = torch::arange(rowids.size(0), index_options) - splits.index_select(0, rowids);

    if (positions.numel() > 0 && positions.max().item<int64_t>() >= position_embedding_->weight.size(0))
        throw std::invalid_argument("argumentStates: more argument slots than the arity table allows");

    auto context = torch::cat({graph.graph_hidden.index_select(0, rowids),
                               tactic_embedding_(tactic.index_select(0, rowids))}, 1);
    auto states = torch::tanh(arguments_head_(context)) + position_embedding_(positions);
    return RaggedTensor::fromRowSplits(states, splits);
}

torch::Tensor EmbeddingEncoderImpl::globalEmbeddings()
{
    return nodeEmbeddings().index_select(0, global_labels_);
}

} // namespace tacpred
