#pragma once

#include <cstdint>
#include <vector>

#include <torch/torch.h>

#include "config.hpp"
#include "proof_state.hpp"
#include "ragged.hpp"

namespace tacpred
{

/// Per-node hidden states of a batch of proof-state graphs.
struct EncodedGraph
{
    RaggedTensor node_hidden;   // [batch, None(nodes), hidden]
    torch::Tensor graph_hidden; // [batch, hidden]

    int64_t batchSize() const { return graph_hidden.size(0); }

    /// Repeats the batch `times` times (row k * batch + i is example i).
    EncodedGraph tile(int64_t times) const;
};

/// Interface to the graph encoder and embedding tables the scoring code consumes.
class ProofStateEncoder
{
public:
    virtual ~ProofStateEncoder() = default;

    virtual int64_t hiddenSize() const = 0;

    virtual EncodedGraph encode(const BatchTensors& batch) = 0;

    /// Tactic logits for every graph: [batch, tactic_num].
    virtual torch::Tensor tacticLogits(const EncodedGraph& graph) = 0;

    /// One hidden state per argument slot of the given tactics:
    /// [batch, None(num_arguments), hidden]. Row i has num_arguments[i] entries.
    virtual RaggedTensor argumentStates(const EncodedGraph& graph, const torch::Tensor& tactic,
                                        const torch::Tensor& num_arguments) = 0;

    /// Embeddings of the global vocabulary in id order: [global_context_size, hidden].
    virtual torch::Tensor globalEmbeddings() = 0;

    virtual std::vector<torch::Tensor> trainableParameters() = 0;
};

/// Reference encoder: label embeddings, mean pooling and linear heads.
/// No message passing; it stands in for the graph network in tests and demos.
class EmbeddingEncoderImpl : public torch::nn::Module, public ProofStateEncoder
{
public:
    EmbeddingEncoderImpl(const GraphConstants& constants, int hidden_size, int tactic_embedding_size,
                         bool unit_norm_embs);

    int64_t hiddenSize() const override { return hidden_size_; }

    EncodedGraph encode(const BatchTensors& batch) override;
    torch::Tensor tacticLogits(const EncodedGraph& graph) override;
    RaggedTensor argumentStates(const EncodedGraph& graph, const torch::Tensor& tactic,
                                const torch::Tensor& num_arguments) override;
    torch::Tensor globalEmbeddings() override;
    std::vector<torch::Tensor> trainableParameters() override { return parameters(); }

private:
    torch::Tensor nodeEmbeddings() const;

    int64_t hidden_size_;
    bool unit_norm_embs_;
    torch::Tensor global_labels_; // [global_context_size] int64

    torch::nn::Embedding node_embedding_{nullptr};
    torch::nn::Embedding tactic_embedding_{nullptr};
    torch::nn::Embedding position_embedding_{nullptr};
    torch::nn::Linear tactic_head_{nullptr};
    torch::nn::Linear arguments_head_{nullptr};
};

TORCH_MODULE(EmbeddingEncoder);

} // namespace tacpred
