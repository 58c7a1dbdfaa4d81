#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <torch/torch.h>

#include "config.hpp"
#include "encoder.hpp"
#include "proof_state.hpp"
#include "ragged.hpp"

namespace tacpred
{

// ============================================================================
// Similarity scoring
// ============================================================================

/// Dot product of every query with every key of the same example.
///
/// queries: [batch, None(args), hidden], keys: [batch, None(candidates), hidden].
/// Returns [batch, None(args), None(candidates)].
RaggedTensor queryKeyMul(const RaggedTensor& queries, const RaggedTensor& keys, QueryKeyMethod method);

/// L2-normalises the last axis; an all-zero vector stays zero.
torch::Tensor unitNormalize(const torch::Tensor& x);

/// Dense view of ragged argument scores: -inf pads the candidate axis, 0 pads
/// the argument axis. The candidate axis is at least `candidate_width` wide.
torch::Tensor scoresToDense(const RaggedTensor& scores, int64_t candidate_width);

/// Hidden states of the local context nodes: [batch, None(local context), hidden].
RaggedTensor localContextHidden(const EncodedGraph& graph, const RaggedTensor& local_context_ids);

// ============================================================================
// Candidate pools
// ============================================================================

/// One source of argument candidates.
class CandidatePool
{
public:
    virtual ~CandidatePool() = default;

    /// Raw scores [batch, max(args), width] for every argument slot of
    /// `argument_states` ([batch, None(args), hidden]). Padded argument rows
    /// are 0; padded or unavailable candidates are -inf.
    virtual torch::Tensor denseScores(const EncodedGraph& graph, const BatchTensors& batch,
                                      const RaggedTensor& argument_states) = 0;

    /// Cuts a dense score tensor back to each example's own candidates:
    /// [batch, None(args), None(candidates)]. `argument_counts` is [batch].
    virtual RaggedTensor toRagged(const torch::Tensor& dense, const BatchTensors& batch,
                                  const torch::Tensor& argument_counts) const = 0;

    virtual std::vector<torch::Tensor> trainableParameters() = 0;
};

/// Candidates are the nodes of the example's local context, in order.
class LocalCandidatePoolImpl : public torch::nn::Module, public CandidatePool
{
public:
    /// With `project` the argument states go through a hidden -> hidden layer first.
    LocalCandidatePoolImpl(int64_t hidden_size, bool project, QueryKeyMethod method);

    torch::Tensor denseScores(const EncodedGraph& graph, const BatchTensors& batch,
                              const RaggedTensor& argument_states) override;
    RaggedTensor toRagged(const torch::Tensor& dense, const BatchTensors& batch,
                          const torch::Tensor& argument_counts) const override;
    std::vector<torch::Tensor> trainableParameters() override { return parameters(); }

private:
    QueryKeyMethod method_;
    torch::nn::Linear projection_{nullptr};
};

TORCH_MODULE(LocalCandidatePool);

/// Candidates are the whole global vocabulary; an example may only use its
/// available ids. Scores are dot products, or cosine similarities divided by
/// a learned temperature.
class GlobalCandidatePoolImpl : public torch::nn::Module, public CandidatePool
{
public:
    GlobalCandidatePoolImpl(std::shared_ptr<ProofStateEncoder> encoder, int64_t hidden_size,
                            int64_t global_context_size, bool cosine_similarity, bool dynamic_global_context,
                            QueryKeyMethod method);

    torch::Tensor denseScores(const EncodedGraph& graph, const BatchTensors& batch,
                              const RaggedTensor& argument_states) override;
    RaggedTensor toRagged(const torch::Tensor& dense, const BatchTensors& batch,
                          const torch::Tensor& argument_counts) const override;
    std::vector<torch::Tensor> trainableParameters() override { return parameters(); }

    int64_t globalContextSize() const { return global_context_size_; }
    bool cosineSimilarity() const { return cosine_similarity_; }
    torch::Tensor temperature() const { return temperature_; }

private:
    std::shared_ptr<ProofStateEncoder> encoder_;
    int64_t global_context_size_;
    bool cosine_similarity_;
    bool dynamic_global_context_;
    QueryKeyMethod method_;

    torch::nn::Linear projection_{nullptr};
    torch::Tensor temperature_;
};

TORCH_MODULE(GlobalCandidatePool);

} // namespace tacpred
