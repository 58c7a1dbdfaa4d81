#include "candidates.hpp"

#include <limits>
#include <stdexcept>
#include <string>

#include "normalizer.hpp"

namespace tacpred
{

namespace
{

constexpr double kNegInf = -std::numeric_limits<double>::infinity();

RaggedTensor mulBroadcastRagged(const RaggedTensor& queries, const RaggedTensor& keys)
{
    // [batch-args, None(candidates), hidden]
    RaggedTensor keys_per_arg = keys.gatherRows(queries.valueRowids());
    // [batch-args-candidates, hidden]
    auto query_per_key = queries.flat_values.index_select(0, keys_per_arg.valueRowids());
    auto logits = (keys_per_arg.flat_values * query_per_key).sum(-1);
    return queries.withValues(keys_per_arg.withFlatValues(logits));
}

RaggedTensor mulRaggedToDenseToRagged(const RaggedTensor& queries, const RaggedTensor& keys)
{
    auto queries_dense = queries.toDense(0.0); // [batch, max(args), hidden]
    auto keys_dense = keys.toDense(0.0);       // [batch, max(candidates), hidden]
    auto logits_dense = torch::einsum("ijl,ikl->ijk", {queries_dense, keys_dense});

    // [batch, None(args), max(candidates)]
    RaggedTensor per_arg = RaggedTensor::fromDense(logits_dense, queries.rowLengths());
    auto lengths = keys.rowLengths().index_select(0, queries.valueRowids());
    return per_arg.withValues(RaggedTensor::fromDense(per_arg.flat_values, lengths));
}

void checkBatch(const BatchTensors& batch, const RaggedTensor& argument_states, const char* where)
{
    if (argument_states.raggedRank() != 1 || argument_states.nrows() != batch.batchSize())
        throw std::invalid_argument(std::string(where) + ": argument states must be [batch, None(args), hidden] with "
                                    + std::to_string(batch.batchSize()) + " rows");
}

// Outer split of a dense [batch, max(args), width] tensor into [batch, None(args), width].
RaggedTensor argumentRows(const torch::Tensor& dense, const BatchTensors& batch, const torch::Tensor& argument_counts)
{
    if (dense.dim() != 3 || dense.size(0) != batch.batchSize() || argument_counts.size(0) != batch.batchSize())
        throw std::invalid_argument("toRagged: scores must be [batch, max(args), candidates] for "
                                    + std::to_string(batch.batchSize()) + " examples");
    return RaggedTensor::fromDense(dense, argument_counts);
}

} // anonymous namespace

// ============================================================================
// Similarity scoring
// ============================================================================

RaggedTensor queryKeyMul(const RaggedTensor& queries, const RaggedTensor& keys, QueryKeyMethod method)
{
    if (queries.raggedRank() != 1 || keys.raggedRank() != 1)
        throw std::invalid_argument("queryKeyMul: queries and keys must have a ragged rank of 1");
    if (queries.nrows() != keys.nrows())
        throw std::invalid_argument("queryKeyMul: " + std::to_string(queries.nrows()) + " query rows but "
                                    + std::to_string(keys.nrows()) + " key rows");

    switch (method)
    {
    case QueryKeyMethod::BROADCAST_RAGGED:
        return mulBroadcastRagged(queries, keys);
    case QueryKeyMethod::RAGGED_TO_DENSE_TO_RAGGED:
        return mulRaggedToDenseToRagged(queries, keys);
    }
    throw std::invalid_argument("Unsupported multiplication method");
}

torch::Tensor unitNormalize(const torch::Tensor& x)
{
    auto norm = x.norm(2, -1, /*keepdim=*/true);
    auto safe = torch::where(norm > 0, norm, torch::ones_like(norm));
    return torch::where(norm > 0, x / safe, torch::zeros_like(x));
}

torch::Tensor scoresToDense(const RaggedTensor& scores, int64_t candidate_width)
{
    if (scores.raggedRank() != 2)
        throw std::invalid_argument("scoresToDense: scores must be [batch, None(args), None(candidates)]");
    return scores.toDense({0.0, kNegInf}, {0, candidate_width});
}

RaggedTensor localContextHidden(const EncodedGraph& graph, const RaggedTensor& local_context_ids)
{
    const auto& nodes = graph.node_hidden;
    if (local_context_ids.nrows() != nodes.nrows())
        throw std::invalid_argument("localContextHidden: " + std::to_string(local_context_ids.nrows())
                                    + " local contexts for " + std::to_string(nodes.nrows()) + " graphs");

    // node ids of each graph are shifted by the number of nodes before it
    auto offsets = nodes.rowSplits().index_select(0, local_context_ids.valueRowids());
    auto hidden = nodes.flat_values.index_select(0, offsets + local_context_ids.flat_values);
    return local_context_ids.withFlatValues(hidden);
}

// ============================================================================
// LocalCandidatePool
// ============================================================================

LocalCandidatePoolImpl::LocalCandidatePoolImpl(int64_t hidden_size, bool project, QueryKeyMethod method)
    : method_(method)
{
    if (project)
        projection_ = register_module("projection", torch::nn::Linear(hidden_size, hidden_size));
}

torch::Tensor LocalCandidatePoolImpl::denseScores(const EncodedGraph& graph, const BatchTensors& batch,
                                                  const RaggedTensor& argument_states)
{
    checkBatch(batch, argument_states, "LocalCandidatePool");

    RaggedTensor queries = projection_
        ? argument_states.withFlatValues(projection_(argument_states.flat_values))
        : argument_states;
    RaggedTensor keys = localContextHidden(graph, batch.local_context_ids);

    auto lengths = batch.local_context_ids.rowLengths();
    const int64_t width = lengths.numel() > 0 ? lengths.max().item<int64_t>() : 0;
    return scoresToDense(queryKeyMul(queries, keys, method_), width);
}

RaggedTensor LocalCandidatePoolImpl::toRagged(const torch::Tensor& dense, const BatchTensors& batch,
                                              const torch::Tensor& argument_counts) const
{
    RaggedTensor rows = argumentRows(dense, batch, argument_counts);
    // local scores are already in context order; drop the -inf tail of each row
    auto lengths = batch.local_context_ids.rowLengths().index_select(0, rows.valueRowids());
    return rows.withValues(RaggedTensor::fromDense(rows.flat_values, lengths));
}

// ============================================================================
// GlobalCandidatePool
// ============================================================================

GlobalCandidatePoolImpl::GlobalCandidatePoolImpl(std::shared_ptr<ProofStateEncoder> encoder, int64_t hidden_size,
                                                 int64_t global_context_size, bool cosine_similarity,
                                                 bool dynamic_global_context, QueryKeyMethod method)
    : encoder_(std::move(encoder))
    , global_context_size_(global_context_size)
    , cosine_similarity_(cosine_similarity)
    , dynamic_global_context_(dynamic_global_context)
    , method_(method)
{
    if (!encoder_)
        throw std::invalid_argument("GlobalCandidatePool needs an encoder");
    projection_ = register_module("projection", torch::nn::Linear(hidden_size, hidden_size));
    // cosine similarities lie in [-1, 1]; the temperature rescales them to [-1/t, 1/t]
    if (cosine_similarity_)
        temperature_ = register_parameter("temperature", torch::ones({}));
}

torch::Tensor GlobalCandidatePoolImpl::denseScores(const EncodedGraph& graph, const BatchTensors& batch,
                                                   const RaggedTensor& argument_states)
{
    (void)graph;
    checkBatch(batch, argument_states, "GlobalCandidatePool");

    auto embeddings = encoder_->globalEmbeddings(); // [global_context_size, hidden]
    if (embeddings.size(0) != global_context_size_)
        throw std::invalid_argument("GlobalCandidatePool: encoder has " + std::to_string(embeddings.size(0))
                                    + " global embeddings, expected " + std::to_string(global_context_size_));

    const int64_t n = batch.batchSize();
    auto index_options = torch::TensorOptions().dtype(torch::kInt64).device(embeddings.device());
    // every example sees the whole vocabulary: [batch, global_context_size, hidden]
    RaggedTensor keys = RaggedTensor::fromRowSplits(embeddings.repeat({n, 1}),
                                                    torch::arange(n + 1, index_options) * global_context_size_);
    RaggedTensor queries = argument_states.withFlatValues(projection_(argument_states.flat_values));

    if (cosine_similarity_)
    {
        keys = keys.withFlatValues(unitNormalize(keys.flat_values));
        queries = queries.withFlatValues(unitNormalize(queries.flat_values));
    }

    RaggedTensor logits = queryKeyMul(queries, keys, method_);
    if (cosine_similarity_)
        logits = logits.withFlatValues(logits.flat_values / temperature_);

    auto dense = scoresToDense(logits, global_context_size_);
    if (dynamic_global_context_)
        dense = dense + globalAvailabilityMask(batch.global_context_ids, global_context_size_).unsqueeze(1);
    return dense;
}

RaggedTensor GlobalCandidatePoolImpl::toRagged(const torch::Tensor& dense, const BatchTensors& batch,
                                               const torch::Tensor& argument_counts) const
{
    RaggedTensor rows = argumentRows(dense, batch, argument_counts);
    const int64_t width = dense.size(2);

    // the available ids of every argument row, in the order the example lists them
    RaggedTensor ids = batch.global_context_ids.gatherRows(rows.valueRowids());
    if (ids.numValues() > 0 && ids.flat_values.max().item<int64_t>() >= width)
        throw std::out_of_range("GlobalCandidatePool: available global id outside the "
                                + std::to_string(width) + " scored entries");

    auto flat_index = ids.valueRowids() * width + ids.flat_values;
    auto picked = rows.flat_values.reshape({-1}).index_select(0, flat_index);
    return rows.withValues(ids.withFlatValues(picked));
}

} // namespace tacpred
