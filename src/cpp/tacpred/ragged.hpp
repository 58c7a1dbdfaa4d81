#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace tacpred
{

/// Marks "no ground-truth value" in argument label rows. Never a valid index.
constexpr int64_t kSentinel = -1;

/// Batch of variable-length rows stored as flat values plus int64 row splits.
///
/// `nested_row_splits` is ordered outermost first. With one level of splits the
/// tensor has shape [nrows, None, ...]; with two levels it is
/// [nrows, None, None, ...] (e.g. [batch, None(args), None(context)]).
/// All operations work on the offset arrays directly and are linear in the
/// number of values.
struct RaggedTensor
{
    torch::Tensor flat_values;
    std::vector<torch::Tensor> nested_row_splits;

    // ==================== Construction ====================

    static RaggedTensor fromRowSplits(torch::Tensor values, torch::Tensor row_splits);
    static RaggedTensor fromRowLengths(torch::Tensor values, const torch::Tensor& row_lengths);
    static RaggedTensor fromValueRowids(torch::Tensor values, const torch::Tensor& value_rowids, int64_t nrows);

    /// Drops the padding of a dense [nrows, width, ...] tensor: row i keeps its
    /// first `lengths[i]` entries. Throws if a length exceeds the width.
    static RaggedTensor fromDense(const torch::Tensor& dense, const torch::Tensor& lengths);

    static RaggedTensor fromNested(const std::vector<std::vector<int64_t>>& rows);
    static RaggedTensor fromNested(const std::vector<std::vector<float>>& rows);
    static RaggedTensor fromNested(const std::vector<std::vector<std::vector<float>>>& rows);

    // ==================== Shape ====================

    int raggedRank() const { return static_cast<int>(nested_row_splits.size()); }
    int64_t nrows() const { return nested_row_splits.front().size(0) - 1; }
    int64_t numValues() const { return flat_values.size(0); }

    const torch::Tensor& rowSplits() const { return nested_row_splits.front(); }
    torch::Tensor rowLengths() const;
    torch::Tensor valueRowids() const;

    /// The ragged tensor one level down (drops the outermost splits).
    /// Requires raggedRank() >= 2.
    RaggedTensor values() const;

    /// Same outer partitioning with a new inner ragged tensor (or flat values).
    RaggedTensor withValues(const RaggedTensor& values) const;
    RaggedTensor withFlatValues(torch::Tensor values) const;

    // ==================== Conversion ====================

    /// Pads every ragged level with `fill`.
    torch::Tensor toDense(double fill) const;

    /// Pads each ragged level with its own fill value, outermost first.
    /// `widths` optionally forces a minimum padded width per level.
    torch::Tensor toDense(const std::vector<double>& fills,
                          const std::vector<int64_t>& widths = {}) const;

    std::vector<std::vector<int64_t>> toNestedInt() const;
    std::vector<std::vector<float>> toNestedFloat() const;

    // ==================== Row operations ====================

    /// Selects whole outer rows (in the given order, repeats allowed).
    RaggedTensor gatherRows(const torch::Tensor& row_indices) const;

    /// Concatenates `times` copies of the rows: row i of copy k is row
    /// k * nrows() + i of the result.
    RaggedTensor tile(int64_t times) const;

    RaggedTensor to(const torch::Device& device) const;
};

/// Per-row sum of a value vector grouped by `value_rowids`; empty rows give 0.
torch::Tensor segmentSum(const torch::Tensor& values, const torch::Tensor& value_rowids, int64_t nrows);

/// Per-row max and first arg-max over the innermost ragged level of `scores`
/// ([..., None(candidates)] with raggedRank() == 1 after dropping outer levels).
/// Empty rows give (-inf, 0).
std::pair<torch::Tensor, torch::Tensor> segmentMaxArgmax(const RaggedTensor& scores);

/// Keeps only the entries whose label differs from kSentinel.
///
/// labels: [batch, None(args)] int64.
/// scores: [batch, None(args), None(candidates)] sharing the outer splits.
/// Returns ([batch, None(valid)], [batch, None(valid), None(candidates)]).
/// A row with only sentinels becomes an empty row.
std::pair<RaggedTensor, RaggedTensor> filterValid(const RaggedTensor& labels, const RaggedTensor& scores);

/// Dense variant: scores is [batch, max(args), candidates]. Returns the flat
/// valid labels [n] and their score rows [n, candidates].
std::pair<torch::Tensor, torch::Tensor> filterValidDense(const RaggedTensor& labels, const torch::Tensor& scores);

/// Picks, for every argument position, the score of its labelled candidate.
///
/// scores: [batch, None(args), None(candidates)], labels: [batch, None(args)].
/// Returns [batch, None(args)]. Throws std::out_of_range when a label does not
/// address a candidate of its own row (sentinels included).
RaggedTensor gatherByLabel(const RaggedTensor& scores, const RaggedTensor& labels);

} // namespace tacpred
