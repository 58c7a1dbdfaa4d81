#include "ragged.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace tacpred
{

namespace
{

constexpr double kNegInf = -std::numeric_limits<double>::infinity();

torch::TensorOptions indexOptions(const torch::Tensor& like)
{
    return torch::TensorOptions().dtype(torch::kInt64).device(like.device());
}

torch::Tensor lengthsFromSplits(const torch::Tensor& splits)
{
    return splits.slice(0, 1) - splits.slice(0, 0, -1);
}

torch::Tensor splitsFromLengths(const torch::Tensor& lengths)
{
    auto zero = torch::zeros({1}, indexOptions(lengths));
    return torch::cat({zero, torch::cumsum(lengths.to(torch::kInt64), 0)});
}

torch::Tensor rowidsFromSplits(const torch::Tensor& splits)
{
    auto lengths = lengthsFromSplits(splits);
    auto rows = torch::arange(lengths.size(0), indexOptions(splits));
    return torch::repeat_interleave(rows, lengths);
}

// Scatters the rows of `values` ([N, ...]) into a [nrows, width, ...] tensor.
torch::Tensor padRows(const torch::Tensor& values, const torch::Tensor& splits, double fill, int64_t min_width)
{
    const int64_t nrows = splits.size(0) - 1;
    auto lengths = lengthsFromSplits(splits);
    int64_t width = nrows > 0 ? lengths.max().item<int64_t>() : 0;
    width = std::max(width, min_width);

    std::vector<int64_t> shape = {nrows, width};
    for (int64_t d = 1; d < values.dim(); ++d)
        shape.push_back(values.size(d));

    auto out = torch::full(shape, fill, values.options());
    if (values.size(0) == 0)
        return out;

    auto rowids = rowidsFromSplits(splits);
    auto cols = torch::arange(values.size(0), indexOptions(splits)) - splits.index_select(0, rowids);
    return out.index_put({rowids, cols}, values);
}

template <typename T>
torch::Tensor vectorToTensor(const std::vector<T>& data, torch::ScalarType dtype)
{
    auto t = torch::empty({static_cast<int64_t>(data.size())}, torch::TensorOptions().dtype(dtype));
    if (!data.empty())
        std::memcpy(t.data_ptr(), data.data(), data.size() * sizeof(T));
    return t;
}

void checkSameOuterRows(const RaggedTensor& labels, const RaggedTensor& scores, const char* where)
{
    if (labels.raggedRank() != 1)
        throw std::invalid_argument(std::string(where) + ": labels must be [batch, None(args)]");
    if (scores.raggedRank() != 2)
        throw std::invalid_argument(std::string(where) + ": scores must be [batch, None(args), None(candidates)]");
    if (!torch::equal(labels.rowSplits(), scores.rowSplits()))
        throw std::invalid_argument(std::string(where) + ": argument counts of labels and scores disagree");
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

RaggedTensor RaggedTensor::fromRowSplits(torch::Tensor values, torch::Tensor row_splits)
{
    if (row_splits.dim() != 1 || row_splits.size(0) < 1)
        throw std::invalid_argument("row_splits must be a non-empty vector");
    row_splits = row_splits.to(torch::kInt64);
    if (row_splits[0].item<int64_t>() != 0)
        throw std::invalid_argument("row_splits must start at 0");
    if (row_splits[-1].item<int64_t>() != values.size(0))
        throw std::invalid_argument("row_splits end at " + std::to_string(row_splits[-1].item<int64_t>())
                                    + " but there are " + std::to_string(values.size(0)) + " values");
    return RaggedTensor{std::move(values), {std::move(row_splits)}};
}

RaggedTensor RaggedTensor::fromRowLengths(torch::Tensor values, const torch::Tensor& row_lengths)
{
    return fromRowSplits(std::move(values), splitsFromLengths(row_lengths));
}

RaggedTensor RaggedTensor::fromValueRowids(torch::Tensor values, const torch::Tensor& value_rowids, int64_t nrows)
{
    auto ones = torch::ones({value_rowids.size(0)}, indexOptions(value_rowids));
    auto lengths = segmentSum(ones, value_rowids.to(torch::kInt64), nrows);
    return fromRowLengths(std::move(values), lengths);
}

RaggedTensor RaggedTensor::fromDense(const torch::Tensor& dense, const torch::Tensor& lengths)
{
    if (dense.dim() < 2)
        throw std::invalid_argument("fromDense needs a tensor of rank >= 2");
    if (lengths.dim() != 1 || lengths.size(0) != dense.size(0))
        throw std::invalid_argument("fromDense: " + std::to_string(lengths.numel()) + " lengths for "
                                    + std::to_string(dense.size(0)) + " rows");

    auto lens = lengths.to(torch::kInt64).to(dense.device());
    const int64_t width = dense.size(1);
    if (lens.numel() > 0 && lens.max().item<int64_t>() > width)
        throw std::invalid_argument("fromDense: row length " + std::to_string(lens.max().item<int64_t>())
                                    + " exceeds padded width " + std::to_string(width));

    auto mask = torch::arange(width, indexOptions(dense)).unsqueeze(0) < lens.unsqueeze(1);
    return fromRowLengths(dense.index({mask}), lens);
}

RaggedTensor RaggedTensor::fromNested(const std::vector<std::vector<int64_t>>& rows)
{
    std::vector<int64_t> flat;
    std::vector<int64_t> splits = {0};
    for (const auto& row : rows)
    {
        flat.insert(flat.end(), row.begin(), row.end());
        splits.push_back(static_cast<int64_t>(flat.size()));
    }
    return fromRowSplits(vectorToTensor(flat, torch::kInt64), vectorToTensor(splits, torch::kInt64));
}

RaggedTensor RaggedTensor::fromNested(const std::vector<std::vector<float>>& rows)
{
    std::vector<float> flat;
    std::vector<int64_t> splits = {0};
    for (const auto& row : rows)
    {
        flat.insert(flat.end(), row.begin(), row.end());
        splits.push_back(static_cast<int64_t>(flat.size()));
    }
    return fromRowSplits(vectorToTensor(flat, torch::kFloat32), vectorToTensor(splits, torch::kInt64));
}

RaggedTensor RaggedTensor::fromNested(const std::vector<std::vector<std::vector<float>>>& rows)
{
    std::vector<float> flat;
    std::vector<int64_t> outer = {0};
    std::vector<int64_t> inner = {0};
    for (const auto& row : rows)
    {
        for (const auto& position : row)
        {
            flat.insert(flat.end(), position.begin(), position.end());
            inner.push_back(static_cast<int64_t>(flat.size()));
        }
        outer.push_back(static_cast<int64_t>(inner.size()) - 1);
    }
    auto inner_ragged = fromRowSplits(vectorToTensor(flat, torch::kFloat32), vectorToTensor(inner, torch::kInt64));
    return fromRowSplits(torch::empty({static_cast<int64_t>(inner.size()) - 1}), vectorToTensor(outer, torch::kInt64))
        .withValues(inner_ragged);
}

// ============================================================================
// Shape
// ============================================================================

torch::Tensor RaggedTensor::rowLengths() const
{
    return lengthsFromSplits(rowSplits());
}

torch::Tensor RaggedTensor::valueRowids() const
{
    return rowidsFromSplits(rowSplits());
}

RaggedTensor RaggedTensor::values() const
{
    if (raggedRank() < 2)
        throw std::invalid_argument("values() needs a ragged rank of at least 2");
    return RaggedTensor{flat_values,
                        std::vector<torch::Tensor>(nested_row_splits.begin() + 1, nested_row_splits.end())};
}

RaggedTensor RaggedTensor::withValues(const RaggedTensor& values) const
{
    const int64_t expected = rowSplits()[-1].item<int64_t>();
    if (values.nrows() != expected)
        throw std::invalid_argument("withValues: " + std::to_string(values.nrows()) + " inner rows, expected "
                                    + std::to_string(expected));
    RaggedTensor result{values.flat_values, {rowSplits()}};
    result.nested_row_splits.insert(result.nested_row_splits.end(),
                                    values.nested_row_splits.begin(), values.nested_row_splits.end());
    return result;
}

RaggedTensor RaggedTensor::withFlatValues(torch::Tensor values) const
{
    if (values.size(0) != flat_values.size(0))
        throw std::invalid_argument("withFlatValues: value count changed from " + std::to_string(flat_values.size(0))
                                    + " to " + std::to_string(values.size(0)));
    return RaggedTensor{std::move(values), nested_row_splits};
}

// ============================================================================
// Conversion
// ============================================================================

torch::Tensor RaggedTensor::toDense(double fill) const
{
    return toDense(std::vector<double>(nested_row_splits.size(), fill));
}

torch::Tensor RaggedTensor::toDense(const std::vector<double>& fills, const std::vector<int64_t>& widths) const
{
    if (fills.size() != nested_row_splits.size())
        throw std::invalid_argument("toDense: one fill value per ragged level is required");
    if (!widths.empty() && widths.size() != nested_row_splits.size())
        throw std::invalid_argument("toDense: one width per ragged level is required");

    torch::Tensor dense = flat_values;
    for (int level = raggedRank() - 1; level >= 0; --level)
    {
        const int64_t min_width = widths.empty() ? 0 : widths[level];
        dense = padRows(dense, nested_row_splits[level], fills[level], min_width);
    }
    return dense;
}

std::vector<std::vector<int64_t>> RaggedTensor::toNestedInt() const
{
    if (raggedRank() != 1)
        throw std::invalid_argument("toNestedInt needs a ragged rank of 1");
    auto values = flat_values.to(torch::kCPU).to(torch::kInt64).contiguous();
    auto splits = rowSplits().to(torch::kCPU).contiguous();
    const int64_t* v = values.data_ptr<int64_t>();
    const int64_t* s = splits.data_ptr<int64_t>();

    std::vector<std::vector<int64_t>> rows(nrows());
    for (int64_t r = 0; r < nrows(); ++r)
        rows[r].assign(v + s[r], v + s[r + 1]);
    return rows;
}

std::vector<std::vector<float>> RaggedTensor::toNestedFloat() const
{
    if (raggedRank() != 1)
        throw std::invalid_argument("toNestedFloat needs a ragged rank of 1");
    auto values = flat_values.detach().to(torch::kCPU).to(torch::kFloat32).contiguous();
    auto splits = rowSplits().to(torch::kCPU).contiguous();
    const float* v = values.data_ptr<float>();
    const int64_t* s = splits.data_ptr<int64_t>();

    std::vector<std::vector<float>> rows(nrows());
    for (int64_t r = 0; r < nrows(); ++r)
        rows[r].assign(v + s[r], v + s[r + 1]);
    return rows;
}

// ============================================================================
// Row operations
// ============================================================================

RaggedTensor RaggedTensor::gatherRows(const torch::Tensor& row_indices) const
{
    auto idx = row_indices.to(torch::kInt64).to(rowSplits().device());
    auto lengths = rowLengths().index_select(0, idx);
    auto starts = rowSplits().index_select(0, idx);
    auto new_splits = splitsFromLengths(lengths);

    auto rowids = torch::repeat_interleave(torch::arange(idx.size(0), indexOptions(idx)), lengths);
    auto positions = torch::arange(rowids.size(0), indexOptions(idx))
                     - new_splits.index_select(0, rowids) + starts.index_select(0, rowids);

    if (raggedRank() == 1)
        return RaggedTensor{flat_values.index_select(0, positions), {new_splits}};

    RaggedTensor inner = values().gatherRows(positions);
    RaggedTensor result{inner.flat_values, {new_splits}};
    result.nested_row_splits.insert(result.nested_row_splits.end(),
                                    inner.nested_row_splits.begin(), inner.nested_row_splits.end());
    return result;
}

RaggedTensor RaggedTensor::tile(int64_t times) const
{
    if (times < 1)
        throw std::invalid_argument("tile: repetition count must be positive");
    auto idx = torch::arange(nrows(), indexOptions(rowSplits())).repeat({times});
    return gatherRows(idx);
}

RaggedTensor RaggedTensor::to(const torch::Device& device) const
{
    RaggedTensor result{flat_values.to(device), {}};
    for (const auto& splits : nested_row_splits)
        result.nested_row_splits.push_back(splits.to(device));
    return result;
}

// ============================================================================
// Free functions
// ============================================================================

torch::Tensor segmentSum(const torch::Tensor& values, const torch::Tensor& value_rowids, int64_t nrows)
{
    auto v = values.scalar_type() == torch::kBool ? values.to(torch::kInt64) : values;
    std::vector<int64_t> shape = {nrows};
    for (int64_t d = 1; d < v.dim(); ++d)
        shape.push_back(v.size(d));
    return torch::zeros(shape, v.options()).index_add(0, value_rowids, v);
}

std::pair<torch::Tensor, torch::Tensor> segmentMaxArgmax(const RaggedTensor& scores)
{
    if (scores.raggedRank() != 1)
        throw std::invalid_argument("segmentMaxArgmax needs a ragged rank of 1");

    const int64_t nrows = scores.nrows();
    auto values = scores.flat_values.detach();
    auto rowids = scores.valueRowids();

    auto best = torch::full({nrows}, kNegInf, values.options())
                    .scatter_reduce(0, rowids, values, "amax", /*include_self=*/true);

    const int64_t none = std::numeric_limits<int64_t>::max();
    auto cols = torch::arange(values.size(0), indexOptions(values)) - scores.rowSplits().index_select(0, rowids);
    auto is_best = values == best.index_select(0, rowids);
    auto candidates = torch::where(is_best, cols, torch::full_like(cols, none));
    auto argmax = torch::full({nrows}, none, indexOptions(values))
                      .scatter_reduce(0, rowids, candidates, "amin", /*include_self=*/true);
    argmax = torch::where(argmax == none, torch::zeros_like(argmax), argmax);
    return {best, argmax};
}

std::pair<RaggedTensor, RaggedTensor> filterValid(const RaggedTensor& labels, const RaggedTensor& scores)
{
    checkSameOuterRows(labels, scores, "filterValid");

    auto keep = labels.flat_values != kSentinel;
    auto keep_idx = torch::nonzero(keep).squeeze(1);
    auto counts = segmentSum(keep.to(torch::kInt64), labels.valueRowids(), labels.nrows());
    auto new_splits = splitsFromLengths(counts);

    RaggedTensor valid_labels{labels.flat_values.index_select(0, keep_idx), {new_splits}};
    RaggedTensor inner = scores.values().gatherRows(keep_idx);
    RaggedTensor valid_scores{inner.flat_values, {new_splits, inner.rowSplits()}};
    return {valid_labels, valid_scores};
}

std::pair<torch::Tensor, torch::Tensor> filterValidDense(const RaggedTensor& labels, const torch::Tensor& scores)
{
    if (labels.raggedRank() != 1)
        throw std::invalid_argument("filterValidDense: labels must be [batch, None(args)]");
    if (scores.dim() != 3 || scores.size(0) != labels.nrows())
        throw std::invalid_argument("filterValidDense: scores must be [batch, max(args), candidates]");

    auto rowids = labels.valueRowids();
    auto cols = torch::arange(labels.numValues(), indexOptions(rowids)) - labels.rowSplits().index_select(0, rowids);
    if (cols.numel() > 0 && cols.max().item<int64_t>() >= scores.size(1))
        throw std::invalid_argument("filterValidDense: more labelled arguments than score rows");

    auto keep_idx = torch::nonzero(labels.flat_values != kSentinel).squeeze(1);
    auto rows = rowids.index_select(0, keep_idx);
    auto positions = cols.index_select(0, keep_idx);
    return {labels.flat_values.index_select(0, keep_idx), scores.index({rows, positions})};
}

RaggedTensor gatherByLabel(const RaggedTensor& scores, const RaggedTensor& labels)
{
    checkSameOuterRows(labels, scores, "gatherByLabel");

    RaggedTensor candidates = scores.values();
    auto lengths = candidates.rowLengths();
    const auto& label_values = labels.flat_values;

    if (label_values.numel() > 0)
    {
        auto bad = (label_values < 0) | (label_values >= lengths);
        if (bad.any().item<bool>())
        {
            const int64_t pos = torch::nonzero(bad)[0][0].item<int64_t>();
            throw std::out_of_range("gatherByLabel: label " + std::to_string(label_values[pos].item<int64_t>())
                                    + " at argument position " + std::to_string(pos) + " is outside its "
                                    + std::to_string(lengths[pos].item<int64_t>()) + " candidates");
        }
    }

    auto starts = candidates.rowSplits().slice(0, 0, -1);
    auto picked = candidates.flat_values.index_select(0, starts + label_values);
    return labels.withFlatValues(picked);
}

} // namespace tacpred
