/**
 * @file table_reindexer.cpp
 */
#include "xdslc/conversion/table_reindexer.hpp"
#include "xdslc/common/conversion_exceptions.hpp"

namespace xdslc
{

size_t layout_size(const TableLayout& layout) noexcept
{
    size_t product = 1;
    for (const auto& axis : layout)
    {
        product *= axis.size;
    }
    return product;
}

TableLayout TableReindexer::layout(const ModelGraph& graph, NodeIdx idx,
                                   AxisConvention convention) const
{
    const NodeRecord& node = graph.node(idx);

    TableLayout parents;
    parents.reserve(node.parents.size());
    for (const auto& parent_id : node.parents)
    {
        auto parent_idx = graph.find_node(parent_id);
        if (!parent_idx.has_value())
        {
            throw ConversionError(
                ConversionErrorCode::InvariantViolation,
                "Parent '" + parent_id + "' of node '" + node.id + "' does not resolve");
        }
        parents.push_back(TableAxis{parent_id, graph.node(parent_idx.value()).states.size()});
    }

    TableLayout result;
    switch (convention)
    {
    case AxisConvention::Interchange:
        result = std::move(parents);
        break;
    case AxisConvention::TargetLibrary:
        result.assign(parents.rbegin(), parents.rend());
        break;
    }

    if (node.kind != NodeKind::Utility)
    {
        result.push_back(TableAxis{node.id, node.states.size()});
    }
    return result;
}

std::vector<double> TableReindexer::permute(const std::vector<double>& values,
                                            const TableLayout& source,
                                            const TableLayout& target) const
{
    const size_t rank = source.size();
    if (target.size() != rank)
    {
        throw ConversionError(
            ConversionErrorCode::InvariantViolation,
            "Cannot permute a table of rank " + std::to_string(rank) + " into rank " +
                std::to_string(target.size()));
    }

    const size_t total = layout_size(source);
    if (values.size() != total)
    {
        throw ConversionError(
            ConversionErrorCode::InvariantViolation,
            "Table holds " + std::to_string(values.size()) + " values; its layout requires " +
                std::to_string(total));
    }

    // Source strides: the last axis varies fastest.
    std::vector<size_t> source_stride(rank, 1);
    for (size_t k = rank; k-- > 1;)
    {
        source_stride[k - 1] = source_stride[k] * source[k].size;
    }

    // For each target axis, the stride of the same variable in the source.
    std::vector<size_t> target_to_source_stride(rank, 0);
    std::vector<bool> used(rank, false);
    for (size_t t = 0; t < rank; ++t)
    {
        bool found = false;
        for (size_t s = 0; s < rank; ++s)
        {
            if (!used[s] && source[s] == target[t])
            {
                used[s] = true;
                target_to_source_stride[t] = source_stride[s];
                found = true;
                break;
            }
        }
        if (!found)
        {
            throw ConversionError(
                ConversionErrorCode::InvariantViolation,
                "Target axis '" + target[t].node_id + "' has no matching source axis");
        }
    }

    std::vector<double> result(total);
    for (size_t out = 0; out < total; ++out)
    {
        size_t remainder = out;
        size_t offset = 0;
        for (size_t t = rank; t-- > 0;)
        {
            size_t index = remainder % target[t].size;
            remainder /= target[t].size;
            offset += index * target_to_source_stride[t];
        }
        result[out] = values[offset];
    }
    return result;
}

std::vector<double> TableReindexer::reindex(const ModelGraph& graph, NodeIdx idx,
                                            const std::vector<double>& values,
                                            AxisConvention from, AxisConvention to) const
{
    if (from == to)
    {
        return values;
    }
    return permute(values, layout(graph, idx, from), layout(graph, idx, to));
}

} // namespace xdslc
