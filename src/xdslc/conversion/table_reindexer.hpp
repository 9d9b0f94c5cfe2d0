/**
 * @file table_reindexer.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_enums.hpp"
#include "xdslc/common/model_graph.hpp"

namespace xdslc
{

/**
 * @brief One axis of a flattened table: the variable and its state count.
 */
struct TableAxis
{
    std::string node_id;
    size_t size{0};

    bool operator==(const TableAxis& other) const
    {
        return node_id == other.node_id && size == other.size;
    }
};

/**
 * @brief Axes of a flattened table, outermost first.
 *
 * @details
 * The last axis varies fastest in the flat value sequence. An empty layout
 * describes a table holding exactly one value.
 */
using TableLayout = std::vector<TableAxis>;

/**
 * @brief Number of values described by a layout (product of axis sizes).
 */
size_t layout_size(const TableLayout& layout) noexcept;

/**
 * @brief Converts flat tables between axis conventions.
 *
 * @details
 * The permutation is computed via strides: every output flat index is
 * decomposed into a multi-index over the target axes, recomposed into an
 * offset over the source axes, and the value copied. Because the target axes
 * are a permutation of the source axes, every output slot is written exactly
 * once.
 */
class TableReindexer
{
public:
    /**
     * @brief Describe the table axes of a node under a convention.
     * @pre Every parent of the node resolves to a non-utility node.
     * @throw ConversionError with `InvariantViolation` if a parent does not
     *        resolve.
     */
    TableLayout layout(const ModelGraph& graph, NodeIdx idx, AxisConvention convention) const;

    /**
     * @brief Permute a flat table from one layout to another.
     * @param values Values in the source layout.
     * @param source Layout of `values`.
     * @param target Requested layout; must hold the same axes as `source`.
     * @return Values in the target layout.
     * @throw ConversionError with `InvariantViolation` if the layouts do not
     *        hold the same axes or if `values` does not match the source size.
     */
    std::vector<double> permute(const std::vector<double>& values,
                                const TableLayout& source,
                                const TableLayout& target) const;

    /**
     * @brief Permute a node's table between two conventions.
     */
    std::vector<double> reindex(const ModelGraph& graph, NodeIdx idx,
                                const std::vector<double>& values,
                                AxisConvention from, AxisConvention to) const;
};

} // namespace xdslc
