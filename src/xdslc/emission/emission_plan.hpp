/**
 * @file emission_plan.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_enums.hpp"
#include "xdslc/conversion/table_reindexer.hpp"

namespace xdslc
{

/**
 * @brief A node's table, ready for the target library.
 */
struct PlannedTable
{
    /// Axes in the target library convention, outermost first.
    TableLayout layout;

    /// Values in `layout` order, already scaled by `weight` if present.
    std::vector<double> values;

    /// Weight applied from a MAU element, if any.
    std::optional<double> weight;

    /// Id of the MAU element that supplied `weight`.
    std::string weight_source;
};

/**
 * @brief The ordered, reindexed view of a validated graph.
 *
 * @details
 * `EmissionPlan` is computed once by `ModelEmitter::plan()` and consumed by
 * every sink, so the textual script and the in-memory model are built from
 * identical data.
 *
 * @par Ownership and movement
 * Members are non-const so that callers may move the vectors out. After
 * moving a member, the plan should be considered partially consumed.
 */
struct EmissionPlan
{
    /**
     * @brief Node indices in emission order.
     * @details Every parent precedes its children; ties follow declaration order.
     */
    std::vector<NodeIdx> order;

    /**
     * @brief Planned tables, indexed by NodeIdx.
     * @details Empty for decision nodes.
     */
    std::vector<std::optional<PlannedTable>> tables;
};

} // namespace xdslc
