/**
 * @file emit_sink.hpp
 * @brief IEmitSink interface.
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_graph.hpp"
#include "xdslc/emission/emission_plan.hpp"

namespace xdslc
{

/**
 * @brief Receiver of construction directives.
 *
 * @details
 * `ModelEmitter` walks an `EmissionPlan` and calls the sink once per
 * directive, in order. Sinks only decide how a directive is materialized:
 * as script text or as calls on an in-memory model.
 *
 * @par Directive order guarantees
 * - `begin_network()` first and `end_network()` last, once each.
 * - `add_node()` for a node precedes every directive that names it.
 * - `add_arc()` is called at most once per (parent, child) pair, after both
 *   endpoints were added and before the child's `fill_table()`.
 */
class IEmitSink
{
public:
    virtual ~IEmitSink() = default;

    virtual void begin_network(const std::string& network_id) = 0;

    virtual void add_node(const NodeRecord& node) = 0;

    virtual void add_arc(const NodeRecord& parent, const NodeRecord& child) = 0;

    virtual void fill_table(const NodeRecord& node, const PlannedTable& table) = 0;

    virtual void end_network() = 0;
};

} // namespace xdslc
