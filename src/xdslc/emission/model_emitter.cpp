/**
 * @file model_emitter.cpp
 */
#include "xdslc/emission/model_emitter.hpp"
#include "xdslc/common/conversion_exceptions.hpp"
#include "xdslc/conversion/table_reindexer.hpp"
#include "xdslc/conversion/topological_orderer.hpp"

#include <algorithm>
#include <set>

namespace xdslc
{

ModelEmitter::ModelEmitter(bool apply_utility_weights)
    : m_apply_utility_weights{apply_utility_weights}
{}

// ============================================================================
// Planning
// ============================================================================

EmissionPlan ModelEmitter::plan(const ModelGraph& graph) const
{
    EmissionPlan result;
    result.order = TopologicalOrderer{}.order(graph);
    result.tables.resize(graph.node_count());

    // Utility node id -> (weight, MAU id); the validator rejects conflicts.
    std::unordered_map<std::string, std::pair<double, std::string>> weights;
    for (const auto& mau : graph.maus())
    {
        const size_t n = std::min(mau.parents.size(), mau.weights.size());
        for (size_t i = 0; i < n; ++i)
        {
            weights.emplace(mau.parents[i], std::make_pair(mau.weights[i], mau.id));
        }
    }

    TableReindexer reindexer;
    for (NodeIdx idx = 0; idx < graph.node_count(); ++idx)
    {
        const NodeRecord& node = graph.node(idx);
        if (node.kind == NodeKind::Decision)
        {
            continue;
        }

        const TableRecord* table = graph.find_table(node.id);
        if (table == nullptr)
        {
            throw ConversionError(
                ConversionErrorCode::InvariantViolation,
                "Node '" + node.id + "' reached planning without a table");
        }

        PlannedTable planned;
        planned.layout = reindexer.layout(graph, idx, AxisConvention::TargetLibrary);
        planned.values = reindexer.permute(
            table->values,
            reindexer.layout(graph, idx, AxisConvention::Interchange),
            planned.layout);

        if (node.kind == NodeKind::Utility && m_apply_utility_weights)
        {
            auto it = weights.find(node.id);
            if (it != weights.end())
            {
                planned.weight = it->second.first;
                planned.weight_source = it->second.second;
                for (double& value : planned.values)
                {
                    value *= it->second.first;
                }
            }
        }

        result.tables[idx] = std::move(planned);
    }

    return result;
}

// ============================================================================
// Emission
// ============================================================================

void ModelEmitter::emit(const ModelGraph& graph, const EmissionPlan& plan, IEmitSink& sink) const
{
    if (plan.order.size() != graph.node_count() || plan.tables.size() != graph.node_count())
    {
        throw ConversionError(
            ConversionErrorCode::InvariantViolation,
            "Emission plan covers " + std::to_string(plan.order.size()) + " of " +
                std::to_string(graph.node_count()) + " nodes");
    }

    std::vector<bool> emitted(graph.node_count(), false);
    std::set<std::pair<NodeIdx, NodeIdx>> declared_arcs;

    sink.begin_network(graph.network_id());

    for (NodeIdx idx : plan.order)
    {
        const NodeRecord& node = graph.node(idx);
        if (emitted[idx])
        {
            throw ConversionError(
                ConversionErrorCode::InvariantViolation,
                "Node '" + node.id + "' appears twice in the emission order");
        }
        sink.add_node(node);
        emitted[idx] = true;

        for (const auto& parent_id : node.parents)
        {
            auto parent_idx = graph.find_node(parent_id);
            if (!parent_idx.has_value() || !emitted[parent_idx.value()])
            {
                throw ConversionError(
                    ConversionErrorCode::InvariantViolation,
                    "Arc " + parent_id + " -> " + node.id +
                        " references a node that has not been emitted");
            }
            if (declared_arcs.emplace(parent_idx.value(), idx).second)
            {
                sink.add_arc(graph.node(parent_idx.value()), node);
            }
        }

        if (plan.tables[idx].has_value())
        {
            sink.fill_table(node, plan.tables[idx].value());
        }
    }

    sink.end_network();
}

} // namespace xdslc
