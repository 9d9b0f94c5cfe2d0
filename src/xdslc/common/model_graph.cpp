/**
 * @file model_graph.cpp
 */
#include "xdslc/common/model_graph.hpp"
#include "xdslc/common/conversion_exceptions.hpp"

namespace xdslc
{

// ============================================================================
// Construction
// ============================================================================

void ModelGraph::set_network_id(std::string network_id)
{
    m_network_id = std::move(network_id);
}

void ModelGraph::set_has_nodes_section(bool has_nodes_section) noexcept
{
    m_has_nodes_section = has_nodes_section;
}

NodeIdx ModelGraph::add_node(NodeRecord node)
{
    NodeIdx idx = m_nodes.size();
    // First declaration wins; later duplicates stay visible to the validator.
    m_node_index.emplace(node.id, idx);
    m_nodes.push_back(std::move(node));
    return idx;
}

void ModelGraph::add_arc(ArcRecord arc)
{
    m_arcs.push_back(std::move(arc));
}

void ModelGraph::add_table(TableRecord table)
{
    m_tables.push_back(std::move(table));
}

void ModelGraph::add_mau(MauRecord mau)
{
    m_maus.push_back(std::move(mau));
}

void ModelGraph::add_issue(DiagnosticItem item)
{
    m_issues.push_back(std::move(item));
}

// ============================================================================
// Queries
// ============================================================================

const NodeRecord& ModelGraph::node(NodeIdx idx) const
{
    if (idx >= m_nodes.size())
    {
        throw ConversionError(
            ConversionErrorCode::InvariantViolation,
            "Node index " + std::to_string(idx) + " does not exist");
    }
    return m_nodes[idx];
}

std::optional<NodeIdx> ModelGraph::find_node(const std::string& id) const
{
    auto it = m_node_index.find(id);
    if (it == m_node_index.end())
    {
        return std::nullopt;
    }
    return it->second;
}

const TableRecord* ModelGraph::find_table(const std::string& node_id) const
{
    for (const auto& table : m_tables)
    {
        if (table.node_id == node_id)
        {
            return &table;
        }
    }
    return nullptr;
}

std::optional<size_t> ModelGraph::expected_table_size(NodeIdx idx) const
{
    const NodeRecord& rec = node(idx);

    size_t product = 1;
    auto multiply = [&product](size_t axis_size) {
        if (axis_size != 0 && product > std::numeric_limits<size_t>::max() / axis_size)
        {
            product = std::numeric_limits<size_t>::max();
            return;
        }
        product *= axis_size;
    };

    for (const auto& parent_id : rec.parents)
    {
        auto parent_idx = find_node(parent_id);
        if (!parent_idx.has_value())
        {
            return std::nullopt;
        }
        const NodeRecord& parent = m_nodes[parent_idx.value()];
        if (parent.kind == NodeKind::Utility)
        {
            // A utility parent has no state axis; the arc itself is invalid.
            return std::nullopt;
        }
        multiply(parent.states.size());
    }

    if (rec.kind != NodeKind::Utility)
    {
        multiply(rec.states.size());
    }
    return product;
}

} // namespace xdslc
