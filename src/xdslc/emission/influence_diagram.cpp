/**
 * @file influence_diagram.cpp
 */
#include "xdslc/emission/influence_diagram.hpp"
#include "xdslc/common/conversion_exceptions.hpp"
#include "xdslc/conversion/table_reindexer.hpp"

#include <algorithm>

namespace xdslc
{

// ============================================================================
// InfluenceDiagram: construction
// ============================================================================

void InfluenceDiagram::add_chance_node(DiagramVariable variable)
{
    add_node(NodeKind::Chance, std::move(variable));
}

void InfluenceDiagram::add_decision_node(DiagramVariable variable)
{
    add_node(NodeKind::Decision, std::move(variable));
}

void InfluenceDiagram::add_utility_node(DiagramVariable variable)
{
    add_node(NodeKind::Utility, std::move(variable));
}

void InfluenceDiagram::add_node(NodeKind kind, DiagramVariable variable)
{
    if (m_nodes.count(variable.name) > 0)
    {
        throw ConversionError(
            ConversionErrorCode::InvalidState,
            "Node '" + variable.name + "' already exists");
    }
    if (kind != NodeKind::Utility && variable.labels.empty())
    {
        throw ConversionError(
            ConversionErrorCode::InvalidState,
            "Node '" + variable.name + "' needs at least one label");
    }
    if (kind == NodeKind::Utility)
    {
        variable.labels.clear();
    }

    std::string name = variable.name;
    DiagramNode node;
    node.kind = kind;
    node.variable = std::move(variable);
    m_nodes.emplace(name, std::move(node));
    m_order.push_back(std::move(name));
}

void InfluenceDiagram::add_arc(const std::string& parent, const std::string& child)
{
    if (parent == child)
    {
        throw ConversionError(
            ConversionErrorCode::InvalidState,
            "Cannot link node '" + parent + "' to itself");
    }

    const DiagramNode& parent_node = node(parent);
    DiagramNode& child_node = mutable_node(child);

    if (parent_node.kind == NodeKind::Utility)
    {
        throw ConversionError(
            ConversionErrorCode::InvalidState,
            "Utility node '" + parent + "' cannot have children");
    }
    if (std::find(child_node.parents.begin(), child_node.parents.end(), parent) !=
        child_node.parents.end())
    {
        return;
    }
    if (child_node.filled)
    {
        throw ConversionError(
            ConversionErrorCode::InvalidState,
            "Cannot add parent '" + parent + "' to node '" + child +
                "' after its table was filled");
    }

    child_node.parents.push_back(parent);
    m_arcs.push_back(ArcRecord{parent, child});
}

void InfluenceDiagram::fill_table(const std::string& name, std::vector<double> values)
{
    DiagramNode& target = mutable_node(name);
    if (target.kind == NodeKind::Decision)
    {
        throw ConversionError(
            ConversionErrorCode::InvalidState,
            "Decision node '" + name + "' has no table");
    }

    std::vector<std::string> variables;
    size_t expected = 1;
    if (target.kind == NodeKind::Chance)
    {
        variables.push_back(name);
        expected *= target.variable.labels.size();
    }
    for (const auto& parent : target.parents)
    {
        variables.push_back(parent);
        expected *= node(parent).variable.labels.size();
    }

    if (values.size() != expected)
    {
        throw ConversionError(
            ConversionErrorCode::InvalidState,
            "Table of node '" + name + "' needs " + std::to_string(expected) +
                " values; got " + std::to_string(values.size()));
    }

    target.table_variables = std::move(variables);
    target.table = std::move(values);
    target.filled = true;
}

void InfluenceDiagram::set_position(const std::string& name, std::array<int, 4> position)
{
    mutable_node(name).position = position;
}

void InfluenceDiagram::set_display_name(const std::string& name, std::string display_name)
{
    DiagramNode& target = mutable_node(name);
    target.variable.description = std::move(display_name);
    target.has_display_name = true;
}

void InfluenceDiagram::set_name(std::string name)
{
    m_name = std::move(name);
}

// ============================================================================
// InfluenceDiagram: queries
// ============================================================================

bool InfluenceDiagram::contains(const std::string& name) const
{
    return m_nodes.count(name) > 0;
}

const DiagramNode& InfluenceDiagram::node(const std::string& name) const
{
    auto it = m_nodes.find(name);
    if (it == m_nodes.end())
    {
        throw ConversionError(
            ConversionErrorCode::InvalidState,
            "Node '" + name + "' does not exist");
    }
    return it->second;
}

DiagramNode& InfluenceDiagram::mutable_node(const std::string& name)
{
    auto it = m_nodes.find(name);
    if (it == m_nodes.end())
    {
        throw ConversionError(
            ConversionErrorCode::InvalidState,
            "Node '" + name + "' does not exist");
    }
    return it->second;
}

double InfluenceDiagram::value(const std::string& name,
                               const std::map<std::string, std::string>& assignment) const
{
    const DiagramNode& target = node(name);
    if (!target.filled)
    {
        throw ConversionError(
            ConversionErrorCode::InvalidState,
            "Node '" + name + "' has no table");
    }

    // First table variable varies fastest.
    size_t offset = 0;
    size_t stride = 1;
    for (const auto& variable : target.table_variables)
    {
        auto it = assignment.find(variable);
        if (it == assignment.end())
        {
            throw ConversionError(
                ConversionErrorCode::InvalidState,
                "Assignment for node '" + name + "' misses variable '" + variable + "'");
        }
        const auto& labels = node(variable).variable.labels;
        auto label = std::find(labels.begin(), labels.end(), it->second);
        if (label == labels.end())
        {
            throw ConversionError(
                ConversionErrorCode::InvalidState,
                "Variable '" + variable + "' has no label '" + it->second + "'");
        }
        offset += static_cast<size_t>(label - labels.begin()) * stride;
        stride *= labels.size();
    }
    return target.table[offset];
}

ModelGraph InfluenceDiagram::to_graph() const
{
    ModelGraph graph;
    graph.set_network_id(m_name);

    for (const auto& name : m_order)
    {
        const DiagramNode& source = m_nodes.at(name);
        NodeRecord record;
        record.id = name;
        record.kind = source.kind;
        record.states = source.variable.labels;
        record.parents = source.parents;
        if (source.has_display_name || source.variable.description != name)
        {
            record.display.name = source.variable.description;
        }
        record.display.position = source.position;
        for (const auto& parent : source.parents)
        {
            graph.add_arc(ArcRecord{parent, name});
        }
        graph.add_node(std::move(record));
    }

    TableReindexer reindexer;
    for (NodeIdx idx = 0; idx < m_order.size(); ++idx)
    {
        const DiagramNode& source = m_nodes.at(m_order[idx]);
        if (!source.filled)
        {
            continue;
        }
        TableRecord table;
        table.node_id = m_order[idx];
        table.values = reindexer.reindex(graph, idx, source.table,
                                         AxisConvention::TargetLibrary,
                                         AxisConvention::Interchange);
        graph.add_table(std::move(table));
    }

    return graph;
}

// ============================================================================
// InfluenceDiagramSink
// ============================================================================

InfluenceDiagramSink::InfluenceDiagramSink()
    : m_diagram{std::make_shared<InfluenceDiagram>()}
{}

void InfluenceDiagramSink::begin_network(const std::string& network_id)
{
    m_diagram->set_name(network_id);
}

void InfluenceDiagramSink::add_node(const NodeRecord& node)
{
    DiagramVariable variable;
    variable.name = node.id;
    variable.description = node.id;
    variable.labels = node.states;

    switch (node.kind)
    {
    case NodeKind::Chance:
        m_diagram->add_chance_node(std::move(variable));
        break;
    case NodeKind::Decision:
        m_diagram->add_decision_node(std::move(variable));
        break;
    case NodeKind::Utility:
        m_diagram->add_utility_node(std::move(variable));
        break;
    }

    if (!node.display.name.empty())
    {
        m_diagram->set_display_name(node.id, node.display.name);
    }
    if (node.display.position.has_value())
    {
        m_diagram->set_position(node.id, node.display.position.value());
    }
}

void InfluenceDiagramSink::add_arc(const NodeRecord& parent, const NodeRecord& child)
{
    m_diagram->add_arc(parent.id, child.id);
}

void InfluenceDiagramSink::fill_table(const NodeRecord& node, const PlannedTable& table)
{
    m_diagram->fill_table(node.id, table.values);
}

void InfluenceDiagramSink::end_network()
{
}

} // namespace xdslc
