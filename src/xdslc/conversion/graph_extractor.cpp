/**
 * @file graph_extractor.cpp
 */
#include "xdslc/conversion/graph_extractor.hpp"
#include "xdslc/common/text_utils.hpp"

#include <algorithm>
#include <cmath>

namespace xdslc
{

namespace
{

DiagnosticItem make_issue(DiagnosticCategory category, std::string message,
                          std::vector<std::string> involved_nodes, int line)
{
    DiagnosticItem item;
    item.severity = DiagnosticSeverity::Error;
    item.category = category;
    item.message = std::move(message);
    item.involved_nodes = std::move(involved_nodes);
    item.line = line;
    return item;
}

std::optional<NodeKind> classify(const std::string& element_name)
{
    if (element_name == "cpt")
    {
        return NodeKind::Chance;
    }
    if (element_name == "decision")
    {
        return NodeKind::Decision;
    }
    if (element_name == "utility")
    {
        return NodeKind::Utility;
    }
    return std::nullopt;
}

std::optional<std::array<int, 4>> parse_position(const std::string& text)
{
    auto tokens = split_whitespace(text);
    if (tokens.size() != 4)
    {
        return std::nullopt;
    }
    std::array<int, 4> rect{};
    for (size_t i = 0; i < 4; ++i)
    {
        auto value = parse_number(tokens[i]);
        if (!value.has_value())
        {
            return std::nullopt;
        }
        const double coordinate = value.value();
        if (coordinate != std::floor(coordinate) ||
            coordinate < static_cast<double>(std::numeric_limits<int>::min()) ||
            coordinate > static_cast<double>(std::numeric_limits<int>::max()))
        {
            return std::nullopt;
        }
        rect[i] = static_cast<int>(coordinate);
    }
    return rect;
}

} // namespace

// ============================================================================
// Entry point
// ============================================================================

ModelGraph GraphExtractor::extract(const XmlElement& root) const
{
    ModelGraph graph;

    if (const std::string* network_id = root.attribute("id"))
    {
        graph.set_network_id(*network_id);
    }

    // Display metadata lives after the nodes section, so collect it first.
    DisplayMap display;
    if (const XmlElement* extensions = root.first_child("extensions"))
    {
        for (const XmlElement* genie : extensions->children_named("genie"))
        {
            collect_display(*genie, display);
        }
    }

    const XmlElement* nodes = root.first_child("nodes");
    if (nodes == nullptr)
    {
        graph.set_has_nodes_section(false);
    }
    else
    {
        for (const auto& element : nodes->children)
        {
            extract_node(element, display, graph);
        }
    }

    for (const XmlElement* dynamic : root.children_named("dynamic"))
    {
        extract_dynamic(*dynamic, graph);
    }

    return graph;
}

// ============================================================================
// Helpers
// ============================================================================

void GraphExtractor::collect_display(const XmlElement& element, DisplayMap& display) const
{
    for (const auto& child : element.children)
    {
        if (child.name == "submodel")
        {
            collect_display(child, display);
            continue;
        }
        if (child.name != "node")
        {
            continue;
        }
        const std::string* id = child.attribute("id");
        if (id == nullptr)
        {
            continue;
        }
        DisplayInfo info;
        if (const XmlElement* name = child.first_child("name"))
        {
            info.name = name->text;
        }
        if (const XmlElement* position = child.first_child("position"))
        {
            info.position = parse_position(position->text);
        }
        display.emplace(*id, std::move(info));
    }
}

void GraphExtractor::extract_node(const XmlElement& element, const DisplayMap& display,
                                  ModelGraph& graph) const
{
    const std::string* id_attr = element.attribute("id");
    if (id_attr == nullptr || id_attr->empty())
    {
        graph.add_issue(make_issue(
            DiagnosticCategory::MissingNodeId,
            "Element <" + element.name + "> has no id",
            {}, element.line));
        return;
    }
    const std::string& id = *id_attr;

    if (element.has_attribute("dynamic"))
    {
        graph.add_issue(make_issue(
            DiagnosticCategory::UnsupportedTemporalConstruct,
            "Node '" + id + "' is declared as a dynamic (" + *element.attribute("dynamic") +
                ") node; time-sliced networks are not supported",
            {id}, element.line));
        return;
    }

    if (element.name == "mau")
    {
        extract_mau(element, id, graph);
        return;
    }

    auto kind = classify(element.name);
    if (!kind.has_value())
    {
        graph.add_issue(make_issue(
            DiagnosticCategory::UnknownNodeKind,
            "Node '" + id + "' has unsupported kind <" + element.name + ">",
            {id}, element.line));
        return;
    }

    NodeRecord node;
    node.id = id;
    node.kind = kind.value();
    node.line = element.line;

    auto display_it = display.find(id);
    if (display_it != display.end())
    {
        node.display = display_it->second;
    }

    if (node.kind != NodeKind::Utility)
    {
        for (const XmlElement* state : element.children_named("state"))
        {
            const std::string* state_id = state->attribute("id");
            if (state_id == nullptr || state_id->empty())
            {
                graph.add_issue(make_issue(
                    DiagnosticCategory::MissingNodeId,
                    "Node '" + id + "' declares a state without an id",
                    {id}, state->line));
                continue;
            }
            node.states.push_back(*state_id);
        }
    }

    if (const XmlElement* parents = element.first_child("parents"))
    {
        for (auto& parent_id : split_whitespace(parents->text))
        {
            graph.add_arc(ArcRecord{parent_id, id});
            if (std::find(node.parents.begin(), node.parents.end(), parent_id) ==
                node.parents.end())
            {
                node.parents.push_back(std::move(parent_id));
            }
        }
    }

    const XmlElement* table_element = nullptr;
    switch (node.kind)
    {
    case NodeKind::Chance:
        table_element = element.first_child("probabilities");
        break;
    case NodeKind::Utility:
        table_element = element.first_child("utilities");
        break;
    case NodeKind::Decision:
        break;
    }

    if (table_element != nullptr)
    {
        TableRecord table;
        table.node_id = id;
        table.line = table_element->line;
        table.values = parse_values(*table_element, id, graph);
        graph.add_table(std::move(table));
    }

    graph.add_node(std::move(node));
}

void GraphExtractor::extract_mau(const XmlElement& element, const std::string& id,
                                 ModelGraph& graph) const
{
    MauRecord mau;
    mau.id = id;
    mau.line = element.line;
    if (const XmlElement* parents = element.first_child("parents"))
    {
        mau.parents = split_whitespace(parents->text);
    }
    if (const XmlElement* weights = element.first_child("weights"))
    {
        mau.weights = parse_values(*weights, id, graph);
    }
    graph.add_mau(std::move(mau));
}

void GraphExtractor::extract_dynamic(const XmlElement& element, ModelGraph& graph) const
{
    std::vector<std::string> involved;
    for (const auto& child : element.children)
    {
        if (const std::string* id = child.attribute("id"))
        {
            involved.push_back(*id);
        }
    }

    std::string message = "Document contains a <dynamic> block";
    if (const std::string* slices = element.attribute("numslices"))
    {
        message += " with " + *slices + " time slices";
    }
    message += "; time-sliced networks are not supported";

    graph.add_issue(make_issue(
        DiagnosticCategory::UnsupportedTemporalConstruct,
        std::move(message), std::move(involved), element.line));
}

std::vector<double> GraphExtractor::parse_values(const XmlElement& element,
                                                 const std::string& owner_id,
                                                 ModelGraph& graph) const
{
    std::vector<double> values;
    for (const auto& token : split_whitespace(element.text))
    {
        auto value = parse_number(token);
        if (!value.has_value())
        {
            graph.add_issue(make_issue(
                DiagnosticCategory::MalformedTableValue,
                "Node '" + owner_id + "' has a non-numeric value '" + token + "' in <" +
                    element.name + ">",
                {owner_id}, element.line));
            continue;
        }
        values.push_back(value.value());
    }
    return values;
}

} // namespace xdslc
