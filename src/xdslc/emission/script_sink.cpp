/**
 * @file script_sink.cpp
 */
#include "xdslc/emission/script_sink.hpp"
#include "xdslc/common/text_utils.hpp"

#include <cstdio>

namespace xdslc
{

std::string quote_python(std::string_view text)
{
    std::string result = "'";
    for (char c : text)
    {
        switch (c)
        {
        case '\\':
            result += "\\\\";
            break;
        case '\'':
            result += "\\'";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\x%02x",
                              static_cast<unsigned>(static_cast<unsigned char>(c)));
                result += escaped;
            }
            else
            {
                result += c;
            }
            break;
        }
    }
    result += "'";
    return result;
}

ScriptSink::ScriptSink(ScriptOptions options)
    : m_options{std::move(options)}
{}

void ScriptSink::begin_network(const std::string& network_id)
{
    if (m_options.emit_comments)
    {
        m_out << "# Influence diagram";
        if (!network_id.empty())
        {
            m_out << " " << quote_python(network_id);
        }
        m_out << " converted from XDSL\n";
    }
    m_out << "import pyAgrum as gum\n"
          << "\n"
          << m_options.diagram_variable << " = gum.InfluenceDiagram()\n";
}

void ScriptSink::add_node(const NodeRecord& node)
{
    const std::string& description = node.display.name.empty() ? node.id : node.display.name;

    m_out << "\n";
    if (m_options.emit_comments)
    {
        std::string kind = to_string(node.kind);
        kind[0] = static_cast<char>(kind[0] - 'a' + 'A');
        m_out << "# " << kind << " node " << quote_python(node.id) << "\n";
    }

    m_out << m_options.diagram_variable;
    switch (node.kind)
    {
    case NodeKind::Chance:
        m_out << ".addChanceNode(";
        break;
    case NodeKind::Decision:
        m_out << ".addDecisionNode(";
        break;
    case NodeKind::Utility:
        m_out << ".addUtilityNode(";
        break;
    }

    m_out << "gum.LabelizedVariable(" << quote_python(node.id) << ", "
          << quote_python(description) << ", ";
    if (node.kind == NodeKind::Utility)
    {
        // Utility variables carry a single placeholder state.
        m_out << "1";
    }
    else
    {
        m_out << "[";
        for (size_t i = 0; i < node.states.size(); ++i)
        {
            m_out << (i > 0 ? ", " : "") << quote_python(node.states[i]);
        }
        m_out << "]";
    }
    m_out << "))\n";
}

void ScriptSink::add_arc(const NodeRecord& parent, const NodeRecord& child)
{
    m_out << m_options.diagram_variable << ".addArc(" << quote_python(parent.id) << ", "
          << quote_python(child.id) << ")\n";
}

void ScriptSink::fill_table(const NodeRecord& node, const PlannedTable& table)
{
    if (m_options.emit_comments && table.weight.has_value())
    {
        m_out << "# utilities scaled by weight " << format_number(table.weight.value())
              << " of MAU " << quote_python(table.weight_source) << "\n";
    }

    m_out << m_options.diagram_variable
          << (node.kind == NodeKind::Utility ? ".utility(" : ".cpt(")
          << quote_python(node.id) << ").fillWith([";
    for (size_t i = 0; i < table.values.size(); ++i)
    {
        m_out << (i > 0 ? ", " : "") << format_number(table.values[i]);
    }
    m_out << "])\n";
}

void ScriptSink::end_network()
{
}

std::string ScriptSink::str() const
{
    return m_out.str();
}

} // namespace xdslc
