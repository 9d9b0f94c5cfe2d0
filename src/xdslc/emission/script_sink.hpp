/**
 * @file script_sink.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/emission/emit_sink.hpp"

#include <sstream>

namespace xdslc
{

/**
 * @brief Configuration for the textual script.
 */
struct ScriptOptions
{
    /**
     * @brief Name of the script variable holding the influence diagram.
     */
    std::string diagram_variable{"diag"};

    /**
     * @brief Whether to emit explanatory comment lines.
     */
    bool emit_comments{true};
};

/**
 * @brief Materializes directives as a standalone construction script.
 *
 * @details
 * The script imports the target library, creates one influence diagram and
 * then, node by node, adds the node, its arcs and its table:
 *
 * @code
 * import pyAgrum as gum
 *
 * diag = gum.InfluenceDiagram()
 *
 * # Chance node 'B'
 * diag.addChanceNode(gum.LabelizedVariable('B', 'B', ['yes', 'no']))
 * diag.addArc('A', 'B')
 * diag.cpt('B').fillWith([0.9, 0.1, 0.2, 0.8])
 * @endcode
 *
 * Numbers are written in their shortest exact form, so identical input
 * yields byte-identical output.
 */
class ScriptSink : public IEmitSink
{
public:
    explicit ScriptSink(ScriptOptions options = {});

    void begin_network(const std::string& network_id) override;
    void add_node(const NodeRecord& node) override;
    void add_arc(const NodeRecord& parent, const NodeRecord& child) override;
    void fill_table(const NodeRecord& node, const PlannedTable& table) override;
    void end_network() override;

    /**
     * @brief Get the script emitted so far.
     */
    std::string str() const;

private:
    ScriptOptions m_options;
    std::ostringstream m_out;
};

/**
 * @brief Quote text as a single-quoted Python string literal.
 */
std::string quote_python(std::string_view text);

} // namespace xdslc
