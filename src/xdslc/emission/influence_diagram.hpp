/**
 * @file influence_diagram.hpp
 * @brief In-memory influence diagram mirroring the target library's model.
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_enums.hpp"
#include "xdslc/common/model_graph.hpp"
#include "xdslc/emission/emit_sink.hpp"

namespace xdslc
{

/**
 * @brief A labelized variable: name, description and ordered labels.
 * @details Utility variables have no labels.
 */
struct DiagramVariable
{
    std::string name;
    std::string description;
    std::vector<std::string> labels;
};

/**
 * @brief A node of the in-memory diagram.
 *
 * @details
 * `table_variables` lists the variables of the node's table in the target
 * library order: the node itself first (chance nodes only), then its parents
 * in arc-insertion order. The FIRST variable varies fastest in `table`.
 */
struct DiagramNode
{
    NodeKind kind{NodeKind::Chance};
    DiagramVariable variable;
    std::vector<std::string> parents;
    std::vector<std::string> table_variables;
    std::vector<double> table;
    std::optional<std::array<int, 4>> position;

    /// True once fill_table() was called.
    bool filled{false};

    /// True if the description came from a display name.
    bool has_display_name{false};
};

/**
 * @brief Populated in-memory model produced by the Model output mode.
 *
 * @details
 * The construction API follows the target library: nodes are added by kind,
 * arcs are declared between existing nodes, and tables are filled with a flat
 * sequence in the library's axis order. Lookups by label assignment make the
 * table contents checkable without knowing that order.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe once construction is complete.
 */
class InfluenceDiagram
{
public:
    // -------------------------------------------------------------------------
    // Construction
    // -------------------------------------------------------------------------

    /**
     * @brief Add a node.
     * @throw ConversionError with `InvalidState` if the name is taken, or if a
     *        chance or decision variable has no labels.
     */
    void add_chance_node(DiagramVariable variable);
    void add_decision_node(DiagramVariable variable);
    void add_utility_node(DiagramVariable variable);

    /**
     * @brief Declare an arc between two existing nodes.
     * @note Declaring the same arc twice has no further effect.
     * @throw ConversionError with `InvalidState` if either node is unknown,
     *        the arc is a self-loop, the parent is a utility node, or the
     *        child's table was already filled.
     */
    void add_arc(const std::string& parent, const std::string& child);

    /**
     * @brief Fill the table of a chance or utility node.
     * @param values Flat values, first table variable varying fastest.
     * @throw ConversionError with `InvalidState` if the node is unknown, is a
     *        decision node, or the value count does not match.
     */
    void fill_table(const std::string& name, std::vector<double> values);

    void set_position(const std::string& name, std::array<int, 4> position);

    /**
     * @brief Use a display name as the node's description.
     * @details The name survives `to_graph()` even when it equals the node id.
     */
    void set_display_name(const std::string& name, std::string display_name);

    void set_name(std::string name);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    const std::string& name() const noexcept
    {
        return m_name;
    }

    size_t size() const noexcept
    {
        return m_nodes.size();
    }

    bool contains(const std::string& name) const;

    /**
     * @brief Get a node by name.
     * @throw ConversionError with `InvalidState` if the node is unknown.
     */
    const DiagramNode& node(const std::string& name) const;

    /**
     * @brief Node names in insertion order.
     */
    const std::vector<std::string>& names() const noexcept
    {
        return m_order;
    }

    /**
     * @brief All arcs in declaration order.
     */
    const std::vector<ArcRecord>& arcs() const noexcept
    {
        return m_arcs;
    }

    /**
     * @brief Look up one table entry by labels.
     * @param name The chance or utility node.
     * @param assignment Label for every table variable, keyed by variable name.
     * @throw ConversionError with `InvalidState` if a variable is missing from
     *        the assignment or a label is unknown.
     */
    double value(const std::string& name,
                 const std::map<std::string, std::string>& assignment) const;

    /**
     * @brief Rebuild the intermediate graph this diagram represents.
     *
     * @details
     * Nodes keep insertion order; parents keep arc-insertion order; tables are
     * permuted back into the interchange convention; display names set with
     * `set_display_name()`, and descriptions that differ from the node id,
     * become display names. MAU elements are not represented.
     */
    ModelGraph to_graph() const;

private:
    void add_node(NodeKind kind, DiagramVariable variable);

    DiagramNode& mutable_node(const std::string& name);

    std::string m_name;
    std::unordered_map<std::string, DiagramNode> m_nodes;
    std::vector<std::string> m_order;
    std::vector<ArcRecord> m_arcs;
};

/**
 * @brief Materializes directives as calls on an `InfluenceDiagram`.
 */
class InfluenceDiagramSink : public IEmitSink
{
public:
    InfluenceDiagramSink();

    void begin_network(const std::string& network_id) override;
    void add_node(const NodeRecord& node) override;
    void add_arc(const NodeRecord& parent, const NodeRecord& child) override;
    void fill_table(const NodeRecord& node, const PlannedTable& table) override;
    void end_network() override;

    /**
     * @brief Get the diagram built so far.
     */
    const std::shared_ptr<InfluenceDiagram>& diagram() const noexcept
    {
        return m_diagram;
    }

private:
    std::shared_ptr<InfluenceDiagram> m_diagram;
};

} // namespace xdslc
