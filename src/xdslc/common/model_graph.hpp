/**
 * @file model_graph.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_enums.hpp"
#include "xdslc/common/validation_report.hpp"

namespace xdslc
{

// ============================================================================
// Records
// ============================================================================

/**
 * @brief Display metadata attached to a node.
 *
 * @details
 * Ignored by the conversion logic; passed through to the output when present.
 * The position is the `left top right bottom` rectangle of the GeNIe editor.
 */
struct DisplayInfo
{
    std::string name;
    std::optional<std::array<int, 4>> position;
};

/**
 * @brief One node of the intermediate graph.
 *
 * @details
 * `parents` is the node's own parent list, in the order the node lists them
 * and without duplicates. This order defines the parent axes of the node's
 * table and must never be re-sorted.
 *
 * `states` is empty for utility nodes.
 */
struct NodeRecord
{
    std::string id;
    NodeKind kind{NodeKind::Chance};
    std::vector<std::string> states;
    std::vector<std::string> parents;
    DisplayInfo display;

    /// Line of the defining element in the source document, 0 if unknown.
    int line{0};
};

/**
 * @brief A directed arc, as (parent, child).
 */
struct ArcRecord
{
    std::string parent_id;
    std::string child_id;

    bool operator==(const ArcRecord& other) const
    {
        return parent_id == other.parent_id && child_id == other.child_id;
    }
};

/**
 * @brief The flat numeric table of one node, in the interchange axis order.
 *
 * @details
 * The logical shape is `parents (listed order) x own states` for chance
 * nodes, and `parents (listed order)` for utility nodes, the last axis
 * varying fastest.
 */
struct TableRecord
{
    std::string node_id;
    std::vector<double> values;
    int line{0};
};

/**
 * @brief A multi-attribute utility element: one weight per utility parent.
 */
struct MauRecord
{
    std::string id;
    std::vector<std::string> parents;
    std::vector<double> weights;
    int line{0};
};

// ============================================================================
// ModelGraph
// ============================================================================

/**
 * @brief The normalized intermediate graph of one conversion.
 *
 * @details
 * `ModelGraph` is filled once by `GraphExtractor`, checked by
 * `GraphValidator`, and then only read by the later stages. It is a plain
 * value owned by the caller; nothing is shared between conversions.
 *
 * @par Duplicate ids
 * `add_node()` accepts a node whose id is already present so that the
 * validator can report it; lookups by id resolve to the first declaration.
 *
 * @par Extraction issues
 * Problems found while walking the document (unknown kinds, unparsable
 * numbers, temporal constructs) are recorded with `add_issue()` and copied
 * into the validation report, so that every problem surfaces in one place.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe if no concurrent writes occur.
 */
class ModelGraph
{
public:
    ModelGraph() = default;

    // -------------------------------------------------------------------------
    // Construction
    // -------------------------------------------------------------------------

    void set_network_id(std::string network_id);

    /// Mark that the document had a `nodes` section.
    void set_has_nodes_section(bool has_nodes_section) noexcept;

    /**
     * @brief Append a node in declaration order.
     * @return The index of the new node.
     */
    NodeIdx add_node(NodeRecord node);

    void add_arc(ArcRecord arc);

    void add_table(TableRecord table);

    void add_mau(MauRecord mau);

    void add_issue(DiagnosticItem item);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    const std::string& network_id() const noexcept
    {
        return m_network_id;
    }

    bool has_nodes_section() const noexcept
    {
        return m_has_nodes_section;
    }

    size_t node_count() const noexcept
    {
        return m_nodes.size();
    }

    const std::vector<NodeRecord>& nodes() const noexcept
    {
        return m_nodes;
    }

    /**
     * @brief Get a node by index.
     * @throw ConversionError with `InvariantViolation` if out of range.
     */
    const NodeRecord& node(NodeIdx idx) const;

    /**
     * @brief Look up a node by id.
     * @return The index of the first node declared with this id, if any.
     */
    std::optional<NodeIdx> find_node(const std::string& id) const;

    /**
     * @brief All arcs, one per listed parent, in declaration order.
     * @note Includes repeated listings; `NodeRecord::parents` does not.
     */
    const std::vector<ArcRecord>& arcs() const noexcept
    {
        return m_arcs;
    }

    const std::vector<TableRecord>& tables() const noexcept
    {
        return m_tables;
    }

    /**
     * @brief Look up the table of a node.
     * @return Pointer to the first table recorded for the node, or nullptr.
     */
    const TableRecord* find_table(const std::string& node_id) const;

    const std::vector<MauRecord>& maus() const noexcept
    {
        return m_maus;
    }

    const std::vector<DiagnosticItem>& issues() const noexcept
    {
        return m_issues;
    }

    /**
     * @brief Compute the number of values the node's table must hold.
     * @return The product of all axis sizes, or nullopt if a parent does not
     *         resolve to a node.
     * @note Decision nodes carry no table; for them the value is the product
     *       of the axes they would have and is only informative.
     */
    std::optional<size_t> expected_table_size(NodeIdx idx) const;

private:
    std::string m_network_id;
    bool m_has_nodes_section{true};

    /// Nodes in declaration order.
    std::vector<NodeRecord> m_nodes;

    /// First index for each node id.
    std::unordered_map<std::string, NodeIdx> m_node_index;

    std::vector<ArcRecord> m_arcs;
    std::vector<TableRecord> m_tables;
    std::vector<MauRecord> m_maus;
    std::vector<DiagnosticItem> m_issues;
};

} // namespace xdslc
