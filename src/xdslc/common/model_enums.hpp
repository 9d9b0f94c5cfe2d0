/**
 * @file model_enums.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"

namespace xdslc
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for node indices.
 *
 * @details
 * `NodeIdx` is a type alias for `size_t` identifying a node by its position in
 * the declaration order of the source document. This alias exists for clarity
 * in API signatures and documentation, not for compile-time type safety.
 */
using NodeIdx = size_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief The closed set of node kinds understood by the converter.
 *
 * @details
 * - `Chance`: a random variable with a discrete state space and a conditional
 *   probability table indexed by its parents' states.
 * - `Decision`: a controllable choice among discrete options; no table.
 * - `Utility`: a real-valued payoff table indexed by its parents' states; no
 *   own state space.
 */
enum class NodeKind
{
    Chance,
    Decision,
    Utility
};

/**
 * @brief Output artifact selected by the caller.
 */
enum class OutputMode
{
    Script,  ///< Textual construction script.
    Model    ///< Populated in-memory model object.
};

/**
 * @brief Axis order convention for flattened tables.
 *
 * @details
 * Both conventions are described outermost-to-innermost, the last axis being
 * the one that varies fastest in the flat value sequence.
 * - `Interchange`: `[parent_1, ..., parent_n, own]`, the order of the XDSL
 *   table definitions.
 * - `TargetLibrary`: `[parent_n, ..., parent_1, own]`, the order expected by
 *   `fillWith()` of the target library, whose tables list the own variable
 *   first and parents in arc-insertion order with the first variable varying
 *   fastest.
 *
 * Utility tables have no own axis; only the parent axes are permuted.
 */
enum class AxisConvention
{
    Interchange,
    TargetLibrary
};

/**
 * @brief Get a printable name for a node kind.
 */
inline const char* to_string(NodeKind kind) noexcept
{
    switch (kind)
    {
    case NodeKind::Chance:
        return "chance";
    case NodeKind::Decision:
        return "decision";
    case NodeKind::Utility:
        return "utility";
    }
    return "unknown";
}

} // namespace xdslc
