/**
 * @file graph_validator.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_graph.hpp"
#include "xdslc/common/validation_report.hpp"

namespace xdslc
{

/**
 * @brief Checks the structural invariants of an extracted graph.
 *
 * @details
 * Runs after extraction and before any ordering or emission. All checks run
 * to completion and accumulate into a single `ValidationReport`; emission may
 * proceed only if the report has no errors.
 *
 * @par Checks
 * - Issues recorded by the extractor (unknown kinds, missing ids, malformed
 *   numbers, temporal constructs) are copied first.
 * - `DuplicateNodeId`, `EmptyStateSpace`, `DuplicateStateId` per node.
 * - `DanglingArc`, `InvalidArcKind` and the `DuplicateArc` warning per arc.
 * - `CyclicGraph`, by depth-first traversal with a recursion-stack marker.
 *   A node listing itself as a parent is a cycle of length one.
 * - `MissingTable` and `TableSizeMismatch` per chance and utility node.
 * - `MauWeightMismatch`, `DanglingArc`, `InvalidArcKind` and
 *   `ConflictingUtilityWeight` per MAU element.
 */
class GraphValidator
{
public:
    /**
     * @brief Validate a graph.
     * @return Shared pointer to the report; never null.
     */
    std::shared_ptr<ValidationReport> validate(const ModelGraph& graph) const;

private:
    void check_nodes(const ModelGraph& graph, ValidationReport& report) const;

    void check_arcs(const ModelGraph& graph, ValidationReport& report) const;

    void check_cycles(const ModelGraph& graph, ValidationReport& report) const;

    void check_tables(const ModelGraph& graph, ValidationReport& report) const;

    void check_maus(const ModelGraph& graph, ValidationReport& report) const;
};

} // namespace xdslc
