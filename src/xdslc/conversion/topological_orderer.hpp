/**
 * @file topological_orderer.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_graph.hpp"

namespace xdslc
{

/**
 * @brief Computes an emission order in which every node follows its parents.
 *
 * @details
 * Kahn's algorithm with a ready-queue ordered by declaration index: among
 * nodes whose parents have all been emitted, the one declared first in the
 * source document comes first. The order is therefore fully determined by
 * the input and stable across runs.
 *
 * @pre The graph passed validation (every parent resolves, no cycle).
 */
class TopologicalOrderer
{
public:
    /**
     * @brief Order the nodes of a validated graph.
     * @return Node indices, each appearing exactly once.
     * @throw ConversionError with `InvariantViolation` if a parent does not
     *        resolve or a cycle is found.
     */
    std::vector<NodeIdx> order(const ModelGraph& graph) const;
};

} // namespace xdslc
