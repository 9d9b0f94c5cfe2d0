/**
 * @file topological_orderer.cpp
 */
#include "xdslc/conversion/topological_orderer.hpp"
#include "xdslc/common/conversion_exceptions.hpp"

#include <functional>
#include <queue>

namespace xdslc
{

std::vector<NodeIdx> TopologicalOrderer::order(const ModelGraph& graph) const
{
    const size_t n = graph.node_count();

    std::vector<size_t> in_degree(n, 0);
    std::vector<std::vector<NodeIdx>> successors(n);

    for (NodeIdx child = 0; child < n; ++child)
    {
        const NodeRecord& node = graph.node(child);
        for (const auto& parent_id : node.parents)
        {
            auto parent = graph.find_node(parent_id);
            if (!parent.has_value())
            {
                throw ConversionError(
                    ConversionErrorCode::InvariantViolation,
                    "Parent '" + parent_id + "' of node '" + node.id +
                        "' does not resolve; the graph was not validated");
            }
            successors[parent.value()].push_back(child);
            ++in_degree[child];
        }
    }

    // Min-heap on declaration index.
    std::priority_queue<NodeIdx, std::vector<NodeIdx>, std::greater<NodeIdx>> ready;
    for (NodeIdx idx = 0; idx < n; ++idx)
    {
        if (in_degree[idx] == 0)
        {
            ready.push(idx);
        }
    }

    std::vector<NodeIdx> result;
    result.reserve(n);
    while (!ready.empty())
    {
        NodeIdx idx = ready.top();
        ready.pop();
        result.push_back(idx);

        for (NodeIdx succ : successors[idx])
        {
            --in_degree[succ];
            if (in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }

    if (result.size() < n)
    {
        std::string remaining;
        for (NodeIdx idx = 0; idx < n; ++idx)
        {
            if (in_degree[idx] > 0)
            {
                remaining += (remaining.empty() ? "" : ", ") + graph.node(idx).id;
            }
        }
        throw ConversionError(
            ConversionErrorCode::InvariantViolation,
            "Cycle reached the orderer through nodes: " + remaining);
    }

    return result;
}

} // namespace xdslc
