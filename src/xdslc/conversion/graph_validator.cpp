/**
 * @file graph_validator.cpp
 */
#include "xdslc/conversion/graph_validator.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <unordered_set>

namespace xdslc
{

namespace
{

DiagnosticItem make_error(DiagnosticCategory category, std::string message,
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

} // namespace

std::shared_ptr<ValidationReport> GraphValidator::validate(const ModelGraph& graph) const
{
    auto report = std::make_shared<ValidationReport>();

    // =========================================================================
    // Phase 1: Issues found during extraction
    // =========================================================================

    if (!graph.has_nodes_section())
    {
        report->add(make_error(
            DiagnosticCategory::MissingNodesSection,
            "Document has no <nodes> section", {}, 0));
    }

    for (const auto& issue : graph.issues())
    {
        report->add(issue);
    }

    // =========================================================================
    // Phase 2: Structural checks
    // =========================================================================

    check_nodes(graph, *report);
    check_arcs(graph, *report);
    check_cycles(graph, *report);
    check_tables(graph, *report);
    check_maus(graph, *report);

    return report;
}

void GraphValidator::check_nodes(const ModelGraph& graph, ValidationReport& report) const
{
    for (NodeIdx idx = 0; idx < graph.node_count(); ++idx)
    {
        const NodeRecord& node = graph.node(idx);

        auto first = graph.find_node(node.id);
        if (first.has_value() && first.value() != idx)
        {
            report.add(make_error(
                DiagnosticCategory::DuplicateNodeId,
                "Node id '" + node.id + "' is declared more than once",
                {node.id}, node.line));
        }

        if (node.kind == NodeKind::Utility)
        {
            continue;
        }

        if (node.states.empty())
        {
            report.add(make_error(
                DiagnosticCategory::EmptyStateSpace,
                "Node '" + node.id + "' (" + to_string(node.kind) + ") declares no states",
                {node.id}, node.line));
        }

        std::unordered_set<std::string> seen;
        std::set<std::string> reported;
        for (const auto& state : node.states)
        {
            if (!seen.insert(state).second && reported.insert(state).second)
            {
                report.add(make_error(
                    DiagnosticCategory::DuplicateStateId,
                    "Node '" + node.id + "' declares state '" + state + "' more than once",
                    {node.id}, node.line));
            }
        }
    }
}

void GraphValidator::check_arcs(const ModelGraph& graph, ValidationReport& report) const
{
    std::map<std::pair<std::string, std::string>, size_t> listings;

    for (const auto& arc : graph.arcs())
    {
        size_t count = ++listings[{arc.parent_id, arc.child_id}];
        if (count > 1)
        {
            // Reported once per repeated pair; the repeats are otherwise ignored.
            if (count == 2)
            {
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Warning;
                item.category = DiagnosticCategory::DuplicateArc;
                item.message = "Node '" + arc.child_id + "' lists parent '" + arc.parent_id +
                               "' more than once; the arc is declared once";
                item.involved_nodes = {arc.parent_id, arc.child_id};
                auto child_idx = graph.find_node(arc.child_id);
                item.line = child_idx.has_value() ? graph.node(child_idx.value()).line : 0;
                report.add(std::move(item));
            }
            continue;
        }

        auto child_idx = graph.find_node(arc.child_id);
        int line = child_idx.has_value() ? graph.node(child_idx.value()).line : 0;

        auto parent_idx = graph.find_node(arc.parent_id);
        if (!parent_idx.has_value())
        {
            report.add(make_error(
                DiagnosticCategory::DanglingArc,
                "Node '" + arc.child_id + "' lists unknown parent '" + arc.parent_id + "'",
                {arc.child_id, arc.parent_id}, line));
            continue;
        }

        const NodeRecord& parent = graph.node(parent_idx.value());
        if (parent.kind == NodeKind::Utility)
        {
            report.add(make_error(
                DiagnosticCategory::InvalidArcKind,
                "Utility node '" + arc.parent_id + "' cannot be a parent of node '" +
                    arc.child_id + "'",
                {arc.parent_id, arc.child_id}, line));
        }
    }
}

void GraphValidator::check_cycles(const ModelGraph& graph, ValidationReport& report) const
{
    const size_t n = graph.node_count();

    // Successor lists, ordered by child declaration order.
    std::vector<std::vector<NodeIdx>> successors(n);
    for (NodeIdx child = 0; child < n; ++child)
    {
        for (const auto& parent_id : graph.node(child).parents)
        {
            auto parent = graph.find_node(parent_id);
            if (parent.has_value())
            {
                successors[parent.value()].push_back(child);
            }
        }
    }

    enum class Mark
    {
        Unvisited,
        OnStack,
        Done
    };
    std::vector<Mark> marks(n, Mark::Unvisited);

    // Iterative DFS; each frame is (node, position of next successor to visit).
    std::vector<std::pair<NodeIdx, size_t>> stack;

    for (NodeIdx start = 0; start < n; ++start)
    {
        if (marks[start] != Mark::Unvisited)
        {
            continue;
        }

        marks[start] = Mark::OnStack;
        stack.emplace_back(start, 0);

        while (!stack.empty())
        {
            auto& [current, next] = stack.back();
            if (next == successors[current].size())
            {
                marks[current] = Mark::Done;
                stack.pop_back();
                continue;
            }

            NodeIdx succ = successors[current][next];
            ++next;

            if (marks[succ] == Mark::Unvisited)
            {
                marks[succ] = Mark::OnStack;
                stack.emplace_back(succ, 0);
            }
            else if (marks[succ] == Mark::OnStack)
            {
                // Back edge: the cycle is the stack suffix starting at succ.
                auto begin = std::find_if(stack.begin(), stack.end(),
                                          [succ](const auto& frame) { return frame.first == succ; });
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Error;
                item.category = DiagnosticCategory::CyclicGraph;
                std::string path;
                for (auto it = begin; it != stack.end(); ++it)
                {
                    const std::string& id = graph.node(it->first).id;
                    item.involved_nodes.push_back(id);
                    path += id + " -> ";
                }
                path += graph.node(succ).id;
                item.message = "Cycle detected: " + path;
                item.line = graph.node(succ).line;
                report.add(std::move(item));
            }
        }
    }
}

void GraphValidator::check_tables(const ModelGraph& graph, ValidationReport& report) const
{
    // Nodes whose tables lost tokens already carry a MalformedTableValue error.
    std::unordered_set<std::string> malformed;
    for (const auto& issue : graph.issues())
    {
        if (issue.category == DiagnosticCategory::MalformedTableValue &&
            !issue.involved_nodes.empty())
        {
            malformed.insert(issue.involved_nodes.front());
        }
    }

    for (NodeIdx idx = 0; idx < graph.node_count(); ++idx)
    {
        const NodeRecord& node = graph.node(idx);
        if (node.kind == NodeKind::Decision)
        {
            continue;
        }
        if (graph.find_node(node.id) != idx)
        {
            continue; // duplicate id, already reported
        }

        const TableRecord* table = graph.find_table(node.id);
        if (table == nullptr)
        {
            report.add(make_error(
                DiagnosticCategory::MissingTable,
                "Node '" + node.id + "' (" + to_string(node.kind) + ") has no " +
                    (node.kind == NodeKind::Chance ? "<probabilities>" : "<utilities>"),
                {node.id}, node.line));
            continue;
        }

        if (malformed.count(node.id) > 0)
        {
            continue;
        }

        auto expected = graph.expected_table_size(idx);
        if (!expected.has_value())
        {
            continue; // unresolved parent, already reported
        }
        if (node.kind == NodeKind::Chance && node.states.empty())
        {
            continue; // empty state space, already reported
        }

        if (table->values.size() != expected.value())
        {
            report.add(make_error(
                DiagnosticCategory::TableSizeMismatch,
                "Node '" + node.id + "' has " + std::to_string(table->values.size()) +
                    " table values; expected " + std::to_string(expected.value()),
                {node.id}, table->line));
        }
    }
}

void GraphValidator::check_maus(const ModelGraph& graph, ValidationReport& report) const
{
    std::map<std::string, std::vector<std::string>> weighted_by;

    for (const auto& mau : graph.maus())
    {
        if (mau.weights.size() != mau.parents.size())
        {
            report.add(make_error(
                DiagnosticCategory::MauWeightMismatch,
                "MAU '" + mau.id + "' has " + std::to_string(mau.parents.size()) +
                    " parents but " + std::to_string(mau.weights.size()) + " weights",
                {mau.id}, mau.line));
        }

        // Parent id -> position of its first listing in this MAU.
        std::map<std::string, size_t> first_listing;

        for (size_t pos = 0; pos < mau.parents.size(); ++pos)
        {
            const std::string& parent_id = mau.parents[pos];

            auto [listed, inserted] = first_listing.emplace(parent_id, pos);
            if (!inserted)
            {
                const size_t first = listed->second;
                const bool weights_known = pos < mau.weights.size();
                if (weights_known && mau.weights[first] != mau.weights[pos])
                {
                    report.add(make_error(
                        DiagnosticCategory::ConflictingUtilityWeight,
                        "MAU '" + mau.id + "' lists parent '" + parent_id +
                            "' more than once with different weights",
                        {parent_id, mau.id}, mau.line));
                }
                else
                {
                    DiagnosticItem item;
                    item.severity = DiagnosticSeverity::Warning;
                    item.category = DiagnosticCategory::DuplicateArc;
                    item.message = "MAU '" + mau.id + "' lists parent '" + parent_id +
                                   "' more than once; the weight is applied once";
                    item.involved_nodes = {parent_id, mau.id};
                    item.line = mau.line;
                    report.add(std::move(item));
                }
                continue;
            }

            auto parent_idx = graph.find_node(parent_id);
            if (!parent_idx.has_value())
            {
                report.add(make_error(
                    DiagnosticCategory::DanglingArc,
                    "MAU '" + mau.id + "' lists unknown parent '" + parent_id + "'",
                    {mau.id, parent_id}, mau.line));
                continue;
            }
            if (graph.node(parent_idx.value()).kind != NodeKind::Utility)
            {
                report.add(make_error(
                    DiagnosticCategory::InvalidArcKind,
                    "MAU '" + mau.id + "' parent '" + parent_id + "' is not a utility node",
                    {mau.id, parent_id}, mau.line));
                continue;
            }
            auto& mau_ids = weighted_by[parent_id];
            if (std::find(mau_ids.begin(), mau_ids.end(), mau.id) == mau_ids.end())
            {
                mau_ids.push_back(mau.id);
            }
        }
    }

    for (const auto& [utility_id, mau_ids] : weighted_by)
    {
        if (mau_ids.size() > 1)
        {
            std::vector<std::string> involved{utility_id};
            involved.insert(involved.end(), mau_ids.begin(), mau_ids.end());
            report.add(make_error(
                DiagnosticCategory::ConflictingUtilityWeight,
                "Utility node '" + utility_id + "' is weighted by " +
                    std::to_string(mau_ids.size()) + " MAU elements",
                std::move(involved), 0));
        }
    }
}

} // namespace xdslc
