/**
 * @file validation_report.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_enums.hpp"

namespace xdslc
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< Blocking issue that prevents emission.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    MissingNodesSection,           ///< The document root has no `nodes` element.
    MissingNodeId,                 ///< A node-defining element has no `id` attribute.
    UnknownNodeKind,               ///< An element under `nodes` has an unrecognized kind.
    DuplicateNodeId,               ///< Two nodes share an id.
    DuplicateStateId,              ///< A node declares the same state twice.
    EmptyStateSpace,               ///< A chance or decision node declares no states.
    DanglingArc,                   ///< An arc references a nonexistent node.
    DuplicateArc,                  ///< A node lists the same parent twice.
    InvalidArcKind,                ///< An arc whose endpoint kinds are not allowed.
    CyclicGraph,                   ///< The arc relation contains a cycle.
    MissingTable,                  ///< A chance or utility node has no table.
    MalformedTableValue,           ///< A table token is not a finite number.
    TableSizeMismatch,             ///< A table length differs from its axis product.
    MauWeightMismatch,             ///< A MAU element has a weight count != parent count.
    ConflictingUtilityWeight,      ///< A utility node is weighted by several MAU elements.
    UnsupportedTemporalConstruct   ///< A time-sliced (dynamic) construct was found.
};

/**
 * @brief Get a printable name for a diagnostic category.
 */
inline const char* to_string(DiagnosticCategory category) noexcept
{
    switch (category)
    {
    case DiagnosticCategory::MissingNodesSection:
        return "MissingNodesSection";
    case DiagnosticCategory::MissingNodeId:
        return "MissingNodeId";
    case DiagnosticCategory::UnknownNodeKind:
        return "UnknownNodeKind";
    case DiagnosticCategory::DuplicateNodeId:
        return "DuplicateNodeId";
    case DiagnosticCategory::DuplicateStateId:
        return "DuplicateStateId";
    case DiagnosticCategory::EmptyStateSpace:
        return "EmptyStateSpace";
    case DiagnosticCategory::DanglingArc:
        return "DanglingArc";
    case DiagnosticCategory::DuplicateArc:
        return "DuplicateArc";
    case DiagnosticCategory::InvalidArcKind:
        return "InvalidArcKind";
    case DiagnosticCategory::CyclicGraph:
        return "CyclicGraph";
    case DiagnosticCategory::MissingTable:
        return "MissingTable";
    case DiagnosticCategory::MalformedTableValue:
        return "MalformedTableValue";
    case DiagnosticCategory::TableSizeMismatch:
        return "TableSizeMismatch";
    case DiagnosticCategory::MauWeightMismatch:
        return "MauWeightMismatch";
    case DiagnosticCategory::ConflictingUtilityWeight:
        return "ConflictingUtilityWeight";
    case DiagnosticCategory::UnsupportedTemporalConstruct:
        return "UnsupportedTemporalConstruct";
    }
    return "Unknown";
}

/**
 * @brief A single diagnostic item (error or warning).
 *
 * @details
 * Each diagnostic item describes one issue detected during extraction or
 * validation. `involved_nodes` names the node ids (or MAU element ids) the
 * issue is attached to, in the order most useful to a reader.
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Node ids involved in this issue (if applicable).
    std::vector<std::string> involved_nodes;

    /// Line in the source document, 0 if unknown.
    int line{0};
};

// ============================================================================
// ValidationReport
// ============================================================================

/**
 * @brief All problems detected in one model graph.
 *
 * @details
 * `ValidationReport` is produced by `GraphValidator::validate()`. Every check
 * runs to completion, so the report lists every problem at once rather than
 * the first one found.
 *
 * @par Error vs Warning
 * - **Errors** block emission. Examples: CyclicGraph, DanglingArc,
 *   TableSizeMismatch, UnsupportedTemporalConstruct.
 * - **Warnings** do not block emission. Example: DuplicateArc, which is
 *   handled idempotently.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once populated, the data is immutable.
 * - Concurrent reads are safe.
 */
class ValidationReport
{
public:
    /**
     * @brief Check if the report has any errors.
     */
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    /**
     * @brief Check if the report has any warnings.
     */
    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if the graph may proceed to emission.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Get all diagnostic items (errors and warnings combined).
     * @return A vector containing all items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    /**
     * @brief Count the items of a given category, errors and warnings alike.
     */
    size_t count(DiagnosticCategory category) const noexcept
    {
        size_t n = 0;
        for (const auto& item : m_errors)
        {
            if (item.category == category) ++n;
        }
        for (const auto& item : m_warnings)
        {
            if (item.category == category) ++n;
        }
        return n;
    }

    /**
     * @brief Record a diagnostic item, routed by its severity.
     */
    void add(DiagnosticItem item)
    {
        if (item.severity == DiagnosticSeverity::Error)
        {
            m_errors.push_back(std::move(item));
        }
        else
        {
            m_warnings.push_back(std::move(item));
        }
    }

    /**
     * @brief Re-classify all warnings as errors.
     */
    void promote_warnings()
    {
        for (auto& item : m_warnings)
        {
            item.severity = DiagnosticSeverity::Error;
            m_errors.push_back(std::move(item));
        }
        m_warnings.clear();
    }

    /**
     * @brief Format one line per item, errors first.
     */
    std::string to_string() const;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

/**
 * @brief Format a single item as `[Category] message (line N)`.
 */
std::string format_item(const DiagnosticItem& item);

} // namespace xdslc
