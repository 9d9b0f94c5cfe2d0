/**
 * @file validation_report.cpp
 */
#include "xdslc/common/validation_report.hpp"
#include <sstream>

namespace xdslc
{

std::string format_item(const DiagnosticItem& item)
{
    std::ostringstream oss;
    oss << "[" << to_string(item.category) << "] " << item.message;
    if (item.line > 0)
    {
        oss << " (line " << item.line << ")";
    }
    return oss.str();
}

std::string ValidationReport::to_string() const
{
    std::ostringstream oss;
    for (const auto& item : m_errors)
    {
        oss << "error: " << format_item(item) << "\n";
    }
    for (const auto& item : m_warnings)
    {
        oss << "warning: " << format_item(item) << "\n";
    }
    return oss.str();
}

} // namespace xdslc
