/**
 * @file text_utils.hpp
 * @brief Locale-independent token and number helpers.
 */
#pragma once
#include "xdslc/common/common.hpp"

namespace xdslc
{

/**
 * @brief Split text on ASCII whitespace, dropping empty tokens.
 */
std::vector<std::string> split_whitespace(std::string_view text);

/**
 * @brief Parse a finite decimal number.
 * @return The value, or nullopt if the token is not entirely a finite number.
 * @note A leading '+' is accepted. Infinities and NaN are rejected.
 */
std::optional<double> parse_number(std::string_view token);

/**
 * @brief Format a number with the shortest text that parses back exactly.
 */
std::string format_number(double value);

} // namespace xdslc
