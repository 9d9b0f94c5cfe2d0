/**
 * @file text_utils.cpp
 */
#include "xdslc/common/text_utils.hpp"

#include <charconv>
#include <cmath>

namespace xdslc
{

namespace
{

bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::vector<std::string> split_whitespace(std::string_view text)
{
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < text.size())
    {
        while (pos < text.size() && is_space(text[pos]))
        {
            ++pos;
        }
        size_t start = pos;
        while (pos < text.size() && !is_space(text[pos]))
        {
            ++pos;
        }
        if (pos > start)
        {
            tokens.emplace_back(text.substr(start, pos - start));
        }
    }
    return tokens;
}

std::optional<double> parse_number(std::string_view token)
{
    if (!token.empty() && token.front() == '+')
    {
        token.remove_prefix(1);
    }
    if (token.empty())
    {
        return std::nullopt;
    }

    double value = 0.0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

std::string format_number(double value)
{
    // Shortest round-trip form; 64 chars covers every double.
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{})
    {
        return std::to_string(value);
    }
    return std::string(buffer.data(), ptr);
}

} // namespace xdslc
