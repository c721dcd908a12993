#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by configuration and table parsing.
 *
 * Provides case normalization, trimming, boolean parsing and list splitting.
 * Functions are header-inline because they are small and reused in
 * configuration, species-list and catalog code paths.
 */

namespace lxt
{
namespace strutil
{

/**
 * @brief Returns a lowercase copy of the input string.
 * @param value Source string view.
 * @return Lowercased string.
 */
inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Returns the input without leading and trailing whitespace.
 */
inline std::string trim_copy(std::string_view value)
{
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };
    const auto first = std::find_if(value.begin(), value.end(), not_space);
    const auto last = std::find_if(value.rbegin(), value.rend(), not_space).base();
    if (first >= last)
    {
        return std::string();
    }
    return std::string(first, last);
}

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string view.
 * @return True for 1/true/yes/on (case-insensitive), false otherwise.
 */
inline bool parse_bool(std::string_view value)
{
    const std::string normalized = lower_copy(trim_copy(value));
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

/**
 * @brief Splits on a separator, trimming items and dropping empty ones.
 */
inline std::vector<std::string> split_list(std::string_view value, char separator = ',')
{
    std::vector<std::string> items;
    std::stringstream stream{std::string(value)};
    std::string item;
    while (std::getline(stream, item, separator))
    {
        item = trim_copy(item);
        if (!item.empty())
        {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace strutil
} // namespace lxt
