/**
 * @file factory.cpp
 * @brief Output scheme selection by configured name.
 */

#include "line_formatter_base.hpp"
#include "schemes/long/long_format.hpp"
#include "schemes/short/short_format.hpp"
#include "string_utils.hpp"

namespace lxt
{

std::unique_ptr<LineFormatterBase> create_line_formatter(const std::string& scheme_name)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(scheme_name));
    if (normalized == "short" || normalized.empty())
    {
        return std::make_unique<ShortFormatScheme>();
    }
    else if (normalized == "long")
    {
        return std::make_unique<LongFormatScheme>();
    }
    return nullptr;
}

std::vector<std::string> get_available_line_formats()
{
    return {"short", "long"};
}

} // namespace lxt
