/**
 * @file render_lines.cpp
 * @brief Shared conversion, header and skip handling for output schemes.
 */

#include "line_formatter_base.hpp"
#include "log_profile.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace lxt
{
namespace
{

std::string format_header(const ExtractionRequest& request, std::size_t line_count, std::size_t warnings)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4)
        << "# " << request.wl_start << " - " << request.wl_end << " A"
        << ", wavelength " << to_string(request.output.wavelength_unit)
        << " (" << to_string(request.output.medium) << ")"
        << ", energy " << to_string(request.output.energy_unit)
        << ", lines " << line_count
        << ", warnings " << warnings;
    if (request.output.isotopic_scaling)
    {
        oss << ", isotopic scaling";
    }
    if (request.output.hfs_splitting)
    {
        oss << ", HFS splitting requested";
    }
    return oss.str();
}

}

bool convert_line(const MergedLine& line, const OutputOptions& options, ConvertedLine& out, std::string& error)
{
    if (!convert_wavelength(line.record.wavelength, options.wavelength_unit, options.medium, out.wavelength, error))
    {
        return false;
    }
    if (!convert_energy(line.record.e_lower, EnergyUnit::ev, options.energy_unit, out.e_lower, error))
    {
        return false;
    }
    return convert_energy(line.record.e_upper, EnergyUnit::ev, options.energy_unit, out.e_upper, error);
}

FormattedOutput render_lines(const std::vector<MergedLine>& lines,
                             const LineFormatterBase& formatter,
                             const ExtractionRequest& request,
                             const SpeciesTable& species,
                             std::size_t warnings_before)
{
    FormattedOutput result;
    std::vector<std::string> body;
    body.reserve(lines.size());

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const MergedLine& line = lines[i];
        ConvertedLine values;
        std::string error;
        if (!convert_line(line, request.output, values, error))
        {
            ++result.skipped_lines;
            if (log_debug_enabled())
            {
                std::cerr << "[EXTRACT] Skipping line of species " << line.record.species_code
                          << ": " << error << std::endl;
            }
            continue;
        }
        body.push_back(formatter.format_line(line, values, species));
        result.rendered.push_back(i);
    }

    result.lines.reserve(body.size() + 2);
    result.lines.push_back(format_header(request, body.size(), warnings_before + result.skipped_lines));
    result.lines.push_back(formatter.legend(request.output));
    for (std::string& text : body)
    {
        result.lines.push_back(std::move(text));
    }
    return result;
}

} // namespace lxt
