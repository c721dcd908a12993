/**
 * @file long_format.cpp
 * @brief Long output scheme rendering.
 */

#include "long_format.hpp"
#include "bibliography.hpp"

#include <iomanip>
#include <sstream>

namespace
{

std::string merge_marker(const lxt::MergedLine& line)
{
    std::string marker;
    if (line.merged_count > 1)
    {
        marker = "M" + std::to_string(line.merged_count);
    }
    if (line.kept_duplicate)
    {
        marker += "D";
    }
    return marker;
}

std::string joined_tags(const lxt::LineRecord& record)
{
    std::string joined;
    for (const std::string& tag : lxt::reference_tags(record))
    {
        if (!joined.empty())
        {
            joined += " ";
        }
        joined += tag;
    }
    return joined;
}

}

std::string LongFormatScheme::legend(const lxt::OutputOptions& options) const
{
    std::ostringstream oss;
    oss << "# Elm Ion, WL(" << lxt::to_string(options.wavelength_unit) << "), log gf, E_low("
        << lxt::to_string(options.energy_unit) << "), J lo, E_up(" << lxt::to_string(options.energy_unit)
        << "), J up, Lande lo, Lande up, Rad., Stark, Waals, Lower term, Upper term, References, Flags";
    return oss.str();
}

std::string LongFormatScheme::format_line(const lxt::MergedLine& line,
                                          const lxt::ConvertedLine& values,
                                          const lxt::SpeciesTable& species) const
{
    const lxt::LineRecord& r = line.record;
    std::ostringstream oss;
    oss << std::fixed
        << "'" << species.display_name(r.species_code) << "',"
        << std::setw(15) << std::setprecision(4) << values.wavelength << ","
        << std::setw(8) << std::setprecision(3) << r.log_gf << ","
        << std::setw(10) << std::setprecision(4) << values.e_lower << ","
        << std::setw(5) << std::setprecision(1) << r.j_lower << ","
        << std::setw(10) << std::setprecision(4) << values.e_upper << ","
        << std::setw(5) << std::setprecision(1) << r.j_upper << ","
        << std::setw(7) << std::setprecision(3) << r.lande_lower << ","
        << std::setw(7) << std::setprecision(3) << r.lande_upper << ","
        << std::setw(7) << std::setprecision(3) << r.gamma_radiative << ","
        << std::setw(7) << std::setprecision(3) << r.gamma_stark << ","
        << std::setw(7) << std::setprecision(3) << r.gamma_vdw << ","
        << " '" << lxt::lower_term(r) << "',"
        << " '" << lxt::upper_term(r) << "',"
        << " '" << joined_tags(r) << "',"
        << " '" << merge_marker(line) << "'";
    return oss.str();
}
