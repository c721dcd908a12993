/**
 * @file short_format.cpp
 * @brief Short output scheme rendering.
 */

#include "short_format.hpp"

#include <iomanip>
#include <sstream>

std::string ShortFormatScheme::legend(const lxt::OutputOptions& options) const
{
    std::ostringstream oss;
    oss << "# Elm Ion, WL(" << lxt::to_string(options.wavelength_unit) << "), log gf, E_low("
        << lxt::to_string(options.energy_unit) << "), J lo, E_up(" << lxt::to_string(options.energy_unit)
        << "), J up, Rad., Stark, Waals";
    return oss.str();
}

std::string ShortFormatScheme::format_line(const lxt::MergedLine& line,
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
        << std::setw(7) << std::setprecision(3) << r.gamma_radiative << ","
        << std::setw(7) << std::setprecision(3) << r.gamma_stark << ","
        << std::setw(7) << std::setprecision(3) << r.gamma_vdw;
    return oss.str();
}
