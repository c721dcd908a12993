/**
 * @file unit_conversion.cpp
 * @brief Air/vacuum correction and unit scaling for formatted output.
 */

#include "unit_conversion.hpp"
#include "extraction_errors.hpp"
#include "physical_constants.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <sstream>

namespace lxt
{

namespace pc = physical_constants;

const char* to_string(EnergyUnit unit)
{
    return unit == EnergyUnit::ev ? "eV" : "cm-1";
}

const char* to_string(WavelengthUnit unit)
{
    switch (unit)
    {
        case WavelengthUnit::nm:
            return "nm";
        case WavelengthUnit::cm1:
            return "cm-1";
        case WavelengthUnit::angstrom:
        default:
            return "A";
    }
}

const char* to_string(Medium medium)
{
    return medium == Medium::air ? "air" : "vacuum";
}

bool parse_energy_unit(const std::string& text, EnergyUnit& out)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(text));
    if (normalized == "ev")
    {
        out = EnergyUnit::ev;
        return true;
    }
    if (normalized == "cm-1" || normalized == "cm^-1" || normalized == "1/cm")
    {
        out = EnergyUnit::cm1;
        return true;
    }
    return false;
}

bool parse_wavelength_unit(const std::string& text, WavelengthUnit& out)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(text));
    if (normalized == "angstrom" || normalized == "a" || normalized == "aa")
    {
        out = WavelengthUnit::angstrom;
        return true;
    }
    if (normalized == "nm")
    {
        out = WavelengthUnit::nm;
        return true;
    }
    if (normalized == "cm-1" || normalized == "cm^-1" || normalized == "1/cm")
    {
        out = WavelengthUnit::cm1;
        return true;
    }
    return false;
}

bool parse_medium(const std::string& text, Medium& out)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(text));
    if (normalized == "air")
    {
        out = Medium::air;
        return true;
    }
    if (normalized == "vacuum" || normalized == "vac")
    {
        out = Medium::vacuum;
        return true;
    }
    return false;
}

double air_refractive_index(double vacuum_angstrom)
{
    const double sigma2 = pc::angstrom_cm1_product / (vacuum_angstrom * vacuum_angstrom);
    return 1.0 + pc::air_index_offset +
           pc::air_index_a / (pc::air_index_a_pole - sigma2) +
           pc::air_index_b / (pc::air_index_b_pole - sigma2);
}

double vacuum_to_air(double vacuum_angstrom)
{
    if (vacuum_angstrom <= pc::air_correction_min_angstrom)
    {
        return vacuum_angstrom;
    }
    return vacuum_angstrom / air_refractive_index(vacuum_angstrom);
}

double air_to_vacuum(double air_angstrom)
{
    // The index varies slowly with wavelength, so a few fixed-point steps converge.
    double vacuum = air_angstrom;
    for (int iter = 0; iter < 20; ++iter)
    {
        const double next = air_angstrom * air_refractive_index(vacuum);
        if (std::abs(next - vacuum) < 1.0e-10)
        {
            vacuum = next;
            break;
        }
        vacuum = next;
    }
    return vacuum > pc::air_correction_min_angstrom ? vacuum : air_angstrom;
}

void validate_output_units(WavelengthUnit unit, Medium medium)
{
    if (unit == WavelengthUnit::cm1 && medium == Medium::air)
    {
        throw ConversionError(ConversionError::Kind::UnsupportedCombination,
                              "wavenumber output is defined in vacuum only; air medium requested");
    }
}

bool convert_wavelength(double vacuum_angstrom,
                        WavelengthUnit unit,
                        Medium medium,
                        double& out,
                        std::string& error)
{
    if (!std::isfinite(vacuum_angstrom) || vacuum_angstrom <= 0.0)
    {
        std::ostringstream oss;
        oss << "wavelength " << vacuum_angstrom << " cannot be converted";
        error = oss.str();
        return false;
    }
    if (unit == WavelengthUnit::cm1 && medium == Medium::air)
    {
        error = "wavenumber output is defined in vacuum only";
        return false;
    }

    const double in_medium = (medium == Medium::air) ? vacuum_to_air(vacuum_angstrom) : vacuum_angstrom;
    switch (unit)
    {
        case WavelengthUnit::nm:
            out = in_medium / pc::angstrom_per_nm;
            break;
        case WavelengthUnit::cm1:
            out = pc::angstrom_cm1_product / in_medium;
            break;
        case WavelengthUnit::angstrom:
        default:
            out = in_medium;
            break;
    }
    return true;
}

bool convert_energy(double value, EnergyUnit from, EnergyUnit to, double& out, std::string& error)
{
    if (!std::isfinite(value))
    {
        error = "energy value is not finite";
        return false;
    }
    if (from == to)
    {
        out = value;
    }
    else if (from == EnergyUnit::ev)
    {
        out = value * pc::cm1_per_ev;
    }
    else
    {
        out = value / pc::cm1_per_ev;
    }
    return true;
}

} // namespace lxt
