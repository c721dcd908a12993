#pragma once

#include <string>

/**
 * @file unit_conversion.hpp
 * @brief Wavelength medium/unit and energy unit conversions for output.
 *
 * Stored wavelengths are vacuum angstroms. Per-line conversions report
 * failure through a bool plus message so the caller can skip the line;
 * request-level combinations that can never work throw ConversionError.
 */

namespace lxt
{

enum class EnergyUnit
{
    ev,
    cm1,
};

enum class WavelengthUnit
{
    angstrom,
    nm,
    cm1,
};

enum class Medium
{
    vacuum,
    air,
};

const char* to_string(EnergyUnit unit);
const char* to_string(WavelengthUnit unit);
const char* to_string(Medium medium);

bool parse_energy_unit(const std::string& text, EnergyUnit& out);
bool parse_wavelength_unit(const std::string& text, WavelengthUnit& out);
bool parse_medium(const std::string& text, Medium& out);

/**
 * @brief Refractive index of standard air at a vacuum wavelength in angstroms.
 */
double air_refractive_index(double vacuum_angstrom);

/**
 * @brief Converts a vacuum wavelength to air; identity at or below 2000 A.
 */
double vacuum_to_air(double vacuum_angstrom);

/**
 * @brief Inverts vacuum_to_air by fixed-point iteration.
 */
double air_to_vacuum(double air_angstrom);

/**
 * @brief Throws ConversionError::UnsupportedCombination for wavenumber output in air.
 */
void validate_output_units(WavelengthUnit unit, Medium medium);

/**
 * @brief Converts a stored vacuum wavelength to the requested unit and medium.
 * @param vacuum_angstrom Stored wavelength.
 * @param unit Output unit.
 * @param medium Output medium.
 * @param out Converted value.
 * @param error Output message on failure.
 * @return False for non-positive or non-finite input.
 */
bool convert_wavelength(double vacuum_angstrom,
                        WavelengthUnit unit,
                        Medium medium,
                        double& out,
                        std::string& error);

/**
 * @brief Converts an energy between eV and cm^-1.
 * @return False for non-finite input.
 */
bool convert_energy(double value, EnergyUnit from, EnergyUnit to, double& out, std::string& error);

} // namespace lxt
