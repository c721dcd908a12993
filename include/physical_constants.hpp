#pragma once

/**
 * @file physical_constants.hpp
 * @brief Shared physical constants used by unit conversion and merging.
 *
 * Centralizes spectroscopic constants to keep the energy conversion,
 * refractive-index correction and merge-window defaults consistent
 * between the formatter and the merge engine.
 */

namespace lxt
{
namespace physical_constants
{
inline constexpr double cm1_per_ev = 8065.543937;
inline constexpr double angstrom_per_nm = 10.0;
inline constexpr double angstrom_cm1_product = 1.0e8;

// Refractive index of standard air (Ciddor-type dispersion), sigma^2 in um^-2.
inline constexpr double air_index_offset = 8.34254e-5;
inline constexpr double air_index_a = 2.406147e-2;
inline constexpr double air_index_a_pole = 130.0;
inline constexpr double air_index_b = 1.5998e-4;
inline constexpr double air_index_b_pole = 38.9;
inline constexpr double air_correction_min_angstrom = 2000.0;

inline constexpr double default_merge_window_angstrom = 0.05;
inline constexpr double default_merge_reference_angstrom = 5000.0;
inline constexpr double default_energy_tolerance = 1.0e-3;
inline constexpr float unknown_lande = 99.0f;
} // namespace physical_constants
} // namespace lxt
