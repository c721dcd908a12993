#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "extraction_request.hpp"
#include "line_record.hpp"

namespace lxt
{

class SpeciesTable;

/**
 * @brief A line waiting in the merge window together with its provenance.
 */
struct PendingLine
{
    LineRecord record;
    RankSet ranks;
    std::size_t source_index = 0;
    int priority = 0;
    double rank_weight = 0.0;
    std::uint64_t sequence = 0;
    int merged_count = 1;
    bool kept_duplicate = false;

    /// False while the line carries only replacement-source data.
    bool has_regular = true;
};

/**
 * @brief Orders pending lines by wavelength, then source priority, then arrival.
 */
bool pending_before(const PendingLine& a, const PendingLine& b);

/**
 * @brief Merge window in angstroms at a wavelength.
 *
 * Scales linearly with wavelength and is clamped to [0.01, 100] times the
 * reference window.
 */
double merge_window(double wavelength, double window_ref, double wl_ref);

/**
 * @brief True when two forbid flags may describe the same transition.
 */
bool forbid_compatible(char a, char b);

/**
 * @brief Checks species, wavelength distance, J values and upper energy.
 *
 * Source identity and forbid flags are checked by the caller.
 */
bool lines_equivalent(const LineRecord& a,
                      const LineRecord& b,
                      double window,
                      double energy_tolerance);

/**
 * @brief Folds the loser's better-ranked parameters into the winner.
 *
 * Each parameter is taken from the loser when its rank is higher. Unknown
 * Lande factors (99.0) and zero damping constants are filled from the
 * loser regardless of rank. merged_count accumulates.
 */
void absorb_parameters(PendingLine& winner, const PendingLine& loser);

/**
 * @brief Adds log10 of the isotope fraction to log gf.
 * @param record Line to scale in place.
 * @param species Table supplying isotope fractions.
 * @param error Output message on failure.
 * @return False when the listed fraction is not positive; codes without a fraction are left unchanged.
 */
bool apply_isotopic_scaling(LineRecord& record, const SpeciesTable& species, std::string& error);

} // namespace lxt
