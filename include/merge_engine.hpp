#pragma once

#include <vector>

#include "extraction_request.hpp"
#include "species_table.hpp"

/**
 * @file merge_engine.hpp
 * @brief Streaming k-way merge of several linelist stores.
 *
 * The engine opens one store per enabled source, pulls lines in global
 * wavelength order, folds equivalent transitions from different sources
 * according to rank and replacement rules, and emits at most max_lines
 * MergedLines in non-decreasing wavelength order. Energies in the output
 * are in eV regardless of the stored unit of each source.
 */

namespace lxt
{

/**
 * @brief Validates request window, cap, output units and source configuration.
 * @throws MergeError for inconsistent requests or sources.
 * @throws ConversionError for unsupported output unit combinations.
 */
void validate_request(const ExtractionRequest& request, const SpeciesTable& species);

class MergeEngine
{
public:
    MergeEngine(const ExtractionRequest& request, const SpeciesTable& species);

    /**
     * @brief Runs the merge to completion or to the line cap.
     *
     * Any store or codec failure aborts the whole run; no partial output is
     * returned. Every store opened by the run is closed before returning or
     * throwing.
     * @throws ExtractionError subclasses, TimeoutError past the request deadline.
     */
    std::vector<MergedLine> run();

    const MergeStats& stats() const { return stats_; }

private:
    const ExtractionRequest& request_;
    const SpeciesTable& species_;
    MergeStats stats_;
};

} // namespace lxt
