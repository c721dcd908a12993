#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "line_record.hpp"
#include "linelist_store.hpp"
#include "physical_constants.hpp"
#include "unit_conversion.hpp"

/**
 * @file extraction_request.hpp
 * @brief Value types describing one extraction and its merged output.
 *
 * An ExtractionRequest is built by the orchestration layer (config loader or
 * caller) from an already-resolved ordered list of linelist sources. It owns
 * no open files; stores are opened per request by the merge engine.
 */

namespace lxt
{

enum class MergeMode
{
    mergeable,
    standalone,
    replacement,
};

const char* to_string(MergeMode mode);
bool parse_merge_mode(const std::string& text, MergeMode& out);

/**
 * @brief Per-parameter rank weights used when folding duplicate lines.
 */
struct RankSet
{
    double wavelength = 0.0;
    double gf = 0.0;
    double e_lower = 0.0;
    double e_upper = 0.0;
    double lande = 0.0;
    double gamma_radiative = 0.0;
    double gamma_stark = 0.0;
    double gamma_vdw = 0.0;

    static RankSet uniform(double weight)
    {
        return RankSet{weight, weight, weight, weight, weight, weight, weight, weight};
    }
};

struct LinelistSource
{
    std::string id;
    std::filesystem::path data_path;
    std::filesystem::path descriptor_path;
    int priority = 0;
    double rank_weight = 1.0;
    std::optional<RankSet> ranks;
    bool enabled = true;
    MergeMode mode = MergeMode::mergeable;

    /// Species codes this source contributes at all.
    int species_min = 0;
    int species_max = std::numeric_limits<int>::max();

    /// Species codes a replacement source supersedes; defaults to the species range.
    std::optional<int> replace_min;
    std::optional<int> replace_max;

    /// Reference merge window in angstroms; unset uses the request default.
    std::optional<double> window;

    EnergyUnit energy_unit = EnergyUnit::ev;
    StoreOpenOptions store;

    RankSet effective_ranks() const { return ranks ? *ranks : RankSet::uniform(rank_weight); }

    bool accepts_species(int code) const { return code >= species_min && code <= species_max; }

    bool replaces_species(int code) const
    {
        return mode == MergeMode::replacement &&
               code >= replace_min.value_or(species_min) &&
               code <= replace_max.value_or(species_max);
    }
};

struct OutputOptions
{
    EnergyUnit energy_unit = EnergyUnit::ev;
    WavelengthUnit wavelength_unit = WavelengthUnit::angstrom;
    Medium medium = Medium::vacuum;
    bool isotopic_scaling = false;
    bool hfs_splitting = false;
    std::string format = "short";
};

struct MergeSettings
{
    double wl_window_ref = physical_constants::default_merge_window_angstrom;
    double wl_ref = physical_constants::default_merge_reference_angstrom;
    double energy_tolerance = physical_constants::default_energy_tolerance;
};

struct ExtractionRequest
{
    std::string job_name = "extraction";
    double wl_start = 0.0;
    double wl_end = 0.0;
    std::size_t max_lines = 1000;

    /// Species codes to keep; empty keeps every species.
    std::vector<int> species_filter;

    std::vector<LinelistSource> sources;
    OutputOptions output;
    MergeSettings merge;

    std::optional<std::chrono::steady_clock::time_point> deadline;
};

/**
 * @brief One output transition after merging.
 */
struct MergedLine
{
    LineRecord record;
    std::size_t source_index = 0;
    int merged_count = 1;
    bool kept_duplicate = false;
};

struct MergeStats
{
    std::size_t sources_opened = 0;
    std::size_t sources_out_of_range = 0;
    std::size_t lines_read = 0;
    std::size_t merges = 0;
    std::size_t replacements = 0;
    std::size_t kept_duplicates = 0;
    std::size_t unmatched_replacement_lines = 0;
    std::size_t skipped_lines = 0;
};

} // namespace lxt
