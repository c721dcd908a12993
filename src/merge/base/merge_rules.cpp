/**
 * @file merge_rules.cpp
 * @brief Duplicate detection and parameter folding between linelist sources.
 */

#include "merge/base/merge_rules.hpp"
#include "physical_constants.hpp"
#include "species_table.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace lxt
{

const char* to_string(MergeMode mode)
{
    switch (mode)
    {
        case MergeMode::standalone:
            return "standalone";
        case MergeMode::replacement:
            return "replacement";
        case MergeMode::mergeable:
        default:
            return "mergeable";
    }
}

bool parse_merge_mode(const std::string& text, MergeMode& out)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(text));
    if (normalized == "mergeable" || normalized == "0")
    {
        out = MergeMode::mergeable;
        return true;
    }
    if (normalized == "standalone" || normalized == "1")
    {
        out = MergeMode::standalone;
        return true;
    }
    if (normalized == "replacement" || normalized == "2")
    {
        out = MergeMode::replacement;
        return true;
    }
    return false;
}

bool pending_before(const PendingLine& a, const PendingLine& b)
{
    if (a.record.wavelength != b.record.wavelength)
    {
        return a.record.wavelength < b.record.wavelength;
    }
    if (a.priority != b.priority)
    {
        return a.priority < b.priority;
    }
    return a.sequence < b.sequence;
}

double merge_window(double wavelength, double window_ref, double wl_ref)
{
    const double scaled = window_ref * wavelength / wl_ref;
    return std::clamp(scaled, 0.01 * window_ref, 100.0 * window_ref);
}

bool forbid_compatible(char a, char b)
{
    return a == b || (a == ' ' && b == 'A') || (a == 'A' && b == ' ');
}

bool lines_equivalent(const LineRecord& a,
                      const LineRecord& b,
                      double window,
                      double energy_tolerance)
{
    if (a.species_code != b.species_code)
    {
        return false;
    }
    if (std::abs(b.wavelength - a.wavelength) > window)
    {
        return false;
    }
    if (a.j_lower != b.j_lower || a.j_upper != b.j_upper)
    {
        return false;
    }
    // A zero upper energy carries no information to compare against.
    if (a.e_upper > 0.0 && std::abs(b.e_upper - a.e_upper) > energy_tolerance * a.e_upper)
    {
        return false;
    }
    return true;
}

void absorb_parameters(PendingLine& winner, const PendingLine& loser)
{
    LineRecord& w = winner.record;
    const LineRecord& l = loser.record;
    RankSet& wr = winner.ranks;
    const RankSet& lr = loser.ranks;

    if (lr.wavelength > wr.wavelength)
    {
        w.wavelength = l.wavelength;
        wr.wavelength = lr.wavelength;
    }
    if (lr.gf > wr.gf)
    {
        w.log_gf = l.log_gf;
        wr.gf = lr.gf;
    }
    if (lr.e_lower > wr.e_lower)
    {
        w.e_lower = l.e_lower;
        wr.e_lower = lr.e_lower;
    }
    if (lr.e_upper > wr.e_upper)
    {
        w.e_upper = l.e_upper;
        wr.e_upper = lr.e_upper;
    }

    const float unknown = physical_constants::unknown_lande;
    if (lr.lande > wr.lande || (w.lande_lower == unknown && l.lande_lower != unknown))
    {
        w.lande_lower = l.lande_lower;
        w.lande_upper = l.lande_upper;
        wr.lande = lr.lande;
    }

    const auto take_damping = [](float& mine, float theirs, double& my_rank, double their_rank)
    {
        if (their_rank > my_rank || (mine == 0.0f && theirs != 0.0f))
        {
            mine = theirs;
            my_rank = their_rank;
        }
    };
    take_damping(w.gamma_radiative, l.gamma_radiative, wr.gamma_radiative, lr.gamma_radiative);
    take_damping(w.gamma_stark, l.gamma_stark, wr.gamma_stark, lr.gamma_stark);
    take_damping(w.gamma_vdw, l.gamma_vdw, wr.gamma_vdw, lr.gamma_vdw);

    winner.merged_count += loser.merged_count;
    winner.kept_duplicate = winner.kept_duplicate || loser.kept_duplicate;
    winner.has_regular = winner.has_regular || loser.has_regular;
}

bool apply_isotopic_scaling(LineRecord& record, const SpeciesTable& species, std::string& error)
{
    const std::optional<double> fraction = species.isotope_fraction(record.species_code);
    if (!fraction)
    {
        return true;
    }
    if (!(*fraction > 0.0))
    {
        std::ostringstream oss;
        oss << "species " << record.species_code << " has non-positive isotope fraction " << *fraction;
        error = oss.str();
        return false;
    }
    record.log_gf = static_cast<float>(record.log_gf + std::log10(*fraction));
    return true;
}

} // namespace lxt
