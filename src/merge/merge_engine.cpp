/**
 * @file merge_engine.cpp
 * @brief Request validation and the windowed k-way merge loop.
 *
 * Lines are pulled from per-source cursors through a min-heap keyed on
 * (wavelength, priority) into a sorted pending window. The head of the
 * window is compared against every pending line within its merge window
 * before it is emitted, so equivalent lines from different sources are
 * folded regardless of which source delivered them first.
 */

#include "merge_engine.hpp"
#include "extraction_errors.hpp"
#include "log_profile.hpp"
#include "merge/base/merge_rules.hpp"
#include "merge/source_cursor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <queue>
#include <set>
#include <sstream>

namespace lxt
{
namespace
{

struct HeapEntry
{
    double wavelength;
    int priority;
    std::size_t cursor;
};

struct HeapLater
{
    bool operator()(const HeapEntry& a, const HeapEntry& b) const
    {
        if (a.wavelength != b.wavelength)
        {
            return a.wavelength > b.wavelength;
        }
        return a.priority > b.priority;
    }
};

enum class MergeOutcome
{
    none,
    head_wins,
    candidate_wins,
};

class MergeRun
{
public:
    MergeRun(const ExtractionRequest& request, const SpeciesTable& species, MergeStats& stats)
        : request_(request), species_(species), stats_(stats)
    {
    }

    std::vector<MergedLine> execute();

private:
    void open_sources();
    void pull_next();
    void insert_pending(PendingLine line);
    void check_deadline();
    double window_ref(const PendingLine& line) const;
    MergeOutcome try_merge(PendingLine& head, PendingLine& candidate);
    void emit(PendingLine& line, std::vector<MergedLine>& output);

    const ExtractionRequest& request_;
    const SpeciesTable& species_;
    MergeStats& stats_;

    std::vector<std::unique_ptr<SourceCursor>> cursors_;
    std::priority_queue<HeapEntry, std::vector<HeapEntry>, HeapLater> heap_;
    std::vector<PendingLine> pending_;
    std::uint64_t sequence_ = 0;
    double max_window_ref_ = 0.0;
};

void MergeRun::open_sources()
{
    max_window_ref_ = request_.merge.wl_window_ref;
    for (std::size_t i = 0; i < request_.sources.size(); ++i)
    {
        const LinelistSource& source = request_.sources[i];
        if (!source.enabled)
        {
            continue;
        }
        max_window_ref_ = std::max(max_window_ref_, source.window.value_or(request_.merge.wl_window_ref));

        auto cursor = std::make_unique<SourceCursor>(source, i, request_);
        ++stats_.sources_opened;
        if (cursor->out_of_range())
        {
            ++stats_.sources_out_of_range;
        }
        if (cursor->has_line())
        {
            heap_.push(HeapEntry{cursor->current().wavelength, source.priority, cursors_.size()});
        }
        cursors_.push_back(std::move(cursor));
    }
}

void MergeRun::check_deadline()
{
    if (request_.deadline && std::chrono::steady_clock::now() > *request_.deadline)
    {
        std::ostringstream oss;
        oss << "extraction '" << request_.job_name << "' exceeded its time budget after reading "
            << stats_.lines_read << " lines";
        throw TimeoutError(oss.str());
    }
}

void MergeRun::insert_pending(PendingLine line)
{
    const auto pos = std::upper_bound(pending_.begin(), pending_.end(), line, pending_before);
    pending_.insert(pos, std::move(line));
}

void MergeRun::pull_next()
{
    const HeapEntry top = heap_.top();
    heap_.pop();

    SourceCursor& cursor = *cursors_[top.cursor];
    const LinelistSource& source = cursor.source();

    PendingLine line;
    line.record = cursor.current();
    line.ranks = source.effective_ranks();
    line.source_index = cursor.source_index();
    line.priority = source.priority;
    line.rank_weight = source.rank_weight;
    line.sequence = sequence_++;
    line.has_regular = source.mode != MergeMode::replacement;
    ++stats_.lines_read;
    if ((stats_.lines_read & 0x3Fu) == 0)
    {
        check_deadline();
    }

    cursor.advance();
    if (cursor.has_line())
    {
        heap_.push(HeapEntry{cursor.current().wavelength, source.priority, top.cursor});
    }
    insert_pending(std::move(line));
}

double MergeRun::window_ref(const PendingLine& line) const
{
    return request_.sources[line.source_index].window.value_or(request_.merge.wl_window_ref);
}

MergeOutcome MergeRun::try_merge(PendingLine& head, PendingLine& candidate)
{
    if (head.source_index == candidate.source_index)
    {
        return MergeOutcome::none;
    }
    const LinelistSource& head_source = request_.sources[head.source_index];
    const LinelistSource& candidate_source = request_.sources[candidate.source_index];
    if (head_source.mode == MergeMode::standalone || candidate_source.mode == MergeMode::standalone)
    {
        return MergeOutcome::none;
    }

    const double window = merge_window(head.record.wavelength,
                                       std::max(window_ref(head), window_ref(candidate)),
                                       request_.merge.wl_ref);
    if (!lines_equivalent(head.record, candidate.record, window, request_.merge.energy_tolerance))
    {
        return MergeOutcome::none;
    }

    // Molecules use the flag byte for parity/branch information.
    if (!species_.is_molecule(head.record.species_code) &&
        !forbid_compatible(head.record.forbid_flag(), candidate.record.forbid_flag()))
    {
        if (!(head.kept_duplicate && candidate.kept_duplicate))
        {
            ++stats_.kept_duplicates;
        }
        head.kept_duplicate = true;
        candidate.kept_duplicate = true;
        return MergeOutcome::none;
    }

    const int code = head.record.species_code;
    const bool head_replaces = head_source.replaces_species(code);
    const bool candidate_replaces = candidate_source.replaces_species(code);
    if (head_replaces != candidate_replaces)
    {
        PendingLine& winner = head_replaces ? head : candidate;
        const PendingLine& loser = head_replaces ? candidate : head;
        winner.merged_count += loser.merged_count;
        winner.kept_duplicate = winner.kept_duplicate || loser.kept_duplicate;
        winner.has_regular = winner.has_regular || loser.has_regular;
        ++stats_.replacements;
        return head_replaces ? MergeOutcome::head_wins : MergeOutcome::candidate_wins;
    }

    bool head_first = head.rank_weight > candidate.rank_weight;
    if (head.rank_weight == candidate.rank_weight)
    {
        head_first = head.priority < candidate.priority;
    }
    if (head_first)
    {
        absorb_parameters(head, candidate);
    }
    else
    {
        absorb_parameters(candidate, head);
    }
    ++stats_.merges;
    return head_first ? MergeOutcome::head_wins : MergeOutcome::candidate_wins;
}

void MergeRun::emit(PendingLine& line, std::vector<MergedLine>& output)
{
    if (!line.has_regular)
    {
        ++stats_.unmatched_replacement_lines;
        return;
    }

    if (request_.output.isotopic_scaling)
    {
        std::string error;
        if (!apply_isotopic_scaling(line.record, species_, error))
        {
            ++stats_.skipped_lines;
            if (log_normal_enabled())
            {
                std::cerr << "[MERGE] Warning: skipping line at " << line.record.wavelength
                          << ": " << error << std::endl;
            }
            return;
        }
    }

    MergedLine merged;
    merged.record = line.record;
    merged.source_index = line.source_index;
    merged.merged_count = line.merged_count;
    merged.kept_duplicate = line.kept_duplicate;
    output.push_back(std::move(merged));
}

std::vector<MergedLine> MergeRun::execute()
{
    std::vector<MergedLine> output;
    check_deadline();
    open_sources();

    std::size_t iterations = 0;
    while (output.size() < request_.max_lines)
    {
        if ((++iterations & 0x3Fu) == 0)
        {
            check_deadline();
        }

        if (pending_.empty())
        {
            if (heap_.empty())
            {
                break;
            }
            pull_next();
            continue;
        }

        // Everything that can pair with the head must be in the window first.
        const std::uint64_t head_sequence = pending_.front().sequence;
        const double head_wavelength = pending_.front().record.wavelength;
        const double horizon = head_wavelength +
                               merge_window(head_wavelength, max_window_ref_, request_.merge.wl_ref);
        while (!heap_.empty() && heap_.top().wavelength <= horizon)
        {
            pull_next();
        }
        if (pending_.front().sequence != head_sequence)
        {
            continue;
        }

        bool head_folded = false;
        std::size_t k = 1;
        while (k < pending_.size())
        {
            if (pending_[k].record.wavelength > horizon)
            {
                break;
            }
            const MergeOutcome outcome = try_merge(pending_.front(), pending_[k]);
            if (outcome == MergeOutcome::head_wins)
            {
                pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(k));
                continue;
            }
            if (outcome == MergeOutcome::candidate_wins)
            {
                PendingLine survivor = std::move(pending_[k]);
                pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(k));
                pending_.erase(pending_.begin());
                insert_pending(std::move(survivor));
                head_folded = true;
                break;
            }
            ++k;
        }
        if (head_folded)
        {
            continue;
        }

        // A wavelength taken from a better-ranked line may move the head back into the window.
        if (pending_.front().record.wavelength != head_wavelength &&
            pending_.size() > 1 && pending_before(pending_[1], pending_.front()))
        {
            PendingLine moved = std::move(pending_.front());
            pending_.erase(pending_.begin());
            insert_pending(std::move(moved));
            continue;
        }

        PendingLine head = std::move(pending_.front());
        pending_.erase(pending_.begin());
        emit(head, output);
    }

    for (auto& cursor : cursors_)
    {
        cursor->close();
    }
    return output;
}

}

void validate_request(const ExtractionRequest& request, const SpeciesTable& species)
{
    if (!std::isfinite(request.wl_start) || !std::isfinite(request.wl_end) ||
        request.wl_start <= 0.0 || request.wl_start >= request.wl_end)
    {
        std::ostringstream oss;
        oss << "invalid wavelength window [" << request.wl_start << ", " << request.wl_end
            << "]: need 0 < start < end";
        throw MergeError(MergeError::Kind::InvalidRequest, oss.str());
    }
    if (request.max_lines == 0)
    {
        throw MergeError(MergeError::Kind::InvalidRequest, "max_lines must be positive");
    }
    if (!(request.merge.wl_window_ref > 0.0) || !(request.merge.wl_ref > 0.0) ||
        !(request.merge.energy_tolerance >= 0.0))
    {
        throw MergeError(MergeError::Kind::InvalidRequest,
                         "merge window, reference wavelength and energy tolerance must be positive");
    }
    validate_output_units(request.output.wavelength_unit, request.output.medium);

    std::set<int> priorities;
    for (const LinelistSource& source : request.sources)
    {
        if (!source.enabled)
        {
            continue;
        }
        const std::string label = "linelist '" + source.id + "'";
        if (source.data_path.empty() || source.descriptor_path.empty())
        {
            throw MergeError(MergeError::Kind::InvalidSource, label + " lacks a data or descriptor path");
        }
        if (!priorities.insert(source.priority).second)
        {
            throw MergeError(MergeError::Kind::InvalidSource,
                             label + " shares priority " + std::to_string(source.priority) +
                             " with another enabled linelist");
        }
        if (!std::isfinite(source.rank_weight))
        {
            throw MergeError(MergeError::Kind::InvalidSource, label + " has a non-finite rank weight");
        }
        if (source.species_min > source.species_max)
        {
            throw MergeError(MergeError::Kind::InvalidSource, label + " has an empty species range");
        }
        if (source.window && !(*source.window > 0.0))
        {
            throw MergeError(MergeError::Kind::InvalidSource, label + " has a non-positive merge window");
        }

        const bool has_replace_range = source.replace_min.has_value() || source.replace_max.has_value();
        if (source.mode != MergeMode::replacement)
        {
            if (has_replace_range)
            {
                throw MergeError(MergeError::Kind::InvalidReplacement,
                                 label + " sets a replacement range but is not a replacement list");
            }
            continue;
        }

        const int lo = std::max(source.replace_min.value_or(source.species_min), source.species_min);
        const int hi = std::min(source.replace_max.value_or(source.species_max), source.species_max);
        if (lo > hi)
        {
            throw MergeError(MergeError::Kind::InvalidReplacement,
                             label + " replacement range lies outside its species range");
        }
        if (!species.empty())
        {
            if (!species.has_code_in_range(lo, hi))
            {
                std::ostringstream oss;
                oss << label << " replaces species [" << lo << ", " << hi
                    << "] but no listed species falls in that range";
                throw MergeError(MergeError::Kind::InvalidReplacement, oss.str());
            }
        }
    }
}

MergeEngine::MergeEngine(const ExtractionRequest& request, const SpeciesTable& species)
    : request_(request), species_(species)
{
}

std::vector<MergedLine> MergeEngine::run()
{
    stats_ = MergeStats{};
    validate_request(request_, species_);

    MergeRun merge_run(request_, species_, stats_);
    std::vector<MergedLine> lines = merge_run.execute();

    if (log_normal_enabled())
    {
        std::cout << "[MERGE] " << request_.job_name << ": " << lines.size() << " lines from "
                  << stats_.sources_opened << " sources (" << stats_.lines_read << " read, "
                  << stats_.merges << " merged, " << stats_.replacements << " replaced, "
                  << stats_.kept_duplicates << " kept duplicates)" << std::endl;
    }
    return lines;
}

} // namespace lxt
