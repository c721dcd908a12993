/**
 * @file source_cursor.cpp
 * @brief Per-source record pulling and filtering for the merge engine.
 */

#include "merge/source_cursor.hpp"
#include "extraction_errors.hpp"
#include "log_profile.hpp"

#include <algorithm>
#include <iostream>

namespace lxt
{

SourceCursor::SourceCursor(const LinelistSource& source,
                           std::size_t source_index,
                           const ExtractionRequest& request)
    : source_(source), source_index_(source_index), request_(request)
{
    store_ = std::make_unique<LinelistStore>(source_.data_path, source_.descriptor_path, source_.store);
    try
    {
        store_->seek(request_.wl_start, request_.wl_end);
    }
    catch (const StoreError& e)
    {
        if (e.store_kind() != StoreError::Kind::OutOfRange)
        {
            throw;
        }
        out_of_range_ = true;
        exhausted_ = true;
        if (log_debug_enabled())
        {
            std::cout << "[MERGE] Source '" << source_.id << "' contributes nothing: " << e.what() << std::endl;
        }
        store_->close();
        return;
    }
    fill();
}

bool SourceCursor::accepts(const LineRecord& line) const
{
    if (line.wavelength < request_.wl_start || line.wavelength > request_.wl_end)
    {
        return false;
    }
    if (!source_.accepts_species(line.species_code))
    {
        return false;
    }
    const std::vector<int>& filter = request_.species_filter;
    return filter.empty() || std::find(filter.begin(), filter.end(), line.species_code) != filter.end();
}

void SourceCursor::fill()
{
    while (position_ >= lines_.size() && !exhausted_)
    {
        lines_.clear();
        position_ = 0;
        if (!store_->next(record_))
        {
            exhausted_ = true;
            break;
        }
        lines_read_ += record_.size();
        if (!record_.empty() && record_.front().wavelength > request_.wl_end)
        {
            exhausted_ = true;
            break;
        }
        for (LineRecord& line : record_)
        {
            if (!accepts(line))
            {
                continue;
            }
            if (source_.energy_unit != EnergyUnit::ev)
            {
                line.e_lower /= physical_constants::cm1_per_ev;
                line.e_upper /= physical_constants::cm1_per_ev;
            }
            lines_.push_back(line);
        }
        if (!record_.empty() && record_.back().wavelength > request_.wl_end)
        {
            exhausted_ = true;
        }
    }
    if (exhausted_ && store_->is_open() && position_ >= lines_.size())
    {
        store_->close();
    }
}

void SourceCursor::advance()
{
    if (position_ < lines_.size())
    {
        ++position_;
    }
    fill();
}

void SourceCursor::close()
{
    if (store_)
    {
        store_->close();
    }
}

} // namespace lxt
