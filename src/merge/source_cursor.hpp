#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "extraction_request.hpp"
#include "linelist_store.hpp"

namespace lxt
{

/**
 * @brief Read cursor over one source's lines inside the request window.
 *
 * Owns the source's store for the duration of one request. Lines come out
 * in stored wavelength order, already filtered by window and species, with
 * energies normalised to eV.
 */
class SourceCursor
{
public:
    /**
     * @throws StoreError on open failure; an out-of-range window leaves the cursor empty.
     */
    SourceCursor(const LinelistSource& source, std::size_t source_index, const ExtractionRequest& request);

    bool has_line() const { return position_ < lines_.size(); }

    const LineRecord& current() const { return lines_[position_]; }

    /**
     * @brief Moves to the next accepted line, decoding further records as needed.
     */
    void advance();

    bool out_of_range() const { return out_of_range_; }

    std::size_t lines_read() const { return lines_read_; }

    std::size_t source_index() const { return source_index_; }

    const LinelistSource& source() const { return source_; }

    void close();

private:
    void fill();
    bool accepts(const LineRecord& line) const;

    const LinelistSource& source_;
    std::size_t source_index_;
    const ExtractionRequest& request_;
    std::unique_ptr<LinelistStore> store_;
    std::vector<LineRecord> record_;
    std::vector<LineRecord> lines_;
    std::size_t position_ = 0;
    std::size_t lines_read_ = 0;
    bool exhausted_ = false;
    bool out_of_range_ = false;
};

} // namespace lxt
