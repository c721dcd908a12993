#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "line_record.hpp"
#include "lzw_codec.hpp"

/**
 * @file linelist_store.hpp
 * @brief Compressed linelist store: descriptor index plus data file.
 *
 * A store is one wavelength-sorted linelist kept as a data file of LZW
 * compressed records and a descriptor file (4-byte record count followed
 * by 24-byte index entries). Each LinelistStore instance owns its file
 * handle, index and cursor; instances are never shared between requests.
 */

namespace lxt
{

struct StoreOpenOptions
{
    ByteOrder stored_order = ByteOrder::little;
    LzwParams codec;
};

class LinelistStore
{
public:
    /**
     * @brief Opens a data file and reads its descriptor fully into memory.
     * @throws StoreError::Open when a file is missing, truncated or inconsistent.
     */
    LinelistStore(const std::filesystem::path& data_path,
                  const std::filesystem::path& descriptor_path,
                  const StoreOpenOptions& options = StoreOpenOptions{});

    LinelistStore(const LinelistStore&) = delete;
    LinelistStore& operator=(const LinelistStore&) = delete;

    /**
     * @brief Positions the cursor on the earliest record intersecting [wl_min, wl_max].
     * @return Index of that record.
     * @throws StoreError::OutOfRange when the window misses the whole index.
     */
    std::size_t seek(double wl_min, double wl_max);

    /**
     * @brief Returns up to max_lines lines with wavelength in [wl_min, wl_max].
     *
     * Leaves the cursor after the last record read, so next() continues there.
     */
    std::vector<LineRecord> query_range(double wl_min, double wl_max, std::size_t max_lines);

    /**
     * @brief Decodes the record under the cursor and advances the cursor.
     * @param out Receives every line of the record, unfiltered.
     * @return False when the cursor has passed the last record.
     * @throws StoreError::NotPositioned before any seek() or query_range().
     */
    bool next(std::vector<LineRecord>& out);

    /**
     * @brief Releases the data file and index. Safe to call repeatedly.
     */
    void close();

    bool is_open() const { return open_; }

    const std::vector<RecordIndexEntry>& index() const;

    const std::filesystem::path& data_path() const { return data_path_; }

private:
    void require_open(const char* operation) const;
    void load_descriptor(const std::filesystem::path& descriptor_path);
    void read_record(std::size_t record_index, std::vector<LineRecord>& out);

    std::filesystem::path data_path_;
    StoreOpenOptions options_;
    std::ifstream data_;
    std::uintmax_t data_size_ = 0;
    std::vector<RecordIndexEntry> index_;
    std::vector<unsigned char> buffer_;
    std::size_t current_record_ = 0;
    bool positioned_ = false;
    bool open_ = false;
};

/**
 * @brief Writes wavelength-sorted records as a data file plus descriptor.
 */
class StoreWriter
{
public:
    StoreWriter(std::filesystem::path data_path,
                std::filesystem::path descriptor_path,
                ByteOrder stored_order = ByteOrder::little,
                std::size_t lines_in_record = lines_per_record,
                const LzwParams& codec = LzwParams{});

    /**
     * @brief Compresses and writes all records.
     * @param error Output message on failure.
     * @return True on success.
     */
    bool write(const std::vector<LineRecord>& records, std::string& error) const;

private:
    std::filesystem::path data_path_;
    std::filesystem::path descriptor_path_;
    ByteOrder stored_order_;
    std::size_t lines_in_record_;
    LzwParams codec_;
};

} // namespace lxt
