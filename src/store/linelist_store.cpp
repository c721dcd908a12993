/**
 * @file linelist_store.cpp
 * @brief Descriptor loading, positioning and sequential record reads.
 *
 * The descriptor is read whole at open time and validated against the data
 * file size, so later reads only fail on I/O errors or corrupt payloads.
 */

#include "linelist_store.hpp"
#include "extraction_errors.hpp"
#include "log_profile.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace lxt
{
namespace
{

template <typename T>
T read_descriptor_field(const unsigned char* bytes, ByteOrder stored_order)
{
    unsigned char raw[sizeof(T)];
    std::memcpy(raw, bytes, sizeof(T));
    if (stored_order != host_byte_order())
    {
        std::reverse(raw, raw + sizeof(T));
    }
    T value;
    std::memcpy(&value, raw, sizeof(T));
    return value;
}

std::string describe(const std::filesystem::path& path)
{
    return "'" + path.string() + "'";
}

}

LinelistStore::LinelistStore(const std::filesystem::path& data_path,
                             const std::filesystem::path& descriptor_path,
                             const StoreOpenOptions& options)
    : data_path_(data_path), options_(options)
{
    validate_lzw_params(options_.codec);

    std::error_code ec;
    data_size_ = std::filesystem::file_size(data_path_, ec);
    if (ec)
    {
        throw StoreError(StoreError::Kind::Open,
                         "cannot stat data file " + describe(data_path_) + ": " + ec.message());
    }

    data_.open(data_path_, std::ios::binary);
    if (!data_.is_open())
    {
        throw StoreError(StoreError::Kind::Open, "cannot open data file " + describe(data_path_));
    }

    load_descriptor(descriptor_path);
    open_ = true;

    if (log_debug_enabled())
    {
        std::cout << "[STORE] Opened " << data_path_.string() << " (" << index_.size()
                  << " records, " << to_string(options_.stored_order) << "-endian)" << std::endl;
    }
}

void LinelistStore::load_descriptor(const std::filesystem::path& descriptor_path)
{
    std::ifstream file(descriptor_path, std::ios::binary);
    if (!file.is_open())
    {
        throw StoreError(StoreError::Kind::Open,
                         "cannot open descriptor file " + describe(descriptor_path));
    }

    const std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(file)),
                                           std::istreambuf_iterator<char>());
    if (bytes.size() < 4)
    {
        throw StoreError(StoreError::Kind::Open,
                         "descriptor " + describe(descriptor_path) + " has no record count");
    }

    const std::uint32_t count = read_descriptor_field<std::uint32_t>(bytes.data(), options_.stored_order);
    const std::size_t expected = 4 + static_cast<std::size_t>(count) * descriptor_entry_bytes;
    if (bytes.size() < expected)
    {
        std::ostringstream oss;
        oss << "descriptor " << describe(descriptor_path) << " is truncated: " << count
            << " records need " << expected << " bytes, found " << bytes.size();
        throw StoreError(StoreError::Kind::Open, oss.str());
    }

    index_.clear();
    index_.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i)
    {
        const unsigned char* entry_bytes = bytes.data() + 4 + i * descriptor_entry_bytes;
        RecordIndexEntry entry;
        entry.wl_start = read_descriptor_field<double>(entry_bytes, options_.stored_order);
        entry.wl_end = read_descriptor_field<double>(entry_bytes + 8, options_.stored_order);
        entry.offset = read_descriptor_field<std::uint32_t>(entry_bytes + 16, options_.stored_order);
        entry.length = read_descriptor_field<std::int32_t>(entry_bytes + 20, options_.stored_order);

        if (entry.length <= 0 ||
            static_cast<std::uintmax_t>(entry.offset) + static_cast<std::uintmax_t>(entry.length) > data_size_)
        {
            std::ostringstream oss;
            oss << "descriptor entry " << i << " points outside data file " << describe(data_path_)
                << " (offset " << entry.offset << ", length " << entry.length
                << ", file size " << data_size_ << ")";
            throw StoreError(StoreError::Kind::Open, oss.str());
        }
        if (!index_.empty() && entry.wl_start < index_.back().wl_start)
        {
            std::ostringstream oss;
            oss << "descriptor entry " << i << " is out of wavelength order ("
                << entry.wl_start << " after " << index_.back().wl_start << ")";
            throw StoreError(StoreError::Kind::Open, oss.str());
        }
        index_.push_back(entry);
    }

    if (bytes.size() > expected && log_normal_enabled())
    {
        std::cerr << "[STORE] Warning: descriptor " << describe(descriptor_path) << " has "
                  << (bytes.size() - expected) << " trailing bytes" << std::endl;
    }
}

void LinelistStore::require_open(const char* operation) const
{
    if (!open_)
    {
        throw StoreError(StoreError::Kind::Closed,
                         std::string(operation) + " on closed store " + describe(data_path_));
    }
}

const std::vector<RecordIndexEntry>& LinelistStore::index() const
{
    require_open("index");
    return index_;
}

std::size_t LinelistStore::seek(double wl_min, double wl_max)
{
    require_open("seek");
    if (index_.empty() || wl_min > index_.back().wl_end || wl_max < index_.front().wl_start)
    {
        std::ostringstream oss;
        oss << "window [" << wl_min << ", " << wl_max << "] outside store " << describe(data_path_);
        if (!index_.empty())
        {
            oss << " range [" << index_.front().wl_start << ", " << index_.back().wl_end << "]";
        }
        throw StoreError(StoreError::Kind::OutOfRange, oss.str());
    }

    // Last entry starting at or before wl_min, then back over overlapping predecessors.
    auto it = std::upper_bound(index_.begin(), index_.end(), wl_min,
                               [](double value, const RecordIndexEntry& entry)
                               {
                                   return value < entry.wl_start;
                               });
    std::size_t pos = (it == index_.begin()) ? 0 : static_cast<std::size_t>(std::distance(index_.begin(), it)) - 1;
    while (pos > 0 && index_[pos - 1].wl_end >= wl_min)
    {
        --pos;
    }
    if (index_[pos].wl_end < wl_min && pos + 1 < index_.size())
    {
        ++pos;
    }

    current_record_ = pos;
    positioned_ = true;
    return pos;
}

void LinelistStore::read_record(std::size_t record_index, std::vector<LineRecord>& out)
{
    const RecordIndexEntry& entry = index_[record_index];
    buffer_.resize(static_cast<std::size_t>(entry.length));

    data_.clear();
    data_.seekg(static_cast<std::streamoff>(entry.offset), std::ios::beg);
    data_.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
    if (!data_ || data_.gcount() != static_cast<std::streamsize>(buffer_.size()))
    {
        std::ostringstream oss;
        oss << "short read of record " << record_index << " from " << describe(data_path_)
            << " (wanted " << buffer_.size() << " bytes at offset " << entry.offset << ")";
        throw StoreError(StoreError::Kind::Read, oss.str());
    }

    out = decode_record(buffer_.data(), buffer_.size(), options_.stored_order, options_.codec);
}

bool LinelistStore::next(std::vector<LineRecord>& out)
{
    require_open("next");
    if (!positioned_)
    {
        throw StoreError(StoreError::Kind::NotPositioned,
                         "next() before seek on store " + describe(data_path_));
    }

    out.clear();
    if (current_record_ >= index_.size())
    {
        return false;
    }
    read_record(current_record_, out);
    ++current_record_;
    return true;
}

std::vector<LineRecord> LinelistStore::query_range(double wl_min, double wl_max, std::size_t max_lines)
{
    seek(wl_min, wl_max);

    std::vector<LineRecord> result;
    std::vector<LineRecord> record;
    while (result.size() < max_lines && next(record))
    {
        if (!record.empty() && record.front().wavelength > wl_max)
        {
            break;
        }
        for (const LineRecord& line : record)
        {
            if (line.wavelength < wl_min || line.wavelength > wl_max)
            {
                continue;
            }
            result.push_back(line);
            if (result.size() >= max_lines)
            {
                break;
            }
        }
    }
    return result;
}

void LinelistStore::close()
{
    if (!open_)
    {
        return;
    }
    data_.close();
    index_.clear();
    index_.shrink_to_fit();
    buffer_.clear();
    buffer_.shrink_to_fit();
    positioned_ = false;
    open_ = false;
}

} // namespace lxt
