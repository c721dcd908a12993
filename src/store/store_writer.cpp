/**
 * @file store_writer.cpp
 * @brief Builds a data file and descriptor from sorted line records.
 */

#include "linelist_store.hpp"
#include "extraction_errors.hpp"
#include "log_profile.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <limits>
#include <sstream>

namespace lxt
{
namespace
{

template <typename T>
void append_field(std::vector<unsigned char>& out, T value, ByteOrder stored_order)
{
    unsigned char raw[sizeof(T)];
    std::memcpy(raw, &value, sizeof(T));
    if (stored_order != host_byte_order())
    {
        std::reverse(raw, raw + sizeof(T));
    }
    out.insert(out.end(), raw, raw + sizeof(T));
}

}

StoreWriter::StoreWriter(std::filesystem::path data_path,
                         std::filesystem::path descriptor_path,
                         ByteOrder stored_order,
                         std::size_t lines_in_record,
                         const LzwParams& codec)
    : data_path_(std::move(data_path)),
      descriptor_path_(std::move(descriptor_path)),
      stored_order_(stored_order),
      lines_in_record_(lines_in_record),
      codec_(codec)
{
}

bool StoreWriter::write(const std::vector<LineRecord>& records, std::string& error) const
{
    if (lines_in_record_ == 0 || lines_in_record_ > lines_per_record)
    {
        error = "lines per record must lie in [1, " + std::to_string(lines_per_record) + "]";
        return false;
    }
    for (std::size_t i = 1; i < records.size(); ++i)
    {
        if (records[i].wavelength < records[i - 1].wavelength)
        {
            std::ostringstream oss;
            oss << "records are not sorted by wavelength at index " << i << " ("
                << records[i].wavelength << " after " << records[i - 1].wavelength << ")";
            error = oss.str();
            return false;
        }
    }

    std::ofstream data(data_path_, std::ios::binary | std::ios::trunc);
    if (!data.is_open())
    {
        error = "cannot create data file '" + data_path_.string() + "'";
        return false;
    }

    std::vector<unsigned char> descriptor;
    const std::size_t record_count = (records.size() + lines_in_record_ - 1) / lines_in_record_;
    append_field<std::uint32_t>(descriptor, static_cast<std::uint32_t>(record_count), stored_order_);

    std::uint64_t offset = 0;
    for (std::size_t first = 0; first < records.size(); first += lines_in_record_)
    {
        const std::size_t last = std::min(records.size(), first + lines_in_record_);
        const std::vector<LineRecord> chunk(records.begin() + static_cast<std::ptrdiff_t>(first),
                                            records.begin() + static_cast<std::ptrdiff_t>(last));
        std::vector<unsigned char> compressed;
        try
        {
            compressed = encode_record(chunk, stored_order_, codec_);
        }
        catch (const CodecError& e)
        {
            error = e.what();
            return false;
        }

        if (offset + compressed.size() > std::numeric_limits<std::uint32_t>::max())
        {
            error = "data file exceeds the 32-bit offset range";
            return false;
        }

        append_field<double>(descriptor, chunk.front().wavelength, stored_order_);
        append_field<double>(descriptor, chunk.back().wavelength, stored_order_);
        append_field<std::uint32_t>(descriptor, static_cast<std::uint32_t>(offset), stored_order_);
        append_field<std::int32_t>(descriptor, static_cast<std::int32_t>(compressed.size()), stored_order_);

        data.write(reinterpret_cast<const char*>(compressed.data()),
                   static_cast<std::streamsize>(compressed.size()));
        offset += compressed.size();
    }
    if (!data)
    {
        error = "write failed on data file '" + data_path_.string() + "'";
        return false;
    }

    std::ofstream desc(descriptor_path_, std::ios::binary | std::ios::trunc);
    if (!desc.is_open())
    {
        error = "cannot create descriptor file '" + descriptor_path_.string() + "'";
        return false;
    }
    desc.write(reinterpret_cast<const char*>(descriptor.data()), static_cast<std::streamsize>(descriptor.size()));
    if (!desc)
    {
        error = "write failed on descriptor file '" + descriptor_path_.string() + "'";
        return false;
    }

    if (log_debug_enabled())
    {
        std::cout << "[STORE] Wrote " << records.size() << " lines in " << record_count
                  << " records to " << data_path_.string() << std::endl;
    }
    return true;
}

} // namespace lxt
