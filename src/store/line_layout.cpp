/**
 * @file line_layout.cpp
 * @brief Field-by-offset codec for the 270-byte linelist line layout.
 *
 * Multi-byte fields are copied out of the raw buffer and reversed when the
 * stored byte order differs from the host. Nothing is reinterpreted in place.
 */

#include "line_record.hpp"

#include <algorithm>
#include <cstring>

namespace lxt
{
namespace
{

constexpr std::size_t off_wavelength = 0;
constexpr std::size_t off_species = 8;
constexpr std::size_t off_log_gf = 12;
constexpr std::size_t off_e_lower = 16;
constexpr std::size_t off_j_lower = 24;
constexpr std::size_t off_e_upper = 28;
constexpr std::size_t off_j_upper = 36;
constexpr std::size_t off_lande_lower = 40;
constexpr std::size_t off_lande_upper = 44;
constexpr std::size_t off_gamma_rad = 48;
constexpr std::size_t off_gamma_stark = 52;
constexpr std::size_t off_gamma_vdw = 56;
constexpr std::size_t off_term_blob = 60;

static_assert(off_term_blob + term_blob_bytes == line_length_bytes,
              "term blob must fill the rest of the line");

/** @brief Copies a field out of the buffer, swapping bytes when orders differ. */
template <typename T>
T read_field(const unsigned char* line, std::size_t offset, ByteOrder stored_order)
{
    unsigned char bytes[sizeof(T)];
    std::memcpy(bytes, line + offset, sizeof(T));
    if (stored_order != host_byte_order())
    {
        std::reverse(bytes, bytes + sizeof(T));
    }
    T value;
    std::memcpy(&value, bytes, sizeof(T));
    return value;
}

template <typename T>
void write_field(unsigned char* line, std::size_t offset, ByteOrder stored_order, T value)
{
    unsigned char bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
    if (stored_order != host_byte_order())
    {
        std::reverse(bytes, bytes + sizeof(T));
    }
    std::memcpy(line + offset, bytes, sizeof(T));
}

std::string trimmed_blob_text(const LineRecord& record, std::size_t offset, std::size_t length)
{
    std::string text(record.term_blob.data() + offset, length);
    const auto not_blank = [](char c) { return c != ' ' && c != '\0'; };
    const auto first = std::find_if(text.begin(), text.end(), not_blank);
    const auto last = std::find_if(text.rbegin(), text.rend(), not_blank).base();
    if (first >= last)
    {
        return std::string();
    }
    return std::string(first, last);
}

}

ByteOrder host_byte_order()
{
    static const ByteOrder detected = []()
    {
        const std::uint16_t probe = 1;
        unsigned char first = 0;
        std::memcpy(&first, &probe, 1);
        return first == 1 ? ByteOrder::little : ByteOrder::big;
    }();
    return detected;
}

const char* to_string(ByteOrder order)
{
    return order == ByteOrder::little ? "little" : "big";
}

LineRecord make_blank_record()
{
    LineRecord record;
    record.term_blob.fill(' ');
    record.set_forbid_flag(' ');
    set_reference_ids(record, 0, 0, 0);
    return record;
}

LineRecord decode_line(const unsigned char* line, ByteOrder stored_order)
{
    LineRecord record;
    record.wavelength = read_field<double>(line, off_wavelength, stored_order);
    record.species_code = read_field<std::int32_t>(line, off_species, stored_order);
    record.log_gf = read_field<float>(line, off_log_gf, stored_order);
    record.e_lower = read_field<double>(line, off_e_lower, stored_order);
    record.j_lower = read_field<float>(line, off_j_lower, stored_order);
    record.e_upper = read_field<double>(line, off_e_upper, stored_order);
    record.j_upper = read_field<float>(line, off_j_upper, stored_order);
    record.lande_lower = read_field<float>(line, off_lande_lower, stored_order);
    record.lande_upper = read_field<float>(line, off_lande_upper, stored_order);
    record.gamma_radiative = read_field<float>(line, off_gamma_rad, stored_order);
    record.gamma_stark = read_field<float>(line, off_gamma_stark, stored_order);
    record.gamma_vdw = read_field<float>(line, off_gamma_vdw, stored_order);
    std::memcpy(record.term_blob.data(), line + off_term_blob, term_blob_bytes);

    if (record.has_reference_ids())
    {
        const unsigned char* ids = line + off_term_blob + term_layout::reference_ids_offset;
        for (std::size_t i = 0; i < record.reference_ids.size(); ++i)
        {
            record.reference_ids[i] = read_field<std::uint16_t>(ids, i * 2, stored_order);
        }
    }
    return record;
}

void encode_line(const LineRecord& record, ByteOrder stored_order, unsigned char* line)
{
    write_field<double>(line, off_wavelength, stored_order, record.wavelength);
    write_field<std::int32_t>(line, off_species, stored_order, record.species_code);
    write_field<float>(line, off_log_gf, stored_order, record.log_gf);
    write_field<double>(line, off_e_lower, stored_order, record.e_lower);
    write_field<float>(line, off_j_lower, stored_order, record.j_lower);
    write_field<double>(line, off_e_upper, stored_order, record.e_upper);
    write_field<float>(line, off_j_upper, stored_order, record.j_upper);
    write_field<float>(line, off_lande_lower, stored_order, record.lande_lower);
    write_field<float>(line, off_lande_upper, stored_order, record.lande_upper);
    write_field<float>(line, off_gamma_rad, stored_order, record.gamma_radiative);
    write_field<float>(line, off_gamma_stark, stored_order, record.gamma_stark);
    write_field<float>(line, off_gamma_vdw, stored_order, record.gamma_vdw);
    std::memcpy(line + off_term_blob, record.term_blob.data(), term_blob_bytes);

    if (record.has_reference_ids())
    {
        unsigned char* ids = line + off_term_blob + term_layout::reference_ids_offset;
        for (std::size_t i = 0; i < record.reference_ids.size(); ++i)
        {
            write_field<std::uint16_t>(ids, i * 2, stored_order, record.reference_ids[i]);
        }
    }
}

std::string lower_term(const LineRecord& record)
{
    return trimmed_blob_text(record, term_layout::lower_term_offset, term_layout::lower_term_length);
}

std::string upper_term(const LineRecord& record)
{
    return trimmed_blob_text(record, term_layout::upper_term_offset, term_layout::upper_term_length);
}

std::string reference_code(const LineRecord& record)
{
    if (record.has_reference_ids())
    {
        return std::string();
    }
    return trimmed_blob_text(record, term_layout::reference_offset, term_layout::reference_length);
}

void set_blob_text(LineRecord& record, std::size_t offset, std::size_t length, const std::string& text)
{
    if (offset >= term_blob_bytes)
    {
        return;
    }
    length = std::min(length, term_blob_bytes - offset);
    std::fill(record.term_blob.begin() + offset, record.term_blob.begin() + offset + length, ' ');
    std::copy_n(text.begin(), std::min(length, text.size()), record.term_blob.begin() + offset);
}

void set_reference_code(LineRecord& record, const std::string& code)
{
    if (code.empty())
    {
        set_reference_ids(record, 0, 0, 0);
        return;
    }
    set_blob_text(record, term_layout::reference_offset, term_layout::reference_length, code);
    record.reference_ids = {0, 0, 0};
}

void set_reference_ids(LineRecord& record, std::uint16_t first, std::uint16_t second, std::uint16_t third)
{
    record.term_blob[term_layout::reference_offset] = '\x01';
    record.reference_ids = {first, second, third};
}

} // namespace lxt
