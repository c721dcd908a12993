#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @file line_record.hpp
 * @brief Spectral-line record types and the fixed 270-byte line layout.
 *
 * Declares the decoded transition record, the per-record index entry of a
 * descriptor file, and the explicit byte-order-aware field codec used to
 * turn raw line buffers into typed records and back.
 */

namespace lxt
{

inline constexpr std::size_t line_length_bytes = 270;
inline constexpr std::size_t lines_per_record = 1024;
inline constexpr std::size_t term_blob_bytes = 210;
inline constexpr std::size_t descriptor_entry_bytes = 24;

namespace term_layout
{
inline constexpr std::size_t lower_term_offset = 0;
inline constexpr std::size_t lower_term_length = 88;
inline constexpr std::size_t upper_term_offset = 88;
inline constexpr std::size_t upper_term_length = 88;
inline constexpr std::size_t reference_offset = 176;
inline constexpr std::size_t reference_length = 14;
inline constexpr std::size_t reference_ids_offset = 177;
inline constexpr std::size_t forbid_flag_offset = 190;
} // namespace term_layout

enum class ByteOrder
{
    little,
    big,
};

/**
 * @brief Returns the byte order of the running host.
 *
 * Detected once per process.
 */
ByteOrder host_byte_order();

/**
 * @brief Returns "little" or "big".
 */
const char* to_string(ByteOrder order);

/**
 * @brief One spectral transition as stored in a linelist.
 */
struct LineRecord
{
    double wavelength = 0.0;
    int species_code = 0;
    float log_gf = 0.0f;
    double e_lower = 0.0;
    double e_upper = 0.0;
    float j_lower = 0.0f;
    float j_upper = 0.0f;
    float lande_lower = 99.0f;
    float lande_upper = 99.0f;
    float gamma_radiative = 0.0f;
    float gamma_stark = 0.0f;
    float gamma_vdw = 0.0f;
    std::array<char, term_blob_bytes> term_blob{};

    /// Host-order reference indices; only meaningful when has_reference_ids().
    std::array<std::uint16_t, 3> reference_ids{};

    /**
     * @brief Selection-rule tag stored at the fixed blob offset.
     */
    char forbid_flag() const { return term_blob[term_layout::forbid_flag_offset]; }

    void set_forbid_flag(char flag) { term_blob[term_layout::forbid_flag_offset] = flag; }

    /**
     * @brief True when the reference field carries numeric indices instead of a code.
     */
    bool has_reference_ids() const
    {
        return static_cast<unsigned char>(term_blob[term_layout::reference_offset]) < '0';
    }
};

/**
 * @brief Location and wavelength bounds of one compressed record.
 */
struct RecordIndexEntry
{
    double wl_start = 0.0;
    double wl_end = 0.0;
    std::uint32_t offset = 0;
    std::int32_t length = 0;
};

/**
 * @brief Returns a record with blank term text, zero reference indices and allowed forbid flag.
 */
LineRecord make_blank_record();

/**
 * @brief Decodes one raw line buffer into a typed record.
 * @param line Pointer to exactly line_length_bytes bytes.
 * @param stored_order Byte order the buffer was written in.
 * @return Decoded record.
 */
LineRecord decode_line(const unsigned char* line, ByteOrder stored_order);

/**
 * @brief Encodes a record into a raw line buffer.
 * @param record Source record.
 * @param stored_order Byte order to write multi-byte fields in.
 * @param line Destination buffer of exactly line_length_bytes bytes.
 */
void encode_line(const LineRecord& record, ByteOrder stored_order, unsigned char* line);

/**
 * @brief Returns the trimmed lower-level term designation.
 */
std::string lower_term(const LineRecord& record);

/**
 * @brief Returns the trimmed upper-level term designation.
 */
std::string upper_term(const LineRecord& record);

/**
 * @brief Returns the trimmed reference code, or an empty string when indices are stored.
 */
std::string reference_code(const LineRecord& record);

/**
 * @brief Writes text into a fixed-width blank-padded blob field.
 */
void set_blob_text(LineRecord& record, std::size_t offset, std::size_t length, const std::string& text);

/**
 * @brief Stores a reference code; an empty code stores zero reference indices.
 */
void set_reference_code(LineRecord& record, const std::string& code);

/**
 * @brief Stores three numeric reference indices in the reference field.
 */
void set_reference_ids(LineRecord& record, std::uint16_t first, std::uint16_t second, std::uint16_t third);

} // namespace lxt
