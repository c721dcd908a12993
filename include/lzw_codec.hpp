#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "line_record.hpp"

/**
 * @file lzw_codec.hpp
 * @brief Variable-width LZW codec for compressed linelist records.
 *
 * One compressed record is a byte stream of LSB-first packed codes. The
 * alphabet holds 2^literal_bits literals, followed by a CLEAR code and an
 * END (end-of-packet) code. The stream starts in the cleared state, so the
 * first code is a literal. Code width starts at literal_bits + 1 and grows
 * by one bit each time the table reaches the current ceiling, up to
 * max_code_bits. Decoded bytes are cut into 270-byte lines.
 */

namespace lxt
{

struct LzwParams
{
    int literal_bits = 8;
    int max_code_bits = 16;
};

/**
 * @brief Throws CodecError::InvalidParameters for unusable parameter sets.
 */
void validate_lzw_params(const LzwParams& params);

/**
 * @brief Incremental decoder yielding one LineRecord per completed line.
 *
 * The decoder owns all table state; independent instances never share data.
 * The input buffer must outlive the decoder.
 */
class RecordDecoder
{
public:
    RecordDecoder(const unsigned char* data,
                  std::size_t size,
                  ByteOrder stored_order,
                  const LzwParams& params = LzwParams{});

    /**
     * @brief Decodes the next complete line.
     * @param out Receives the decoded record.
     * @return False once the END code has been consumed.
     * @throws CodecError on malformed input.
     */
    bool next(LineRecord& out);

    std::size_t lines_decoded() const { return lines_decoded_; }

private:
    bool next_byte(unsigned char& out);
    void decode_step();
    unsigned read_code();
    void reset_table();

    const unsigned char* data_;
    std::size_t size_;
    std::size_t position_ = 0;
    std::uint32_t bit_buffer_ = 0;
    int bit_count_ = 0;

    ByteOrder stored_order_;
    unsigned literal_mask_;
    unsigned clear_code_;
    unsigned end_code_;
    unsigned first_free_;
    unsigned table_capacity_;
    int initial_code_size_;
    int max_code_size_;

    int code_size_ = 0;
    unsigned max_code_ = 0;
    unsigned free_code_ = 0;
    unsigned code_ = 0;
    unsigned old_code_ = 0;
    unsigned fin_char_ = 0;
    bool finished_ = false;

    std::vector<std::uint16_t> prefix_;
    std::vector<unsigned char> suffix_;
    std::vector<unsigned char> stack_;

    std::vector<unsigned char> line_;
    std::size_t lines_decoded_ = 0;
};

/**
 * @brief Decodes a whole compressed record.
 * @throws CodecError on malformed input.
 */
std::vector<LineRecord> decode_record(const unsigned char* data,
                                      std::size_t size,
                                      ByteOrder stored_order,
                                      const LzwParams& params = LzwParams{});

/**
 * @brief Packs variable-width codes LSB-first into bytes.
 */
class LzwBitWriter
{
public:
    void write(unsigned code, int width);

    /**
     * @brief Flushes any partial byte and returns the packed stream.
     */
    std::vector<unsigned char> finish();

private:
    std::vector<unsigned char> bytes_;
    std::uint32_t bit_buffer_ = 0;
    int bit_count_ = 0;
};

/**
 * @brief Reference compressor producing streams RecordDecoder accepts.
 */
class LzwEncoder
{
public:
    explicit LzwEncoder(const LzwParams& params = LzwParams{});

    /**
     * @brief Compresses a non-empty byte sequence into one record stream.
     * @throws CodecError::InvalidParameters for empty input or out-of-alphabet bytes.
     */
    std::vector<unsigned char> encode(const unsigned char* data, std::size_t size) const;

private:
    LzwParams params_;
};

/**
 * @brief Serializes records into 270-byte lines and compresses them.
 * @throws CodecError when more than lines_per_record records are given.
 */
std::vector<unsigned char> encode_record(const std::vector<LineRecord>& records,
                                         ByteOrder stored_order,
                                         const LzwParams& params = LzwParams{});

} // namespace lxt
