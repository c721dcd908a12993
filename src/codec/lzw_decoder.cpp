/**
 * @file lzw_decoder.cpp
 * @brief Incremental LZW decoder for compressed linelist records.
 *
 * Each RecordDecoder owns its prefix/suffix table, output stack and line
 * buffer, so any number of decoders can run concurrently. Output bytes are
 * produced lazily and cut into 270-byte lines as they complete.
 */

#include "lzw_codec.hpp"
#include "extraction_errors.hpp"

#include <sstream>
#include <string>

namespace lxt
{

void validate_lzw_params(const LzwParams& params)
{
    if (params.literal_bits < 2 || params.literal_bits > 8)
    {
        throw CodecError(CodecError::Kind::InvalidParameters,
                         "literal_bits must lie in [2, 8], got " + std::to_string(params.literal_bits));
    }
    if (params.max_code_bits <= params.literal_bits || params.max_code_bits > 16)
    {
        throw CodecError(CodecError::Kind::InvalidParameters,
                         "max_code_bits must lie in (literal_bits, 16], got " +
                         std::to_string(params.max_code_bits));
    }
}

RecordDecoder::RecordDecoder(const unsigned char* data,
                             std::size_t size,
                             ByteOrder stored_order,
                             const LzwParams& params)
    : data_(data), size_(size), stored_order_(stored_order)
{
    validate_lzw_params(params);

    clear_code_ = 1u << params.literal_bits;
    literal_mask_ = clear_code_ - 1;
    end_code_ = clear_code_ + 1;
    first_free_ = clear_code_ + 2;
    initial_code_size_ = params.literal_bits + 1;
    max_code_size_ = params.max_code_bits;
    table_capacity_ = 1u << params.max_code_bits;

    prefix_.assign(table_capacity_, 0);
    suffix_.assign(table_capacity_, 0);
    stack_.reserve(table_capacity_ + 1);
    line_.reserve(line_length_bytes);

    // The stream starts in the cleared state: the first code is a literal.
    reset_table();
    code_ = clear_code_;
}

void RecordDecoder::reset_table()
{
    code_size_ = initial_code_size_;
    max_code_ = 1u << code_size_;
    free_code_ = first_free_;
}

unsigned RecordDecoder::read_code()
{
    while (bit_count_ < code_size_)
    {
        if (position_ >= size_)
        {
            std::ostringstream oss;
            oss << "compressed record exhausted after " << size_
                << " bytes without an END code";
            throw CodecError(CodecError::Kind::Truncated, oss.str());
        }
        bit_buffer_ |= static_cast<std::uint32_t>(data_[position_++]) << bit_count_;
        bit_count_ += 8;
    }
    const unsigned code = bit_buffer_ & ((1u << code_size_) - 1u);
    bit_buffer_ >>= code_size_;
    bit_count_ -= code_size_;
    return code;
}

void RecordDecoder::decode_step()
{
    if (code_ == clear_code_)
    {
        reset_table();
        const unsigned literal = read_code();
        if (literal > literal_mask_)
        {
            throw CodecError(CodecError::Kind::InvalidCode,
                             "expected a literal after CLEAR, got code " + std::to_string(literal));
        }
        old_code_ = literal;
        fin_char_ = literal;
        stack_.push_back(static_cast<unsigned char>(fin_char_));
    }
    else
    {
        if (free_code_ >= table_capacity_)
        {
            throw CodecError(CodecError::Kind::TableOverflow,
                             "code table full without CLEAR (" + std::to_string(table_capacity_) + " entries)");
        }
        const unsigned in_code = code_;
        unsigned cur_code = code_;
        if (cur_code > free_code_)
        {
            std::ostringstream oss;
            oss << "code " << cur_code << " beyond next free table slot " << free_code_;
            throw CodecError(CodecError::Kind::InvalidCode, oss.str());
        }

        // Not in the table yet: the string is the previous one plus its own first byte.
        if (cur_code == free_code_)
        {
            cur_code = old_code_;
            stack_.push_back(static_cast<unsigned char>(fin_char_));
        }

        while (cur_code > literal_mask_)
        {
            if (cur_code < first_free_ || stack_.size() > table_capacity_)
            {
                throw CodecError(CodecError::Kind::InvalidCode,
                                 "corrupt prefix chain at code " + std::to_string(cur_code));
            }
            stack_.push_back(suffix_[cur_code]);
            cur_code = prefix_[cur_code];
        }
        fin_char_ = cur_code & literal_mask_;
        stack_.push_back(static_cast<unsigned char>(fin_char_));

        prefix_[free_code_] = static_cast<std::uint16_t>(old_code_);
        suffix_[free_code_] = static_cast<unsigned char>(fin_char_);
        old_code_ = in_code;

        ++free_code_;
        if (free_code_ >= max_code_ && code_size_ < max_code_size_)
        {
            ++code_size_;
            max_code_ <<= 1;
        }
    }

    code_ = read_code();
    if (code_ == end_code_)
    {
        finished_ = true;
    }
}

bool RecordDecoder::next_byte(unsigned char& out)
{
    if (stack_.empty())
    {
        if (finished_)
        {
            return false;
        }
        decode_step();
    }
    // The stack holds each string in reverse order.
    out = stack_.back();
    stack_.pop_back();
    return true;
}

bool RecordDecoder::next(LineRecord& out)
{
    line_.clear();
    unsigned char byte = 0;
    while (line_.size() < line_length_bytes)
    {
        if (!next_byte(byte))
        {
            // A trailing partial line carries no record.
            return false;
        }
        line_.push_back(byte);
    }

    if (lines_decoded_ >= lines_per_record)
    {
        throw CodecError(CodecError::Kind::RecordOverflow,
                         "record decodes to more than " + std::to_string(lines_per_record) + " lines");
    }
    out = decode_line(line_.data(), stored_order_);
    ++lines_decoded_;
    return true;
}

std::vector<LineRecord> decode_record(const unsigned char* data,
                                      std::size_t size,
                                      ByteOrder stored_order,
                                      const LzwParams& params)
{
    RecordDecoder decoder(data, size, stored_order, params);
    std::vector<LineRecord> records;
    LineRecord record;
    while (decoder.next(record))
    {
        records.push_back(record);
    }
    return records;
}

} // namespace lxt
