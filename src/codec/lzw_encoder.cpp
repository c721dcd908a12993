/**
 * @file lzw_encoder.cpp
 * @brief Reference LZW compressor for building linelist stores.
 *
 * Mirrors the decoder's table growth exactly: no leading CLEAR, the code
 * width tracks the decoder's next free slot, and a CLEAR is emitted as soon
 * as the table cannot take another entry.
 */

#include "lzw_codec.hpp"
#include "extraction_errors.hpp"

#include <string>
#include <unordered_map>

namespace lxt
{

void LzwBitWriter::write(unsigned code, int width)
{
    bit_buffer_ |= static_cast<std::uint32_t>(code & ((1u << width) - 1u)) << bit_count_;
    bit_count_ += width;
    while (bit_count_ >= 8)
    {
        bytes_.push_back(static_cast<unsigned char>(bit_buffer_ & 0xFFu));
        bit_buffer_ >>= 8;
        bit_count_ -= 8;
    }
}

std::vector<unsigned char> LzwBitWriter::finish()
{
    if (bit_count_ > 0)
    {
        bytes_.push_back(static_cast<unsigned char>(bit_buffer_ & 0xFFu));
        bit_buffer_ = 0;
        bit_count_ = 0;
    }
    return std::move(bytes_);
}

LzwEncoder::LzwEncoder(const LzwParams& params) : params_(params)
{
    validate_lzw_params(params_);
}

std::vector<unsigned char> LzwEncoder::encode(const unsigned char* data, std::size_t size) const
{
    if (size == 0)
    {
        throw CodecError(CodecError::Kind::InvalidParameters, "cannot encode an empty record");
    }

    const unsigned clear_code = 1u << params_.literal_bits;
    const unsigned end_code = clear_code + 1;
    const unsigned first_free = clear_code + 2;
    const unsigned capacity = 1u << params_.max_code_bits;
    const int initial_code_size = params_.literal_bits + 1;

    for (std::size_t i = 0; i < size; ++i)
    {
        if (data[i] >= clear_code)
        {
            throw CodecError(CodecError::Kind::InvalidParameters,
                             "byte " + std::to_string(data[i]) + " outside the literal alphabet");
        }
    }

    LzwBitWriter writer;
    std::unordered_map<std::uint32_t, unsigned> table;
    unsigned next_code = first_free;
    int code_size = initial_code_size;
    unsigned max_code = 1u << code_size;
    unsigned decoder_free = first_free;
    std::size_t codes_since_clear = 0;

    const auto reset = [&]()
    {
        table.clear();
        next_code = first_free;
        code_size = initial_code_size;
        max_code = 1u << code_size;
        decoder_free = first_free;
        codes_since_clear = 0;
    };

    // The decoder grows its table after every data code except the first one
    // following a CLEAR; the width it reads with follows that table.
    const auto emit = [&](unsigned code)
    {
        writer.write(code, code_size);
        ++codes_since_clear;
        if (codes_since_clear >= 2)
        {
            ++decoder_free;
            if (decoder_free >= max_code && code_size < params_.max_code_bits)
            {
                ++code_size;
                max_code <<= 1;
            }
        }
    };

    unsigned current = data[0];
    for (std::size_t i = 1; i < size; ++i)
    {
        const unsigned byte = data[i];
        const std::uint32_t key = (static_cast<std::uint32_t>(current) << 8) | byte;
        const auto found = table.find(key);
        if (found != table.end())
        {
            current = found->second;
            continue;
        }

        emit(current);
        if (next_code < capacity)
        {
            table.emplace(key, next_code++);
        }
        else
        {
            writer.write(clear_code, code_size);
            reset();
        }
        current = byte;
    }

    emit(current);
    writer.write(end_code, code_size);
    return writer.finish();
}

std::vector<unsigned char> encode_record(const std::vector<LineRecord>& records,
                                         ByteOrder stored_order,
                                         const LzwParams& params)
{
    if (records.size() > lines_per_record)
    {
        throw CodecError(CodecError::Kind::RecordOverflow,
                         "a record holds at most " + std::to_string(lines_per_record) + " lines");
    }

    std::vector<unsigned char> raw(records.size() * line_length_bytes);
    for (std::size_t i = 0; i < records.size(); ++i)
    {
        encode_line(records[i], stored_order, raw.data() + i * line_length_bytes);
    }
    return LzwEncoder(params).encode(raw.data(), raw.size());
}

} // namespace lxt
