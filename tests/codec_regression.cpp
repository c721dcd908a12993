#include "extraction_errors.hpp"
#include "lzw_codec.hpp"
#include "test_support.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace
{
using lxt_test::make_line;
using lxt_test::nearly_equal;

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[codec-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

template <typename Fn>
bool throws_codec_kind(Fn&& fn, lxt::CodecError::Kind kind)
{
    try
    {
        fn();
    }
    catch (const lxt::CodecError& e)
    {
        return e.codec_kind() == kind;
    }
    return false;
}

int test_record_fields_survive_compression()
{
    int failures = 0;
    std::vector<lxt::LineRecord> lines;
    lines.push_back(make_line(5000.123456789, 2600, -1.25f, 2.2, 4.7, ' ', "K07"));
    lines.push_back(make_line(5000.5, 2601, 0.5f, 0.0, 2.5, '4', ""));
    lxt::set_reference_ids(lines.back(), 12, 0, 345);
    lines.back().lande_lower = 1.5f;
    lines.back().gamma_vdw = -7.5f;

    for (lxt::ByteOrder order : {lxt::ByteOrder::little, lxt::ByteOrder::big})
    {
        const std::vector<unsigned char> packed = lxt::encode_record(lines, order);
        const std::vector<lxt::LineRecord> decoded = lxt::decode_record(packed.data(), packed.size(), order);
        const std::string tag = std::string(" (") + lxt::to_string(order) + "-endian)";

        failures += expect_true(decoded.size() == 2, "record must decode to two lines" + tag);
        if (decoded.size() != 2)
        {
            continue;
        }
        failures += expect_true(nearly_equal(decoded[0].wavelength, 5000.123456789),
                                "wavelength must be preserved exactly" + tag);
        failures += expect_true(decoded[0].species_code == 2600, "species code must be preserved" + tag);
        failures += expect_true(decoded[0].log_gf == -1.25f, "log gf must be preserved" + tag);
        failures += expect_true(lxt::lower_term(decoded[0]) == "a5D", "lower term must be preserved" + tag);
        failures += expect_true(lxt::reference_code(decoded[0]) == "K07", "reference code must be preserved" + tag);
        failures += expect_true(decoded[1].forbid_flag() == '4', "forbid flag must be preserved" + tag);
        failures += expect_true(decoded[1].has_reference_ids(), "numeric references must be detected" + tag);
        failures += expect_true(decoded[1].reference_ids[0] == 12 && decoded[1].reference_ids[2] == 345,
                                "reference indices must decode in host order" + tag);
        failures += expect_true(decoded[1].lande_lower == 1.5f && decoded[1].gamma_vdw == -7.5f,
                                "Lande and damping values must be preserved" + tag);
    }
    return failures;
}

int test_full_record_grows_code_width_and_clears()
{
    int failures = 0;
    std::vector<lxt::LineRecord> lines;
    lines.reserve(lxt::lines_per_record);
    std::uint32_t state = 12345u;
    for (std::size_t i = 0; i < lxt::lines_per_record; ++i)
    {
        state = state * 1103515245u + 12345u;
        lxt::LineRecord line = make_line(4000.0 + 0.01 * static_cast<double>(i),
                                         2600 + static_cast<int>(state % 7u),
                                         static_cast<float>(state % 1000u) / -250.0f,
                                         static_cast<double>(state % 977u) * 0.01);
        line.gamma_stark = static_cast<float>(state >> 20) * -0.001f;
        lines.push_back(line);
    }

    const std::vector<unsigned char> packed = lxt::encode_record(lines, lxt::ByteOrder::little);
    failures += expect_true(packed.size() < lines.size() * lxt::line_length_bytes,
                            "a full record must compress below its raw size");

    lxt::RecordDecoder decoder(packed.data(), packed.size(), lxt::ByteOrder::little);
    lxt::LineRecord out;
    std::size_t mismatches = 0;
    std::size_t count = 0;
    while (decoder.next(out))
    {
        if (count < lines.size() &&
            (out.wavelength != lines[count].wavelength || out.log_gf != lines[count].log_gf ||
             out.gamma_stark != lines[count].gamma_stark))
        {
            ++mismatches;
        }
        ++count;
    }
    failures += expect_true(count == lxt::lines_per_record, "incremental decoder must yield 1024 lines");
    failures += expect_true(decoder.lines_decoded() == count, "lines_decoded must track yielded lines");
    failures += expect_true(mismatches == 0, "every line of a full record must decode unchanged");
    return failures;
}

int test_record_overflow_is_rejected()
{
    int failures = 0;
    std::vector<lxt::LineRecord> lines(lxt::lines_per_record + 1, make_line(5000.0, 2600));
    failures += expect_true(throws_codec_kind([&]() { lxt::encode_record(lines, lxt::ByteOrder::little); },
                                              lxt::CodecError::Kind::RecordOverflow),
                            "encoding 1025 lines must raise RecordOverflow");

    std::vector<unsigned char> raw(lines.size() * lxt::line_length_bytes, 0x20);
    const std::vector<unsigned char> packed = lxt::LzwEncoder().encode(raw.data(), raw.size());
    failures += expect_true(throws_codec_kind([&]() { lxt::decode_record(packed.data(), packed.size(), lxt::ByteOrder::little); },
                                              lxt::CodecError::Kind::RecordOverflow),
                            "decoding more than 1024 lines must raise RecordOverflow");
    return failures;
}

int test_trailing_partial_line_is_ignored()
{
    int failures = 0;
    std::vector<unsigned char> raw(lxt::line_length_bytes + 100, 0x41);
    const std::vector<unsigned char> packed = lxt::LzwEncoder().encode(raw.data(), raw.size());
    const std::vector<lxt::LineRecord> decoded = lxt::decode_record(packed.data(), packed.size(), lxt::ByteOrder::little);
    failures += expect_true(decoded.size() == 1, "370 decoded bytes must yield exactly one line");
    return failures;
}

int test_malformed_streams()
{
    int failures = 0;
    const std::vector<lxt::LineRecord> lines{make_line(5000.0, 2600), make_line(5001.0, 2600)};
    std::vector<unsigned char> packed = lxt::encode_record(lines, lxt::ByteOrder::little);
    packed.resize(packed.size() / 2);
    failures += expect_true(throws_codec_kind([&]() { lxt::decode_record(packed.data(), packed.size(), lxt::ByteOrder::little); },
                                              lxt::CodecError::Kind::Truncated),
                            "a stream cut before END must raise Truncated");

    // 9-bit codes: literal 'A', then 300 while the next free slot is 258.
    lxt::LzwBitWriter bad_code;
    bad_code.write(0x41, 9);
    bad_code.write(300, 9);
    bad_code.write(257, 9);
    const std::vector<unsigned char> bad = bad_code.finish();
    failures += expect_true(throws_codec_kind([&]() { lxt::decode_record(bad.data(), bad.size(), lxt::ByteOrder::little); },
                                              lxt::CodecError::Kind::InvalidCode),
                            "a code beyond the next free slot must raise InvalidCode");

    lxt::LzwBitWriter no_literal;
    no_literal.write(258, 9);
    const std::vector<unsigned char> start = no_literal.finish();
    failures += expect_true(throws_codec_kind([&]() { lxt::decode_record(start.data(), start.size(), lxt::ByteOrder::little); },
                                              lxt::CodecError::Kind::InvalidCode),
                            "a stream must start with a literal");

    // 2-bit literals, 3-bit codes: the table fills after two entries and no CLEAR follows.
    lxt::LzwParams tiny;
    tiny.literal_bits = 2;
    tiny.max_code_bits = 3;
    lxt::LzwBitWriter overflow;
    for (int i = 0; i < 5; ++i)
    {
        overflow.write(0, 3);
    }
    const std::vector<unsigned char> full = overflow.finish();
    failures += expect_true(throws_codec_kind([&]() { lxt::decode_record(full.data(), full.size(), lxt::ByteOrder::little, tiny); },
                                              lxt::CodecError::Kind::TableOverflow),
                            "a full code table without CLEAR must raise TableOverflow");

    const std::vector<unsigned char> empty;
    failures += expect_true(throws_codec_kind([&]() { lxt::decode_record(empty.data(), empty.size(), lxt::ByteOrder::little); },
                                              lxt::CodecError::Kind::Truncated),
                            "an empty stream must raise Truncated");
    return failures;
}

int test_parameter_validation_and_small_alphabet()
{
    int failures = 0;
    lxt::LzwParams bad_literal;
    bad_literal.literal_bits = 9;
    failures += expect_true(throws_codec_kind([&]() { lxt::validate_lzw_params(bad_literal); },
                                              lxt::CodecError::Kind::InvalidParameters),
                            "literal_bits above 8 must be rejected");
    lxt::LzwParams bad_max;
    bad_max.max_code_bits = 17;
    failures += expect_true(throws_codec_kind([&]() { lxt::validate_lzw_params(bad_max); },
                                              lxt::CodecError::Kind::InvalidParameters),
                            "max_code_bits above 16 must be rejected");

    lxt::LzwParams seven_bit;
    seven_bit.literal_bits = 7;
    seven_bit.max_code_bits = 12;
    std::vector<unsigned char> raw(2 * lxt::line_length_bytes);
    for (std::size_t i = 0; i < raw.size(); ++i)
    {
        raw[i] = static_cast<unsigned char>((i * 31u) % 128u);
    }
    const std::vector<unsigned char> packed = lxt::LzwEncoder(seven_bit).encode(raw.data(), raw.size());
    lxt::RecordDecoder decoder(packed.data(), packed.size(), lxt::ByteOrder::little, seven_bit);
    lxt::LineRecord out;
    std::size_t count = 0;
    while (decoder.next(out))
    {
        ++count;
    }
    failures += expect_true(count == 2, "a 7-bit alphabet stream must decode to two lines");

    const unsigned char high = 0xC8;
    failures += expect_true(throws_codec_kind([&]() { lxt::LzwEncoder(seven_bit).encode(&high, 1); },
                                              lxt::CodecError::Kind::InvalidParameters),
                            "bytes outside a 7-bit alphabet must be rejected by the encoder");
    return failures;
}
}

int main()
{
    int failures = 0;
    failures += test_record_fields_survive_compression();
    failures += test_full_record_grows_code_width_and_clears();
    failures += test_record_overflow_is_rejected();
    failures += test_trailing_partial_line_is_ignored();
    failures += test_malformed_streams();
    failures += test_parameter_validation_and_small_alphabet();

    if (failures == 0)
    {
        std::cout << "[codec-regression] PASS" << std::endl;
        return 0;
    }

    std::cerr << "[codec-regression] " << failures << " failure(s)" << std::endl;
    return 1;
}
