#include "extraction_errors.hpp"
#include "linelist_store.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace
{
using lxt_test::make_line;

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[store-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

template <typename Fn>
bool throws_store_kind(Fn&& fn, lxt::StoreError::Kind kind)
{
    try
    {
        fn();
    }
    catch (const lxt::StoreError& e)
    {
        return e.store_kind() == kind;
    }
    return false;
}

// 100 lines from 6500.0 to 6599.0 in records of 10 lines.
std::vector<lxt::LineRecord> ladder()
{
    std::vector<lxt::LineRecord> lines;
    for (int i = 0; i < 100; ++i)
    {
        lines.push_back(make_line(6500.0 + i, 2600 + (i % 3)));
    }
    return lines;
}

int test_range_query_and_cursor(const std::filesystem::path& dir)
{
    int failures = 0;
    lxt::LinelistSource source;
    if (!lxt_test::write_source(dir, "ladder", ladder(), 1, source, lxt::ByteOrder::little, 10))
    {
        return 1;
    }

    lxt::LinelistStore store(source.data_path, source.descriptor_path);
    failures += expect_true(store.index().size() == 10, "100 lines in records of 10 must index 10 records");
    failures += expect_true(store.index()[3].wl_start == 6530.0 && store.index()[3].wl_end == 6539.0,
                            "index entries must hold first and last wavelength of each record");

    const std::vector<lxt::LineRecord> hits = store.query_range(6525.5, 6541.0, 1000);
    failures += expect_true(hits.size() == 15, "window [6525.5, 6541] must hold 15 lines");
    failures += expect_true(!hits.empty() && hits.front().wavelength == 6526.0 && hits.back().wavelength == 6541.0,
                            "range query must return the inclusive window in order");

    const std::vector<lxt::LineRecord> capped = store.query_range(6500.0, 6599.0, 7);
    failures += expect_true(capped.size() == 7 && capped.back().wavelength == 6506.0,
                            "range query must stop at max_lines");

    failures += expect_true(store.seek(6539.5, 6545.0) == 4, "seek between records must land on the next record");
    failures += expect_true(store.seek(6500.0, 6501.0) == 0, "seek at the store start must land on record 0");

    std::vector<lxt::LineRecord> record;
    store.seek(6590.0, 6700.0);
    failures += expect_true(store.next(record) && record.size() == 10, "next must return a whole record");
    failures += expect_true(!store.next(record) && record.empty(), "next past the last record must return false");

    failures += expect_true(throws_store_kind([&]() { store.seek(7000.0, 7100.0); }, lxt::StoreError::Kind::OutOfRange),
                            "a window above the store must raise OutOfRange");
    failures += expect_true(throws_store_kind([&]() { store.seek(100.0, 200.0); }, lxt::StoreError::Kind::OutOfRange),
                            "a window below the store must raise OutOfRange");

    store.close();
    store.close();
    failures += expect_true(!store.is_open(), "close must be idempotent");
    failures += expect_true(throws_store_kind([&]() { store.seek(6500.0, 6510.0); }, lxt::StoreError::Kind::Closed),
                            "seek after close must raise Closed");
    failures += expect_true(throws_store_kind([&]() { store.next(record); }, lxt::StoreError::Kind::Closed),
                            "next after close must raise Closed");
    return failures;
}

int test_overlapping_records_seek_back(const std::filesystem::path& dir)
{
    int failures = 0;
    // Equal wavelengths straddle the record boundary.
    std::vector<lxt::LineRecord> lines;
    for (double wl : {5000.0, 5001.0, 5002.0, 5002.0, 5002.0, 5003.0})
    {
        lines.push_back(make_line(wl, 2600));
    }
    lxt::LinelistSource source;
    if (!lxt_test::write_source(dir, "overlap", lines, 1, source, lxt::ByteOrder::little, 2))
    {
        return 1;
    }
    lxt::LinelistStore store(source.data_path, source.descriptor_path);
    failures += expect_true(store.seek(5002.0, 5002.0) == 1,
                            "seek must step back to the earliest record reaching wl_min");
    failures += expect_true(store.query_range(5002.0, 5002.0, 100).size() == 3,
                            "every line at a shared boundary wavelength must be returned");
    return failures;
}

int test_next_requires_seek(const std::filesystem::path& dir)
{
    lxt::LinelistSource source;
    if (!lxt_test::write_source(dir, "unpositioned", ladder(), 1, source))
    {
        return 1;
    }
    lxt::LinelistStore store(source.data_path, source.descriptor_path);
    std::vector<lxt::LineRecord> record;
    return expect_true(throws_store_kind([&]() { store.next(record); }, lxt::StoreError::Kind::NotPositioned),
                       "next before seek must raise NotPositioned");
}

int test_big_endian_store(const std::filesystem::path& dir)
{
    int failures = 0;
    lxt::LinelistSource source;
    if (!lxt_test::write_source(dir, "big", ladder(), 1, source, lxt::ByteOrder::big, 25))
    {
        return 1;
    }

    lxt::StoreOpenOptions big;
    big.stored_order = lxt::ByteOrder::big;
    lxt::LinelistStore store(source.data_path, source.descriptor_path, big);
    const std::vector<lxt::LineRecord> hits = store.query_range(6550.0, 6552.0, 10);
    failures += expect_true(store.index().size() == 4, "big-endian descriptor must decode four records");
    failures += expect_true(hits.size() == 3 && hits[1].wavelength == 6551.0 && hits[1].species_code == 2600 + 51 % 3,
                            "big-endian lines must decode to the written values");

    // Reading with the wrong order makes the record count implausible.
    failures += expect_true(throws_store_kind([&]() { lxt::LinelistStore wrong(source.data_path, source.descriptor_path); },
                                              lxt::StoreError::Kind::Open),
                            "a big-endian descriptor opened as little-endian must fail to open");
    return failures;
}

int test_broken_files(const std::filesystem::path& dir)
{
    int failures = 0;
    lxt::LinelistSource source;
    if (!lxt_test::write_source(dir, "broken", ladder(), 1, source, lxt::ByteOrder::little, 10))
    {
        return 1;
    }

    failures += expect_true(throws_store_kind([&]() { lxt::LinelistStore missing(dir / "none.dat", source.descriptor_path); },
                                              lxt::StoreError::Kind::Open),
                            "a missing data file must raise Open");

    const std::filesystem::path cut = dir / "cut.desc";
    std::filesystem::copy_file(source.descriptor_path, cut);
    std::filesystem::resize_file(cut, 4 + 3 * lxt::descriptor_entry_bytes + 5);
    failures += expect_true(throws_store_kind([&]() { lxt::LinelistStore truncated(source.data_path, cut); },
                                              lxt::StoreError::Kind::Open),
                            "a truncated descriptor must raise Open");

    const std::filesystem::path short_data = dir / "short.dat";
    std::filesystem::copy_file(source.data_path, short_data);
    std::filesystem::resize_file(short_data, std::filesystem::file_size(source.data_path) / 2);
    failures += expect_true(throws_store_kind([&]() { lxt::LinelistStore cut_data(short_data, source.descriptor_path); },
                                              lxt::StoreError::Kind::Open),
                            "descriptor entries beyond the data file must raise Open");
    return failures;
}

int test_corrupt_record_raises_codec_error(const std::filesystem::path& dir)
{
    lxt::LinelistSource source;
    if (!lxt_test::write_source(dir, "corrupt", ladder(), 1, source, lxt::ByteOrder::little, 100))
    {
        return 1;
    }
    {
        std::fstream data(source.data_path, std::ios::in | std::ios::out | std::ios::binary);
        data.seekp(0);
        const char garbage[4] = {'\xFF', '\xFF', '\xFF', '\xFF'};
        data.write(garbage, sizeof(garbage));
    }

    lxt::LinelistStore store(source.data_path, source.descriptor_path);
    bool codec_failure = false;
    try
    {
        store.query_range(6500.0, 6510.0, 10);
    }
    catch (const lxt::CodecError&)
    {
        codec_failure = true;
    }
    return expect_true(codec_failure, "a corrupted record must surface as CodecError");
}
}

int main()
{
    const std::filesystem::path dir = lxt_test::make_scratch_dir("store");
    int failures = 0;
    failures += test_range_query_and_cursor(dir);
    failures += test_overlapping_records_seek_back(dir);
    failures += test_next_requires_seek(dir);
    failures += test_big_endian_store(dir);
    failures += test_broken_files(dir);
    failures += test_corrupt_record_raises_codec_error(dir);
    std::filesystem::remove_all(dir);

    if (failures == 0)
    {
        std::cout << "[store-regression] PASS" << std::endl;
        return 0;
    }

    std::cerr << "[store-regression] " << failures << " failure(s)" << std::endl;
    return 1;
}
