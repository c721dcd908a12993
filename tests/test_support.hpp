#pragma once

#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "extraction_request.hpp"
#include "line_record.hpp"
#include "linelist_store.hpp"

// Synthetic store fixtures shared by the regression executables.
namespace lxt_test
{

inline bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

/**
 * @brief Creates a fresh scratch directory under the system temp directory.
 */
inline std::filesystem::path make_scratch_dir(const std::string& name)
{
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("lxt_" + name + "_" + std::to_string(stamp));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline lxt::LineRecord make_line(double wavelength,
                                 int species_code,
                                 float log_gf = -1.0f,
                                 double e_lower = 1.0,
                                 double e_upper = 3.5,
                                 char forbid_flag = ' ',
                                 const std::string& reference = "K07")
{
    lxt::LineRecord record = lxt::make_blank_record();
    record.wavelength = wavelength;
    record.species_code = species_code;
    record.log_gf = log_gf;
    record.e_lower = e_lower;
    record.e_upper = e_upper;
    record.j_lower = 1.0f;
    record.j_upper = 2.0f;
    record.set_forbid_flag(forbid_flag);
    lxt::set_blob_text(record, lxt::term_layout::lower_term_offset, lxt::term_layout::lower_term_length, "a5D");
    lxt::set_blob_text(record, lxt::term_layout::upper_term_offset, lxt::term_layout::upper_term_length, "z5P");
    lxt::set_reference_code(record, reference);
    return record;
}

/**
 * @brief Writes records as a store and fills a mergeable source pointing at it.
 * @return False when the store could not be written; the reason is printed.
 */
inline bool write_source(const std::filesystem::path& dir,
                         const std::string& id,
                         const std::vector<lxt::LineRecord>& records,
                         int priority,
                         lxt::LinelistSource& source,
                         lxt::ByteOrder order = lxt::ByteOrder::little,
                         std::size_t lines_in_record = lxt::lines_per_record)
{
    source = lxt::LinelistSource{};
    source.id = id;
    source.data_path = dir / (id + ".dat");
    source.descriptor_path = dir / (id + ".desc");
    source.priority = priority;
    source.store.stored_order = order;

    lxt::StoreWriter writer(source.data_path, source.descriptor_path, order, lines_in_record);
    std::string error;
    if (!writer.write(records, error))
    {
        std::cerr << "[test-support] cannot write store '" << id << "': " << error << std::endl;
        return false;
    }
    return true;
}

} // namespace lxt_test
