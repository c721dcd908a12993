#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bibliography.hpp"
#include "extraction_errors.hpp"
#include "extraction_request.hpp"
#include "species_table.hpp"

/**
 * @file extraction_runtime.hpp
 * @brief Top-level entry point turning one request into text output.
 *
 * run_extraction() is the boundary between the core and job orchestration:
 * it never throws, and reports a single pass/fail with the first fatal
 * error and a warning summary.
 */

namespace lxt
{

struct ExtractionResult
{
    bool ok = false;
    std::optional<ErrorKind> error_kind;
    std::string error_message;

    std::size_t skipped_lines = 0;
    std::size_t kept_duplicates = 0;

    /// Header, legend and one entry per emitted line; empty on failure.
    std::vector<std::string> lines;
    std::string bibliography;
    MergeStats stats;

    std::size_t warning_count() const { return skipped_lines + kept_duplicates; }
};

/**
 * @brief Runs merge, conversion and formatting for one request.
 * @param request Validated or raw request; validation happens here.
 * @param species Species table for names, molecule flags and isotope fractions.
 * @param catalog Optional citation catalog for the bibliography.
 * @return Result with ok set on success; partial output is never returned.
 */
ExtractionResult run_extraction(const ExtractionRequest& request,
                                const SpeciesTable& species,
                                const ReferenceCatalog* catalog = nullptr);

} // namespace lxt
