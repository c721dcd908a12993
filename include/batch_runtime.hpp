#pragma once

#include <string>
#include <vector>

#include "extraction_runtime.hpp"
#include "runtime_config.hpp"

/**
 * @file batch_runtime.hpp
 * @brief Runs independent extraction jobs on a bounded worker pool.
 *
 * Each job is handled by exactly one worker and owns its stores, tables
 * and output; workers share nothing mutable besides the log profile.
 */

namespace lxt
{

struct BatchRunOptions
{
    int workers = 2;
    std::string outdir = "data/extractions";
};

struct BatchJobOutcome
{
    std::string job_name;
    std::string lines_path;
    std::string bibliography_path;
    ExtractionResult result;
};

/**
 * @brief Runs every job and writes <outdir>/<job>.lines.txt and <job>.bib.txt for successful ones.
 * @param jobs Loaded jobs; deadlines are set from each job's timeout when it starts.
 * @param options Worker count and output directory.
 * @return One outcome per job, in input order.
 */
std::vector<BatchJobOutcome> run_batch(std::vector<ExtractionJob>& jobs, const BatchRunOptions& options);

/**
 * @brief Picks the output file stem of every job.
 *
 * Repeated names get a `_<index>` suffix; names that are empty or contain
 * a path separator map to an empty stem and their jobs are failed.
 */
std::vector<std::string> assign_output_names(const std::vector<ExtractionJob>& jobs);

/**
 * @brief Writes the text output of one successful result.
 * @return False with a message when a file cannot be written.
 */
bool write_extraction_output(const ExtractionResult& result,
                             const std::string& lines_path,
                             const std::string& bibliography_path,
                             std::string& error);

} // namespace lxt
