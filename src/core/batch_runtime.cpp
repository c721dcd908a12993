/**
 * @file batch_runtime.cpp
 * @brief OpenMP worker pool over extraction jobs and result file output.
 */

#include "batch_runtime.hpp"
#include "log_profile.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <unordered_set>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace lxt
{

bool write_extraction_output(const ExtractionResult& result,
                             const std::string& lines_path,
                             const std::string& bibliography_path,
                             std::string& error)
{
    std::ofstream lines(lines_path, std::ios::trunc);
    if (!lines.is_open())
    {
        error = "cannot create " + lines_path;
        return false;
    }
    for (const std::string& line : result.lines)
    {
        lines << line << '\n';
    }
    if (!lines)
    {
        error = "write failed on " + lines_path;
        return false;
    }

    std::ofstream bib(bibliography_path, std::ios::trunc);
    if (!bib.is_open())
    {
        error = "cannot create " + bibliography_path;
        return false;
    }
    bib << result.bibliography;
    if (!bib)
    {
        error = "write failed on " + bibliography_path;
        return false;
    }
    return true;
}

namespace
{
bool is_safe_output_name(const std::string& name)
{
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of("/\\") == std::string::npos;
}
}

std::vector<std::string> assign_output_names(const std::vector<ExtractionJob>& jobs)
{
    std::vector<std::string> names(jobs.size());
    std::unordered_set<std::string> taken;
    for (std::size_t i = 0; i < jobs.size(); ++i)
    {
        const std::string& name = jobs[i].request.job_name;
        if (!is_safe_output_name(name))
        {
            continue;
        }
        std::string candidate = name;
        while (taken.count(candidate) != 0)
        {
            candidate += "_" + std::to_string(i);
        }
        if (candidate != name && log_normal_enabled())
        {
            std::cerr << "Warning: Job name '" << name << "' already used; job " << i
                      << " writes as '" << candidate << "'." << std::endl;
        }
        taken.insert(candidate);
        names[i] = candidate;
    }
    return names;
}

std::vector<BatchJobOutcome> run_batch(std::vector<ExtractionJob>& jobs, const BatchRunOptions& options)
{
    std::vector<BatchJobOutcome> outcomes(jobs.size());
    const int workers = options.workers > 0 ? options.workers : 1;

    std::error_code ec;
    std::filesystem::create_directories(options.outdir, ec);
    if (ec)
    {
        for (std::size_t i = 0; i < jobs.size(); ++i)
        {
            outcomes[i].job_name = jobs[i].request.job_name;
            outcomes[i].result.error_message = "cannot create output directory " + options.outdir + ": " + ec.message();
        }
        return outcomes;
    }

    if (log_normal_enabled())
    {
#ifdef _OPENMP
        std::cout << "[BATCH] Running " << jobs.size() << " jobs on " << workers << " workers" << std::endl;
#else
        std::cout << "[BATCH] Running " << jobs.size() << " jobs serially (built without OpenMP)" << std::endl;
#endif
    }

    const std::vector<std::string> output_names = assign_output_names(jobs);

    const long long job_count = static_cast<long long>(jobs.size());
    #pragma omp parallel for schedule(dynamic) num_threads(workers)
    for (long long i = 0; i < job_count; ++i)
    {
        ExtractionJob& job = jobs[static_cast<std::size_t>(i)];
        BatchJobOutcome& outcome = outcomes[static_cast<std::size_t>(i)];
        outcome.job_name = job.request.job_name;
        const std::string& output_name = output_names[static_cast<std::size_t>(i)];
        if (output_name.empty())
        {
            outcome.result.error_message = "job name '" + job.request.job_name +
                                           "' is not usable as an output file name";
            continue;
        }

        if (job.timeout_s > 0.0)
        {
            job.request.deadline = std::chrono::steady_clock::now() +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::duration<double>(job.timeout_s));
        }

        outcome.result = run_extraction(job.request, job.species, job.has_catalog ? &job.catalog : nullptr);
        if (!outcome.result.ok)
        {
            continue;
        }

        const std::filesystem::path base = std::filesystem::path(options.outdir) / output_name;
        outcome.lines_path = base.string() + ".lines.txt";
        outcome.bibliography_path = base.string() + ".bib.txt";
        std::string error;
        if (!write_extraction_output(outcome.result, outcome.lines_path, outcome.bibliography_path, error))
        {
            outcome.result.ok = false;
            outcome.result.error_message = error;
        }
    }

    return outcomes;
}

} // namespace lxt
