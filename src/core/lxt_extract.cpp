/**
 * @file lxt_extract.cpp
 * @brief Command-line entry point running extraction jobs from config files.
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "batch_runtime.hpp"
#include "log_profile.hpp"
#include "runtime_config.hpp"

namespace
{

void print_usage(const char* program)
{
    std::cerr << "Usage: " << program
              << " --config=<file> [--config=<file> ...] [--workers=N] [--outdir=DIR]"
              << " [--log-profile=quiet|normal|debug]" << std::endl;
}

}

/**
 * @brief Program entry point.
 * @param argc CLI argument count.
 * @param argv CLI argument vector.
 * @return Zero when every job succeeded, non-zero otherwise.
 */
int main(int argc, char** argv)
{
    std::vector<std::string> config_paths;
    lxt::BatchRunOptions options;
    bool log_profile_from_cli = false;
    lxt::LogProfile cli_log_profile = lxt::LogProfile::normal;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0)
        {
            config_paths.push_back(arg.substr(9));
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            config_paths.push_back(argv[++i]);
        }
        else if (arg.rfind("--workers=", 0) == 0)
        {
            int parsed = 0;
            const std::string value = arg.substr(10);
            if (!lxt::try_parse_int_value(value, parsed) || parsed <= 0)
            {
                std::cerr << "Invalid --workers value '" << value
                          << "'. Expected a positive integer." << std::endl;
                return 1;
            }
            options.workers = parsed;
        }
        else if (arg.rfind("--outdir=", 0) == 0)
        {
            options.outdir = arg.substr(9);
        }
        else if (arg.rfind("--log-profile=", 0) == 0)
        {
            bool valid = false;
            const std::string value = arg.substr(14);
            cli_log_profile = lxt::parse_log_profile(value, &valid);
            if (!valid)
            {
                std::cerr << "Invalid --log-profile value '" << value
                          << "'. Valid values: quiet, normal, debug." << std::endl;
                return 1;
            }
            log_profile_from_cli = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument '" << arg << "'." << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_paths.empty())
    {
        print_usage(argv[0]);
        return 1;
    }
    if (log_profile_from_cli)
    {
        lxt::global_log_profile = cli_log_profile;
    }

    std::vector<lxt::ExtractionJob> jobs;
    int load_failures = 0;
    for (const std::string& path : config_paths)
    {
        lxt::ExtractionJob job;
        std::string error;
        if (!lxt::load_extraction_job(path, job, error))
        {
            std::cerr << "[BATCH] FAIL " << path << ": " << error << std::endl;
            ++load_failures;
            continue;
        }
        jobs.push_back(std::move(job));
    }

    // Config files may set logging.profile; environment and CLI take precedence.
    if (const char* env_log_profile = std::getenv("LXT_LOG_PROFILE"))
    {
        bool valid = false;
        const lxt::LogProfile parsed = lxt::parse_log_profile(env_log_profile, &valid);
        if (valid)
        {
            lxt::global_log_profile = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid LXT_LOG_PROFILE '" << env_log_profile
                      << "'. Valid values: quiet, normal, debug." << std::endl;
        }
    }
    if (log_profile_from_cli)
    {
        lxt::global_log_profile = cli_log_profile;
    }

    const std::vector<lxt::BatchJobOutcome> outcomes = lxt::run_batch(jobs, options);

    int failures = load_failures;
    for (const lxt::BatchJobOutcome& outcome : outcomes)
    {
        const lxt::ExtractionResult& result = outcome.result;
        if (result.ok)
        {
            std::cout << "[BATCH] PASS " << outcome.job_name << ": "
                      << (result.lines.size() >= 2 ? result.lines.size() - 2 : 0) << " lines, "
                      << result.warning_count() << " warnings (" << result.skipped_lines << " skipped, "
                      << result.kept_duplicates << " kept duplicates) -> " << outcome.lines_path << std::endl;
        }
        else
        {
            ++failures;
            std::cout << "[BATCH] FAIL " << outcome.job_name << " ["
                      << (result.error_kind ? lxt::to_string(*result.error_kind) : "internal") << "]: "
                      << result.error_message << std::endl;
        }
    }
    return failures == 0 ? 0 : 1;
}
