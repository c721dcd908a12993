#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "bibliography.hpp"
#include "extraction_request.hpp"
#include "log_profile.hpp"
#include "species_table.hpp"

/**
 * @file runtime_config.hpp
 * @brief Job configuration loading and parsing helpers.
 *
 * Declares the job bundle produced from one configuration file and the
 * parsing and conversion helpers used while reading YAML-like inputs for
 * the extraction window, output options, merge settings and linelists.
 */

namespace lxt
{

/**
 * @brief Everything one extraction job needs, loaded from a single config file.
 */
struct ExtractionJob
{
    std::string config_path;
    ExtractionRequest request;
    SpeciesTable species;
    ReferenceCatalog catalog;
    bool has_catalog = false;

    /// Wall-clock budget in seconds; zero disables the deadline.
    double timeout_s = 0.0;
};

/**
 * @brief Returns a lowercased copy of the input.
 * @param value Input string.
 * @return Lowercased string.
 */
std::string to_lower_copy(std::string value);

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string.
 * @return Parsed boolean value.
 */
bool parse_bool_value(const std::string& value);

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a non-negative integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse and non-negative result.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out);

/**
 * @brief Parses an unsigned 64-bit integer value.
 * @param value Input string.
 * @param out Parsed unsigned output.
 * @return True on successful parse.
 */
bool try_parse_uint64_value(const std::string& value, std::uint64_t& out);

/**
 * @brief Parses a finite floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Parses a simple key-value YAML file into dotted keys.
 * @param filename Input file path.
 * @param config Parsed key-value map.
 * @param error Output message when the file cannot be read.
 * @return True when the file was read.
 */
bool parse_yaml_simple(const std::string& filename,
                       std::unordered_map<std::string, std::string>& config,
                       std::string& error);

/**
 * @brief Builds a job from already flattened configuration keys.
 *
 * Relative file paths are resolved against base_dir. Invalid optional
 * values are warned about and left at their defaults.
 * @return False with a message when a mandatory value is missing or a referenced file cannot be loaded.
 */
bool build_extraction_job(const std::unordered_map<std::string, std::string>& config,
                          const std::string& base_dir,
                          ExtractionJob& job,
                          std::string& error);

/**
 * @brief Loads one job from a configuration file.
 *
 * Applies logging.profile to the process-wide log profile when present.
 */
bool load_extraction_job(const std::string& config_path, ExtractionJob& job, std::string& error);

} // namespace lxt
