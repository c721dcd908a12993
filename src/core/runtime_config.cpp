/**
 * @file runtime_config.cpp
 * @brief Configuration parsing for extraction jobs.
 *
 * Flattens the YAML-like job file into dotted keys and maps them onto an
 * ExtractionRequest, its linelist sources and the species and reference
 * tables the job needs.
 */

#include "runtime_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <sstream>

#include "string_utils.hpp"

namespace lxt
{

LogProfile global_log_profile = LogProfile::normal;

namespace
{

/**
 * @brief Removes matching single or double quotes around a string value.
 */
std::string strip_wrapping_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

/**
 * @brief Emits a standardized warning for invalid configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    if (log_normal_enabled())
    {
        std::cerr << "Warning: Invalid " << key << " '" << value
                  << "'; expected " << expected
                  << ". Keeping previous/default value." << std::endl;
    }
}

std::string resolve_path(const std::string& base_dir, const std::string& value)
{
    const std::filesystem::path path(value);
    if (path.is_absolute() || base_dir.empty())
    {
        return path.string();
    }
    return (std::filesystem::path(base_dir) / path).string();
}

/**
 * @brief Per-linelist keys grouped by linelist id.
 */
std::map<std::string, std::map<std::string, std::string>> collect_linelists(
    const std::unordered_map<std::string, std::string>& config)
{
    std::map<std::string, std::map<std::string, std::string>> linelists;
    const std::string prefix = "linelists.";
    for (const auto& entry : config)
    {
        if (entry.first.rfind(prefix, 0) != 0)
        {
            continue;
        }
        const std::string rest = entry.first.substr(prefix.size());
        const std::size_t dot = rest.find('.');
        if (dot == std::string::npos || dot == 0)
        {
            continue;
        }
        linelists[rest.substr(0, dot)][rest.substr(dot + 1)] = entry.second;
    }
    return linelists;
}

bool parse_rank_list(const std::string& value, RankSet& out)
{
    const std::vector<std::string> items = strutil::split_list(value);
    if (items.size() != 8)
    {
        return false;
    }
    double parsed[8];
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (!try_parse_double_value(items[i], parsed[i]))
        {
            return false;
        }
    }
    out = RankSet{parsed[0], parsed[1], parsed[2], parsed[3], parsed[4], parsed[5], parsed[6], parsed[7]};
    return true;
}

bool build_linelist_source(const std::string& id,
                           const std::map<std::string, std::string>& keys,
                           const std::string& base_dir,
                           LinelistSource& source,
                           std::string& error)
{
    const std::string label = "linelists." + id;
    source.id = id;

    const auto data = keys.find("data");
    const auto descriptor = keys.find("descriptor");
    if (data == keys.end() || data->second.empty() || descriptor == keys.end() || descriptor->second.empty())
    {
        error = label + " needs both 'data' and 'descriptor' paths";
        return false;
    }
    source.data_path = resolve_path(base_dir, data->second);
    source.descriptor_path = resolve_path(base_dir, descriptor->second);

    for (const auto& entry : keys)
    {
        const std::string& key = entry.first;
        const std::string& value = entry.second;
        const std::string full_key = label + "." + key;
        if (key == "data" || key == "descriptor")
        {
            continue;
        }
        else if (key == "priority")
        {
            if (!try_parse_int_value(value, source.priority))
            {
                warn_invalid_config_value(full_key, value, "an integer");
            }
        }
        else if (key == "rank")
        {
            double parsed = 0.0;
            if (try_parse_double_value(value, parsed))
            {
                source.rank_weight = parsed;
            }
            else
            {
                warn_invalid_config_value(full_key, value, "a number");
            }
        }
        else if (key == "ranks")
        {
            RankSet ranks;
            if (parse_rank_list(value, ranks))
            {
                source.ranks = ranks;
            }
            else
            {
                warn_invalid_config_value(full_key, value, "eight comma-separated numbers");
            }
        }
        else if (key == "enabled")
        {
            source.enabled = parse_bool_value(value);
        }
        else if (key == "mode")
        {
            if (!parse_merge_mode(value, source.mode))
            {
                warn_invalid_config_value(full_key, value, "mergeable, standalone or replacement");
            }
        }
        else if (key == "species_min" || key == "species_max" || key == "replace_min" || key == "replace_max")
        {
            int parsed = 0;
            if (!try_parse_int_value(value, parsed))
            {
                warn_invalid_config_value(full_key, value, "an integer species code");
                continue;
            }
            if (key == "species_min") source.species_min = parsed;
            else if (key == "species_max") source.species_max = parsed;
            else if (key == "replace_min") source.replace_min = parsed;
            else source.replace_max = parsed;
        }
        else if (key == "window")
        {
            double parsed = 0.0;
            if (try_parse_double_value(value, parsed) && parsed > 0.0)
            {
                source.window = parsed;
            }
            else
            {
                warn_invalid_config_value(full_key, value, "a positive window in angstroms");
            }
        }
        else if (key == "energy_unit")
        {
            if (!parse_energy_unit(value, source.energy_unit))
            {
                warn_invalid_config_value(full_key, value, "ev or cm-1");
            }
        }
        else if (key == "byte_order")
        {
            const std::string normalized = to_lower_copy(value);
            if (normalized == "little") source.store.stored_order = ByteOrder::little;
            else if (normalized == "big") source.store.stored_order = ByteOrder::big;
            else warn_invalid_config_value(full_key, value, "little or big");
        }
        else if (log_normal_enabled())
        {
            std::cerr << "Warning: Unknown key " << full_key << " ignored." << std::endl;
        }
    }
    return true;
}

}

std::string to_lower_copy(std::string value)
{
    return strutil::lower_copy(value);
}

bool parse_bool_value(const std::string& value)
{
    return strutil::parse_bool(value);
}

bool try_parse_int_value(const std::string& value, int& out)
{
    try
    {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool try_parse_non_negative_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed) || parsed < 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

bool try_parse_uint64_value(const std::string& value, std::uint64_t& out)
{
    if (value.empty() || value[0] == '-')
    {
        return false;
    }
    try
    {
        size_t consumed = 0;
        const unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool try_parse_double_value(const std::string& value, double& out)
{
    try
    {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Returns string label for runtime logging profile.
 */
const char* log_profile_name(LogProfile profile)
{
    switch (profile)
    {
        case LogProfile::quiet:
            return "quiet";
        case LogProfile::debug:
            return "debug";
        case LogProfile::normal:
        default:
            return "normal";
    }
}

/**
 * @brief Parses runtime logging profile from text.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = to_lower_copy(value);
    if (normalized == "quiet")
    {
        if (valid) *valid = true;
        return LogProfile::quiet;
    }
    if (normalized == "normal")
    {
        if (valid) *valid = true;
        return LogProfile::normal;
    }
    if (normalized == "debug")
    {
        if (valid) *valid = true;
        return LogProfile::debug;
    }

    if (valid) *valid = false;
    return LogProfile::normal;
}

bool parse_yaml_simple(const std::string& filename,
                       std::unordered_map<std::string, std::string>& config,
                       std::string& error)
{
    config.clear();
    std::ifstream file(filename);
    if (!file.is_open())
    {
        error = "could not open config file: " + filename;
        return false;
    }

    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(file, line))
    {
        size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos)
        {
            line = line.substr(0, comment_pos);
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;

        size_t indent_level = indent / 2;

        line = strutil::trim_copy(line);
        if (line.empty()) continue;

        if (line.back() == ':')
        {
            std::string section_name = line.substr(0, line.size() - 1);

            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            section_stack.push_back(section_name);

            continue;
        }

        size_t colon_pos = line.find(':');

        if (colon_pos != std::string::npos)
        {
            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            const std::string key = strutil::trim_copy(line.substr(0, colon_pos));
            const std::string value = strip_wrapping_quotes(strutil::trim_copy(line.substr(colon_pos + 1)));

            std::string full_key;
            for (const auto& section : section_stack)
            {
                if (!full_key.empty()) full_key += ".";
                full_key += section;
            }
            if (!full_key.empty()) full_key += ".";
            full_key += key;
            config[full_key] = value;
        }
    }

    return true;
}

bool build_extraction_job(const std::unordered_map<std::string, std::string>& config,
                          const std::string& base_dir,
                          ExtractionJob& job,
                          std::string& error)
{
    ExtractionRequest& request = job.request;
    const auto get = [&config](const std::string& key) -> const std::string*
    {
        const auto it = config.find(key);
        return (it == config.end()) ? nullptr : &it->second;
    };

    const std::string* wl_start = get("extraction.wl_start");
    const std::string* wl_end = get("extraction.wl_end");
    if (!wl_start || !wl_end)
    {
        error = "extraction.wl_start and extraction.wl_end are required";
        return false;
    }
    if (!try_parse_double_value(*wl_start, request.wl_start) ||
        !try_parse_double_value(*wl_end, request.wl_end))
    {
        error = "extraction.wl_start/wl_end must be numbers";
        return false;
    }

    if (const std::string* value = get("extraction.name"))
    {
        if (!value->empty())
        {
            request.job_name = *value;
        }
    }
    if (const std::string* value = get("extraction.max_lines"))
    {
        std::uint64_t parsed = 0;
        if (try_parse_uint64_value(*value, parsed) && parsed > 0)
        {
            request.max_lines = static_cast<std::size_t>(parsed);
        }
        else
        {
            warn_invalid_config_value("extraction.max_lines", *value, "a positive integer");
        }
    }
    if (const std::string* value = get("extraction.energy_unit"))
    {
        if (!parse_energy_unit(*value, request.output.energy_unit))
        {
            warn_invalid_config_value("extraction.energy_unit", *value, "ev or cm-1");
        }
    }
    if (const std::string* value = get("extraction.wavelength_unit"))
    {
        if (!parse_wavelength_unit(*value, request.output.wavelength_unit))
        {
            warn_invalid_config_value("extraction.wavelength_unit", *value, "angstrom, nm or cm-1");
        }
    }
    if (const std::string* value = get("extraction.medium"))
    {
        if (!parse_medium(*value, request.output.medium))
        {
            warn_invalid_config_value("extraction.medium", *value, "air or vacuum");
        }
    }
    if (const std::string* value = get("extraction.isotopic_scaling"))
    {
        request.output.isotopic_scaling = parse_bool_value(*value);
    }
    if (const std::string* value = get("extraction.hfs_splitting"))
    {
        request.output.hfs_splitting = parse_bool_value(*value);
    }
    if (const std::string* value = get("extraction.format"))
    {
        const std::string normalized = to_lower_copy(strutil::trim_copy(*value));
        if (normalized == "short" || normalized == "long")
        {
            request.output.format = normalized;
        }
        else
        {
            warn_invalid_config_value("extraction.format", *value, "short or long");
        }
    }
    if (const std::string* value = get("extraction.timeout_s"))
    {
        double parsed = 0.0;
        if (try_parse_double_value(*value, parsed) && parsed >= 0.0)
        {
            job.timeout_s = parsed;
        }
        else
        {
            warn_invalid_config_value("extraction.timeout_s", *value, "a non-negative number of seconds");
        }
    }

    const auto positive_setting = [&](const char* key, double& target)
    {
        if (const std::string* value = get(key))
        {
            double parsed = 0.0;
            if (try_parse_double_value(*value, parsed) && parsed > 0.0)
            {
                target = parsed;
            }
            else
            {
                warn_invalid_config_value(key, *value, "a positive number");
            }
        }
    };
    positive_setting("merge.wl_window_ref", request.merge.wl_window_ref);
    positive_setting("merge.wl_ref", request.merge.wl_ref);
    positive_setting("merge.energy_tolerance", request.merge.energy_tolerance);

    if (const std::string* value = get("species.table"))
    {
        if (!job.species.load(resolve_path(base_dir, *value), error))
        {
            return false;
        }
    }
    if (const std::string* value = get("references.catalog"))
    {
        if (!job.catalog.load(resolve_path(base_dir, *value), error))
        {
            return false;
        }
        job.has_catalog = true;
    }
    if (const std::string* value = get("extraction.elements"))
    {
        if (!job.species.parse_element_filter(*value, request.species_filter, error))
        {
            error = "extraction.elements: " + error;
            return false;
        }
    }

    request.sources.clear();
    for (const auto& linelist : collect_linelists(config))
    {
        LinelistSource source;
        if (!build_linelist_source(linelist.first, linelist.second, base_dir, source, error))
        {
            return false;
        }
        request.sources.push_back(std::move(source));
    }
    std::stable_sort(request.sources.begin(), request.sources.end(),
                     [](const LinelistSource& a, const LinelistSource& b)
                     {
                         return a.priority < b.priority;
                     });
    return true;
}

bool load_extraction_job(const std::string& config_path, ExtractionJob& job, std::string& error)
{
    std::unordered_map<std::string, std::string> config;
    if (!parse_yaml_simple(config_path, config, error))
    {
        return false;
    }

    if (config.count("logging.profile"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(config["logging.profile"], &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid logging.profile '" << config["logging.profile"]
                      << "'. Valid values: quiet, normal, debug. Using normal." << std::endl;
            global_log_profile = LogProfile::normal;
        }
    }

    job = ExtractionJob{};
    job.config_path = config_path;
    job.request.job_name = std::filesystem::path(config_path).stem().string();

    const std::string base_dir = std::filesystem::path(config_path).parent_path().string();
    if (!build_extraction_job(config, base_dir, job, error))
    {
        error = config_path + ": " + error;
        return false;
    }

    if (log_normal_enabled())
    {
        std::cout << "Loaded config " << config_path << " with " << config.size() << " keys, "
                  << job.request.sources.size() << " linelists" << std::endl;
    }
    return true;
}

} // namespace lxt
