/**
 * @file species_table.cpp
 * @brief CSV species list loader and element filter resolution.
 */

#include "species_table.hpp"
#include "log_profile.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace lxt
{
namespace
{

std::vector<std::string> split_csv_row(const std::string& line)
{
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (char c : line)
    {
        if (c == '"')
        {
            quoted = !quoted;
        }
        else if (c == ',' && !quoted)
        {
            fields.push_back(strutil::trim_copy(field));
            field.clear();
        }
        else if (c != '\r')
        {
            field.push_back(c);
        }
    }
    fields.push_back(strutil::trim_copy(field));
    return fields;
}

}

std::string SpeciesInfo::display_name() const
{
    return name + " " + std::to_string(charge + 1);
}

bool SpeciesInfo::is_molecule() const
{
    // Element symbols carry one capital letter; "CH", "TiO" or "C2" do not.
    const auto capitals = std::count_if(name.begin(), name.end(), [](unsigned char c) { return std::isupper(c) != 0; });
    return capitals > 1 ||
           std::any_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool SpeciesTable::load(const std::string& path, std::string& error)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        error = "cannot open species list '" + path + "'";
        return false;
    }

    std::string line;
    if (!std::getline(file, line))
    {
        error = "species list '" + path + "' is empty";
        return false;
    }
    // Optional version comment before the header row.
    if (!line.empty() && line[0] == '#' && !std::getline(file, line))
    {
        error = "species list '" + path + "' has no header row";
        return false;
    }

    std::unordered_map<std::string, std::size_t> columns;
    const std::vector<std::string> header = split_csv_row(line);
    for (std::size_t i = 0; i < header.size(); ++i)
    {
        columns[header[i]] = i;
    }
    for (const char* required : {"Index", "Name", "Charge", "Mass", "Ion. en."})
    {
        if (columns.count(required) == 0)
        {
            error = "species list '" + path + "' lacks column '" + required + "'";
            return false;
        }
    }

    const auto column = [&](const std::vector<std::string>& row, const char* key) -> const std::string*
    {
        const auto it = columns.find(key);
        if (it == columns.end() || it->second >= row.size() || row[it->second].empty())
        {
            return nullptr;
        }
        return &row[it->second];
    };
    const auto required = [&](const std::vector<std::string>& row, const char* key) -> const std::string&
    {
        const std::string* value = column(row, key);
        if (!value)
        {
            throw std::invalid_argument(std::string("missing ") + key);
        }
        return *value;
    };

    std::size_t skipped = 0;
    std::size_t line_number = 1;
    while (std::getline(file, line))
    {
        ++line_number;
        if (strutil::trim_copy(line).empty())
        {
            continue;
        }
        const std::vector<std::string> row = split_csv_row(line);
        try
        {
            SpeciesInfo info;
            info.code = std::stoi(required(row, "Index"));
            info.name = required(row, "Name");
            info.charge = std::stoi(required(row, "Charge"));
            info.mass = std::stod(required(row, "Mass"));
            info.ionization_energy = std::stod(required(row, "Ion. en."));
            if (const std::string* fraction = column(row, "Isotope fraction"))
            {
                info.isotope_fraction = std::stod(*fraction);
            }
            if (const std::string* base = column(row, "Base"))
            {
                info.base_code = std::stoi(*base);
            }
            add(info);
        }
        catch (const std::exception&)
        {
            ++skipped;
            if (log_debug_enabled())
            {
                std::cerr << "[EXTRACT] Skipping malformed species row " << line_number
                          << " in " << path << std::endl;
            }
        }
    }

    if (skipped > 0 && log_normal_enabled())
    {
        std::cerr << "[EXTRACT] Warning: skipped " << skipped << " malformed rows in species list "
                  << path << std::endl;
    }
    return true;
}

void SpeciesTable::add(const SpeciesInfo& info)
{
    species_[info.code] = info;
}

const SpeciesInfo* SpeciesTable::find(int code) const
{
    const auto it = species_.find(code);
    return it == species_.end() ? nullptr : &it->second;
}

std::string SpeciesTable::display_name(int code) const
{
    const SpeciesInfo* info = find(code);
    return info ? info->display_name() : "Unknown(" + std::to_string(code) + ")";
}

bool SpeciesTable::is_molecule(int code) const
{
    const SpeciesInfo* info = find(code);
    return info != nullptr && info->is_molecule();
}

bool SpeciesTable::has_code_in_range(int lo, int hi) const
{
    const auto it = species_.lower_bound(lo);
    return it != species_.end() && it->first <= hi;
}

std::optional<double> SpeciesTable::isotope_fraction(int code) const
{
    const SpeciesInfo* info = find(code);
    if (!info)
    {
        return std::nullopt;
    }
    return info->isotope_fraction;
}

bool SpeciesTable::parse_element_filter(const std::string& text, std::vector<int>& codes, std::string& error) const
{
    codes.clear();
    std::stringstream items(text);
    std::string item;
    const auto push_unique = [&codes](int code)
    {
        if (std::find(codes.begin(), codes.end(), code) == codes.end())
        {
            codes.push_back(code);
        }
    };

    while (std::getline(items, item, ','))
    {
        item = strutil::trim_copy(item);
        if (item.empty())
        {
            continue;
        }

        if (std::all_of(item.begin(), item.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
        {
            try
            {
                push_unique(std::stoi(item));
            }
            catch (const std::exception&)
            {
                error = "species code out of range in element filter item '" + item + "'";
                return false;
            }
            continue;
        }

        std::istringstream parts(item);
        std::string name;
        std::string spectrum_text;
        parts >> name >> spectrum_text;
        int charge = -1;
        if (!spectrum_text.empty())
        {
            try
            {
                charge = std::stoi(spectrum_text) - 1;
            }
            catch (const std::exception&)
            {
                error = "invalid spectrum number in element filter item '" + item + "'";
                return false;
            }
            if (charge < 0)
            {
                error = "spectrum number must be at least 1 in '" + item + "'";
                return false;
            }
        }

        const std::string wanted = strutil::lower_copy(name);
        bool matched = false;
        for (const auto& entry : species_)
        {
            const SpeciesInfo& info = entry.second;
            if (strutil::lower_copy(info.name) == wanted && (charge < 0 || info.charge == charge))
            {
                push_unique(info.code);
                matched = true;
            }
        }
        if (!matched)
        {
            error = "element filter item '" + item + "' matches no listed species";
            return false;
        }
    }
    return true;
}

} // namespace lxt
