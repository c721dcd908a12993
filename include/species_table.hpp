#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @file species_table.hpp
 * @brief Species list lookup: display names, molecule flags, isotope fractions.
 *
 * Species codes stored in a linelist index into a CSV species list. The
 * table resolves those codes for output, drives the forbid-flag exemption
 * for molecules, supplies isotope abundances for isotopic scaling, and
 * resolves element filter strings into codes.
 */

namespace lxt
{

struct SpeciesInfo
{
    int code = 0;
    std::string name;
    int charge = 0;
    double mass = 0.0;
    double ionization_energy = 0.0;
    std::optional<double> isotope_fraction;
    std::optional<int> base_code;

    /**
     * @brief Returns "<name> <spectrum number>", e.g. "Fe 1" for neutral iron.
     */
    std::string display_name() const;

    /**
     * @brief True for names with several capitals or digits (molecules).
     */
    bool is_molecule() const;
};

class SpeciesTable
{
public:
    /**
     * @brief Loads a CSV species list.
     * @param path CSV file with Index, Name, Charge, Mass, Ion. en. columns.
     * @param error Output message on failure.
     * @return True on success.
     */
    bool load(const std::string& path, std::string& error);

    void add(const SpeciesInfo& info);

    const SpeciesInfo* find(int code) const;

    /**
     * @brief Returns the display name, or "Unknown(<code>)" for unlisted codes.
     */
    std::string display_name(int code) const;

    bool is_molecule(int code) const;

    /**
     * @brief True when at least one listed code lies in [lo, hi].
     */
    bool has_code_in_range(int lo, int hi) const;

    /**
     * @brief Returns the isotope fraction used for isotopic scaling, if any.
     */
    std::optional<double> isotope_fraction(int code) const;

    /**
     * @brief Resolves a comma-separated element filter into species codes.
     *
     * Accepts numeric codes ("2600"), names with a spectrum number ("Fe 1")
     * and bare names ("Fe", every ionization stage).
     * @param text Filter text.
     * @param codes Output codes in first-mention order, without duplicates.
     * @param error Output message on failure.
     * @return True when every item resolved.
     */
    bool parse_element_filter(const std::string& text, std::vector<int>& codes, std::string& error) const;

    std::size_t size() const { return species_.size(); }

    bool empty() const { return species_.empty(); }

private:
    std::map<int, SpeciesInfo> species_;
};

} // namespace lxt
