/**
 * @file short_format.hpp
 * @brief Short output scheme: one compact row per transition.
 */

#pragma once
#include "line_formatter_base.hpp"

/**
 * @brief Species, wavelength, log gf, level energies and J, damping constants.
 */
class ShortFormatScheme : public lxt::LineFormatterBase
{
public:
    std::string name() const override { return "short"; }

    std::string legend(const lxt::OutputOptions& options) const override;

    std::string format_line(const lxt::MergedLine& line,
                            const lxt::ConvertedLine& values,
                            const lxt::SpeciesTable& species) const override;
};
