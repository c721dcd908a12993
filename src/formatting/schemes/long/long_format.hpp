/**
 * @file long_format.hpp
 * @brief Long output scheme: short columns plus Lande factors, terms and references.
 */

#pragma once
#include "line_formatter_base.hpp"

/**
 * @brief Adds Lande factors, term designations, reference tags and a merge marker.
 *
 * The marker is "M<n>" for a line folded from n source lines, "D" for a
 * kept duplicate with an incompatible forbid flag, and blank otherwise.
 */
class LongFormatScheme : public lxt::LineFormatterBase
{
public:
    std::string name() const override { return "long"; }

    std::string legend(const lxt::OutputOptions& options) const override;

    std::string format_line(const lxt::MergedLine& line,
                            const lxt::ConvertedLine& values,
                            const lxt::SpeciesTable& species) const override;
};
