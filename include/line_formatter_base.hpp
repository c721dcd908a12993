#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "extraction_request.hpp"
#include "species_table.hpp"

/**
 * @file line_formatter_base.hpp
 * @brief Output scheme contract for rendering merged lines as text.
 *
 * Declares the converted-value bundle shared by all schemes, the scheme
 * base class and the renderer that applies header, legend and per-line
 * conversion-failure handling around a scheme.
 */

namespace lxt
{

/**
 * @brief Values of one line in the requested output units.
 */
struct ConvertedLine
{
    double wavelength = 0.0;
    double e_lower = 0.0;
    double e_upper = 0.0;
};

/**
 * @brief Converts a merged line's wavelength and eV energies to the output units.
 * @return False with a message when any value cannot be converted.
 */
bool convert_line(const MergedLine& line, const OutputOptions& options, ConvertedLine& out, std::string& error);

class LineFormatterBase
{
public:
    virtual ~LineFormatterBase() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Column legend printed after the header line.
     */
    virtual std::string legend(const OutputOptions& options) const = 0;

    /**
     * @brief Renders one line from already converted values.
     */
    virtual std::string format_line(const MergedLine& line,
                                    const ConvertedLine& values,
                                    const SpeciesTable& species) const = 0;
};

/**
 * @brief Creates an output scheme by configured name ("short" or "long").
 * @return Null for unknown names.
 */
std::unique_ptr<LineFormatterBase> create_line_formatter(const std::string& scheme_name);

/**
 * @brief Returns names of available output schemes.
 */
std::vector<std::string> get_available_line_formats();

struct FormattedOutput
{
    std::vector<std::string> lines;

    /// Indices into the input of the lines that were rendered.
    std::vector<std::size_t> rendered;
    std::size_t skipped_lines = 0;
};

/**
 * @brief Renders the header, legend and every convertible line.
 *
 * Lines whose values cannot be converted are skipped and counted; the
 * header reports the final line count and warning count including
 * warnings_before.
 */
FormattedOutput render_lines(const std::vector<MergedLine>& lines,
                             const LineFormatterBase& formatter,
                             const ExtractionRequest& request,
                             const SpeciesTable& species,
                             std::size_t warnings_before = 0);

} // namespace lxt
