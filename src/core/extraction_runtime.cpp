/**
 * @file extraction_runtime.cpp
 * @brief Request execution with error capture and warning summary.
 */

#include "extraction_runtime.hpp"
#include "line_formatter_base.hpp"
#include "log_profile.hpp"
#include "merge_engine.hpp"

#include <chrono>
#include <iostream>

namespace lxt
{

const char* to_string(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::Codec:
            return "codec";
        case ErrorKind::Store:
            return "store";
        case ErrorKind::Merge:
            return "merge";
        case ErrorKind::Conversion:
            return "conversion";
        case ErrorKind::Timeout:
            return "timeout";
    }
    return "unknown";
}

ExtractionResult run_extraction(const ExtractionRequest& request,
                                const SpeciesTable& species,
                                const ReferenceCatalog* catalog)
{
    ExtractionResult result;
    const auto started = std::chrono::steady_clock::now();
    try
    {
        const std::unique_ptr<LineFormatterBase> formatter = create_line_formatter(request.output.format);
        if (!formatter)
        {
            throw MergeError(MergeError::Kind::InvalidRequest,
                             "unknown output format '" + request.output.format + "'");
        }

        MergeEngine engine(request, species);
        const std::vector<MergedLine> merged = engine.run();
        result.stats = engine.stats();

        FormattedOutput output = render_lines(merged, *formatter, request, species,
                                              result.stats.skipped_lines + result.stats.kept_duplicates);

        Bibliography bibliography;
        for (std::size_t index : output.rendered)
        {
            bibliography.add_line(merged[index].record);
        }

        result.skipped_lines = result.stats.skipped_lines + output.skipped_lines;
        result.kept_duplicates = result.stats.kept_duplicates;
        result.lines = std::move(output.lines);
        result.bibliography = bibliography.render(catalog);
        result.ok = true;
    }
    catch (const ExtractionError& e)
    {
        result = ExtractionResult{};
        result.error_kind = e.kind();
        result.error_message = e.what();
    }
    catch (const std::exception& e)
    {
        result = ExtractionResult{};
        result.error_message = std::string("unexpected failure: ") + e.what();
    }

    const double elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    if (!result.ok && log_normal_enabled())
    {
        std::cerr << "[EXTRACT] " << request.job_name << " failed ("
                  << (result.error_kind ? to_string(*result.error_kind) : "internal") << "): "
                  << result.error_message << std::endl;
    }
    else if (result.ok && log_normal_enabled())
    {
        std::cout << "[EXTRACT] " << request.job_name << " done: "
                  << (result.lines.size() >= 2 ? result.lines.size() - 2 : 0) << " lines, "
                  << result.warning_count() << " warnings in " << elapsed_s << " s" << std::endl;
    }
    return result;
}

} // namespace lxt
