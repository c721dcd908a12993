#include "bibliography.hpp"
#include "extraction_runtime.hpp"
#include "line_formatter_base.hpp"
#include "log_profile.hpp"
#include "physical_constants.hpp"
#include "test_support.hpp"
#include "unit_conversion.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
using lxt_test::make_line;
using lxt_test::nearly_equal;

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[output-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

bool contains(const std::string& text, const std::string& needle)
{
    return text.find(needle) != std::string::npos;
}

int test_air_vacuum_conversion()
{
    int failures = 0;
    const double h_alpha_air = lxt::vacuum_to_air(6564.614);
    failures += expect_true(nearly_equal(h_alpha_air, 6562.80, 0.01), "H-alpha vacuum 6564.614 A must be about 6562.80 A in air");
    failures += expect_true(nearly_equal(lxt::air_to_vacuum(h_alpha_air), 6564.614, 1.0e-6),
                            "air to vacuum must invert vacuum to air within 1e-6 A");

    for (double wl : {2500.0, 4861.35, 15000.0, 100000.0})
    {
        failures += expect_true(nearly_equal(lxt::air_to_vacuum(lxt::vacuum_to_air(wl)), wl, 1.0e-6),
                                "vacuum/air round trip must hold at " + std::to_string(wl) + " A");
    }
    failures += expect_true(lxt::vacuum_to_air(1500.0) == 1500.0, "no air correction applies at or below 2000 A");
    failures += expect_true(lxt::air_to_vacuum(1500.0) == 1500.0, "no vacuum correction applies below 2000 A");
    failures += expect_true(lxt::air_refractive_index(5000.0) > 1.00027 && lxt::air_refractive_index(5000.0) < 1.00029,
                            "refractive index of air in the visible must be about 1.00028");
    return failures;
}

int test_unit_conversions()
{
    int failures = 0;
    double out = 0.0;
    std::string error;

    failures += expect_true(lxt::convert_energy(1.0, lxt::EnergyUnit::ev, lxt::EnergyUnit::cm1, out, error) &&
                            nearly_equal(out, 8065.543937, 1.0e-9),
                            "1 eV must equal 8065.543937 cm-1");
    failures += expect_true(lxt::convert_energy(8065.543937, lxt::EnergyUnit::cm1, lxt::EnergyUnit::ev, out, error) &&
                            nearly_equal(out, 1.0, 1.0e-12),
                            "8065.543937 cm-1 must equal 1 eV");
    failures += expect_true(!lxt::convert_energy(std::nan(""), lxt::EnergyUnit::ev, lxt::EnergyUnit::cm1, out, error),
                            "non-finite energies must fail conversion");

    failures += expect_true(lxt::convert_wavelength(5000.0, lxt::WavelengthUnit::nm, lxt::Medium::vacuum, out, error) &&
                            nearly_equal(out, 500.0),
                            "5000 A must be 500 nm");
    failures += expect_true(lxt::convert_wavelength(5000.0, lxt::WavelengthUnit::cm1, lxt::Medium::vacuum, out, error) &&
                            nearly_equal(out, 20000.0, 1.0e-9),
                            "5000 A must be 20000 cm-1");
    failures += expect_true(!lxt::convert_wavelength(-1.0, lxt::WavelengthUnit::angstrom, lxt::Medium::vacuum, out, error),
                            "negative wavelengths must fail conversion");

    bool rejected = false;
    try
    {
        lxt::validate_output_units(lxt::WavelengthUnit::cm1, lxt::Medium::air);
    }
    catch (const lxt::ConversionError& e)
    {
        rejected = e.conversion_kind() == lxt::ConversionError::Kind::UnsupportedCombination;
    }
    failures += expect_true(rejected, "wavenumbers in air must be rejected");

    lxt::WavelengthUnit unit = lxt::WavelengthUnit::angstrom;
    lxt::EnergyUnit energy = lxt::EnergyUnit::ev;
    lxt::Medium medium = lxt::Medium::vacuum;
    failures += expect_true(lxt::parse_wavelength_unit("nm", unit) && unit == lxt::WavelengthUnit::nm, "'nm' must parse");
    failures += expect_true(lxt::parse_energy_unit("cm-1", energy) && energy == lxt::EnergyUnit::cm1, "'cm-1' must parse");
    failures += expect_true(lxt::parse_medium("AIR", medium) && medium == lxt::Medium::air, "medium parsing must ignore case");
    failures += expect_true(!lxt::parse_medium("water", medium), "unknown media must be rejected");
    return failures;
}

int test_formatters()
{
    int failures = 0;
    lxt::SpeciesTable species;
    lxt::SpeciesInfo fe;
    fe.code = 2600;
    fe.name = "Fe";
    species.add(fe);

    failures += expect_true(lxt::get_available_line_formats().size() == 2, "short and long formats must be available");
    failures += expect_true(lxt::create_line_formatter("tabular") == nullptr, "unknown formats must yield null");

    lxt::MergedLine line;
    line.record = make_line(5000.0, 2600, -1.5f, 1.0, 3.5, ' ', "K07");
    line.merged_count = 2;
    lxt::MergedLine unknown;
    unknown.record = make_line(5001.0, 9999, -0.5f);
    unknown.kept_duplicate = true;
    lxt::MergedLine broken;
    broken.record = make_line(5002.0, 2600);
    broken.record.e_upper = std::nan("");

    lxt::ExtractionRequest request;
    request.wl_start = 4990.0;
    request.wl_end = 5010.0;
    request.output.energy_unit = lxt::EnergyUnit::cm1;

    const std::unique_ptr<lxt::LineFormatterBase> short_format = lxt::create_line_formatter("short");
    const lxt::FormattedOutput brief = lxt::render_lines({line, unknown, broken}, *short_format, request, species, 1);
    failures += expect_true(brief.lines.size() == 4, "header, legend and two convertible lines expected");
    failures += expect_true(brief.skipped_lines == 1 && brief.rendered.size() == 2,
                            "an unconvertible line must be skipped and counted");
    if (brief.lines.size() == 4)
    {
        failures += expect_true(contains(brief.lines[0], "lines 2") && contains(brief.lines[0], "warnings 2"),
                                "header must report final line and warning counts");
        failures += expect_true(contains(brief.lines[1], "E_low(cm-1)"), "legend must name the energy unit");
        failures += expect_true(contains(brief.lines[2], "'Fe 1'") && contains(brief.lines[2], "8065.5439"),
                                "short line must show species name and converted energy");
        failures += expect_true(contains(brief.lines[3], "'Unknown(9999)'"), "unlisted species must still render");
    }

    const std::unique_ptr<lxt::LineFormatterBase> long_format = lxt::create_line_formatter("long");
    const lxt::FormattedOutput full = lxt::render_lines({line, unknown}, *long_format, request, species);
    if (full.lines.size() == 4)
    {
        failures += expect_true(contains(full.lines[2], "'a5D'") && contains(full.lines[2], "'K07'") &&
                                contains(full.lines[2], "'M2'"),
                                "long line must show terms, references and merge marker");
        failures += expect_true(contains(full.lines[3], "'D'"), "kept duplicates must be marked");
    }
    else
    {
        failures += expect_true(false, "long format must render header, legend and two lines");
    }
    return failures;
}

int test_bibliography(const std::filesystem::path& dir)
{
    int failures = 0;
    lxt::LineRecord coded = make_line(5000.0, 2600, -1.0f, 1.0, 3.5, ' ', "K07");
    lxt::LineRecord numbered = make_line(5001.0, 2600, -1.0f, 1.0, 3.5, ' ', "");
    lxt::set_reference_ids(numbered, 4, 0, 17);

    const std::vector<std::string> tags = lxt::reference_tags(numbered);
    failures += expect_true(tags.size() == 2 && tags[0] == "#4" && tags[1] == "#17",
                            "numeric references must yield one tag per non-zero index");

    lxt::Bibliography bibliography;
    bibliography.add_line(coded);
    bibliography.add_line(numbered);
    bibliography.add_line(coded);
    failures += expect_true(bibliography.entries().size() == 3, "tags must be collected once each");
    failures += expect_true(bibliography.entries()[0].tag == "K07" && bibliography.entries()[0].lines == 2,
                            "tags must keep first-use order and count lines");

    const std::filesystem::path catalog_path = dir / "refs.tsv";
    {
        std::ofstream out(catalog_path);
        out << "# tag\tcitation\n";
        out << "K07\tKurucz (2007)\n";
        out << "\n";
        out << "#4 is a comment, not a tag\n";
    }
    lxt::ReferenceCatalog catalog;
    std::string error;
    failures += expect_true(catalog.load(catalog_path.string(), error) && catalog.size() == 1,
                            "catalog must load tab-separated entries and skip comments");
    failures += expect_true(bibliography.render(&catalog) == "K07\t2\tKurucz (2007)\n#4\t1\n#17\t1\n",
                            "bibliography must render tag, count and known citations");
    failures += expect_true(!catalog.load((dir / "missing.tsv").string(), error), "a missing catalog must fail to load");
    return failures;
}

int test_run_extraction_output(const std::filesystem::path& dir)
{
    int failures = 0;
    lxt::SpeciesTable species;
    lxt::LinelistSource source;
    if (!lxt_test::write_source(dir, "run", {make_line(5000.0, 2600, -1.0f, 1.0, 3.5, ' ', "K07"),
                                             make_line(5005.0, 2600, -2.0f, 1.0, 3.5, ' ', "B99")},
                                1, source))
    {
        return 1;
    }

    lxt::ExtractionRequest request;
    request.job_name = "output-regression";
    request.wl_start = 4990.0;
    request.wl_end = 5010.0;
    request.sources.push_back(source);
    request.output.format = "long";
    request.output.medium = lxt::Medium::air;

    const lxt::ExtractionResult result = lxt::run_extraction(request, species);
    failures += expect_true(result.ok, "a valid request must succeed");
    failures += expect_true(result.lines.size() == 4, "result must hold header, legend and two lines");
    failures += expect_true(result.bibliography == "K07\t1\nB99\t1\n", "result must carry the bibliography");
    failures += expect_true(result.warning_count() == 0, "a clean run must report no warnings");

    request.output.format = "tabular";
    const lxt::ExtractionResult bad_format = lxt::run_extraction(request, species);
    failures += expect_true(!bad_format.ok && bad_format.error_kind == lxt::ErrorKind::Merge,
                            "an unknown output format must fail the request");
    return failures;
}
}

int main()
{
    lxt::global_log_profile = lxt::LogProfile::quiet;
    const std::filesystem::path dir = lxt_test::make_scratch_dir("output");

    int failures = 0;
    failures += test_air_vacuum_conversion();
    failures += test_unit_conversions();
    failures += test_formatters();
    failures += test_bibliography(dir);
    failures += test_run_extraction_output(dir);
    std::filesystem::remove_all(dir);

    if (failures == 0)
    {
        std::cout << "[output-regression] PASS" << std::endl;
        return 0;
    }

    std::cerr << "[output-regression] " << failures << " failure(s)" << std::endl;
    return 1;
}
