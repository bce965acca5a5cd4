#include "fits_inspect/pipeline/classifier.hpp"
#include "fits_inspect/pipeline/extractor.hpp"

#include "fits_fixtures.hpp"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace fits_inspect;
using fits_inspect::testing::ColumnSpec;
using fits_inspect::testing::FitsWriter;
using fits_inspect::testing::TempDir;

namespace {

UnitSummary image_summary(std::vector<int64_t> shape, int bitpix, bool uniform) {
    UnitSummary s;
    s.kind = UnitKind::Image;
    s.kind_name = "ImageHDU";
    s.shape = std::move(shape);
    s.bitpix = bitpix;
    ImageStats st;
    st.min_value = 1.0;
    st.max_value = uniform ? 1.0 : 2.0;
    st.is_uniform = uniform;
    s.stats = st;
    s.has_numeric_data = true;
    return s;
}

std::vector<Analysis> analyse(const fs::path& path) {
    auto summaries = pipeline::extract(path);
    REQUIRE(summaries.ok());
    return pipeline::classify(path, summaries.value());
}

} // namespace

TEST_CASE("classify_columns_by_name_families") {
    using pipeline::classify_columns;
    REQUIRE(classify_columns({"MJD", "FLUX"}) == Classification::LightCurve);
    REQUIRE(classify_columns({"time", "sap_flux", "flux_err"}) == Classification::LightCurve);
    REQUIRE(classify_columns({"WAVELENGTH", "FLUX"}) == Classification::Spectrum);
    REQUIRE(classify_columns({"lambda", "counts"}) == Classification::Spectrum);
    REQUIRE(classify_columns({"ID", "NOTES"}) == Classification::Table);
    REQUIRE(classify_columns({"MJD", "RA"}) == Classification::Table);
    REQUIRE(classify_columns({}) == Classification::Table);
}

TEST_CASE("image_rules_follow_markers_and_uniformity") {
    config::ClassifyConfig limits;

    auto plain = pipeline::classify_unit(image_summary({10, 10}, -32, false), nullptr, limits);
    REQUIRE(plain.value().classification == Classification::Image);

    auto flat = pipeline::classify_unit(image_summary({10, 10}, -32, true), nullptr, limits);
    REQUIRE(flat.value().classification == Classification::LowContrastImage);

    auto flat_int = pipeline::classify_unit(image_summary({10, 10}, 16, true), nullptr, limits);
    REQUIRE(flat_int.value().classification == Classification::Image);

    UnitSummary err = image_summary({10, 10}, -32, true);
    err.header["EXTNAME"] = std::string("Uncertainty");
    REQUIRE(pipeline::classify_unit(err, nullptr, limits).value().classification ==
            Classification::ErrorMap);

    auto line = pipeline::classify_unit(image_summary({10}, -32, false), nullptr, limits);
    REQUIRE(line.value().classification == Classification::Image);

    auto empty = pipeline::classify_unit(image_summary({}, 8, true), nullptr, limits);
    REQUIRE(empty.value().classification == Classification::Unknown);
}

TEST_CASE("error_map_marker_lookup_order") {
    Header h;
    h["DATATYPE"] = std::string("SCIENCE");
    h["EXTNAME"] = std::string("ERR");
    REQUIRE_FALSE(pipeline::header_suggests_error_map(h));

    Header h2;
    h2["HDUCLAS1"] = std::string("ERROR");
    REQUIRE(pipeline::header_suggests_error_map(h2));
}

TEST_CASE("axis_meaning_copies_string_ctype_keys") {
    Header h;
    h["CTYPE1"] = std::string("RA---TAN");
    h["CTYPE2"] = std::string("DEC--TAN");
    h["CTYPE3"] = int64_t{5};
    h["CRVAL1"] = 10.0;

    auto axes = pipeline::axis_meaning(h);
    REQUIRE(axes.size() == 2);
    REQUIRE(axes.at("CTYPE1") == "RA---TAN");
}

TEST_CASE("table_without_source_degrades_to_unknown") {
    UnitSummary s;
    s.kind = UnitKind::Table;
    auto r = pipeline::classify_unit(s, nullptr, {});
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.failure().kind == ErrorKind::Unit);

    Analysis a = pipeline::degraded_analysis(s);
    REQUIRE(a.classification == Classification::Unknown);
    REQUIRE(a.column_names.empty());
    REQUIRE(a.units.empty());
}

TEST_CASE("light_curve_table_is_classified_from_file") {
    TempDir dir;
    const auto path = dir / "lc.fits";
    {
        FitsWriter w(path);
        w.image(8, 8, testing::ramp(64));
        w.table(200, {ColumnSpec{"MJD", "1D", "d", testing::ramp(200, 59000.0, 0.1), {}},
                      ColumnSpec{"FLUX", "1E", "e-/s", testing::ramp(200, 10.0), {}}});
        w.close();
    }

    auto analyses = analyse(path);
    REQUIRE(analyses.size() == 2);
    REQUIRE(analyses[0].classification == Classification::Image);

    const Analysis& lc = analyses[1];
    REQUIRE(lc.classification == Classification::LightCurve);
    REQUIRE(lc.column_names == std::vector<std::string>{"MJD", "FLUX"});
    REQUIRE(lc.units.at("MJD") == "d");
    REQUIRE(lc.units.at("FLUX") == "e-/s");
}

TEST_CASE("string_table_is_plain_table") {
    TempDir dir;
    const auto path = dir / "notes.fits";
    {
        FitsWriter w(path);
        w.empty_image();
        w.table(3, {ColumnSpec{"ID", "8A", "", {}, {"a", "b", "c"}},
                    ColumnSpec{"NOTES", "16A", "", {}, {"x", "y", "z"}}});
        w.close();
    }

    auto analyses = analyse(path);
    REQUIRE(analyses.size() == 2);
    REQUIRE(analyses[0].classification == Classification::Unknown);
    REQUIRE(analyses[1].classification == Classification::Table);
    REQUIRE(analyses[1].column_names == std::vector<std::string>{"ID", "NOTES"});
}

TEST_CASE("spectrum_table_and_axis_meaning") {
    TempDir dir;
    const auto path = dir / "spec.fits";
    {
        FitsWriter w(path);
        w.image(4, 4, testing::ramp(16));
        w.key("CTYPE1", std::string("RA---TAN"));
        w.table(50, {ColumnSpec{"WAVELENGTH", "1D", "Angstrom", testing::ramp(50, 4000.0, 10.0), {}},
                     ColumnSpec{"FLUX", "1D", "", testing::ramp(50, 1.0), {}}});
        w.close();
    }

    auto analyses = analyse(path);
    REQUIRE(analyses[0].axis_meaning.at("CTYPE1") == "RA---TAN");
    REQUIRE(analyses[1].classification == Classification::Spectrum);
}
