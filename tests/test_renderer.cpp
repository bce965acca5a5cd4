#include "fits_inspect/config/configuration.hpp"
#include "fits_inspect/core/errors.hpp"
#include "fits_inspect/render/plot_backend.hpp"
#include "fits_inspect/render/renderer.hpp"

#include "fits_fixtures.hpp"

#include <limits>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace fits_inspect;
using namespace fits_inspect::render;
using fits_inspect::testing::ColumnSpec;
using fits_inspect::testing::FitsWriter;
using fits_inspect::testing::TempDir;

namespace {

Analysis analysis_for(int index, Classification c, std::vector<std::string> columns = {}) {
    Analysis a;
    a.index = index;
    a.classification = c;
    a.column_names = std::move(columns);
    return a;
}

bool is_png(const fs::path& path) {
    const auto bytes = core::read_bytes(path);
    return bytes.size() > 8 && bytes[0] == 0x89 && bytes[1] == 'P' && bytes[2] == 'N' &&
           bytes[3] == 'G';
}

} // namespace

TEST_CASE("preview_names_are_deterministic") {
    REQUIRE(preview_file_name("0a1b2c3d", 2) == "fits_0a1b2c3d_hdu_2.png");
    REQUIRE(preview_url("/previews", "x.png") == "/previews/x.png");
    REQUIRE(preview_url("/static/previews/", "x.png") == "/static/previews/x.png");
}

TEST_CASE("numeric_formats_are_detected_from_tform") {
    REQUIRE(is_numeric_format("1E"));
    REQUIRE(is_numeric_format("D"));
    REQUIRE(is_numeric_format("1J"));
    REQUIRE(is_numeric_format("1K"));
    REQUIRE(is_numeric_format("I"));
    REQUIRE_FALSE(is_numeric_format("16A"));
    REQUIRE_FALSE(is_numeric_format("L"));
    REQUIRE_FALSE(is_numeric_format("1B"));
}

TEST_CASE("time_flux_resolution_uses_last_match_then_position") {
    auto lc = resolve_time_flux_columns({"MJD", "FLUX"});
    REQUIRE(lc.has_value());
    REQUIRE(lc->x == 0);
    REQUIRE(lc->y == 1);

    auto last = resolve_time_flux_columns({"TIME", "SAP_FLUX", "PDCSAP_FLUX"});
    REQUIRE(last->x == 0);
    REQUIRE(last->y == 2);

    auto fallback = resolve_time_flux_columns({"A", "B", "C"});
    REQUIRE(fallback->x == 0);
    REQUIRE(fallback->y == 1);

    REQUIRE_FALSE(resolve_time_flux_columns({"ONLY"}).has_value());
    REQUIRE_FALSE(resolve_time_flux_columns({}).has_value());
}

TEST_CASE("wavelength_flux_resolution") {
    auto s = resolve_wavelength_flux_columns({"FLUX", "WAVE"});
    REQUIRE(s->x == 1);
    REQUIRE(s->y == 0);
}

TEST_CASE("scatter_resolution_prefers_numeric_columns") {
    auto two = resolve_scatter_columns({"NAME", "RA", "DEC"}, {"8A", "1D", "1D"});
    REQUIRE(two->x == 1);
    REQUIRE(two->y == 2);

    auto one = resolve_scatter_columns({"NAME", "MAG"}, {"8A", "1E"});
    REQUIRE(one->x == 1);
    REQUIRE(one->y == -1);

    auto none = resolve_scatter_columns({"ID", "NOTES"}, {"8A", "16A"});
    REQUIRE(none->x == 0);
    REQUIRE(none->y == 1);

    REQUIRE_FALSE(resolve_scatter_columns({}, {}).has_value());
}

TEST_CASE("render_uniform_image_writes_png") {
    TempDir dir;
    const auto path = dir / "flat.fits";
    {
        FitsWriter w(path);
        w.image(100, 100, std::vector<double>(100 * 100, 3.5));
        w.close();
    }

    config::Config cfg;
    const auto out = dir / "previews";
    prepare_output_dir(out);
    auto url = render_unit(path, analysis_for(0, Classification::LowContrastImage), out,
                           "cafe0001", cfg);

    REQUIRE(url.has_value());
    REQUIRE(*url == "/previews/fits_cafe0001_hdu_0.png");
    REQUIRE(is_png(out / "fits_cafe0001_hdu_0.png"));
}

TEST_CASE("render_light_curve_and_long_table") {
    TempDir dir;
    const auto path = dir / "lc.fits";
    const size_t rows = 60000;
    {
        FitsWriter w(path);
        w.empty_image();
        w.table(200, {ColumnSpec{"MJD", "1D", "d", testing::ramp(200, 59000.0, 0.01), {}},
                      ColumnSpec{"FLUX", "1E", "", testing::ramp(200, 5.0, 0.5), {}}});
        w.table(static_cast<LONGLONG>(rows),
                {ColumnSpec{"TIME", "1D", "", testing::ramp(rows), {}},
                 ColumnSpec{"RATE", "1D", "", testing::ramp(rows, 1.0, 0.001), {}}});
        w.close();
    }

    config::Config cfg;
    const auto out = dir / "previews";
    auto urls = render_all(path,
                           {analysis_for(1, Classification::LightCurve, {"MJD", "FLUX"}),
                            analysis_for(2, Classification::LightCurve, {"TIME", "RATE"})},
                           out, "beef0002", cfg);

    REQUIRE(urls.size() == 2);
    REQUIRE(urls[0].has_value());
    REQUIRE(urls[1].has_value());
    REQUIRE(is_png(out / "fits_beef0002_hdu_1.png"));
    REQUIRE(is_png(out / "fits_beef0002_hdu_2.png"));

    io::FitsFile file(path);
    file.select(2);
    auto series = read_table_series(file, {"TIME", "RATE"}, ColumnPair{0, 1},
                                    static_cast<size_t>(cfg.render.max_table_rows));
    REQUIRE(series.x.size() == 50000);
    REQUIRE(series.y.size() == 50000);
    REQUIRE(series.x.front() == 0.0);
    REQUIRE(series.x.back() == static_cast<double>(rows - 1));
    REQUIRE(series.x_label == "TIME");
    REQUIRE(series.y_label == "RATE");

    file.select(1);
    auto short_series = read_table_series(file, {"MJD", "FLUX"}, ColumnPair{0, 1}, 50000);
    REQUIRE(short_series.x.size() == 200);
}

TEST_CASE("render_string_table_uses_row_index") {
    TempDir dir;
    const auto path = dir / "notes.fits";
    {
        FitsWriter w(path);
        w.empty_image();
        w.table(3, {ColumnSpec{"ID", "8A", "", {}, {"a", "b", "c"}},
                    ColumnSpec{"NOTES", "16A", "", {}, {"x", "y", "z"}}});
        w.close();
    }

    config::Config cfg;
    const auto out = dir / "previews";
    prepare_output_dir(out);
    auto url = render_unit(path, analysis_for(1, Classification::Table, {"ID", "NOTES"}), out,
                           "00000003", cfg);
    REQUIRE(url.has_value());

    io::FitsFile file(path);
    file.select(1);
    auto pair = resolve_scatter_columns({"ID", "NOTES"}, {file.column_format(1), file.column_format(2)});
    REQUIRE(pair.has_value());
    auto series = read_table_series(file, {"ID", "NOTES"}, *pair, 50000);
    REQUIRE(series.x == std::vector<double>{0.0, 1.0, 2.0});
    REQUIRE(series.y == std::vector<double>{0.0, 1.0, 2.0});
}

TEST_CASE("single_numeric_column_is_plotted_against_row_index") {
    TempDir dir;
    const auto path = dir / "one.fits";
    {
        FitsWriter w(path);
        w.empty_image();
        w.table(4, {ColumnSpec{"NAME", "8A", "", {}, {"a", "b", "c", "d"}},
                    ColumnSpec{"VALUE", "1D", "", {10.0, 20.0, 30.0, 40.0}, {}}});
        w.close();
    }

    io::FitsFile file(path);
    file.select(1);
    auto pair = resolve_scatter_columns({"NAME", "VALUE"}, {file.column_format(1), file.column_format(2)});
    REQUIRE(pair.has_value());
    REQUIRE(pair->x == 1);
    REQUIRE(pair->y == -1);
    auto series = read_table_series(file, {"NAME", "VALUE"}, *pair, 2);
    REQUIRE(series.x == std::vector<double>{10.0, 40.0});
    REQUIRE(series.y == std::vector<double>{0.0, 3.0});
    REQUIRE(series.y_label == "index");
}

TEST_CASE("render_failures_become_null") {
    TempDir dir;
    const auto path = dir / "mixed.fits";
    {
        FitsWriter w(path);
        w.image_1d({1.0, 2.0, 3.0});
        w.table(2, {ColumnSpec{"A", "1D", "", {1.0, 2.0}, {}}});
        w.close();
    }

    config::Config cfg;
    const auto out = dir / "previews";
    prepare_output_dir(out);

    // Out-of-range unit.
    REQUIRE_FALSE(render_unit(path, analysis_for(7, Classification::Image), out, "f", cfg).has_value());
    // 1-D image.
    REQUIRE_FALSE(render_unit(path, analysis_for(0, Classification::Image), out, "f", cfg).has_value());
    // Unknown table unit falls back to the image path and fails.
    REQUIRE_FALSE(render_unit(path, analysis_for(1, Classification::Unknown), out, "f", cfg).has_value());
    // Light curve with a single column cannot resolve a pair.
    REQUIRE_FALSE(render_unit(path, analysis_for(1, Classification::LightCurve, {"A"}), out, "f", cfg).has_value());
    // Missing file.
    REQUIRE_FALSE(render_unit(dir / "nope.fits", analysis_for(0, Classification::Image), out, "f", cfg).has_value());

    auto failed = try_render_unit(path, analysis_for(7, Classification::Image), out, "f", cfg);
    REQUIRE_FALSE(failed.ok());
    REQUIRE(failed.failure().kind == ErrorKind::Render);
}

TEST_CASE("render_all_throws_when_directory_cannot_be_created") {
    TempDir dir;
    core::write_text(dir / "blocked", "file in the way");

    config::Config cfg;
    REQUIRE_THROWS_AS(render_all(dir / "missing.fits", {}, dir / "blocked" / "sub", "f", cfg),
                      RenderError);
}

TEST_CASE("plot_backend_rejects_series_without_finite_points") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    PlotOptions o;
    REQUIRE_THROWS_AS(render_line({nan}, {1.0}, "x", "y", o), RenderError);
    REQUIRE_THROWS_AS(render_scatter({}, {}, "x", "y", o), RenderError);

    auto png = render_scatter({1.0, 2.0}, {3.0, 3.0}, "x", "y", o);
    REQUIRE(png.size() > 8);
    REQUIRE(color_scale_from_string("Viridis") == ColorScale::Viridis);
    REQUIRE(color_scale_from_string("other") == ColorScale::Gray);
}
