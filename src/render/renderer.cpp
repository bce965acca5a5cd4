#include "fits_inspect/render/renderer.hpp"
#include "fits_inspect/core/errors.hpp"
#include "fits_inspect/core/utils.hpp"
#include "fits_inspect/io/fits_io.hpp"
#include "fits_inspect/pipeline/column_roles.hpp"
#include "fits_inspect/render/display_range.hpp"
#include "fits_inspect/render/plot_backend.hpp"
#include "fits_inspect/render/stretch.hpp"

#include <algorithm>
#include <cmath>
#include <system_error>

namespace fits_inspect::render {

namespace {

using pipeline::ColumnRole;

std::optional<ColumnPair> resolve_pair(const std::vector<std::string>& names,
                                       ColumnRole x_role, ColumnRole y_role) {
    ColumnPair pair;
    for (size_t i = 0; i < names.size(); ++i) {
        if (pipeline::has_role(names[i], x_role)) pair.x = static_cast<int>(i);
        if (pipeline::has_role(names[i], y_role)) pair.y = static_cast<int>(i);
    }
    if (pair.x < 0 && !names.empty()) pair.x = 0;
    if (pair.y < 0 && names.size() > 1) pair.y = 1;
    if (pair.x < 0 || pair.y < 0) return std::nullopt;
    return pair;
}

bool any_finite(const std::vector<double>& v) {
    return std::any_of(v.begin(), v.end(), [](double d) { return std::isfinite(d); });
}

std::vector<double> row_index_series(size_t n) {
    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<double>(i);
    return out;
}

ImageBytes render_image_unit(const io::FitsFile& file, const config::Config& cfg) {
    if (file.kind() != UnitKind::Image) {
        throw RenderError("unit holds no image samples");
    }
    const Matrix2Dd plane = file.read_plane();
    const std::vector<double> values(plane.data(), plane.data() + plane.size());
    const DisplayRange range = resolve_display_range(values, cfg.zscale, cfg.range);
    return render_raster(plane, range, choose_stretch(range), plot_options_from(cfg.render));
}

ImageBytes render_table_unit(const io::FitsFile& file, const Analysis& analysis,
                             const config::Config& cfg) {
    const std::vector<std::string>& names = analysis.column_names;
    const size_t max_rows = static_cast<size_t>(cfg.render.max_table_rows);
    const PlotOptions options = plot_options_from(cfg.render);

    switch (analysis.classification) {
        case Classification::LightCurve: {
            auto pair = resolve_time_flux_columns(names);
            if (!pair) throw RenderError("no time / flux columns");
            TableSeries s = read_table_series(file, names, *pair, max_rows);
            return render_line(s.x, s.y, s.x_label, s.y_label, options);
        }
        case Classification::Spectrum: {
            auto pair = resolve_wavelength_flux_columns(names);
            if (!pair) throw RenderError("no wavelength / flux columns");
            TableSeries s = read_table_series(file, names, *pair, max_rows);
            return render_line(s.x, s.y, s.x_label, s.y_label, options);
        }
        default: {
            std::vector<std::string> formats;
            const int ncols = std::min(file.column_count(), static_cast<int>(names.size()));
            for (int c = 1; c <= ncols; ++c) {
                formats.push_back(file.column_format(c));
            }
            auto pair = resolve_scatter_columns(names, formats);
            if (!pair) throw RenderError("table has no columns");
            TableSeries s = read_table_series(file, names, *pair, max_rows);
            return render_scatter(s.x, s.y, s.x_label, s.y_label, options);
        }
    }
}

} // namespace

std::string preview_file_name(const std::string& file_id, int index) {
    return "fits_" + file_id + "_hdu_" + std::to_string(index) + ".png";
}

std::string preview_url(const std::string& url_prefix, const std::string& file_name) {
    std::string prefix = url_prefix;
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return prefix + "/" + file_name;
}

bool is_numeric_format(const std::string& tform) {
    const std::string f = core::to_upper(tform);
    return f.find_first_of("EDIJK") != std::string::npos;
}

std::optional<ColumnPair> resolve_time_flux_columns(const std::vector<std::string>& names) {
    return resolve_pair(names, ColumnRole::Time, ColumnRole::Flux);
}

std::optional<ColumnPair> resolve_wavelength_flux_columns(const std::vector<std::string>& names) {
    return resolve_pair(names, ColumnRole::Wavelength, ColumnRole::Flux);
}

std::optional<ColumnPair> resolve_scatter_columns(const std::vector<std::string>& names,
                                                  const std::vector<std::string>& formats) {
    if (names.empty()) return std::nullopt;

    std::vector<int> numeric;
    const size_t n = std::min(names.size(), formats.size());
    for (size_t i = 0; i < n; ++i) {
        if (is_numeric_format(formats[i])) numeric.push_back(static_cast<int>(i));
    }
    if (numeric.size() >= 2) return ColumnPair{numeric[0], numeric[1]};
    if (numeric.size() == 1) return ColumnPair{numeric[0], -1};
    return ColumnPair{0, names.size() > 1 ? 1 : -1};
}

TableSeries read_table_series(const io::FitsFile& file, const std::vector<std::string>& names,
                              const ColumnPair& pair, size_t max_rows) {
    const int64_t rows = file.row_count();
    if (rows <= 0) {
        throw RenderError("table has no rows");
    }
    const int ncols = file.column_count();
    auto load = [&](int pos) {
        if (pos < 0) return row_index_series(static_cast<size_t>(rows));
        if (pos >= ncols) {
            throw RenderError("column '" + names[static_cast<size_t>(pos)] + "' is missing");
        }
        std::vector<double> v = file.read_column(pos + 1);
        if (!any_finite(v)) {
            v = row_index_series(v.size());
        }
        return v;
    };

    TableSeries s;
    s.x = load(pair.x);
    s.y = load(pair.y);
    s.x_label = pair.x >= 0 ? names[static_cast<size_t>(pair.x)] : "index";
    s.y_label = pair.y >= 0 ? names[static_cast<size_t>(pair.y)] : "index";

    const size_t n = std::min(s.x.size(), s.y.size());
    const std::vector<size_t> keep = core::uniform_indices(n, max_rows);
    std::vector<double> x, y;
    x.reserve(keep.size());
    y.reserve(keep.size());
    for (size_t idx : keep) {
        x.push_back(s.x[idx]);
        y.push_back(s.y[idx]);
    }
    s.x.swap(x);
    s.y.swap(y);
    return s;
}

Result<std::string> try_render_unit(const fs::path& fits_path, const Analysis& analysis,
                                    const fs::path& out_dir, const std::string& file_id,
                                    const config::Config& cfg) {
    try {
        io::FitsFile file(fits_path);
        if (analysis.index < 0 || analysis.index >= file.unit_count()) {
            return Result<std::string>::fail(
                ErrorKind::Render, "unit index " + std::to_string(analysis.index) + " out of range");
        }
        file.select(analysis.index);

        const Classification c = analysis.classification;
        ImageBytes png;
        if (c == Classification::LightCurve || c == Classification::Spectrum ||
            c == Classification::Table) {
            png = render_table_unit(file, analysis, cfg);
        } else {
            // Image-like units, and a best-effort attempt for unknown ones.
            png = render_image_unit(file, cfg);
        }

        const std::string name = preview_file_name(file_id, analysis.index);
        core::write_bytes(out_dir / name, png);
        return Result<std::string>(preview_url(cfg.render.url_prefix, name));
    } catch (const std::exception& e) {
        return Result<std::string>::fail(ErrorKind::Render, e.what());
    }
}

std::optional<std::string> render_unit(const fs::path& fits_path, const Analysis& analysis,
                                       const fs::path& out_dir, const std::string& file_id,
                                       const config::Config& cfg) {
    auto r = try_render_unit(fits_path, analysis, out_dir, file_id, cfg);
    if (!r) return std::nullopt;
    return r.take();
}

void prepare_output_dir(const fs::path& out_dir) {
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec || !fs::is_directory(out_dir, ec)) {
        throw RenderError("cannot create preview directory " + out_dir.string() +
                          (ec ? ": " + ec.message() : std::string()));
    }
}

std::vector<std::optional<std::string>> render_all(const fs::path& fits_path,
                                                   const std::vector<Analysis>& analyses,
                                                   const fs::path& out_dir,
                                                   const std::string& file_id,
                                                   const config::Config& cfg) {
    prepare_output_dir(out_dir);

    std::vector<std::optional<std::string>> urls;
    urls.reserve(analyses.size());
    for (const auto& a : analyses) {
        urls.push_back(render_unit(fits_path, a, out_dir, file_id, cfg));
    }
    return urls;
}

} // namespace fits_inspect::render
