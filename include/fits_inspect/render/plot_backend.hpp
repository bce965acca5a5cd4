#pragma once

#include "fits_inspect/config/configuration.hpp"
#include "fits_inspect/core/types.hpp"
#include "fits_inspect/render/display_range.hpp"
#include "fits_inspect/render/stretch.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fits_inspect::render {

using ImageBytes = std::vector<uint8_t>;

enum class ColorScale {
    Gray,
    Viridis,
    Inferno
};

ColorScale color_scale_from_string(const std::string& name);

struct PlotOptions {
    int width = 600;
    int height = 400;
    int max_image_side = 1024;
    bool colorbar = true;
    ColorScale color_scale = ColorScale::Gray;
    double asinh_a = 0.1;
};

PlotOptions plot_options_from(const config::RenderConfig& cfg);

// All three return PNG bytes and throw RenderError when nothing can be drawn.

// Rows of `values` run bottom to top on screen (origin lower-left).
ImageBytes render_raster(const Matrix2Dd& values, const DisplayRange& range, StretchKind stretch,
                         const PlotOptions& options);

ImageBytes render_line(const std::vector<double>& x, const std::vector<double>& y,
                       const std::string& x_label, const std::string& y_label,
                       const PlotOptions& options);

ImageBytes render_scatter(const std::vector<double>& x, const std::vector<double>& y,
                          const std::string& x_label, const std::string& y_label,
                          const PlotOptions& options);

} // namespace fits_inspect::render
