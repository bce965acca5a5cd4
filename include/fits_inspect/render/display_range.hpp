#pragma once

#include "fits_inspect/config/configuration.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fits_inspect::render {

enum class RangeSource {
    ZScale,
    Percentile,
    MinMax,
    Default
};

struct DisplayRange {
    double vmin = 0.0;
    double vmax = 1.0;
    RangeSource source = RangeSource::Default;
    // The min/max tier had to synthesize vmax (flat or non-finite data).
    bool degenerate = false;
};

// IRAF zscale: samples the finite values, fits a line to the sorted sample
// with iterative k-sigma rejection and derives limits from the slope.
// nullopt when there are no finite values.
std::optional<std::pair<double, double>> zscale_limits(const std::vector<double>& values,
                                                       const config::ZScaleConfig& params);

std::optional<std::pair<double, double>> percentile_limits(const std::vector<double>& values,
                                                           double low, double high);

// Three-tier fallback: zscale, then percentiles, then min/max with
// min -> 0 when non-finite and max -> min + 1e-6 when non-finite or equal
// to min. The result always satisfies vmax > vmin.
DisplayRange resolve_display_range(const std::vector<double>& values,
                                   const config::ZScaleConfig& zscale,
                                   const config::RangeConfig& range);

} // namespace fits_inspect::render
