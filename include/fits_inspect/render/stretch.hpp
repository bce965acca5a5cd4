#pragma once

#include "fits_inspect/core/types.hpp"
#include "fits_inspect/render/display_range.hpp"

#include <string>

namespace fits_inspect::render {

enum class StretchKind {
    Linear,
    Asinh
};

// Degenerate ranges are drawn linearly, everything else with asinh.
StretchKind choose_stretch(const DisplayRange& range);

// Maps v into [0, 1]: normalize against the range, clip, then stretch.
// NaN maps to 0.
double apply_stretch(double v, const DisplayRange& range, StretchKind kind, double asinh_a);

Matrix2Dd stretch_plane(const Matrix2Dd& plane, const DisplayRange& range, StretchKind kind,
                        double asinh_a);

} // namespace fits_inspect::render
