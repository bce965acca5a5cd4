#include "fits_inspect/render/stretch.hpp"

#include <algorithm>
#include <cmath>

namespace fits_inspect::render {

StretchKind choose_stretch(const DisplayRange& range) {
    return range.degenerate ? StretchKind::Linear : StretchKind::Asinh;
}

double apply_stretch(double v, const DisplayRange& range, StretchKind kind, double asinh_a) {
    if (std::isnan(v)) return 0.0;
    const double span = range.vmax - range.vmin;
    double x = span > 0.0 ? (v - range.vmin) / span : 0.0;
    x = std::clamp(x, 0.0, 1.0);
    if (kind == StretchKind::Linear || asinh_a <= 0.0) {
        return x;
    }
    return std::asinh(x / asinh_a) / std::asinh(1.0 / asinh_a);
}

Matrix2Dd stretch_plane(const Matrix2Dd& plane, const DisplayRange& range, StretchKind kind,
                        double asinh_a) {
    return plane.unaryExpr([&](double v) { return apply_stretch(v, range, kind, asinh_a); });
}

} // namespace fits_inspect::render
