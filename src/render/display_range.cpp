#include "fits_inspect/render/display_range.hpp"
#include "fits_inspect/core/types.hpp"
#include "fits_inspect/core/utils.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>

namespace fits_inspect::render {

namespace {

// Finite and distinct, in increasing order.
bool usable(double lo, double hi) {
    return std::isfinite(lo) && std::isfinite(hi) && lo < hi;
}

// Least-squares line through the good samples: returns (slope, intercept).
std::pair<double, double> fit_line(const std::vector<double>& samples,
                                   const std::vector<bool>& bad, size_t ngood) {
    Eigen::MatrixXd A(static_cast<Eigen::Index>(ngood), 2);
    Eigen::VectorXd b(static_cast<Eigen::Index>(ngood));
    Eigen::Index row = 0;
    for (size_t i = 0; i < samples.size(); ++i) {
        if (bad[i]) continue;
        A(row, 0) = static_cast<double>(i);
        A(row, 1) = 1.0;
        b(row) = samples[i];
        ++row;
    }
    Eigen::Vector2d coef = A.colPivHouseholderQr().solve(b);
    return {coef(0), coef(1)};
}

} // namespace

std::optional<std::pair<double, double>> zscale_limits(const std::vector<double>& values,
                                                       const config::ZScaleConfig& params) {
    std::vector<double> finite;
    finite.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) finite.push_back(v);
    }
    if (finite.empty()) return std::nullopt;

    const size_t n_samples = static_cast<size_t>(std::max(params.n_samples, 1));
    const size_t stride = std::max<size_t>(1, finite.size() / n_samples);
    std::vector<double> samples;
    samples.reserve(std::min(n_samples, finite.size()));
    for (size_t i = 0; i < finite.size() && samples.size() < n_samples; i += stride) {
        samples.push_back(finite[i]);
    }
    finite.clear();
    finite.shrink_to_fit();
    std::sort(samples.begin(), samples.end());

    const size_t npix = samples.size();
    double vmin = samples.front();
    double vmax = samples.back();

    const size_t minpix = std::max(static_cast<size_t>(std::max(params.min_npixels, 0)),
                                   static_cast<size_t>(static_cast<double>(npix) * params.max_reject));
    const size_t ngrow = std::max<size_t>(1, static_cast<size_t>(static_cast<double>(npix) * 0.01));
    // Centered dilation window: pixel i turns bad when any source in
    // [i - (ngrow - 1 - half), i + half] was rejected.
    const size_t half = (ngrow - 1) / 2;
    const size_t back = ngrow - 1 - half;

    std::vector<bool> bad(npix, false);
    size_t ngood = npix;
    size_t last_ngood = npix + 1;
    double slope = 0.0;

    for (int iter = 0; iter < params.max_iterations; ++iter) {
        if (ngood >= last_ngood || ngood < minpix) break;

        auto [a, c] = fit_line(samples, bad, ngood);
        slope = a;

        std::vector<double> flat(npix);
        double sum = 0.0;
        for (size_t i = 0; i < npix; ++i) {
            flat[i] = samples[i] - (a * static_cast<double>(i) + c);
            if (!bad[i]) sum += flat[i];
        }
        const double mean = sum / static_cast<double>(ngood);
        double var = 0.0;
        for (size_t i = 0; i < npix; ++i) {
            if (bad[i]) continue;
            const double d = flat[i] - mean;
            var += d * d;
        }
        const double threshold = params.krej * std::sqrt(var / static_cast<double>(ngood));

        std::vector<bool> rejected = bad;
        for (size_t i = 0; i < npix; ++i) {
            if (flat[i] < -threshold || flat[i] > threshold) rejected[i] = true;
        }

        std::vector<bool> dilated(npix, false);
        for (size_t i = 0; i < npix; ++i) {
            if (!rejected[i]) continue;
            const size_t lo = i >= half ? i - half : 0;
            const size_t hi = std::min(npix - 1, i + back);
            for (size_t k = lo; k <= hi; ++k) dilated[k] = true;
        }
        bad.swap(dilated);

        last_ngood = ngood;
        ngood = static_cast<size_t>(std::count(bad.begin(), bad.end(), false));
    }

    if (ngood >= minpix) {
        if (params.contrast > 0.0) {
            slope /= params.contrast;
        }
        const double center = static_cast<double>((npix - 1) / 2);
        const double median = core::median_of(samples);
        vmin = std::max(vmin, median - (center - 1.0) * slope);
        vmax = std::min(vmax, median + (static_cast<double>(npix) - center) * slope);
    }
    return std::make_pair(vmin, vmax);
}

std::optional<std::pair<double, double>> percentile_limits(const std::vector<double>& values,
                                                           double low, double high) {
    const double lo = core::percentile_of(values, low);
    const double hi = core::percentile_of(values, high);
    if (std::isnan(lo) || std::isnan(hi)) return std::nullopt;
    return std::make_pair(lo, hi);
}

DisplayRange resolve_display_range(const std::vector<double>& values,
                                   const config::ZScaleConfig& zscale,
                                   const config::RangeConfig& range) {
    DisplayRange out;
    if (values.empty()) {
        return out;
    }

    if (auto z = zscale_limits(values, zscale)) {
        if (usable(z->first, z->second)) {
            out.vmin = z->first;
            out.vmax = z->second;
            out.source = RangeSource::ZScale;
            return out;
        }
    }

    if (auto p = percentile_limits(values, range.percentile_low, range.percentile_high)) {
        if (usable(p->first, p->second)) {
            out.vmin = p->first;
            out.vmax = p->second;
            out.source = RangeSource::Percentile;
            return out;
        }
    }

    // NaN-ignoring min / max; infinities still count, as in nanmin/nanmax.
    double vmin = std::numeric_limits<double>::quiet_NaN();
    double vmax = std::numeric_limits<double>::quiet_NaN();
    for (double v : values) {
        if (std::isnan(v)) continue;
        if (std::isnan(vmin) || v < vmin) vmin = v;
        if (std::isnan(vmax) || v > vmax) vmax = v;
    }
    if (!std::isfinite(vmin)) {
        vmin = 0.0;
    }
    if (!std::isfinite(vmax) || vmax == vmin) {
        vmax = vmin + 1e-6;
        out.degenerate = true;
    }
    if (!(vmax > vmin)) {
        // 1e-6 vanishes next to very large magnitudes.
        vmax = std::nextafter(vmin, std::numeric_limits<double>::infinity());
        out.degenerate = true;
    }
    out.vmin = vmin;
    out.vmax = vmax;
    out.source = RangeSource::MinMax;
    return out;
}

} // namespace fits_inspect::render
