#include "fits_inspect/render/plot_backend.hpp"
#include "fits_inspect/core/errors.hpp"
#include "fits_inspect/core/utils.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace fits_inspect::render {

namespace {

const cv::Scalar kWhite(255, 255, 255);
const cv::Scalar kBlack(0, 0, 0);
const cv::Scalar kGrid(225, 225, 225);
const cv::Scalar kSeries(180, 119, 31);  // BGR

constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;
constexpr double kFontScale = 0.4;
constexpr int kMinRasterSide = 128;

std::string tick_label(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", v);
    return buf;
}

cv::Size text_size(const std::string& text) {
    int baseline = 0;
    return cv::getTextSize(text, kFont, kFontScale, 1, &baseline);
}

void put_text(cv::Mat& canvas, const std::string& text, cv::Point origin) {
    cv::putText(canvas, text, origin, kFont, kFontScale, kBlack, 1, cv::LINE_AA);
}

// Draws text rotated a quarter turn counter-clockwise, centered on `center`.
void put_vertical_text(cv::Mat& canvas, const std::string& text, cv::Point center) {
    if (text.empty()) return;
    const cv::Size ts = text_size(text);
    cv::Mat strip(ts.height + 6, ts.width + 4, CV_8UC3, kWhite);
    put_text(strip, text, cv::Point(2, ts.height + 2));
    cv::Mat rotated;
    cv::rotate(strip, rotated, cv::ROTATE_90_COUNTERCLOCKWISE);

    cv::Rect roi(center.x - rotated.cols / 2, center.y - rotated.rows / 2, rotated.cols,
                 rotated.rows);
    roi &= cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (roi.width <= 0 || roi.height <= 0) return;
    rotated(cv::Rect(0, 0, roi.width, roi.height)).copyTo(canvas(roi));
}

cv::Mat colorize(const cv::Mat& gray, ColorScale scale) {
    cv::Mat out;
    switch (scale) {
        case ColorScale::Viridis:
            cv::applyColorMap(gray, out, cv::COLORMAP_VIRIDIS);
            break;
        case ColorScale::Inferno:
            cv::applyColorMap(gray, out, cv::COLORMAP_INFERNO);
            break;
        default:
            cv::cvtColor(gray, out, cv::COLOR_GRAY2BGR);
            break;
    }
    return out;
}

ImageBytes encode_png(const cv::Mat& canvas) {
    std::vector<uchar> buf;
    if (!cv::imencode(".png", canvas, buf)) {
        throw RenderError("PNG encoding failed");
    }
    return ImageBytes(buf.begin(), buf.end());
}

struct Bounds {
    double lo = 0.0;
    double hi = 1.0;
};

Bounds padded_bounds(double lo, double hi) {
    if (lo == hi) {
        const double pad = lo == 0.0 ? 0.5 : std::abs(lo) * 0.05;
        return {lo - pad, hi + pad};
    }
    const double pad = (hi - lo) * 0.05;
    return {lo - pad, hi + pad};
}

// Axes frame shared by line and scatter charts.
class Axes {
public:
    Axes(const PlotOptions& options, const std::vector<double>& x, const std::vector<double>& y)
        : canvas_(std::max(options.height, 120), std::max(options.width, 160), CV_8UC3, kWhite) {
        double xmin = 0.0, xmax = 0.0, ymin = 0.0, ymax = 0.0;
        bool any = false;
        const size_t n = std::min(x.size(), y.size());
        for (size_t i = 0; i < n; ++i) {
            if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
            if (!any) {
                xmin = xmax = x[i];
                ymin = ymax = y[i];
                any = true;
                continue;
            }
            xmin = std::min(xmin, x[i]);
            xmax = std::max(xmax, x[i]);
            ymin = std::min(ymin, y[i]);
            ymax = std::max(ymax, y[i]);
        }
        if (!any) {
            throw RenderError("no finite data points to plot");
        }
        xb_ = padded_bounds(xmin, xmax);
        yb_ = padded_bounds(ymin, ymax);

        plot_ = cv::Rect(kLeft, kTop, canvas_.cols - kLeft - kRight,
                         canvas_.rows - kTop - kBottom);
    }

    cv::Point map(double x, double y) const {
        const double fx = (x - xb_.lo) / (xb_.hi - xb_.lo);
        const double fy = (y - yb_.lo) / (yb_.hi - yb_.lo);
        return cv::Point(plot_.x + static_cast<int>(std::lround(fx * (plot_.width - 1))),
                         plot_.y + plot_.height - 1 -
                             static_cast<int>(std::lround(fy * (plot_.height - 1))));
    }

    void draw_frame(const std::string& x_label, const std::string& y_label) {
        constexpr int kTicks = 5;
        for (int i = 0; i < kTicks; ++i) {
            const double t = static_cast<double>(i) / (kTicks - 1);
            const double xv = xb_.lo + t * (xb_.hi - xb_.lo);
            const double yv = yb_.lo + t * (yb_.hi - yb_.lo);
            const cv::Point px = map(xv, yb_.lo);
            const cv::Point py = map(xb_.lo, yv);

            cv::line(canvas_, cv::Point(px.x, plot_.y), cv::Point(px.x, plot_.br().y - 1), kGrid);
            cv::line(canvas_, cv::Point(plot_.x, py.y), cv::Point(plot_.br().x - 1, py.y), kGrid);

            cv::line(canvas_, cv::Point(px.x, plot_.br().y), cv::Point(px.x, plot_.br().y + 4),
                     kBlack);
            cv::line(canvas_, cv::Point(plot_.x - 4, py.y), cv::Point(plot_.x, py.y), kBlack);

            const std::string xl = tick_label(xv);
            const cv::Size xs = text_size(xl);
            put_text(canvas_, xl, cv::Point(px.x - xs.width / 2, plot_.br().y + 8 + xs.height));

            const std::string yl = tick_label(yv);
            const cv::Size ys = text_size(yl);
            put_text(canvas_, yl, cv::Point(plot_.x - 7 - ys.width, py.y + ys.height / 2));
        }
        cv::rectangle(canvas_, plot_, kBlack, 1);

        const cv::Size xs = text_size(x_label);
        put_text(canvas_, x_label,
                 cv::Point(plot_.x + (plot_.width - xs.width) / 2, canvas_.rows - 10));
        put_vertical_text(canvas_, y_label, cv::Point(12, plot_.y + plot_.height / 2));
    }

    cv::Mat& canvas() { return canvas_; }

private:
    static constexpr int kLeft = 72;
    static constexpr int kRight = 20;
    static constexpr int kTop = 16;
    static constexpr int kBottom = 48;

    cv::Mat canvas_;
    cv::Rect plot_;
    Bounds xb_;
    Bounds yb_;
};

} // namespace

ColorScale color_scale_from_string(const std::string& name) {
    const std::string s = core::to_lower(name);
    if (s == "viridis") return ColorScale::Viridis;
    if (s == "inferno") return ColorScale::Inferno;
    return ColorScale::Gray;
}

PlotOptions plot_options_from(const config::RenderConfig& cfg) {
    PlotOptions o;
    o.width = cfg.plot_width;
    o.height = cfg.plot_height;
    o.max_image_side = cfg.max_image_side;
    o.colorbar = cfg.colorbar;
    o.color_scale = color_scale_from_string(cfg.color_scale);
    o.asinh_a = cfg.asinh_a;
    return o;
}

ImageBytes render_raster(const Matrix2Dd& values, const DisplayRange& range, StretchKind stretch,
                         const PlotOptions& options) {
    if (values.rows() == 0 || values.cols() == 0) {
        throw RenderError("empty sample plane");
    }
    try {
        const Matrix2Dd unit = stretch_plane(values, range, stretch, options.asinh_a);

        cv::Mat gray(static_cast<int>(unit.rows()), static_cast<int>(unit.cols()), CV_8UC1);
        for (int r = 0; r < gray.rows; ++r) {
            uchar* row = gray.ptr<uchar>(r);
            for (int c = 0; c < gray.cols; ++c) {
                row[c] = cv::saturate_cast<uchar>(unit(r, c) * 255.0);
            }
        }
        // Row 0 is the bottom of the picture.
        cv::flip(gray, gray, 0);

        const int longest = std::max(gray.rows, gray.cols);
        if (longest > options.max_image_side) {
            const double s = static_cast<double>(options.max_image_side) / longest;
            cv::Size dst(std::max(1, static_cast<int>(gray.cols * s)),
                         std::max(1, static_cast<int>(gray.rows * s)));
            cv::resize(gray, gray, dst, 0, 0, cv::INTER_AREA);
        } else if (longest < kMinRasterSide) {
            const int f = (kMinRasterSide + longest - 1) / longest;
            cv::resize(gray, gray, cv::Size(gray.cols * f, gray.rows * f), 0, 0,
                       cv::INTER_NEAREST);
        }
        const cv::Mat image = colorize(gray, options.color_scale);

        if (!options.colorbar) {
            return encode_png(image);
        }

        constexpr int pad = 12;
        constexpr int bar_gap = 14;
        constexpr int bar_width = 16;
        const std::string top = tick_label(range.vmax);
        const std::string bottom = tick_label(range.vmin);
        const int label_w = std::max(text_size(top).width, text_size(bottom).width);
        const int label_h = text_size(top).height;
        const int axis_w = label_h + 10;

        const int height = std::max(image.rows, 120) + 2 * pad;
        const int width = pad + image.cols + bar_gap + bar_width + 6 + label_w + 8 + axis_w + pad;
        cv::Mat canvas(height, width, CV_8UC3, kWhite);

        const int img_y = (height - image.rows) / 2;
        image.copyTo(canvas(cv::Rect(pad, img_y, image.cols, image.rows)));

        const int bar_x = pad + image.cols + bar_gap;
        const int bar_h = height - 2 * pad;
        cv::Mat ramp(bar_h, 1, CV_8UC1);
        for (int r = 0; r < bar_h; ++r) {
            const double t = bar_h > 1 ? 1.0 - static_cast<double>(r) / (bar_h - 1) : 1.0;
            ramp.at<uchar>(r, 0) = cv::saturate_cast<uchar>(t * 255.0);
        }
        cv::Mat bar;
        cv::resize(colorize(ramp, options.color_scale), bar, cv::Size(bar_width, bar_h), 0, 0,
                   cv::INTER_NEAREST);
        const cv::Rect bar_rect(bar_x, pad, bar_width, bar_h);
        bar.copyTo(canvas(bar_rect));
        cv::rectangle(canvas, bar_rect, kBlack, 1);

        const int label_x = bar_x + bar_width + 6;
        put_text(canvas, top, cv::Point(label_x, pad + label_h));
        put_text(canvas, bottom, cv::Point(label_x, pad + bar_h));
        put_vertical_text(canvas, "Pixel value",
                          cv::Point(label_x + label_w + 8 + axis_w / 2, pad + bar_h / 2));

        return encode_png(canvas);
    } catch (const cv::Exception& e) {
        throw RenderError(std::string("raster rendering failed: ") + e.what());
    }
}

ImageBytes render_line(const std::vector<double>& x, const std::vector<double>& y,
                       const std::string& x_label, const std::string& y_label,
                       const PlotOptions& options) {
    try {
        Axes axes(options, x, y);
        axes.draw_frame(x_label, y_label);

        // Non-finite points break the line.
        const size_t n = std::min(x.size(), y.size());
        bool have_prev = false;
        cv::Point prev;
        for (size_t i = 0; i < n; ++i) {
            if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
                have_prev = false;
                continue;
            }
            const cv::Point p = axes.map(x[i], y[i]);
            if (have_prev) {
                cv::line(axes.canvas(), prev, p, kSeries, 1, cv::LINE_AA);
            } else {
                cv::circle(axes.canvas(), p, 0, kSeries, -1);
            }
            prev = p;
            have_prev = true;
        }
        return encode_png(axes.canvas());
    } catch (const cv::Exception& e) {
        throw RenderError(std::string("line rendering failed: ") + e.what());
    }
}

ImageBytes render_scatter(const std::vector<double>& x, const std::vector<double>& y,
                          const std::string& x_label, const std::string& y_label,
                          const PlotOptions& options) {
    try {
        Axes axes(options, x, y);
        axes.draw_frame(x_label, y_label);

        const size_t n = std::min(x.size(), y.size());
        for (size_t i = 0; i < n; ++i) {
            if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
            cv::circle(axes.canvas(), axes.map(x[i], y[i]), 2, kSeries, -1, cv::LINE_AA);
        }
        return encode_png(axes.canvas());
    } catch (const cv::Exception& e) {
        throw RenderError(std::string("scatter rendering failed: ") + e.what());
    }
}

} // namespace fits_inspect::render
