#include "fits_inspect/pipeline/extractor.hpp"
#include "fits_inspect/core/errors.hpp"
#include "fits_inspect/core/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <utility>

namespace fits_inspect::pipeline {

namespace {

std::string unquote(const std::string& raw) {
    std::string s = core::trim(raw);
    if (s.size() >= 2 && s.front() == '\'' && s.back() == '\'') {
        s = s.substr(1, s.size() - 2);
    }
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        out.push_back(s[i]);
        if (s[i] == '\'' && i + 1 < s.size() && s[i + 1] == '\'') ++i;
    }
    // Trailing blanks inside FITS strings are not significant.
    out.erase(out.find_last_not_of(' ') + 1);
    return out;
}

bool is_commentary_key(const std::string& key) {
    return key.empty() || key == "COMMENT" || key == "HISTORY" ||
           key == "CONTINUE" || key == "END";
}

std::optional<int64_t> header_int(const Header& header, const std::string& key) {
    auto it = header.find(key);
    if (it == header.end()) return std::nullopt;
    if (auto v = std::get_if<int64_t>(&it->second)) return *v;
    if (auto d = std::get_if<double>(&it->second)) {
        if (std::isfinite(*d)) return static_cast<int64_t>(*d);
    }
    return std::nullopt;
}

} // namespace

HeaderValue to_header_value(const std::string& raw, char type_code) {
    const std::string text = core::trim(raw);
    switch (type_code) {
        case 'C':
            return unquote(raw);
        case 'L':
            return text == "T";
        case 'I': {
            errno = 0;
            char* end = nullptr;
            long long v = std::strtoll(text.c_str(), &end, 10);
            if (errno == 0 && end && *end == '\0' && !text.empty()) {
                return static_cast<int64_t>(v);
            }
            return OpaqueValue{text};
        }
        case 'F': {
            std::string fixed = text;
            std::replace(fixed.begin(), fixed.end(), 'D', 'E');
            std::replace(fixed.begin(), fixed.end(), 'd', 'e');
            errno = 0;
            char* end = nullptr;
            double v = std::strtod(fixed.c_str(), &end);
            if (errno == 0 && end && *end == '\0' && !fixed.empty()) {
                return v;
            }
            return OpaqueValue{text};
        }
        default:
            return OpaqueValue{text};
    }
}

Header clean_header(const std::vector<io::HeaderRecord>& records) {
    Header out;
    for (const auto& rec : records) {
        const std::string key = core::trim(rec.key);
        if (is_commentary_key(key)) continue;
        if (rec.type_code == '\0') continue;
        out[key] = to_header_value(rec.value, rec.type_code);
    }
    return out;
}

UnitMap collect_units(const Header& header, int max_index) {
    UnitMap units;
    auto copy_key = [&](const std::string& key) {
        auto it = header.find(key);
        if (it != header.end()) {
            units[key] = core::trim(header_value_to_string(it->second));
        }
    };
    copy_key("BUNIT");
    for (int i = 1; i <= max_index; ++i) {
        copy_key("TUNIT" + std::to_string(i));
        copy_key("CUNIT" + std::to_string(i));
    }
    return units;
}

std::vector<int64_t> shape_from_header(const Header& header) {
    auto naxis = header_int(header, "NAXIS");
    if (!naxis || *naxis <= 0) return {};
    std::vector<int64_t> shape;
    shape.reserve(static_cast<size_t>(*naxis));
    for (int64_t i = 1; i <= *naxis; ++i) {
        shape.push_back(header_int(header, "NAXIS" + std::to_string(i)).value_or(0));
    }
    return shape;
}

std::string dtype_from_bitpix(int bitpix) {
    switch (bitpix) {
        case 8: return "uint8";
        case 16: return "int16";
        case 32: return "int32";
        case 64: return "int64";
        case -32: return "float32";
        case -64: return "float64";
        default: return "unknown";
    }
}

std::optional<ImageStats> compute_image_stats(const std::vector<double>& samples) {
    if (samples.empty()) return std::nullopt;

    size_t n_finite = 0;
    double vmin = std::numeric_limits<double>::infinity();
    double vmax = -std::numeric_limits<double>::infinity();
    for (double v : samples) {
        if (!std::isfinite(v)) continue;
        ++n_finite;
        if (v < vmin) vmin = v;
        if (v > vmax) vmax = v;
    }

    ImageStats stats;
    stats.nan_fraction = 1.0 - static_cast<double>(n_finite) / static_cast<double>(samples.size());
    if (n_finite == 0) {
        stats.is_uniform = true;
        return stats;
    }
    stats.min_value = vmin;
    stats.max_value = vmax;
    stats.is_uniform = (vmin == vmax);
    return stats;
}

Result<UnitSummary> extract_unit(io::FitsFile& file, int index,
                                 const config::ClassifyConfig& limits) {
    try {
        file.select(index);

        UnitSummary s;
        s.index = index;
        s.kind = file.kind();
        s.kind_name = file.kind_name();
        s.header = clean_header(file.header_records());
        s.units = collect_units(s.header, limits.max_unit_keys);

        if (s.kind == UnitKind::Image) {
            // Declared geometry only; ZNAXIS for tile-compressed images.
            s.shape = file.image_shape();
            s.bitpix = file.image_bitpix();
            s.dtype_name = dtype_from_bitpix(*s.bitpix);
        } else {
            s.shape = shape_from_header(s.header);
            s.dtype_name = s.kind == UnitKind::Table ? "table" : "unknown";
        }

        const std::optional<int64_t> n_samples =
            s.shape.empty() ? std::optional<int64_t>(0) : core::checked_product(s.shape);

        // Declared sizes that overflow or cannot be read back leave the unit
        // without stats.
        if (s.kind == UnitKind::Image && s.shape.size() >= 2 && n_samples.value_or(1) > 0) {
            std::vector<double> samples;
            try {
                samples = file.read_samples();
            } catch (const std::exception&) {
                samples.clear();
            }
            if (!samples.empty()) {
                s.has_numeric_data = true;
                s.stats = compute_image_stats(samples);
            }
        }
        return Result<UnitSummary>(std::move(s));
    } catch (const std::exception& e) {
        return Result<UnitSummary>::fail(ErrorKind::Unit, e.what());
    }
}

Result<std::vector<UnitSummary>> extract(const fs::path& path,
                                         const config::ClassifyConfig& limits) {
    using R = Result<std::vector<UnitSummary>>;
    try {
        io::FitsFile file(path);

        int nunits = 0;
        try {
            nunits = file.unit_count();
        } catch (const FitsError& e) {
            return R::fail(ErrorKind::Structural,
                           std::string("Failed to iterate HDUs: ") + e.what());
        }

        std::vector<UnitSummary> summaries;
        summaries.reserve(static_cast<size_t>(nunits));
        for (int i = 0; i < nunits; ++i) {
            auto unit = extract_unit(file, i, limits);
            if (unit) {
                summaries.push_back(unit.take());
            }
        }
        return R(std::move(summaries));
    } catch (const std::exception& e) {
        return R::fail(ErrorKind::Structural, e.what());
    }
}

} // namespace fits_inspect::pipeline
