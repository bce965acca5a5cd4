#include "fits_inspect/core/utils.hpp"
#include "fits_inspect/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>

namespace fits_inspect::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_' << random_hex_id(8);
    return oss.str();
}

std::string random_hex_id(int length) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<size_t>(std::max(length, 0)));
    for (int i = 0; i < length; ++i) {
        out.push_back(hex[dis(gen)]);
    }
    return out;
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

void write_bytes(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

double percentile_of(std::vector<double> values, double percentile) {
    // NaN samples are ignored; infinities take part in the ordering.
    values.erase(std::remove_if(values.begin(), values.end(),
                                [](double v) { return std::isnan(v); }),
                 values.end());
    if (values.empty()) return std::numeric_limits<double>::quiet_NaN();

    std::sort(values.begin(), values.end());
    const double clamped = std::min(std::max(percentile, 0.0), 100.0);
    const double idx = clamped / 100.0 * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(idx);
    const size_t upper = std::min(lower + 1, values.size() - 1);
    const double frac = idx - static_cast<double>(lower);
    if (frac == 0.0) return values[lower];
    return values[lower] + (values[upper] - values[lower]) * frac;
}

double median_of(std::vector<double> values) {
    if (values.empty()) return 0.0;
    const size_t n = values.size();
    const size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
    const double hi = values[mid];
    if ((n % 2) == 1) return hi;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid - 1), values.end());
    const double lo = values[mid - 1];
    return 0.5 * (lo + hi);
}

std::string format_double(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    // Shortest representation that reads back to the same double.
    char buf[64];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) break;
    }
    return buf;
}

std::optional<int64_t> checked_product(const std::vector<int64_t>& extents) {
    int64_t total = 1;
    for (int64_t n : extents) {
        if (n < 0) return std::nullopt;
        if (n != 0 && total > std::numeric_limits<int64_t>::max() / n) return std::nullopt;
        total *= n;
    }
    return total;
}

std::vector<size_t> uniform_indices(size_t count, size_t max_samples) {
    std::vector<size_t> out;
    if (count == 0 || max_samples == 0) return out;
    if (count <= max_samples) {
        out.resize(count);
        for (size_t i = 0; i < count; ++i) out[i] = i;
        return out;
    }
    if (max_samples == 1) {
        out.push_back(0);
        return out;
    }
    out.reserve(max_samples);
    const uint64_t span = static_cast<uint64_t>(count - 1);
    const uint64_t steps = static_cast<uint64_t>(max_samples - 1);
    for (uint64_t i = 0; i <= steps; ++i) {
        size_t idx = static_cast<size_t>((i * span) / steps);
        if (out.empty() || out.back() != idx) {
            out.push_back(idx);
        }
    }
    return out;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace fits_inspect::core
