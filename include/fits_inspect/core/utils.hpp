#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fits_inspect::core {

namespace fs = std::filesystem;

// Time / identifier utilities
std::string get_iso_timestamp();
std::string get_run_id();
std::string random_hex_id(int length = 8);

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_bytes(const fs::path& path, const std::vector<uint8_t>& data);
void write_text(const fs::path& path, const std::string& text);

// Math utilities
double percentile_of(std::vector<double> values, double percentile);
double median_of(std::vector<double> values);
std::string format_double(double value);

// Product of axis extents; nullopt on a negative extent or int64 overflow.
std::optional<int64_t> checked_product(const std::vector<int64_t>& extents);

// Evenly spaced, strictly increasing indices into [0, count) capped at
// max_samples; the first and last index are always kept.
std::vector<size_t> uniform_indices(size_t count, size_t max_samples);

// String utilities
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
bool contains(const std::string& haystack, const std::string& needle);

} // namespace fits_inspect::core
