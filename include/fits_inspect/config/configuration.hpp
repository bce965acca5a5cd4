#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace fits_inspect::config {

namespace fs = std::filesystem;

struct RenderConfig {
  int max_table_rows = 50000;
  int max_image_side = 1024;
  int plot_width = 600;
  int plot_height = 400;
  double asinh_a = 0.1;
  bool colorbar = true;
  std::string color_scale = "gray"; // gray | viridis | inferno
  std::string url_prefix = "/previews";
};

// IRAF / astropy ZScaleInterval defaults
struct ZScaleConfig {
  int n_samples = 1000;
  double contrast = 0.25;
  double max_reject = 0.5;
  int min_npixels = 5;
  double krej = 2.5;
  int max_iterations = 5;
};

struct RangeConfig {
  double percentile_low = 1.0;
  double percentile_high = 99.0;
};

struct ClassifyConfig {
  int max_columns = 999;  // TTYPEn scan limit
  int max_unit_keys = 99; // TUNITn / CUNITn scan limit
};

struct LoggingConfig {
  bool events = true;
  bool verbose = false;
};

struct Config {
  RenderConfig render;
  ZScaleConfig zscale;
  RangeConfig range;
  ClassifyConfig classify;
  LoggingConfig logging;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace fits_inspect::config
