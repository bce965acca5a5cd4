#include "fits_inspect/config/configuration.hpp"
#include "fits_inspect/core/errors.hpp"

#include <fstream>

namespace fits_inspect::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }

    try {
        if (node["render"]) {
            auto r = node["render"];
            if (r["max_table_rows"]) cfg.render.max_table_rows = r["max_table_rows"].as<int>();
            if (r["max_image_side"]) cfg.render.max_image_side = r["max_image_side"].as<int>();
            if (r["plot_width"]) cfg.render.plot_width = r["plot_width"].as<int>();
            if (r["plot_height"]) cfg.render.plot_height = r["plot_height"].as<int>();
            if (r["asinh_a"]) cfg.render.asinh_a = r["asinh_a"].as<double>();
            if (r["colorbar"]) cfg.render.colorbar = r["colorbar"].as<bool>();
            if (r["color_scale"]) cfg.render.color_scale = r["color_scale"].as<std::string>();
            if (r["url_prefix"]) cfg.render.url_prefix = r["url_prefix"].as<std::string>();
        }

        if (node["zscale"]) {
            auto z = node["zscale"];
            if (z["n_samples"]) cfg.zscale.n_samples = z["n_samples"].as<int>();
            if (z["contrast"]) cfg.zscale.contrast = z["contrast"].as<double>();
            if (z["max_reject"]) cfg.zscale.max_reject = z["max_reject"].as<double>();
            if (z["min_npixels"]) cfg.zscale.min_npixels = z["min_npixels"].as<int>();
            if (z["krej"]) cfg.zscale.krej = z["krej"].as<double>();
            if (z["max_iterations"]) cfg.zscale.max_iterations = z["max_iterations"].as<int>();
        }

        if (node["range"]) {
            auto rg = node["range"];
            if (rg["percentile_low"]) cfg.range.percentile_low = rg["percentile_low"].as<double>();
            if (rg["percentile_high"]) cfg.range.percentile_high = rg["percentile_high"].as<double>();
        }

        if (node["classify"]) {
            auto c = node["classify"];
            if (c["max_columns"]) cfg.classify.max_columns = c["max_columns"].as<int>();
            if (c["max_unit_keys"]) cfg.classify.max_unit_keys = c["max_unit_keys"].as<int>();
        }

        if (node["logging"]) {
            auto l = node["logging"];
            if (l["events"]) cfg.logging.events = l["events"].as<bool>();
            if (l["verbose"]) cfg.logging.verbose = l["verbose"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["render"]["max_table_rows"] = render.max_table_rows;
    node["render"]["max_image_side"] = render.max_image_side;
    node["render"]["plot_width"] = render.plot_width;
    node["render"]["plot_height"] = render.plot_height;
    node["render"]["asinh_a"] = render.asinh_a;
    node["render"]["colorbar"] = render.colorbar;
    node["render"]["color_scale"] = render.color_scale;
    node["render"]["url_prefix"] = render.url_prefix;

    node["zscale"]["n_samples"] = zscale.n_samples;
    node["zscale"]["contrast"] = zscale.contrast;
    node["zscale"]["max_reject"] = zscale.max_reject;
    node["zscale"]["min_npixels"] = zscale.min_npixels;
    node["zscale"]["krej"] = zscale.krej;
    node["zscale"]["max_iterations"] = zscale.max_iterations;

    node["range"]["percentile_low"] = range.percentile_low;
    node["range"]["percentile_high"] = range.percentile_high;

    node["classify"]["max_columns"] = classify.max_columns;
    node["classify"]["max_unit_keys"] = classify.max_unit_keys;

    node["logging"]["events"] = logging.events;
    node["logging"]["verbose"] = logging.verbose;

    return node;
}

void Config::validate() const {
    if (render.max_table_rows < 1) {
        throw ValidationError("render.max_table_rows must be >= 1");
    }
    if (render.max_image_side < 16) {
        throw ValidationError("render.max_image_side must be >= 16");
    }
    if (render.plot_width < 160 || render.plot_height < 120) {
        throw ValidationError("render.plot_width/plot_height must be at least 160x120");
    }
    if (!(render.asinh_a > 0.0)) {
        throw ValidationError("render.asinh_a must be > 0");
    }
    if (render.color_scale != "gray" && render.color_scale != "viridis" &&
        render.color_scale != "inferno") {
        throw ValidationError("render.color_scale must be 'gray', 'viridis' or 'inferno'");
    }

    if (zscale.n_samples < 1) {
        throw ValidationError("zscale.n_samples must be >= 1");
    }
    if (zscale.max_reject < 0.0 || zscale.max_reject > 1.0) {
        throw ValidationError("zscale.max_reject must be in [0,1]");
    }
    if (zscale.min_npixels < 1) {
        throw ValidationError("zscale.min_npixels must be >= 1");
    }
    if (!(zscale.krej > 0.0)) {
        throw ValidationError("zscale.krej must be > 0");
    }
    if (zscale.max_iterations < 1) {
        throw ValidationError("zscale.max_iterations must be >= 1");
    }

    if (range.percentile_low < 0.0 || range.percentile_high > 100.0 ||
        range.percentile_low >= range.percentile_high) {
        throw ValidationError("range.percentile_low/high must satisfy 0 <= low < high <= 100");
    }

    if (classify.max_columns < 1 || classify.max_columns > 999) {
        throw ValidationError("classify.max_columns must be in [1,999]");
    }
    if (classify.max_unit_keys < 1 || classify.max_unit_keys > 999) {
        throw ValidationError("classify.max_unit_keys must be in [1,999]");
    }
}

} // namespace fits_inspect::config
