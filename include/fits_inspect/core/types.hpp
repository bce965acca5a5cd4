#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fits_inspect {

namespace fs = std::filesystem;

// Sample plane types
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Unit (HDU) kind as reported by the container reader
enum class UnitKind {
    Image,
    Table,
    Other
};

// Semantic category assigned by the classifier
enum class Classification {
    Image,
    ErrorMap,
    LowContrastImage,
    Spectrum,
    LightCurve,
    Table,
    Unknown
};

inline std::string classification_to_string(Classification c) {
    switch (c) {
        case Classification::Image: return "image";
        case Classification::ErrorMap: return "error_map";
        case Classification::LowContrastImage: return "low_contrast_image";
        case Classification::Spectrum: return "spectrum";
        case Classification::LightCurve: return "light_curve";
        case Classification::Table: return "table";
        default: return "unknown";
    }
}

inline bool is_image_like(Classification c) {
    return c == Classification::Image || c == Classification::ErrorMap ||
           c == Classification::LowContrastImage;
}

inline bool is_plottable(Classification c) {
    return c != Classification::Unknown;
}

// Header card value that had no plain scalar form (e.g. complex)
struct OpaqueValue {
    std::string text;
};

inline bool operator==(const OpaqueValue& a, const OpaqueValue& b) {
    return a.text == b.text;
}

using HeaderValue = std::variant<std::string, int64_t, double, bool, OpaqueValue>;
using Header = std::map<std::string, HeaderValue>;
using UnitMap = std::map<std::string, std::string>;

std::string header_value_to_string(const HeaderValue& value);

// Quick statistics over a numeric image unit
struct ImageStats {
    std::optional<double> min_value;  // null when no finite samples
    std::optional<double> max_value;
    double nan_fraction = 0.0;
    bool is_uniform = true;           // true for zero finite samples
};

// Structural summary of one unit, produced by the extractor
struct UnitSummary {
    int index = 0;
    UnitKind kind = UnitKind::Other;
    std::string kind_name = "Unknown";
    Header header;
    std::vector<int64_t> shape;
    std::string dtype_name = "unknown";
    std::optional<int> bitpix;
    UnitMap units;
    bool has_numeric_data = false;
    std::optional<ImageStats> stats;
};

// Summary plus classification, produced by the classifier
struct Analysis : UnitSummary {
    Classification classification = Classification::Unknown;
    std::vector<std::string> column_names;
    std::map<std::string, std::string> axis_meaning;
};

enum class PipelineStatus {
    Success,
    ValidNoVisualizableData,
    Error
};

inline std::string pipeline_status_to_string(PipelineStatus s) {
    switch (s) {
        case PipelineStatus::Success: return "success";
        case PipelineStatus::ValidNoVisualizableData: return "valid_no_visualizable_data";
        default: return "error";
    }
}

// Final per-unit record
struct UnitRecord {
    int index = 0;
    std::string kind_name;
    Classification classification = Classification::Unknown;
    std::optional<std::string> preview_url;
    Header metadata;
    UnitMap units;
};

struct PipelineResult {
    PipelineStatus status = PipelineStatus::Error;
    std::string file_name;
    std::vector<UnitRecord> units;
    std::vector<std::string> warnings;
    std::optional<std::string> error;   // set iff status == Error
    std::optional<std::string> message;
};

// Pipeline stage enumeration (event log)
enum class Stage {
    EXTRACT = 0,
    CLASSIFY = 1,
    RENDER = 2,
    DONE = 3
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::EXTRACT: return "EXTRACT";
        case Stage::CLASSIFY: return "CLASSIFY";
        case Stage::RENDER: return "RENDER";
        case Stage::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace fits_inspect
