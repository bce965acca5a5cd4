#include "fits_inspect/io/result_json.hpp"

#include <type_traits>
#include <variant>

namespace fits_inspect {

json header_value_to_json(const HeaderValue& value) {
    return std::visit(
        [](const auto& v) -> json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, OpaqueValue>) {
                return v.text;
            } else {
                return v;
            }
        },
        value);
}

json header_to_json(const Header& header) {
    json j = json::object();
    for (const auto& [key, value] : header) {
        j[key] = header_value_to_json(value);
    }
    return j;
}

void to_json(json& j, const UnitSummary& s) {
    j = json{
        {"hdu_index", s.index},
        {"hdu_type", s.kind_name},
        {"header", header_to_json(s.header)},
        {"data_shape", s.shape},
        {"data_dtype", s.dtype_name},
        {"units", s.units},
        {"has_numeric_data", s.has_numeric_data}
    };
    if (s.stats) {
        j["min_value"] = s.stats->min_value ? json(*s.stats->min_value) : json(nullptr);
        j["max_value"] = s.stats->max_value ? json(*s.stats->max_value) : json(nullptr);
        j["nan_fraction"] = s.stats->nan_fraction;
        j["is_uniform"] = s.stats->is_uniform;
    }
}

void to_json(json& j, const Analysis& a) {
    to_json(j, static_cast<const UnitSummary&>(a));
    j["classification"] = classification_to_string(a.classification);
    j["column_names"] = a.column_names;
    j["axis_meaning"] = a.axis_meaning;
}

void to_json(json& j, const UnitRecord& r) {
    j = json{
        {"index", r.index},
        {"type", r.kind_name},
        {"classification", classification_to_string(r.classification)},
        {"previewImage", r.preview_url ? json(*r.preview_url) : json(nullptr)},
        {"metadata", header_to_json(r.metadata)},
        {"units", r.units}
    };
}

void to_json(json& j, const PipelineResult& r) {
    json hdus = json::array();
    for (const auto& u : r.units) {
        hdus.push_back(u);
    }
    j = json{
        {"status", pipeline_status_to_string(r.status)},
        {"fileName", r.file_name},
        {"hdus", hdus},
        {"warnings", r.warnings},
        {"error", r.error ? json(*r.error) : json(nullptr)}
    };
    if (r.message) {
        j["message"] = *r.message;
    }
}

std::string dump_document(const json& j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

PipelineResult usage_error(const std::string& usage) {
    PipelineResult r;
    r.status = PipelineStatus::Error;
    r.error = usage;
    return r;
}

} // namespace fits_inspect
