#include "fits_inspect/pipeline/classifier.hpp"
#include "fits_inspect/pipeline/column_roles.hpp"
#include "fits_inspect/core/errors.hpp"
#include "fits_inspect/core/utils.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace fits_inspect::pipeline {

TableColumns read_table_columns(const io::FitsFile& file, const config::ClassifyConfig& limits) {
    TableColumns cols;
    for (int i = 1; i <= limits.max_columns; ++i) {
        auto name = file.read_string_key("TTYPE" + std::to_string(i));
        if (!name) break;
        cols.names.push_back(core::trim(*name));
    }

    for (size_t i = 0; i < cols.names.size(); ++i) {
        const std::string& name = cols.names[i];
        if (name.empty()) continue;
        auto unit = file.read_string_key("TUNIT" + std::to_string(i + 1));
        if (unit) {
            cols.units[name] = core::trim(*unit);
        }
    }
    if (auto bunit = file.read_string_key("BUNIT")) {
        cols.units["BUNIT"] = core::trim(*bunit);
    }
    return cols;
}

Classification classify_columns(const std::vector<std::string>& columns) {
    if (columns.empty()) {
        return Classification::Table;
    }
    const bool flux = any_has_role(columns, ColumnRole::Flux);
    if (flux && any_has_role(columns, ColumnRole::Time)) {
        return Classification::LightCurve;
    }
    if (flux && any_has_role(columns, ColumnRole::Wavelength)) {
        return Classification::Spectrum;
    }
    return Classification::Table;
}

bool header_suggests_error_map(const Header& header) {
    std::string marker;
    for (const char* key : {"DATATYPE", "HDUCLAS1", "EXTNAME"}) {
        auto it = header.find(key);
        if (it == header.end()) continue;
        marker = header_value_to_string(it->second);
        if (!marker.empty()) break;
    }
    const std::string s = core::to_lower(marker);
    return core::contains(s, "error") || core::contains(s, "uncertainty");
}

bool suggests_low_contrast(const UnitSummary& summary) {
    if (!summary.bitpix || *summary.bitpix >= 0) return false;
    return summary.stats.has_value() && summary.stats->is_uniform;
}

std::map<std::string, std::string> axis_meaning(const Header& header) {
    std::map<std::string, std::string> out;
    for (const auto& [key, value] : header) {
        if (!core::starts_with(key, "CTYPE")) continue;
        if (auto s = std::get_if<std::string>(&value)) {
            out[key] = core::trim(*s);
        }
    }
    return out;
}

Analysis degraded_analysis(const UnitSummary& summary) {
    Analysis a;
    static_cast<UnitSummary&>(a) = summary;
    a.classification = Classification::Unknown;
    a.column_names.clear();
    a.units.clear();
    a.axis_meaning.clear();
    return a;
}

Result<Analysis> classify_unit(const UnitSummary& summary, io::FitsFile* table_source,
                               const config::ClassifyConfig& limits) {
    try {
        Analysis a;
        static_cast<UnitSummary&>(a) = summary;
        a.axis_meaning = axis_meaning(summary.header);

        switch (summary.kind) {
            case UnitKind::Image: {
                const size_t ndim = summary.shape.size();
                if (ndim >= 2) {
                    if (header_suggests_error_map(summary.header)) {
                        a.classification = Classification::ErrorMap;
                    } else if (suggests_low_contrast(summary)) {
                        a.classification = Classification::LowContrastImage;
                    } else {
                        a.classification = Classification::Image;
                    }
                } else if (ndim == 1) {
                    a.classification = Classification::Image;
                } else {
                    a.classification = Classification::Unknown;
                }
                break;
            }
            case UnitKind::Table: {
                if (!table_source) {
                    throw FitsError("File could not be reopened for column names");
                }
                if (summary.index < table_source->unit_count()) {
                    table_source->select(summary.index);
                    TableColumns cols = read_table_columns(*table_source, limits);
                    a.column_names = std::move(cols.names);
                    a.units = std::move(cols.units);
                }
                a.classification = classify_columns(a.column_names);
                break;
            }
            default:
                a.classification = Classification::Unknown;
                break;
        }
        return Result<Analysis>(std::move(a));
    } catch (const std::exception& e) {
        return Result<Analysis>::fail(ErrorKind::Unit, e.what());
    }
}

std::vector<Analysis> classify(const fs::path& path, const std::vector<UnitSummary>& summaries,
                               const config::ClassifyConfig& limits) {
    std::vector<Analysis> out;
    out.reserve(summaries.size());

    // Reopened lazily, only for table units.
    std::unique_ptr<io::FitsFile> table_source;
    bool reopen_attempted = false;

    for (const auto& s : summaries) {
        if (s.kind == UnitKind::Table && !reopen_attempted) {
            reopen_attempted = true;
            try {
                table_source = std::make_unique<io::FitsFile>(path);
            } catch (const FitsError&) {
                table_source.reset();
            }
        }

        auto analysis = classify_unit(s, table_source.get(), limits);
        out.push_back(analysis ? analysis.take() : degraded_analysis(s));
    }
    return out;
}

} // namespace fits_inspect::pipeline
