#pragma once

#include "fits_inspect/config/configuration.hpp"
#include "fits_inspect/core/result.hpp"
#include "fits_inspect/core/types.hpp"
#include "fits_inspect/io/fits_io.hpp"

#include <map>
#include <string>
#include <vector>

namespace fits_inspect::pipeline {

// Column roster of a table unit, read from TTYPEn / TUNITn only.
struct TableColumns {
    std::vector<std::string> names;
    UnitMap units;  // column name -> TUNITn, plus BUNIT
};

TableColumns read_table_columns(const io::FitsFile& file, const config::ClassifyConfig& limits);

Classification classify_columns(const std::vector<std::string>& columns);

bool header_suggests_error_map(const Header& header);
bool suggests_low_contrast(const UnitSummary& summary);

std::map<std::string, std::string> axis_meaning(const Header& header);

// Unknown classification with empty roster, units and axis meaning.
Analysis degraded_analysis(const UnitSummary& summary);

// table_source is the already-open file used for table units; it may be
// null when the file could not be reopened. Never throws.
Result<Analysis> classify_unit(const UnitSummary& summary, io::FitsFile* table_source,
                               const config::ClassifyConfig& limits);

// Classifies every summary in order; failures degrade to Unknown.
std::vector<Analysis> classify(const fs::path& path, const std::vector<UnitSummary>& summaries,
                               const config::ClassifyConfig& limits = {});

} // namespace fits_inspect::pipeline
