#pragma once

#include <string>
#include <vector>

namespace fits_inspect::pipeline {

// Name families a table column can belong to. One name may match several.
enum class ColumnRole {
    Time,
    Flux,
    Wavelength
};

// Lower-case with underscores and whitespace removed: "Flux_Err" -> "fluxerr".
std::string normalize_column_name(const std::string& name);

// Vocabulary test shared by classification and column selection.
// Time matches exact words only; Flux and Wavelength also match substrings.
bool has_role(const std::string& name, ColumnRole role);

bool any_has_role(const std::vector<std::string>& names, ColumnRole role);

} // namespace fits_inspect::pipeline
