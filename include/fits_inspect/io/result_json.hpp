#pragma once

#include "fits_inspect/core/types.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fits_inspect {

using json = nlohmann::json;

json header_value_to_json(const HeaderValue& value);
json header_to_json(const Header& header);

void to_json(json& j, const UnitSummary& s);
void to_json(json& j, const Analysis& a);
void to_json(json& j, const UnitRecord& r);
void to_json(json& j, const PipelineResult& r);

// Pretty-printed document text. Invalid UTF-8 in names or header strings is
// replaced with U+FFFD rather than aborting the dump.
std::string dump_document(const json& j);

// Error document for bad command-line usage.
PipelineResult usage_error(const std::string& usage);

} // namespace fits_inspect
