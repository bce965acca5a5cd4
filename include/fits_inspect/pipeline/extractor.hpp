#pragma once

#include "fits_inspect/config/configuration.hpp"
#include "fits_inspect/core/result.hpp"
#include "fits_inspect/core/types.hpp"
#include "fits_inspect/io/fits_io.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fits_inspect::pipeline {

// Total conversion of a raw header value; never fails. Values with no plain
// scalar form come back as OpaqueValue holding the raw text.
HeaderValue to_header_value(const std::string& raw, char type_code);

// Drops commentary (COMMENT, HISTORY, CONTINUE, END), blank keys and cards
// without a value; converts the rest.
Header clean_header(const std::vector<io::HeaderRecord>& records);

UnitMap collect_units(const Header& header, int max_index = 99);

// Declared geometry from NAXIS / NAXISn; empty when undetermined.
std::vector<int64_t> shape_from_header(const Header& header);

std::string dtype_from_bitpix(int bitpix);

std::optional<ImageStats> compute_image_stats(const std::vector<double>& samples);

// Summary of the currently selected unit. Never throws.
Result<UnitSummary> extract_unit(io::FitsFile& file, int index,
                                 const config::ClassifyConfig& limits);

// Walks every unit of the file. Units that fail are skipped; only a file
// that cannot be opened or iterated yields a Structural failure.
Result<std::vector<UnitSummary>> extract(const fs::path& path,
                                         const config::ClassifyConfig& limits = {});

} // namespace fits_inspect::pipeline
