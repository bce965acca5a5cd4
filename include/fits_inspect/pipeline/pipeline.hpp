#pragma once

#include "fits_inspect/config/configuration.hpp"
#include "fits_inspect/core/types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace fits_inspect::pipeline {

extern const char* const kNoPlottableMessage;
extern const char* const kNoNumericDataMessage;

// What the orchestrator does with the stage outputs before rendering.
enum class Gate {
    Proceed,
    NoPlottable,    // valid_no_visualizable_data
    NoNumericData   // error
};

// Zero decodable units give NoPlottable; units without numeric image data
// anywhere give NoNumericData.
Gate gate_summaries(const std::vector<UnitSummary>& summaries);

// NoPlottable when every unit classified as unknown.
Gate gate_analyses(const std::vector<Analysis>& analyses);

struct RunOptions {
    config::Config config;
    // Pinned preview identifier; a random 8-hex id is drawn when empty.
    std::optional<std::string> file_id;
    // Event log sink; nullptr disables logging.
    std::ostream* log = nullptr;
};

// Extract, classify and render one file. Never throws: every failure ends
// up in the returned status, error and warnings.
PipelineResult run(const fs::path& fits_path, const fs::path& previews_dir,
                   const std::optional<std::string>& display_name = std::nullopt,
                   const RunOptions& options = {});

} // namespace fits_inspect::pipeline
