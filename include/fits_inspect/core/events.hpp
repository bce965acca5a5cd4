#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace fits_inspect::core {

using json = nlohmann::json;

// JSON-line event log. Events go to the stream handed in; stdout stays
// reserved for the result document.
class EventEmitter {
public:
    EventEmitter() = default;
    explicit EventEmitter(bool enabled) : enabled_(enabled) {}

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, const std::string& status, std::ostream& out);

    void stage_start(const std::string& run_id, Stage stage, std::ostream& out);
    void stage_end(const std::string& run_id, Stage stage, const std::string& status,
                   const json& extra, std::ostream& out);

    void unit_processed(const std::string& run_id, Stage stage, int unit_index,
                        const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);

    bool enabled_ = true;
};

} // namespace fits_inspect::core
