#include "fits_inspect/core/events.hpp"
#include "fits_inspect/core/utils.hpp"

namespace fits_inspect::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    if (!enabled_) return;
    out << event.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, const std::string& status,
                           std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::stage_start(const std::string& run_id, Stage stage, std::ostream& out) {
    json event = base_event("stage_start", run_id);
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    emit(event, out);
}

void EventEmitter::stage_end(const std::string& run_id, Stage stage,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("stage_end", run_id);
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::unit_processed(const std::string& run_id, Stage stage, int unit_index,
                                  const json& extra, std::ostream& out) {
    json event = base_event("unit_processed", run_id);
    event["stage"] = stage_to_int(stage);
    event["unit_index"] = unit_index;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace fits_inspect::core
