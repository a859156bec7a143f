#include "panel_promote/core/events.hpp"
#include "panel_promote/core/utils.hpp"

namespace panel_promote::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    // Paths and error texts come from the OS and may not be UTF-8.
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

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::panel_processed(const std::string& run_id, const PanelResult& result,
                                   int done, int total, std::ostream& out) {
    json event = base_event("panel_processed", run_id);
    event["phase"] = phase_to_int(Phase::PROCESSING_PANELS);
    event["panel_id"] = result.panel_id;
    event["panel_index"] = result.panel_index;
    event["state"] = panel_state_to_string(result.state);
    event["done"] = done;
    event["total"] = total;
    if (result.succeeded()) {
        event["seed"] = result.seed;
        event["sharpness_score"] = result.sharpness_score;
        event["quality_tier"] = quality_tier_to_string(result.quality_tier);
    } else {
        event["error"] = result.error;
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

} // namespace panel_promote::core
