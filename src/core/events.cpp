#include "tile_weave/core/events.hpp"
#include "tile_weave/core/utils.hpp"

namespace tile_weave::core {

EventEmitter::EventEmitter(std::ostream& out, std::ofstream* log_file)
    : out_(out), log_file_(log_file) {}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    const std::string line = event.dump();

    out_ << line << "\n";
    out_.flush();

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << "\n";
        log_file_->flush();
    }
}

void EventEmitter::run_start(const std::string& run_id, const json& extra) {
    json event = base_event("run_start", run_id);
    if (extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success, const std::string& status) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event);
}

void EventEmitter::run_error(const std::string& run_id, const std::string& error_type,
                             const std::string& message) {
    json event = base_event("run_error", run_id);
    event["error_type"] = error_type;
    event["message"] = message;
    emit(event);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, const json& extra) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    if (extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
    emit(event);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, int current, int total,
                                  const std::string& message) {
    json event = base_event("phase_progress", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<float>(current) / static_cast<float>(total) : 1.0f;
    if (!message.empty()) {
        event["substep"] = message;
    }
    emit(event);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase, const std::string& status,
                             const json& extra) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    if (extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event);
}

} // namespace tile_weave::core
