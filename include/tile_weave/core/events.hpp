#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <ostream>
#include <string>

namespace tile_weave::core {

using json = nlohmann::json;

/**
 * Event emission for CLI runs.
 * Emits one JSON object per line to the given stream and an optional log file.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out, std::ofstream* log_file = nullptr);

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const std::string& status);
    void run_error(const std::string& run_id, const std::string& error_type,
                   const std::string& message);

    void phase_start(const std::string& run_id, Phase phase, const json& extra = json::object());
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        const std::string& message = "");
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra = json::object());

    void warning(const std::string& run_id, const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream& out_;
    std::ofstream* log_file_;
};

} // namespace tile_weave::core
