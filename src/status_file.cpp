// status_file.cpp

#include "status_file.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

StatusFile::StatusFile(const std::string& path, Logger& logger) : file_path(path), logger(logger) {}

void StatusFile::write(const std::string& state, const CycleStatus& status,
                       std::chrono::system_clock::time_point now) {
    if (file_path.empty()) {
        return;
    }

    nlohmann::json j;
    j["status"] = state;
    j["cycles"] = status.cycles;
    j["successes"] = status.successes;
    j["failures"] = status.failures;
    j["last_attempts"] = status.last_attempts;
    j["last_success"] = status.last_success;
    j["last_artifact"] = status.last_artifact;
    j["last_error"] = status.last_error;
    j["last_cycle_duration_ms"] = status.last_cycle_duration_ms;
    j["last_cycle_timestamp"] = status.last_cycle_epoch;
    j["updated_at"] = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    // Error text and paths are raw bytes from the OS; invalid UTF-8 becomes U+FFFD
    std::string text;
    try {
        text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        logger.warning("Could not serialize status: " + std::string(e.what()));
        return;
    }

    std::ofstream f(file_path);
    if (!f.is_open()) {
        logger.warning("Could not write status file " + file_path);
        return;
    }
    f << text << "\n";
}
