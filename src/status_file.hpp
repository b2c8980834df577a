// status_file.hpp

#pragma once

#include <chrono>
#include <string>

#include "logger.hpp"

// Running totals kept across cycles for metrics scraping.
struct CycleStatus {
    long cycles = 0;
    long successes = 0;
    long failures = 0;
    int last_attempts = 0;
    bool last_success = false;
    std::string last_artifact;
    std::string last_error;
    double last_cycle_duration_ms = 0;
    long last_cycle_epoch = 0;
};

// JSON snapshot rewritten after every state change. An empty path disables it.
class StatusFile {
public:
    StatusFile(const std::string& path, Logger& logger);

    void write(const std::string& state, const CycleStatus& status,
               std::chrono::system_clock::time_point now);

    const std::string& path() const { return file_path; }

private:
    std::string file_path;
    Logger& logger;
};
