// scheduler_loop.hpp

#pragma once

#include <string>

#include "clock.hpp"
#include "logger.hpp"
#include "retrying_attempt.hpp"
#include "settings.hpp"
#include "status_file.hpp"

class SchedulerLoop {
public:
    SchedulerLoop(RetryingAttempt& attempt, StatusFile& status_file, Clock& clock, Logger& logger,
                  const CaptureConfig& config, const std::string& output_dir);

    // One full cycle: every retry of one capture, then the status update.
    // Does not sleep afterwards.
    AttemptResult run_cycle();

    // Cycles forever, sleeping config.interval after each one whatever its
    // outcome. Only process termination stops it.
    void run();

    const CycleStatus& status() const { return cycle_status; }

private:
    RetryingAttempt& attempt;
    StatusFile& status_file;
    Clock& clock;
    Logger& logger;
    CaptureConfig config;
    std::string output_dir;
    CycleStatus cycle_status;
};
