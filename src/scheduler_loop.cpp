// scheduler_loop.cpp

#include "scheduler_loop.hpp"

#include <chrono>

#include "utils.hpp"

SchedulerLoop::SchedulerLoop(RetryingAttempt& attempt, StatusFile& status_file, Clock& clock,
                             Logger& logger, const CaptureConfig& config, const std::string& output_dir)
    : attempt(attempt), status_file(status_file), clock(clock), logger(logger), config(config),
      output_dir(output_dir) {}

AttemptResult SchedulerLoop::run_cycle() {
    status_file.write("capturing", cycle_status, clock.now());

    // record start time
    Clock::time_point cycle_start = clock.now();

    AttemptResult result = attempt.run_once(config, output_dir);

    Clock::time_point cycle_end = clock.now();
    std::chrono::duration<double> elapsed = cycle_end - cycle_start;

    ++cycle_status.cycles;
    if (result.success) {
        ++cycle_status.successes;
        cycle_status.last_artifact = result.artifact_path;
        cycle_status.last_error.clear();
    } else {
        ++cycle_status.failures;
        cycle_status.last_error = result.error;
        logger.error("All screenshot attempts failed: " + result.error);
    }
    cycle_status.last_success = result.success;
    cycle_status.last_attempts = result.attempts;
    cycle_status.last_cycle_duration_ms = elapsed.count() * 1000.0;
    cycle_status.last_cycle_epoch =
        std::chrono::duration_cast<std::chrono::seconds>(cycle_end.time_since_epoch()).count();

    logger.info("Cycle " + std::to_string(cycle_status.cycles) + " finished in " +
                format_duration(elapsed.count()) + " (" + std::to_string(cycle_status.successes) +
                " ok, " + std::to_string(cycle_status.failures) + " failed so far)");

    status_file.write("sleeping", cycle_status, clock.now());
    return result;
}

void SchedulerLoop::run() {
    logger.info("Starting screenshot service...");
    for (;;) {
        run_cycle();

        long minutes = std::chrono::duration_cast<std::chrono::minutes>(config.interval).count();
        logger.info("Waiting " + std::to_string(minutes) + " minutes before next update...");
        clock.sleep_for(std::chrono::duration_cast<std::chrono::milliseconds>(config.interval));
    }
}
