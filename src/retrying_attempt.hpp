// retrying_attempt.hpp

#pragma once

#include <chrono>
#include <string>

#include "background_applier.hpp"
#include "clock.hpp"
#include "logger.hpp"
#include "screenshot_source.hpp"
#include "settings.hpp"

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds retry_delay = std::chrono::seconds(30);
};

// One try inside a cycle; logged and then dropped.
struct CaptureAttempt {
    Clock::time_point timestamp;
    int number = 0;
    bool success = false;
    std::string artifact_path;
    std::string error;
};

struct AttemptResult {
    bool success = false;
    int attempts = 0;
    std::string artifact_path;
    std::string error;
};

// capture -> persist -> apply, retried with a fixed backoff.
class RetryingAttempt {
public:
    RetryingAttempt(ScreenshotSource& source, BackgroundApplier& applier, Clock& clock,
                    Logger& logger, const RetryPolicy& policy);

    AttemptResult run_once(const CaptureConfig& config, const std::string& output_dir);

private:
    CaptureAttempt try_once(const CaptureConfig& config, const std::string& output_dir, int number);

    ScreenshotSource& source;
    BackgroundApplier& applier;
    Clock& clock;
    Logger& logger;
    RetryPolicy policy;
};
