// retrying_attempt.cpp

#include "retrying_attempt.hpp"

#include <exception>
#include <vector>

#include "artifact_store.hpp"

RetryingAttempt::RetryingAttempt(ScreenshotSource& source, BackgroundApplier& applier, Clock& clock,
                                 Logger& logger, const RetryPolicy& policy)
    : source(source), applier(applier), clock(clock), logger(logger), policy(policy) {}

CaptureAttempt RetryingAttempt::try_once(const CaptureConfig& config, const std::string& output_dir,
                                         int number) {
    CaptureAttempt attempt;
    attempt.timestamp = clock.now();
    attempt.number = number;

    try {
        std::vector<unsigned char> image = source.capture(config);

        // Name from the time the image exists, not when the attempt began
        attempt.artifact_path = artifact_path(output_dir, clock.now());
        write_artifact(attempt.artifact_path, image);
        logger.info("Saved screenshot to " + attempt.artifact_path);

        applier.apply(attempt.artifact_path);
        attempt.success = true;
    } catch (const std::exception& e) {
        attempt.error = e.what();
    }
    return attempt;
}

AttemptResult RetryingAttempt::run_once(const CaptureConfig& config, const std::string& output_dir) {
    AttemptResult result;

    for (int number = 1; number <= policy.max_retries; ++number) {
        if (number > 1) {
            logger.info("Retry attempt " + std::to_string(number) + "/" +
                        std::to_string(policy.max_retries));
            clock.sleep_for(policy.retry_delay);
        }

        CaptureAttempt attempt = try_once(config, output_dir, number);
        result.attempts = number;

        if (attempt.success) {
            logger.info("Successfully updated screenshot: " + attempt.artifact_path);
            result.success = true;
            result.artifact_path = attempt.artifact_path;
            result.error.clear();
            return result;
        }

        result.error = "attempt " + std::to_string(number) + " failed: " + attempt.error;
        logger.warning("Attempt " + std::to_string(number) + "/" + std::to_string(policy.max_retries) +
                       " failed: " + attempt.error);
    }
    return result;
}
