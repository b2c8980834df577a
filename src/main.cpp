// main.cpp

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "background_applier.hpp"
#include "capturer.hpp"
#include "chrome_engine.hpp"
#include "clock.hpp"
#include "logger.hpp"
#include "retrying_attempt.hpp"
#include "scheduler_loop.hpp"
#include "screenshot_source.hpp"
#include "settings.hpp"
#include "status_file.hpp"
#include "utils.hpp"

namespace {

// Resolves the output directory and creates it. Failure here is fatal: no
// cycle can run without somewhere to put the artifacts.
std::string prepare_output_dir(const Settings& settings) {
    std::string dir = settings.output_dir;
    if (dir.empty()) {
        std::string home = home_directory();
        if (home.empty()) {
            throw std::runtime_error("Failed to get user home directory");
        }
        dir = join_path(home, SCREENSHOTS_DIR_NAME);
    }
    if (!create_dir(dir, 0755)) {
        throw std::runtime_error("Failed to create screenshots directory: " + dir);
    }
    return dir;
}

} // namespace

int main(int argc, char* argv[]) {
    Settings settings;
    try {
        if (parse_args(argc, argv, settings) == ParseResult::Help) {
            std::cout << usage(argv[0]);
            return 0;
        }
        settings.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << usage(argv[0]);
        return 2;
    }

    try {
        std::string output_dir = prepare_output_dir(settings);

        SystemClock clock;
        Logger logger(clock);
        logger.add_sink(std::make_shared<ConsoleSink>());
        std::string log_file = settings.log_file.empty() ? join_path(output_dir, LOG_FILE_NAME)
                                                         : settings.log_file;
        logger.add_sink(std::make_shared<FileSink>(log_file));

        for (const auto& warning : settings.warnings) {
            logger.warning(warning);
        }
        logger.info("Capturing " + settings.url + " at " + std::to_string(settings.capture.width) +
                    "x" + std::to_string(settings.capture.height) + " into " + output_dir);

        ShellCommandRunner runner;
        std::unique_ptr<BackgroundApplier> applier =
            make_background_applier(settings.applier, runner, logger);

        CaptureOptions options;
        options.user_agent = settings.user_agent;
        options.ready_selector = settings.ready_selector;
        options.settle = settings.settle;
        options.overlay_delay = settings.overlay_delay;
        options.watermark_enabled = settings.watermark_enabled;
        options.watermark_text = settings.watermark_text;

        ChromeEngineFactory factory(settings.chrome_path, logger);
        Capturer capturer(options, logger);
        BrowserScreenshotSource source(
            factory, capturer, clock, logger, settings.url,
            std::chrono::duration_cast<std::chrono::milliseconds>(settings.session_timeout));

        RetryPolicy policy;
        policy.max_retries = settings.max_retries;
        policy.retry_delay = std::chrono::duration_cast<std::chrono::milliseconds>(settings.retry_delay);
        RetryingAttempt attempt(source, *applier, clock, logger, policy);

        StatusFile status_file(settings.status_file, logger);
        SchedulerLoop loop(attempt, status_file, clock, logger, settings.capture, output_dir);

        if (settings.once) {
            return loop.run_cycle().success ? 0 : 1;
        }
        loop.run();

    } catch (const std::runtime_error& e) {
        // Setup errors like an unusable home or output directory
        std::cerr << "Fatal Error during setup: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unhandled Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
