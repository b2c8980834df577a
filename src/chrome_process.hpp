// chrome_process.hpp

#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>

#include "logger.hpp"
#include "settings.hpp"

// A headless Chromium child with its own throwaway profile directory and a
// DevTools endpoint on an ephemeral port. Destroying it kills the process
// and removes the profile.
class ChromeProcess {
public:
    // Throws SessionError if the binary cannot start and TimeoutError if the
    // DevTools endpoint does not appear before the deadline.
    ChromeProcess(const std::string& binary, const CaptureConfig& config,
                  std::chrono::steady_clock::time_point deadline, Logger& logger);
    ~ChromeProcess();

    ChromeProcess(const ChromeProcess&) = delete;
    ChromeProcess& operator=(const ChromeProcess&) = delete;

    const std::string& browser_ws_url() const { return ws_url; }

private:
    void wait_for_devtools(std::chrono::steady_clock::time_point deadline);
    void terminate();

    Logger& logger;
    pid_t pid;
    std::string profile_dir;
    std::string ws_url;
};
