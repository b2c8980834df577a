// capturer.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "browser_session.hpp"
#include "logger.hpp"

struct CaptureOptions {
    std::string user_agent;
    std::string ready_selector = "body";

    // Pages fill in their status asynchronously after first paint
    std::chrono::milliseconds settle = std::chrono::milliseconds(5000);
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(250);

    bool watermark_enabled = true;
    std::string watermark_text;
    std::chrono::milliseconds overlay_delay = std::chrono::milliseconds(500);

    int quality = 100;
};

// Script that overlays a large rotated label plus a tiled pattern of smaller
// labels, all translucent and click-through.
std::string watermark_script(const std::string& text);

class Capturer {
public:
    Capturer(const CaptureOptions& options, Logger& logger);

    // Drives the session through headers, navigation, readiness, settle,
    // watermark and full-page capture. Throws CaptureError (or NavigationError)
    // naming the failed step; never returns a partial image.
    std::vector<unsigned char> capture(BrowserSession& session, const std::string& target_url);

private:
    void wait_until_visible(BrowserSession& session, const std::string& selector);

    CaptureOptions options;
    Logger& logger;
};
