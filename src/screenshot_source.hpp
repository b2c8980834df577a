// screenshot_source.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "capturer.hpp"
#include "clock.hpp"
#include "logger.hpp"
#include "render_engine.hpp"
#include "settings.hpp"

// Produces the image bytes for one attempt.
class ScreenshotSource {
public:
    virtual ~ScreenshotSource() {}
    virtual std::vector<unsigned char> capture(const CaptureConfig& config) = 0;
};

// Opens a fresh browser session per call so a crashed renderer never carries
// over into the next attempt.
class BrowserScreenshotSource : public ScreenshotSource {
public:
    BrowserScreenshotSource(RenderEngineFactory& factory, Capturer& capturer, Clock& clock,
                            Logger& logger, const std::string& target_url,
                            std::chrono::milliseconds session_timeout);

    std::vector<unsigned char> capture(const CaptureConfig& config) override;

private:
    RenderEngineFactory& factory;
    Capturer& capturer;
    Clock& clock;
    Logger& logger;
    std::string target_url;
    std::chrono::milliseconds session_timeout;
};
