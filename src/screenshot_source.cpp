// screenshot_source.cpp

#include "screenshot_source.hpp"

#include "browser_session.hpp"

BrowserScreenshotSource::BrowserScreenshotSource(RenderEngineFactory& factory, Capturer& capturer,
                                                 Clock& clock, Logger& logger,
                                                 const std::string& target_url,
                                                 std::chrono::milliseconds session_timeout)
    : factory(factory), capturer(capturer), clock(clock), logger(logger), target_url(target_url),
      session_timeout(session_timeout) {}

std::vector<unsigned char> BrowserScreenshotSource::capture(const CaptureConfig& config) {
    std::unique_ptr<BrowserSession> session =
        BrowserSession::acquire(factory, config, clock, logger, session_timeout);
    std::vector<unsigned char> image = capturer.capture(*session, target_url);
    session->release();
    return image;
}
