// browser_session.hpp

#pragma once

#include <chrono>
#include <memory>

#include "clock.hpp"
#include "logger.hpp"
#include "render_engine.hpp"
#include "settings.hpp"

// A single rendering engine scoped to one capture attempt. The engine is torn
// down when the session is destroyed, whichever way the attempt ends.
class BrowserSession {
public:
    // Throws SessionError if the engine cannot be started.
    static std::unique_ptr<BrowserSession> acquire(RenderEngineFactory& factory,
                                                   const CaptureConfig& config,
                                                   Clock& clock,
                                                   Logger& logger,
                                                   std::chrono::milliseconds timeout);

    ~BrowserSession();

    BrowserSession(const BrowserSession&) = delete;
    BrowserSession& operator=(const BrowserSession&) = delete;

    // Throws TimeoutError once the session deadline has passed.
    RenderEngine& engine();
    void check_deadline() const;

    std::chrono::milliseconds remaining() const;
    bool expired() const;

    // Sleeps on the session clock. If the wait would cross the deadline it
    // sleeps up to the deadline and throws TimeoutError.
    void sleep_for(std::chrono::milliseconds d);

    Clock& clock() { return session_clock; }

    void release();

private:
    BrowserSession(std::unique_ptr<RenderEngine> engine, Clock& clock, Logger& logger,
                   Clock::time_point deadline);

    std::unique_ptr<RenderEngine> render_engine;
    Clock& session_clock;
    Logger& logger;
    Clock::time_point deadline;
};
