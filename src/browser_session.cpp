// browser_session.cpp

#include "browser_session.hpp"

#include <exception>

#include "errors.hpp"

std::unique_ptr<BrowserSession> BrowserSession::acquire(RenderEngineFactory& factory,
                                                        const CaptureConfig& config,
                                                        Clock& clock,
                                                        Logger& logger,
                                                        std::chrono::milliseconds timeout) {
    Clock::time_point deadline = clock.now() + timeout;

    std::unique_ptr<RenderEngine> engine;
    try {
        engine = factory.launch(config, timeout);
    } catch (const SessionError&) {
        throw;
    } catch (const std::exception& e) {
        throw SessionError(std::string("failed to launch rendering engine: ") + e.what());
    }
    if (!engine) {
        throw SessionError("failed to launch rendering engine: no engine returned");
    }

    if (clock.now() >= deadline) {
        throw TimeoutError("browser session timed out while launching");
    }

    logger.info("Browser session started (" + std::to_string(config.width) + "x" +
                std::to_string(config.height) + ")");
    return std::unique_ptr<BrowserSession>(
        new BrowserSession(std::move(engine), clock, logger, deadline));
}

BrowserSession::BrowserSession(std::unique_ptr<RenderEngine> engine, Clock& clock, Logger& logger,
                               Clock::time_point deadline)
    : render_engine(std::move(engine)), session_clock(clock), logger(logger), deadline(deadline) {}

BrowserSession::~BrowserSession() {
    release();
}

void BrowserSession::release() {
    if (render_engine) {
        render_engine.reset();
        logger.info("Browser session released");
    }
}

RenderEngine& BrowserSession::engine() {
    check_deadline();
    if (!render_engine) {
        throw SessionError("browser session already released");
    }
    return *render_engine;
}

void BrowserSession::check_deadline() const {
    if (expired()) {
        throw TimeoutError("browser session exceeded its time limit");
    }
}

std::chrono::milliseconds BrowserSession::remaining() const {
    Clock::time_point now = session_clock.now();
    if (now >= deadline) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

bool BrowserSession::expired() const {
    return session_clock.now() >= deadline;
}

void BrowserSession::sleep_for(std::chrono::milliseconds d) {
    check_deadline();
    std::chrono::milliseconds left = remaining();
    if (d >= left) {
        session_clock.sleep_for(left);
        throw TimeoutError("browser session exceeded its time limit");
    }
    session_clock.sleep_for(d);
}
