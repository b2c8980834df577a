#include <gtest/gtest.h>

#include "browser_session.hpp"
#include "capturer.hpp"
#include "errors.hpp"
#include "fakes.hpp"

class CapturerTest : public ::testing::Test {
protected:
    CapturerTest() : state(std::make_shared<FakeEngineState>()), factory(state) {
        options.user_agent = "TestAgent/1.0";
        logger.add_sink(sink);
    }

    std::unique_ptr<BrowserSession> open_session(std::chrono::milliseconds timeout = std::chrono::minutes(3)) {
        return BrowserSession::acquire(factory, config, clock, logger, timeout);
    }

    FakeClock clock;
    Logger logger{clock};
    std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
    std::shared_ptr<FakeEngineState> state;
    FakeEngineFactory factory;
    CaptureConfig config;
    CaptureOptions options;
};

TEST_F(CapturerTest, RunsStepsInOrder) {
    auto session = open_session();
    Capturer capturer(options, logger);

    std::vector<unsigned char> image = capturer.capture(*session, "https://example.com/status");

    EXPECT_EQ(std::string(image.begin(), image.end()), "PNGDATA");
    std::vector<std::string> expected = {"headers", "navigate", "visible", "evaluate", "capture"};
    EXPECT_EQ(state->calls, expected);
    EXPECT_EQ(state->headers["User-Agent"], "TestAgent/1.0");
    ASSERT_EQ(state->navigations.size(), 1u);
    EXPECT_EQ(state->navigations[0], "https://example.com/status");
    ASSERT_EQ(state->capture_qualities.size(), 1u);
    EXPECT_EQ(state->capture_qualities[0], 100);
}

TEST_F(CapturerTest, WaitsSettleThenOverlayDelay) {
    auto session = open_session();
    Capturer capturer(options, logger);
    capturer.capture(*session, "https://example.com");

    ASSERT_EQ(clock.sleeps.size(), 2u);
    EXPECT_EQ(clock.sleeps[0], std::chrono::seconds(5));
    EXPECT_EQ(clock.sleeps[1], std::chrono::milliseconds(500));
}

TEST_F(CapturerTest, WatermarkDefaultsToTargetHost) {
    auto session = open_session();
    Capturer capturer(options, logger);
    capturer.capture(*session, "https://isbaileybutlerintheoffice.today/");

    ASSERT_EQ(state->scripts.size(), 1u);
    EXPECT_NE(state->scripts[0].find("'isbaileybutlerintheoffice.today'"), std::string::npos);
    EXPECT_NE(state->scripts[0].find("rotate(-45deg)"), std::string::npos);
}

TEST_F(CapturerTest, WatermarkTextIsEscaped) {
    std::string script = watermark_script("it's <here>");
    EXPECT_NE(script.find("'it\\'s \\x3chere>'"), std::string::npos);
    EXPECT_NE(script.find("i < 9"), std::string::npos);
}

TEST_F(CapturerTest, WatermarkCanBeDisabled) {
    options.watermark_enabled = false;
    auto session = open_session();
    Capturer capturer(options, logger);
    capturer.capture(*session, "https://example.com");

    EXPECT_TRUE(state->scripts.empty());
    ASSERT_EQ(clock.sleeps.size(), 1u);
}

TEST_F(CapturerTest, PollsUntilContentVisible) {
    state->visible_after_polls = 3;
    options.poll_interval = std::chrono::milliseconds(250);
    auto session = open_session();
    Capturer capturer(options, logger);
    capturer.capture(*session, "https://example.com");

    EXPECT_EQ(state->visibility_polls, 4);
    EXPECT_EQ(clock.sleeps[0], std::chrono::milliseconds(250));
    EXPECT_EQ(clock.sleeps[2], std::chrono::milliseconds(250));
    EXPECT_EQ(clock.sleeps[3], std::chrono::seconds(5));
}

TEST_F(CapturerTest, NeverVisibleIsNavigationError) {
    state->visible_after_polls = -1;
    auto session = open_session(std::chrono::seconds(10));
    Capturer capturer(options, logger);

    EXPECT_THROW(capturer.capture(*session, "https://example.com"), NavigationError);
    EXPECT_TRUE(state->capture_qualities.empty());
    EXPECT_LE(clock.total_slept(), std::chrono::seconds(10));
}

TEST_F(CapturerTest, UnansweredReadinessProbeIsNavigationError) {
    state->visibility_hangs = true;
    auto session = open_session();
    Capturer capturer(options, logger);

    try {
        capturer.capture(*session, "https://example.com");
        FAIL() << "expected NavigationError";
    } catch (const NavigationError& e) {
        EXPECT_NE(std::string(e.what()).find("no response before the session deadline"), std::string::npos);
    }
    EXPECT_EQ(state->visibility_polls, 1);
    EXPECT_TRUE(state->capture_qualities.empty());
}

TEST_F(CapturerTest, StepFailureIsWrappedWithStepName) {
    state->fail_on = "navigate";
    auto session = open_session();
    Capturer capturer(options, logger);

    try {
        capturer.capture(*session, "https://example.com");
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_EQ(std::string(e.what()), "navigate failed: navigate exploded");
    }
    EXPECT_TRUE(state->capture_qualities.empty());
}

TEST_F(CapturerTest, ScriptFailureAbortsBeforeCapture) {
    state->fail_on = "evaluate";
    auto session = open_session();
    Capturer capturer(options, logger);

    EXPECT_THROW(capturer.capture(*session, "https://example.com"), CaptureError);
    EXPECT_TRUE(state->capture_qualities.empty());
}

TEST_F(CapturerTest, EmptyImageIsCaptureError) {
    state->image.clear();
    auto session = open_session();
    Capturer capturer(options, logger);

    EXPECT_THROW(capturer.capture(*session, "https://example.com"), CaptureError);
}

TEST_F(CapturerTest, SettleCrossingDeadlineFails) {
    auto session = open_session(std::chrono::seconds(3));
    Capturer capturer(options, logger);

    try {
        capturer.capture(*session, "https://example.com");
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_NE(std::string(e.what()).find("settle failed"), std::string::npos);
    }
    EXPECT_EQ(clock.total_slept(), std::chrono::seconds(3));
}
