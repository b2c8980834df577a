#include <gtest/gtest.h>

#include "fakes.hpp"
#include "retrying_attempt.hpp"

class RetryingAttemptTest : public ::testing::Test {
protected:
    RetryingAttemptTest() : source(clock) {
        logger.add_sink(sink);
    }

    RetryingAttempt make_attempt() {
        return RetryingAttempt(source, applier, clock, logger, policy);
    }

    FakeClock clock;
    StubSource source;
    FakeApplier applier;
    Logger logger{clock};
    std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
    RetryPolicy policy;
    CaptureConfig config;
    TempDir out;
};

TEST_F(RetryingAttemptTest, FirstAttemptSucceedsWithoutBackoff) {
    RetryingAttempt attempt = make_attempt();
    AttemptResult result = attempt.run_once(config, out.path);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(source.calls, 1);
    EXPECT_TRUE(clock.sleeps.empty());
    ASSERT_EQ(list_files(out.path).size(), 1u);
    ASSERT_EQ(applier.applied.size(), 1u);
    EXPECT_EQ(applier.applied[0], result.artifact_path);
    EXPECT_EQ(read_file(result.artifact_path), "PNGDATA");
}

TEST_F(RetryingAttemptTest, SucceedsOnThirdAttemptAfterBackoff) {
    source.failures_before_success = 2;
    RetryingAttempt attempt = make_attempt();
    AttemptResult result = attempt.run_once(config, out.path);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(source.calls, 3);

    ASSERT_EQ(source.call_times.size(), 3u);
    EXPECT_EQ(source.call_times[1] - source.call_times[0], std::chrono::seconds(30));
    EXPECT_EQ(source.call_times[2] - source.call_times[1], std::chrono::seconds(30));
    ASSERT_EQ(clock.sleeps.size(), 2u);
    EXPECT_EQ(clock.sleeps[1], std::chrono::seconds(30));

    EXPECT_EQ(list_files(out.path).size(), 1u);
    EXPECT_TRUE(sink->contains("Retry attempt 3/3"));
    EXPECT_TRUE(sink->contains("Attempt 1/3 failed: renderer crashed on call 1"));
}

TEST_F(RetryingAttemptTest, ExhaustedRetriesReportLastError) {
    source.failures_before_success = 100;
    RetryingAttempt attempt = make_attempt();
    AttemptResult result = attempt.run_once(config, out.path);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(source.calls, policy.max_retries);
    EXPECT_EQ(result.error, "attempt 3 failed: renderer crashed on call 3");
    EXPECT_TRUE(result.artifact_path.empty());
    EXPECT_TRUE(list_files(out.path).empty());
    EXPECT_TRUE(applier.applied.empty());
}

TEST_F(RetryingAttemptTest, HonoursCustomPolicy) {
    policy.max_retries = 5;
    policy.retry_delay = std::chrono::milliseconds(1500);
    source.failures_before_success = 100;
    RetryingAttempt attempt = make_attempt();
    AttemptResult result = attempt.run_once(config, out.path);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(source.calls, 5);
    EXPECT_EQ(clock.total_slept(), std::chrono::milliseconds(6000));
}

TEST_F(RetryingAttemptTest, PersistFailureLeavesNoFiles) {
    std::string missing = out.path + "/does/not/exist";
    RetryingAttempt attempt = make_attempt();
    AttemptResult result = attempt.run_once(config, missing);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(source.calls, 3);
    EXPECT_NE(result.error.find("failed to save screenshot"), std::string::npos);
    EXPECT_TRUE(list_files(out.path).empty());
    EXPECT_TRUE(applier.applied.empty());
}

TEST_F(RetryingAttemptTest, ApplyFailureKeepsArtifact) {
    applier.fail = true;
    policy.max_retries = 1;
    RetryingAttempt attempt = make_attempt();
    AttemptResult result = attempt.run_once(config, out.path);

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("-1743"), std::string::npos);
    ASSERT_EQ(applier.applied.size(), 1u);
    std::vector<std::string> files = list_files(out.path);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(applier.applied[0]), "PNGDATA");
}

TEST_F(RetryingAttemptTest, RetriesAfterApplyFailureWriteSeparateFiles) {
    applier.fail = true;
    RetryingAttempt attempt = make_attempt();
    AttemptResult result = attempt.run_once(config, out.path);

    EXPECT_FALSE(result.success);
    ASSERT_EQ(applier.applied.size(), 3u);
    EXPECT_NE(applier.applied[0], applier.applied[1]);
    EXPECT_NE(applier.applied[1], applier.applied[2]);
    EXPECT_EQ(list_files(out.path).size(), 3u);
}
