/**
 * @file test_job_client.cpp
 * @brief Unit tests for job_client construction and argument checks
 */

#include <gtest/gtest.h>

#include <jobwire/jobwire.h>
#include <jobwire/core/logging.h>

namespace jobwire::test {

class JobClientBuilderTest : public ::testing::Test {};

TEST_F(JobClientBuilderTest, RejectsMissingApiUrl) {
    auto built = job_client::builder().build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(JobClientBuilderTest, RejectsNonPositivePollInterval) {
    auto built = job_client::builder()
        .with_config(client_config_builder()
            .with_api_url("https://api.test/api")
            .with_poll_interval(std::chrono::milliseconds{0})
            .build())
        .build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(JobClientBuilderTest, BuildsWithDefaultTransports) {
    auto built = job_client::builder()
        .with_config(client_config_builder()
            .with_api_url("https://api.test/api")
            .with_credential("token")
            .build())
        .build();
    ASSERT_TRUE(built.has_value()) << built.error().message;

    auto& client = built.value();
    EXPECT_FALSE(client.is_connected());
    EXPECT_EQ(client.config().api_url, "https://api.test/api");
    EXPECT_TRUE(get_logger().is_initialized());
}

TEST_F(JobClientBuilderTest, ClientIsMovable) {
    auto built = job_client::builder()
        .with_config(client_config_builder().with_api_url("https://api.test/api").build())
        .build();
    ASSERT_TRUE(built.has_value());

    job_client moved = std::move(built.value());
    EXPECT_EQ(moved.config().api_url, "https://api.test/api");
}

// =============================================================================
// Argument checks before any request
// =============================================================================

class JobClientArgumentTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto built = job_client::builder()
            .with_config(client_config_builder()
                .with_api_url("https://api.test/api")
                .with_credential("token")
                .build())
            .build();
        ASSERT_TRUE(built.has_value());
        client_ = std::make_unique<job_client>(std::move(built.value()));
    }

    std::unique_ptr<job_client> client_;
};

TEST_F(JobClientArgumentTest, EmptyBackend) {
    auto outcome = client_->submit_and_wait({'{', '}'}, "", std::chrono::seconds{1});
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::invalid_argument);
}

TEST_F(JobClientArgumentTest, EmptyPayload) {
    auto outcome = client_->submit_and_wait({}, "simulator", std::chrono::seconds{1});
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::invalid_payload);
}

// =============================================================================
// Enumerations
// =============================================================================

TEST(OrchestratorStateTest, Names) {
    EXPECT_STREQ(to_string(orchestrator_state::submitting), "submitting");
    EXPECT_STREQ(to_string(orchestrator_state::awaiting_status), "awaiting_status");
    EXPECT_STREQ(to_string(orchestrator_state::streaming), "streaming");
    EXPECT_STREQ(to_string(orchestrator_state::polling), "polling");
    EXPECT_STREQ(to_string(orchestrator_state::terminal), "terminal");
    EXPECT_STREQ(to_string(orchestrator_state::fetching_result), "fetching_result");
    EXPECT_STREQ(to_string(orchestrator_state::done), "done");
}

TEST(MonitorPathTest, Names) {
    EXPECT_STREQ(to_string(monitor_path::stream), "stream");
    EXPECT_STREQ(to_string(monitor_path::polling), "polling");
}

}  // namespace jobwire::test
