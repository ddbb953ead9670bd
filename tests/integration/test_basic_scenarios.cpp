/**
 * @file test_basic_scenarios.cpp
 * @brief End-to-end tests for submit_and_wait against the in-process service
 */

#include "test_fixtures.h"

#include <algorithm>

namespace jobwire::test {

using namespace std::chrono_literals;

namespace {

const std::string small_payload = R"({"shots":1024,"circuit":"h q[0]; cx q[0],q[1];"})";

auto large_payload() -> std::string {
    json doc;
    doc["shots"] = 100;
    doc["gates"] = json::array();
    for (int i = 0; i < 64; ++i) {
        doc["gates"].push_back({{"op", "rx"}, {"target", i % 5}, {"angle", 0.125 * i}});
    }
    return doc.dump(2);
}

}  // namespace

// ============================================================================
// Stream path
// ============================================================================

class StreamPathTest : public JobServiceFixture {};

TEST_F(StreamPathTest, InlineJobCompletesViaStream) {
    auto client = make_client();
    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    const auto& value = outcome.value();
    EXPECT_EQ(value.final_status, job_status::completed);
    EXPECT_EQ(value.monitored_by, monitor_path::stream);
    EXPECT_FALSE(value.fallback_reason.has_value());
    EXPECT_EQ(value.handle.mode(), submission_mode::inline_only);
    EXPECT_EQ(value.handle.backend(), "simulator");
    ASSERT_TRUE(value.result.has_value());
    EXPECT_EQ(to_text(*value.result), service_->result_body);

    auto record = service_->job(value.handle.id());
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->inline_payload.has_value());
    EXPECT_EQ(json::parse(*record->inline_payload), json::parse(small_payload));

    EXPECT_EQ(service_->count("GET", "/jobs/" + value.handle.id() + "/status"), 0u);
    EXPECT_EQ(service_->count("GET", "/jobs/" + value.handle.id() + "/result"), 1u);

    ASSERT_EQ(channels_->created(), 1u);
    auto trace = channels_->traces().front();
    EXPECT_TRUE(trace->closed.load());
    std::lock_guard lock(trace->mutex);
    EXPECT_EQ(trace->endpoint,
              std::string(test_stream_url) + "/jobs/" + value.handle.id() + "/status");
    ASSERT_EQ(trace->sent.size(), 1u);
    auto subscribe = json::parse(trace->sent.front());
    EXPECT_EQ(subscribe["job_id"], value.handle.id());
    EXPECT_EQ(subscribe["credential"], test_token);
}

TEST_F(StreamPathTest, ObserverSeesEveryStatus) {
    std::vector<job_status> seen;
    wait_options options;
    options.on_status = [&seen](const status_event& event) { seen.push_back(event.status); };

    auto client = make_client();
    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s, options);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(seen, (std::vector<job_status>{job_status::running, job_status::completed}));
}

TEST_F(StreamPathTest, StateSequenceOnStream) {
    std::vector<orchestrator_state> states;
    std::vector<std::string> ids;

    auto client = make_client();
    client.on_state_changed([&](const std::string& id, orchestrator_state state) {
        ids.push_back(id);
        states.push_back(state);
    });
    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);
    ASSERT_TRUE(outcome.has_value());

    EXPECT_EQ(states, (std::vector<orchestrator_state>{
        orchestrator_state::submitting, orchestrator_state::awaiting_status,
        orchestrator_state::streaming, orchestrator_state::terminal,
        orchestrator_state::fetching_result, orchestrator_state::done}));
    EXPECT_TRUE(ids.front().empty());
    EXPECT_EQ(ids.back(), outcome.value().handle.id());
}

TEST_F(StreamPathTest, ErroredJobHasNoResult) {
    channel_script script;
    script.frames = {R"({"job_id":"{job_id}","status":"ERROR_RUNNING_JOB"})"};
    channels_->set_script(script);

    std::vector<orchestrator_state> states;
    auto client = make_client();
    client.on_state_changed([&](const std::string&, orchestrator_state state) {
        states.push_back(state);
    });
    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().final_status, job_status::error);
    EXPECT_FALSE(outcome.value().result.has_value());
    EXPECT_EQ(service_->count("GET", "/result"), 0u);
    EXPECT_EQ(std::count(states.begin(), states.end(), orchestrator_state::fetching_result), 0);
    EXPECT_EQ(states.back(), orchestrator_state::done);
}

TEST_F(StreamPathTest, CancelledJobHasNoResult) {
    channel_script script;
    script.frames = {R"({"type":"job-status","data":{"jobId":"{job_id}","status":"CANCELLED"}})"};
    channels_->set_script(script);

    auto client = make_client();
    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().final_status, job_status::cancelled);
    EXPECT_FALSE(outcome.value().result.has_value());
}

TEST_F(StreamPathTest, StreamTimeoutEndsWait) {
    channel_script script;
    script.frames = {R"({"job_id":"{job_id}","status":"RUNNING"})"};
    channels_->set_script(script);

    auto client = make_client();
    auto start = std::chrono::steady_clock::now();
    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 300ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::timeout);
    EXPECT_EQ(outcome.error().category(), error_category::timeout);
    EXPECT_LT(elapsed, 300ms + 500ms);
    EXPECT_EQ(service_->count("GET", "/status"), 0u);
}

TEST_F(StreamPathTest, StalledHandshakeEndsWaitAtDeadline) {
    channel_script script;
    script.open = channel_script::open_behavior::stall;
    channels_->set_script(script);

    auto client = make_client();
    auto start = std::chrono::steady_clock::now();
    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 300ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::timeout);
    EXPECT_LT(elapsed, 300ms + 500ms);
    ASSERT_EQ(channels_->created(), 1u);
    EXPECT_TRUE(channels_->traces().front()->closed.load());
}

TEST_F(StreamPathTest, UnboundedTimeoutCompletes) {
    channels_->set_script(completed_stream());

    auto client = make_client();
    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator",
                                          std::chrono::milliseconds::max());
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value().final_status, job_status::completed);
    EXPECT_EQ(outcome.value().monitored_by, monitor_path::stream);
}

// ============================================================================
// Fallback to polling
// ============================================================================

class FallbackTest : public JobServiceFixture {
protected:
    auto run(const channel_script& script) -> result<job_outcome> {
        channels_->set_script(script);
        auto client = make_client();
        client.on_state_changed([this](const std::string&, orchestrator_state state) {
            states_.push_back(state);
        });
        return client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);
    }

    void expect_polled(const result<job_outcome>& outcome, error_code reason) {
        ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
        EXPECT_EQ(outcome.value().final_status, job_status::completed);
        EXPECT_EQ(outcome.value().monitored_by, monitor_path::polling);
        ASSERT_TRUE(outcome.value().fallback_reason.has_value());
        EXPECT_EQ(outcome.value().fallback_reason->code, reason);
        ASSERT_TRUE(outcome.value().result.has_value());
        EXPECT_EQ(to_text(*outcome.value().result), service_->result_body);
        EXPECT_GE(service_->count("GET", "/jobs/" + outcome.value().handle.id() + "/status"), 2u);
    }

    std::vector<orchestrator_state> states_;
};

TEST_F(FallbackTest, InvalidFrame) {
    channel_script script;
    script.frames = {R"({"job_id":"{job_id}","status":"RUNNING"})", "<html>502</html>"};
    auto outcome = run(script);
    expect_polled(outcome, error_code::protocol_error);

    EXPECT_EQ(states_, (std::vector<orchestrator_state>{
        orchestrator_state::submitting, orchestrator_state::awaiting_status,
        orchestrator_state::streaming, orchestrator_state::polling,
        orchestrator_state::terminal, orchestrator_state::fetching_result,
        orchestrator_state::done}));
}

TEST_F(FallbackTest, StreamUnreachable) {
    channel_script script;
    script.open = channel_script::open_behavior::unreachable;
    auto outcome = run(script);
    expect_polled(outcome, error_code::host_unreachable);
    EXPECT_EQ(outcome.value().fallback_reason->category(), error_category::connect);
}

TEST_F(FallbackTest, HandshakeRejected) {
    channel_script script;
    script.open = channel_script::open_behavior::reject;
    auto outcome = run(script);
    expect_polled(outcome, error_code::connect_failed);
}

TEST_F(FallbackTest, SubscriptionRejected) {
    channel_script script;
    script.frames = {R"({"type":"authentication-failed","data":"token expired"})"};
    auto outcome = run(script);
    expect_polled(outcome, error_code::auth_rejected);
}

TEST_F(FallbackTest, ClosedBeforeFinalStatus) {
    channel_script script;
    script.frames = {R"({"job_id":"{job_id}","status":"RUNNING"})"};
    script.close_after_frames = true;
    auto outcome = run(script);
    expect_polled(outcome, error_code::protocol_error);
}

TEST_F(FallbackTest, NoStreamUrlPollsDirectly) {
    auto config = make_config();
    config.stream_url.clear();
    auto client = make_client(config);

    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().monitored_by, monitor_path::polling);
    EXPECT_EQ(channels_->created(), 0u);
}

TEST_F(FallbackTest, PollingHonoursDeadline) {
    service_->status_script = {job_status::running};
    channel_script script;
    script.frames = {"garbage"};
    channels_->set_script(script);

    auto client = make_client();
    auto start = std::chrono::steady_clock::now();
    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 300ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::timeout);
    EXPECT_GE(elapsed, 250ms);
    EXPECT_LT(elapsed, 300ms + 20ms + 500ms);
}

TEST_F(FallbackTest, StreamAndPollingAgree) {
    auto client = make_client();
    auto streamed = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);

    channel_script broken;
    broken.open = channel_script::open_behavior::unreachable;
    channels_->set_script(broken);
    auto polled = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);

    ASSERT_TRUE(streamed.has_value());
    ASSERT_TRUE(polled.has_value());
    EXPECT_EQ(streamed.value().monitored_by, monitor_path::stream);
    EXPECT_EQ(polled.value().monitored_by, monitor_path::polling);
    EXPECT_EQ(streamed.value().final_status, polled.value().final_status);
    EXPECT_EQ(streamed.value().result, polled.value().result);
}

// ============================================================================
// Object storage
// ============================================================================

class ObjectStorageTest : public JobServiceFixture {};

TEST_F(ObjectStorageTest, LargePayloadGoesThroughStorage) {
    auto payload = large_payload();
    ASSERT_GT(payload.size(), 256u);

    auto client = make_client();
    auto outcome = client.submit_and_wait(to_bytes(payload), "simulator", 5s);
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;

    const auto& value = outcome.value();
    EXPECT_EQ(value.handle.mode(), submission_mode::object_storage);
    EXPECT_EQ(value.final_status, job_status::completed);
    ASSERT_TRUE(value.result.has_value());
    EXPECT_EQ(to_text(*value.result), service_->result_body);

    auto record = service_->job(value.handle.id());
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->object_storage);
    EXPECT_TRUE(record->upload_signalled);
    EXPECT_TRUE(record->result_download_signalled);
    EXPECT_FALSE(record->inline_payload.has_value());
    EXPECT_EQ(json::parse(to_text(record->stored_payload)), json::parse(payload));
    EXPECT_EQ(to_text(record->stored_payload), json::parse(payload).dump());

    EXPECT_EQ(service_->count("PUT", "/upload/" + value.handle.id()), 1u);
    EXPECT_EQ(service_->count("GET", "/result/" + value.handle.id()), 1u);
    EXPECT_EQ(service_->count("GET", "/jobs/" + value.handle.id() + "/result"), 0u);
}

TEST_F(ObjectStorageTest, BinaryPayloadUsesStorageInAutomaticMode) {
    std::vector<uint8_t> payload = {0x00, 0xFF, 0x10, 0x80, 0x7F};

    auto client = make_client();
    auto handle = client.submit(payload, "simulator");
    ASSERT_TRUE(handle.has_value()) << handle.error().message;
    EXPECT_TRUE(handle.value().uses_object_storage());

    auto record = service_->job(handle.value().id());
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->stored_payload, payload);

    auto downloaded = client.download_job_payload(handle.value());
    ASSERT_TRUE(downloaded.has_value());
    EXPECT_EQ(downloaded.value(), payload);
}

TEST_F(ObjectStorageTest, InlineOnlyRejectsBinaryPayload) {
    auto config = make_config();
    config.mode = submission_mode::inline_only;
    auto client = make_client(config);

    auto outcome = client.submit_and_wait({0x01, 0x02, 0x03}, "simulator", 5s);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::invalid_payload);
    EXPECT_EQ(service_->job_count(), 0u);
}

TEST_F(ObjectStorageTest, PayloadIdenticalAcrossModes) {
    const auto payload = to_bytes("{ \"b\": [1, 2, 3], \"a\": {\"z\": null, \"y\": 0.5} }");

    auto client = make_client();
    wait_options inline_opts;
    inline_opts.mode = submission_mode::inline_only;
    wait_options storage_opts;
    storage_opts.mode = submission_mode::object_storage;

    auto inline_handle = client.submit(payload, "simulator", inline_opts);
    auto storage_handle = client.submit(payload, "simulator", storage_opts);
    ASSERT_TRUE(inline_handle.has_value());
    ASSERT_TRUE(storage_handle.has_value());
    EXPECT_FALSE(inline_handle.value().uses_object_storage());
    EXPECT_TRUE(storage_handle.value().uses_object_storage());

    auto from_inline = client.download_job_payload(inline_handle.value());
    auto from_storage = client.download_job_payload(storage_handle.value());
    ASSERT_TRUE(from_inline.has_value()) << from_inline.error().message;
    ASSERT_TRUE(from_storage.has_value()) << from_storage.error().message;
    EXPECT_EQ(from_inline.value(), from_storage.value());
    EXPECT_EQ(json::parse(to_text(from_inline.value())), json::parse(to_text(payload)));
}

TEST_F(ObjectStorageTest, ResultIdenticalAcrossModes) {
    auto client = make_client();
    wait_options storage_opts;
    storage_opts.mode = submission_mode::object_storage;

    auto inline_outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);
    auto storage_outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s,
                                                  storage_opts);
    ASSERT_TRUE(inline_outcome.has_value());
    ASSERT_TRUE(storage_outcome.has_value());
    EXPECT_EQ(inline_outcome.value().result, storage_outcome.value().result);
}

TEST_F(ObjectStorageTest, FailedUploadCancelsJob) {
    service_->upload_status_code = 403;

    auto client = make_client();
    auto outcome = client.submit_and_wait(to_bytes(large_payload()), "simulator", 5s);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().category(), error_category::transfer);

    ASSERT_EQ(service_->job_count(), 1u);
    auto record = service_->job("job-1");
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->cancelled);
    EXPECT_FALSE(record->upload_signalled);
    EXPECT_EQ(channels_->created(), 0u);
}

// ============================================================================
// Connection and API errors
// ============================================================================

class ServiceErrorTest : public JobServiceFixture {};

TEST_F(ServiceErrorTest, WrongCredential) {
    auto config = make_config();
    config.credential = "expired-token";
    auto client = make_client(config);

    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::auth_rejected);
    EXPECT_FALSE(client.is_connected());
    EXPECT_EQ(service_->job_count(), 0u);
}

TEST_F(ServiceErrorTest, ServiceUnreachable) {
    service_->reachable = false;
    auto client = make_client();

    auto outcome = client.submit_and_wait(to_bytes(small_payload), "simulator", 5s);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::host_unreachable);
    EXPECT_TRUE(is_fallback_eligible(outcome.error().code));
}

TEST_F(ServiceErrorTest, ConnectOnce) {
    auto client = make_client();
    ASSERT_TRUE(client.connect().has_value());
    EXPECT_TRUE(client.is_connected());

    ASSERT_TRUE(client.submit_and_wait(to_bytes(small_payload), "simulator", 5s).has_value());
    ASSERT_TRUE(client.submit_and_wait(to_bytes(small_payload), "simulator", 5s).has_value());
    EXPECT_EQ(service_->count("GET", "/users/me"), 1u);
}

TEST_F(ServiceErrorTest, CancelJobThroughClient) {
    auto client = make_client();
    auto handle = client.submit(to_bytes(small_payload), "simulator");
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(client.cancel_job(handle.value()).has_value());

    auto record = service_->job(handle.value().id());
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->cancelled);

    auto status = client.api().job_status(handle.value().id());
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value().status, job_status::cancelled);
}

// ============================================================================
// Thin API wrappers
// ============================================================================

class ApiWrapperTest : public JobServiceFixture {};

TEST_F(ApiWrapperTest, Backends) {
    auto client = make_client();
    ASSERT_TRUE(client.connect().has_value());

    auto backends = client.api().list_backends();
    ASSERT_TRUE(backends.has_value());
    ASSERT_TRUE(backends.value().is_array());
    EXPECT_EQ(backends.value().size(), 2u);

    auto status = client.api().backend_status("device-5q");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status.value()["backend_name"], "device-5q");
    EXPECT_TRUE(status.value()["operational"].get<bool>());

    auto properties = client.api().backend_properties("device-5q");
    ASSERT_TRUE(properties.has_value());
    EXPECT_EQ(properties.value()["n_qubits"], 5);
}

TEST_F(ApiWrapperTest, ListJobsPaged) {
    auto client = make_client();
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(client.submit(to_bytes(small_payload), "simulator").has_value());
    }

    auto first = client.api().list_jobs_status(2, 0);
    auto rest = client.api().list_jobs_status(2, 2);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(first.value().size(), 2u);
    EXPECT_EQ(rest.value().size(), 1u);
}

TEST_F(ApiWrapperTest, FieldFilterSameEitherSide) {
    auto client = make_client();
    auto handle = client.submit(to_bytes(small_payload), "simulator");
    ASSERT_TRUE(handle.has_value());

    field_filter filter{{"id", "status"}, {}};
    auto client_side = client.api().get_job(handle.value().id(), filter);
    service_->honour_field_filter = true;
    auto server_side = client.api().get_job(handle.value().id(), filter);

    ASSERT_TRUE(client_side.has_value());
    ASSERT_TRUE(server_side.has_value());
    EXPECT_EQ(client_side.value(), server_side.value());
    EXPECT_EQ(client_side.value().size(), 2u);
    EXPECT_FALSE(client_side.value().contains("payload"));
}

TEST_F(ApiWrapperTest, VersionWithoutCredential) {
    auto config = make_config();
    config.credential = "wrong";
    auto client = make_client(config);

    auto version = client.api().api_version();
    ASSERT_TRUE(version.has_value());
    EXPECT_TRUE(version.value()["new_api"].get<bool>());
}

}  // namespace jobwire::test
