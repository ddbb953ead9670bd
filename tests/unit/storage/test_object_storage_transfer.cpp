/**
 * @file test_object_storage_transfer.cpp
 * @brief Unit tests for object storage staging of payloads and results
 */

#include <gtest/gtest.h>

#include <jobwire/storage/object_storage_transfer.h>

#include <map>
#include <string>
#include <vector>

namespace jobwire {
namespace {

/**
 * @brief HTTP client serving control API locators and a bucket
 */
class mock_storage_http_client : public http_client_interface {
public:
    struct request {
        std::string method;
        std::string url;
        http_headers headers;
        std::vector<uint8_t> body;
    };

    std::map<std::string, std::vector<uint8_t>> bucket;
    int put_status = 200;
    bool fail_put_transport = false;
    std::map<std::string, std::string> api_bodies;

    auto get(const std::string& url, const http_query&, const http_headers& headers)
        -> result<http_response> override {
        requests.push_back({"GET", url, headers, {}});
        if (auto it = api_bodies.find(url); it != api_bodies.end()) {
            return ok(it->second);
        }
        auto key = object_key(url);
        if (auto it = bucket.find(key); it != bucket.end()) {
            http_response resp;
            resp.status_code = 200;
            resp.body = it->second;
            return resp;
        }
        return status(404);
    }

    auto post(const std::string& url, const std::string&, const http_headers& headers)
        -> result<http_response> override {
        requests.push_back({"POST", url, headers, {}});
        return ok("{}");
    }

    auto put(const std::string& url, const std::vector<uint8_t>& body,
             const http_headers& headers) -> result<http_response> override {
        requests.push_back({"PUT", url, headers, body});
        if (fail_put_transport) {
            return unexpected{error{error_code::host_unreachable, "Connection reset"}};
        }
        if (put_status != 200) {
            return status(put_status);
        }
        bucket[object_key(url)] = body;
        return ok("");
    }

    auto del(const std::string& url, const http_headers& headers)
        -> result<http_response> override {
        requests.push_back({"DELETE", url, headers, {}});
        return status(405);
    }

    auto count(const std::string& method, const std::string& url) const -> std::size_t {
        std::size_t n = 0;
        for (const auto& req : requests) {
            if (req.method == method && req.url == url) {
                ++n;
            }
        }
        return n;
    }

    std::vector<request> requests;

private:
    static auto object_key(const std::string& url) -> std::string {
        return url.substr(0, url.find('?'));
    }

    static auto ok(const std::string& body) -> http_response {
        http_response resp;
        resp.status_code = 200;
        resp.body = std::vector<uint8_t>(body.begin(), body.end());
        return resp;
    }

    static auto status(int code) -> http_response {
        http_response resp;
        resp.status_code = code;
        return resp;
    }
};

constexpr const char* api = "https://api.test/api";

class ObjectStorageTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<mock_storage_http_client>();
        http_->api_bodies[std::string(api) + "/jobs/job-1/jobUploadUrl"] =
            R"({"url":"https://bucket.test/payloads/job-1?sig=up","expiry":"2100-01-01T00:00:00Z"})";
        http_->api_bodies[std::string(api) + "/jobs/job-1/jobDownloadUrl"] =
            R"({"url":"https://bucket.test/payloads/job-1?sig=down"})";
        http_->api_bodies[std::string(api) + "/jobs/job-1/resultDownloadUrl"] =
            R"({"url":"https://bucket.test/results/job-1?sig=res"})";

        auto config = client_config_builder()
            .with_api_url(api)
            .with_credential("secret-token")
            .build();
        api_ = control_api_client::create(config, http_);
    }

    auto make_transfer() -> object_storage_transfer {
        return object_storage_transfer(api_, http_);
    }

    static auto bytes(const std::string& text) -> std::vector<uint8_t> {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::shared_ptr<mock_storage_http_client> http_;
    std::shared_ptr<control_api_client> api_;
};

TEST_F(ObjectStorageTransferTest, UploadFlow) {
    auto transfer = make_transfer();
    auto payload = bytes(R"({"shots":1000})");

    auto uploaded = transfer.upload(job_context{"job-1", "simulator"}, payload);
    ASSERT_TRUE(uploaded.has_value()) << uploaded.error().message;

    EXPECT_EQ(http_->bucket["https://bucket.test/payloads/job-1"], payload);
    EXPECT_EQ(http_->count("POST", std::string(api) + "/jobs/job-1/jobDataUploaded"), 1u);

    // Signed URLs carry their own authorization
    for (const auto& req : http_->requests) {
        if (req.method == "PUT") {
            EXPECT_EQ(req.headers.count("Authorization"), 0u);
            EXPECT_EQ(req.headers.at("Content-Type"), "application/octet-stream");
        }
    }
}

TEST_F(ObjectStorageTransferTest, UploadLocatorIsSingleUse) {
    auto transfer = make_transfer();
    auto locator = transfer.request_upload_locator(job_context{"job-1", "simulator"});
    ASSERT_TRUE(locator.has_value());

    ASSERT_TRUE(transfer.put_payload(locator.value(), bytes("a")).has_value());
    auto second = transfer.put_payload(locator.value(), bytes("b"));
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::locator_consumed);
    EXPECT_EQ(http_->count("PUT", locator.value().url()), 1u);
}

TEST_F(ObjectStorageTransferTest, ExpiredLocatorIsNotUsed) {
    auto transfer = make_transfer();
    storage_locator expired(locator_direction::upload, "https://bucket.test/payloads/job-1?sig=x",
                            storage_locator::clock::now() - std::chrono::seconds{1});

    auto put = transfer.put_payload(expired, bytes("a"));
    ASSERT_FALSE(put.has_value());
    EXPECT_EQ(put.error().code, error_code::locator_expired);
    EXPECT_TRUE(http_->requests.empty());
}

TEST_F(ObjectStorageTransferTest, WrongDirectionIsRejected) {
    auto transfer = make_transfer();
    auto locator = transfer.request_download_locator("job-1", object_kind::payload);
    ASSERT_TRUE(locator.has_value());

    auto put = transfer.put_payload(locator.value(), bytes("a"));
    ASSERT_FALSE(put.has_value());
    EXPECT_EQ(put.error().code, error_code::invalid_argument);
    EXPECT_FALSE(locator.value().is_consumed());
}

TEST_F(ObjectStorageTransferTest, UploadRejectedByBucket) {
    http_->put_status = 403;
    auto transfer = make_transfer();

    auto uploaded = transfer.upload(job_context{"job-1", "simulator"}, bytes("{}"));
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::transfer_failed);
    EXPECT_NE(uploaded.error().message.find("HTTP 403"), std::string::npos);
    EXPECT_EQ(http_->count("POST", std::string(api) + "/jobs/job-1/jobDataUploaded"), 0u);
}

TEST_F(ObjectStorageTransferTest, UploadTransportFailure) {
    http_->fail_put_transport = true;
    auto transfer = make_transfer();

    auto uploaded = transfer.upload(job_context{"job-1", "simulator"}, bytes("{}"));
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::transfer_failed);
    EXPECT_NE(uploaded.error().message.find("Connection reset"), std::string::npos);
}

TEST_F(ObjectStorageTransferTest, MissingLocatorEndpoint) {
    auto transfer = make_transfer();
    auto uploaded = transfer.upload(job_context{"job-2", "simulator"}, bytes("{}"));
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::api_error);
}

TEST_F(ObjectStorageTransferTest, DownloadPayloadRoundTrip) {
    auto transfer = make_transfer();
    auto payload = bytes(R"({"circuit":"bell"})");
    ASSERT_TRUE(transfer.upload(job_context{"job-1", "simulator"}, payload).has_value());

    auto downloaded = transfer.download("job-1", object_kind::payload);
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().message;
    EXPECT_EQ(downloaded.value(), payload);
    EXPECT_EQ(http_->count("POST", std::string(api) + "/jobs/job-1/resultDownloaded"), 0u);
}

TEST_F(ObjectStorageTransferTest, DownloadResultSignalsService) {
    http_->bucket["https://bucket.test/results/job-1"] = bytes(R"({"counts":{"0":1}})");
    auto transfer = make_transfer();

    auto downloaded = transfer.download("job-1", object_kind::result);
    ASSERT_TRUE(downloaded.has_value());
    EXPECT_EQ(downloaded.value(), bytes(R"({"counts":{"0":1}})"));
    EXPECT_EQ(http_->count("POST", std::string(api) + "/jobs/job-1/resultDownloaded"), 1u);
}

TEST_F(ObjectStorageTransferTest, DownloadMissingObject) {
    auto transfer = make_transfer();
    auto downloaded = transfer.download("job-1", object_kind::result);
    ASSERT_FALSE(downloaded.has_value());
    EXPECT_EQ(downloaded.error().code, error_code::transfer_failed);
    EXPECT_EQ(http_->count("POST", std::string(api) + "/jobs/job-1/resultDownloaded"), 0u);
}

}  // namespace
}  // namespace jobwire
