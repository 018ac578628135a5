#include "chunked/server/http_api.hpp"
#include "chunked/events/components.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace chunked;
using chunked::network::HttpMethod;
using chunked::network::HttpRequest;
using chunked::network::HttpResponse;
using chunked::test_support::TempDir;
using json = nlohmann::json;

class HttpApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(service.initialize().is_ok());
        server::register_upload_routes(router, service, &metrics);
    }

    static ServerConfig make_config(const TempDir& dir) {
        ServerConfig config;
        config.artifacts_root = dir / "uploads";
        config.staging_root = dir / "staging";
        config.max_chunk_bytes = 64 * 1024;
        return config;
    }

    HttpResponse post_json(const std::string& url, const json& body) {
        HttpRequest request;
        request.method = HttpMethod::POST;
        request.url = url;
        request.set_header("Content-Type", "application/json");
        request.set_body(body.dump());
        return router.handle_request(request);
    }

    HttpResponse put_chunk(const std::string& fp, const std::string& index, const std::vector<std::uint8_t>& bytes) {
        HttpRequest request;
        request.method = HttpMethod::PUT;
        request.url = "/api/upload/chunk";
        request.set_header("X-Fingerprint", fp);
        request.set_header("X-Chunk-Index", index);
        request.set_header("Content-Length", std::to_string(bytes.size()));

        auto open = router.open_stream(request);
        if (!open.sink) {
            return open.rejection;
        }
        // Feed in two slices the way the server delivers socket reads
        const auto half = bytes.size() / 2;
        if (open.sink->write(bytes.data(), half)) {
            open.sink->write(bytes.data() + half, bytes.size() - half);
        }
        return open.sink->finish();
    }

    HttpResponse del(const std::string& url) {
        HttpRequest request;
        request.method = HttpMethod::DELETE_METHOD;
        request.url = url;
        return router.handle_request(request);
    }

    static json body_of(const HttpResponse& response) {
        return json::parse(response.body_as_string());
    }

    TempDir dir;
    events::EventBus bus;
    events::MetricsComponent metrics{bus};
    server::UploadService service{make_config(dir), bus};
    network::HttpRouter router;
};

TEST_F(HttpApiTest, FullUploadFlow) {
    const auto c0 = test_support::make_payload(1000, 1);
    const auto c1 = test_support::make_payload(500, 2);

    auto status = post_json("/api/upload/status", {{"fingerprint", "abc"}, {"artifact_name", "f.bin"}});
    ASSERT_EQ(status.status_code, 200);
    EXPECT_EQ(body_of(status)["exists"], false);
    EXPECT_TRUE(body_of(status)["stored_indices"].empty());

    ASSERT_EQ(put_chunk("abc", "1", c1).status_code, 200);

    status = post_json("/api/upload/status", {{"fingerprint", "abc"}, {"artifact_name", "f.bin"}});
    EXPECT_EQ(body_of(status)["stored_indices"], json::array({"1"}));

    auto stored = put_chunk("abc", "0", c0);
    ASSERT_EQ(stored.status_code, 200);
    EXPECT_EQ(body_of(stored)["bytes"], 1000);

    auto merged = post_json("/api/upload/merge",
                            {{"fingerprint", "abc"}, {"artifact_name", "f.bin"},
                             {"total_chunks", 2}, {"total_size", 1500}});
    ASSERT_EQ(merged.status_code, 200) << merged.body_as_string();
    EXPECT_EQ(body_of(merged)["location"], "/uploads/f.bin");

    status = post_json("/api/upload/status", {{"fingerprint", "abc"}, {"artifact_name", "f.bin"}});
    EXPECT_EQ(body_of(status)["exists"], true);
    EXPECT_EQ(body_of(status)["location"], "/uploads/f.bin");

    std::vector<std::uint8_t> expected(c0);
    expected.insert(expected.end(), c1.begin(), c1.end());
    EXPECT_EQ(test_support::read_file(service.catalog().artifact_path("f.bin")), expected);
}

TEST_F(HttpApiTest, MergeMismatchCarriesCounts) {
    ASSERT_EQ(put_chunk("abc", "0", test_support::make_payload(10)).status_code, 200);

    auto merged = post_json("/api/upload/merge",
                            {{"fingerprint", "abc"}, {"artifact_name", "f.bin"}, {"total_chunks", 3}});
    EXPECT_EQ(merged.status_code, 400);
    const auto body = body_of(merged);
    EXPECT_EQ(body["code"], "chunk_count_mismatch");
    EXPECT_EQ(body["expected"], 3);
    EXPECT_EQ(body["actual"], 1);
}

TEST_F(HttpApiTest, MergeRequiresTotalChunks) {
    auto merged = post_json("/api/upload/merge", {{"fingerprint", "abc"}, {"artifact_name", "f.bin"}});
    EXPECT_EQ(merged.status_code, 400);
    EXPECT_EQ(body_of(merged)["code"], "missing_identifier");

    auto negative = post_json("/api/upload/merge",
                              {{"fingerprint", "abc"}, {"artifact_name", "f.bin"}, {"total_chunks", -1}});
    EXPECT_EQ(negative.status_code, 400);
    EXPECT_EQ(body_of(negative)["code"], "invalid_argument");
}

TEST_F(HttpApiTest, StatusRejectsMalformedBody) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/api/upload/status";
    request.set_body("not json");
    auto response = router.handle_request(request);
    EXPECT_EQ(response.status_code, 400);
}

TEST_F(HttpApiTest, ChunkErrorsMapToStatusCodes) {
    EXPECT_EQ(put_chunk("", "0", test_support::make_payload(10)).status_code, 400);
    EXPECT_EQ(put_chunk("abc", "zero", test_support::make_payload(10)).status_code, 400);
    EXPECT_EQ(put_chunk("abc", "0", test_support::make_payload(64 * 1024 + 1)).status_code, 413);

    auto merging = service.gate().try_exclusive("abc");
    ASSERT_TRUE(merging.has_value());
    auto busy = put_chunk("abc", "0", test_support::make_payload(10));
    EXPECT_EQ(busy.status_code, 409);
    EXPECT_EQ(body_of(busy)["code"], "merge_in_progress");
}

TEST_F(HttpApiTest, DiscardAndAbandon) {
    ASSERT_EQ(put_chunk("abc", "0", test_support::make_payload(10)).status_code, 200);
    ASSERT_EQ(put_chunk("abc", "1", test_support::make_payload(10)).status_code, 200);

    auto discarded = del("/api/upload/chunk/abc/1");
    ASSERT_EQ(discarded.status_code, 200);
    EXPECT_EQ(body_of(discarded)["discarded"], true);

    auto again = del("/api/upload/chunk/abc/1");
    ASSERT_EQ(again.status_code, 200);
    EXPECT_EQ(body_of(again)["discarded"], false);

    auto abandoned = del("/api/upload/abc");
    ASSERT_EQ(abandoned.status_code, 200);
    EXPECT_EQ(body_of(abandoned)["chunks_removed"], 1);
    EXPECT_FALSE(service.staging().has_chunk_set("abc"));
}

TEST_F(HttpApiTest, StatsReflectActivity) {
    ASSERT_EQ(put_chunk("abc", "0", test_support::make_payload(10)).status_code, 200);

    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = "/api/stats";
    auto response = router.handle_request(request);
    ASSERT_EQ(response.status_code, 200);
    const auto body = body_of(response);
    EXPECT_EQ(body["chunks_stored"], 1);
    EXPECT_EQ(body["bytes_stored"], 10);
    EXPECT_EQ(body["artifacts"], 0);
}

TEST(HttpStatusMappingTest, ErrorCodesMapToProtocolStatuses) {
    using network::HttpStatus;
    EXPECT_EQ(server::http_status_for(ErrorCode::MissingIdentifier), HttpStatus::BAD_REQUEST);
    EXPECT_EQ(server::http_status_for(ErrorCode::ChunkCountMismatch), HttpStatus::BAD_REQUEST);
    EXPECT_EQ(server::http_status_for(ErrorCode::ChunkTooLarge), HttpStatus::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(server::http_status_for(ErrorCode::MergeInProgress), HttpStatus::CONFLICT);
    EXPECT_EQ(server::http_status_for(ErrorCode::Timeout), HttpStatus::GATEWAY_TIMEOUT);
    EXPECT_EQ(server::http_status_for(ErrorCode::IoFailure), HttpStatus::INTERNAL_SERVER_ERROR);
}
