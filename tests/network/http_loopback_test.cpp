#include "chunked/client/http_transport.hpp"
#include "chunked/client/orchestrator.hpp"
#include "chunked/network/http_server_asio.hpp"
#include "chunked/server/http_api.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace chunked;
using chunked::test_support::TempDir;

/**
 * Real server on an ephemeral port, driven through HttpTransport
 */
class HttpLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        ServerConfig config;
        config.artifacts_root = dir / "uploads";
        config.staging_root = dir / "staging";
        config.max_chunk_bytes = 256 * 1024;

        service = std::make_unique<server::UploadService>(config, bus);
        ASSERT_TRUE(service->initialize().is_ok());
        server::register_upload_routes(router, *service);

        network::ServerOptions options;
        options.worker_threads = 2;
        server = std::make_unique<network::HttpServerAsio>(io, 0, router, options);
        io_thread = std::thread([this]() { io.run(); });

        ClientConfig client_config;
        client_config.host = "127.0.0.1";
        client_config.port = server->get_port();
        transport = std::make_unique<client::HttpTransport>(client_config);
    }

    void TearDown() override {
        work.reset();
        io.stop();
        if (io_thread.joinable()) {
            io_thread.join();
        }
        if (server) {
            server->stop();
        }
    }

    TempDir dir;
    events::EventBus bus;
    std::unique_ptr<server::UploadService> service;
    network::HttpRouter router;
    boost::asio::io_context io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work{io.get_executor()};
    std::unique_ptr<network::HttpServerAsio> server;
    std::thread io_thread;
    std::unique_ptr<client::HttpTransport> transport;
};

TEST_F(HttpLoopbackTest, ChunkedUploadOverHttp) {
    const auto c0 = test_support::make_payload(100 * 1024, 1);
    const auto c1 = test_support::make_payload(30 * 1024, 2);

    auto status = transport->check_status("abc", "f.bin", nullptr);
    ASSERT_TRUE(status.is_ok()) << status.error().message;
    EXPECT_FALSE(status.value().exists);
    EXPECT_TRUE(status.value().stored_indices.empty());

    std::uint64_t last_sent = 0;
    auto uploaded = transport->upload_chunk("abc", 0, c0,
        [&](std::uint64_t sent, std::uint64_t) { last_sent = sent; }, nullptr);
    ASSERT_TRUE(uploaded.is_ok()) << uploaded.error().message;
    EXPECT_EQ(last_sent, c0.size());
    ASSERT_TRUE(transport->upload_chunk("abc", 1, c1, nullptr, nullptr).is_ok());

    status = transport->check_status("abc", "f.bin", nullptr);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().stored_indices, (std::vector<std::uint32_t>{0, 1}));

    auto location = transport->merge("abc", "f.bin", 2, c0.size() + c1.size(), nullptr);
    ASSERT_TRUE(location.is_ok()) << location.error().message;
    EXPECT_EQ(location.value(), "/uploads/f.bin");

    std::vector<std::uint8_t> expected(c0);
    expected.insert(expected.end(), c1.begin(), c1.end());
    EXPECT_EQ(test_support::read_file(service->catalog().artifact_path("f.bin")), expected);

    status = transport->check_status("abc", "other-name.bin", nullptr);
    ASSERT_TRUE(status.is_ok());
    EXPECT_TRUE(status.value().exists);
    EXPECT_EQ(status.value().location, "/uploads/f.bin");
}

TEST_F(HttpLoopbackTest, ServerErrorsComeBackTyped) {
    ASSERT_TRUE(transport->upload_chunk("abc", 0, test_support::make_payload(10), nullptr, nullptr).is_ok());

    auto merged = transport->merge("abc", "f.bin", 4, 0, nullptr);
    ASSERT_TRUE(merged.is_error());
    EXPECT_EQ(merged.error().code, ErrorCode::ChunkCountMismatch);
    EXPECT_EQ(merged.error().expected, 4u);
    EXPECT_EQ(merged.error().actual, 1u);

    auto bad_name = transport->check_status("abc", "..", nullptr);
    ASSERT_TRUE(bad_name.is_error());
    EXPECT_EQ(bad_name.error().code, ErrorCode::InvalidArgument);
}

TEST_F(HttpLoopbackTest, CleanupAndAbandon) {
    ASSERT_TRUE(transport->upload_chunk("abc", 0, test_support::make_payload(10), nullptr, nullptr).is_ok());
    ASSERT_TRUE(transport->upload_chunk("abc", 1, test_support::make_payload(10), nullptr, nullptr).is_ok());

    auto discarded = transport->cleanup_chunk("abc", 1);
    ASSERT_TRUE(discarded.is_ok()) << discarded.error().message;
    EXPECT_TRUE(discarded.value());

    auto removed = transport->abandon("abc");
    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value(), 1u);
    EXPECT_FALSE(service->staging().has_chunk_set("abc"));
}

TEST_F(HttpLoopbackTest, OrchestratorUploadsFileEndToEnd) {
    const auto content = test_support::make_payload(300 * 1024 + 17, 9);
    const auto file = dir / "local" / "data.bin";
    test_support::write_file(file, content);

    client::OrchestratorOptions options;
    options.chunk_size = 64 * 1024;
    options.max_concurrent_uploads = 3;
    client::UploadOrchestrator orchestrator(*transport, options);

    auto outcome = orchestrator.upload_file(file);
    ASSERT_TRUE(outcome.succeeded()) << (outcome.error ? outcome.error->message : "");
    EXPECT_EQ(outcome.state, client::UploadState::Success);
    EXPECT_EQ(outcome.chunks_total, 5u);
    EXPECT_EQ(outcome.location, "/uploads/data.bin");
    EXPECT_EQ(test_support::read_file(service->catalog().artifact_path("data.bin")), content);

    auto again = orchestrator.upload_file(file);
    EXPECT_EQ(again.state, client::UploadState::FastSuccess);
    EXPECT_EQ(again.chunks_uploaded, 0u);
}

TEST(ErrorFromResponseTest, FallsBackToStatusWithoutJson) {
    network::HttpResponse response(network::HttpStatus::PAYLOAD_TOO_LARGE);
    response.set_body("too big");
    EXPECT_EQ(client::error_from_response(response).code, ErrorCode::ChunkTooLarge);

    network::HttpResponse busy(network::HttpStatus::CONFLICT);
    EXPECT_EQ(client::error_from_response(busy).code, ErrorCode::MergeInProgress);

    network::HttpResponse slow(network::HttpStatus::GATEWAY_TIMEOUT);
    EXPECT_EQ(client::error_from_response(slow).code, ErrorCode::Timeout);
}
