#pragma once

#include "chunked/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunked {

/**
 * @brief Server settings
 *
 * Defaults are usable as-is; a JSON file may override any subset of them and
 * command-line flags override the file.
 *
 * Example file:
 * @code
 * {
 *   "port": 9000,
 *   "artifacts_root": "/srv/uploads",
 *   "staging_root": "/srv/uploads/chunks",
 *   "max_chunk_bytes": 8388608,
 *   "merge_timeout_ms": 300000,
 *   "log_level": "debug"
 * }
 * @endcode
 */
struct ServerConfig {
    std::uint16_t port = 8080;
    std::filesystem::path artifacts_root = "uploads";
    std::filesystem::path staging_root = "uploads/chunks";

    std::uint64_t max_chunk_bytes = 16ULL * 1024 * 1024;
    std::uint64_t max_json_body_bytes = 64 * 1024;

    std::size_t io_threads = 1;
    std::size_t worker_threads = 4;

    std::chrono::milliseconds request_timeout{120000};
    std::chrono::milliseconds merge_timeout{600000};
    std::chrono::milliseconds sweep_interval{600000};
    std::chrono::milliseconds staging_ttl{86400000};

    std::string log_level = "info";
};

/**
 * @brief Uploader settings
 */
struct ClientConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;

    std::uint64_t chunk_size = 5ULL * 1024 * 1024;
    std::size_t max_concurrent_uploads = 3;
    std::size_t max_chunk_attempts = 3;

    std::chrono::milliseconds chunk_timeout{60000};
    std::chrono::milliseconds merge_timeout{600000};
    std::chrono::milliseconds status_timeout{15000};

    std::string log_level = "info";
};

Result<ServerConfig> parse_server_config(const std::string& json_text);
Result<ClientConfig> parse_client_config(const std::string& json_text);

Result<ServerConfig> load_server_config(const std::filesystem::path& path);
Result<ClientConfig> load_client_config(const std::filesystem::path& path);

/**
 * @brief Apply a textual log level ("trace" .. "off") to spdlog
 */
Result<void> apply_log_level(const std::string& level);

} // namespace chunked
