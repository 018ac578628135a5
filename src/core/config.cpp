#include "chunked/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace chunked {
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Overwrite `target` with json[key] when the key is present.
// Wrong JSON types surface as nlohmann::json::type_error.
template<typename T>
void read_key(const json& doc, const char* key, T& target) {
    auto it = doc.find(key);
    if (it != doc.end()) {
        target = it->get<T>();
    }
}

void read_ms(const json& doc, const char* key, std::chrono::milliseconds& target) {
    auto it = doc.find(key);
    if (it != doc.end()) {
        target = std::chrono::milliseconds(it->get<std::int64_t>());
    }
}

void read_path(const json& doc, const char* key, fs::path& target) {
    auto it = doc.find(key);
    if (it != doc.end()) {
        target = fs::path(it->get<std::string>());
    }
}

Result<json> parse_object(const std::string& json_text) {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return Err<json>(ErrorCode::InvalidArgument, "config is not valid JSON");
    }
    if (!doc.is_object()) {
        return Err<json>(ErrorCode::InvalidArgument, "config must be a JSON object");
    }
    return Ok(std::move(doc));
}

Result<std::string> read_text(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::IoFailure, "failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Ok(buffer.str());
}

} // namespace

Result<ServerConfig> parse_server_config(const std::string& json_text) {
    auto parsed = parse_object(json_text);
    if (parsed.is_error()) {
        return Err<ServerConfig>(parsed.error());
    }
    const auto& doc = parsed.value();

    ServerConfig config;
    try {
        read_key(doc, "port", config.port);
        read_path(doc, "artifacts_root", config.artifacts_root);
        read_path(doc, "staging_root", config.staging_root);
        read_key(doc, "max_chunk_bytes", config.max_chunk_bytes);
        read_key(doc, "max_json_body_bytes", config.max_json_body_bytes);
        read_key(doc, "io_threads", config.io_threads);
        read_key(doc, "worker_threads", config.worker_threads);
        read_ms(doc, "request_timeout_ms", config.request_timeout);
        read_ms(doc, "merge_timeout_ms", config.merge_timeout);
        read_ms(doc, "sweep_interval_ms", config.sweep_interval);
        read_ms(doc, "staging_ttl_ms", config.staging_ttl);
        read_key(doc, "log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<ServerConfig>(ErrorCode::InvalidArgument, std::string("invalid config value: ") + e.what());
    }

    if (config.max_chunk_bytes == 0) {
        return Err<ServerConfig>(ErrorCode::InvalidArgument, "max_chunk_bytes must be > 0");
    }
    if (config.io_threads == 0 || config.worker_threads == 0) {
        return Err<ServerConfig>(ErrorCode::InvalidArgument, "thread counts must be > 0");
    }
    return Ok(std::move(config));
}

Result<ClientConfig> parse_client_config(const std::string& json_text) {
    auto parsed = parse_object(json_text);
    if (parsed.is_error()) {
        return Err<ClientConfig>(parsed.error());
    }
    const auto& doc = parsed.value();

    ClientConfig config;
    try {
        read_key(doc, "host", config.host);
        read_key(doc, "port", config.port);
        read_key(doc, "chunk_size", config.chunk_size);
        read_key(doc, "max_concurrent_uploads", config.max_concurrent_uploads);
        read_key(doc, "max_chunk_attempts", config.max_chunk_attempts);
        read_ms(doc, "chunk_timeout_ms", config.chunk_timeout);
        read_ms(doc, "merge_timeout_ms", config.merge_timeout);
        read_ms(doc, "status_timeout_ms", config.status_timeout);
        read_key(doc, "log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, std::string("invalid config value: ") + e.what());
    }

    if (config.chunk_size == 0) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, "chunk_size must be > 0");
    }
    if (config.max_concurrent_uploads == 0 || config.max_chunk_attempts == 0) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument,
                                 "max_concurrent_uploads and max_chunk_attempts must be > 0");
    }
    return Ok(std::move(config));
}

Result<ServerConfig> load_server_config(const fs::path& path) {
    auto text = read_text(path);
    if (text.is_error()) {
        return Err<ServerConfig>(text.error());
    }
    return parse_server_config(text.value());
}

Result<ClientConfig> load_client_config(const fs::path& path) {
    auto text = read_text(path);
    if (text.is_error()) {
        return Err<ClientConfig>(text.error());
    }
    return parse_client_config(text.value());
}

Result<void> apply_log_level(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return Err<void>(ErrorCode::InvalidArgument, "unknown log level: " + level);
    }
    spdlog::set_level(parsed);
    return Ok();
}

} // namespace chunked
