#include "chunked/server/upload_service.hpp"

#include <spdlog/spdlog.h>

namespace chunked::server {

namespace {

MergeAssembler::Options merge_options(const ServerConfig& config) {
    MergeAssembler::Options options;
    options.merge_timeout = config.merge_timeout;
    return options;
}

} // namespace

UploadService::UploadService(const ServerConfig& config, events::EventBus& bus)
    : config_(config),
      event_bus_(bus),
      staging_(config.staging_root),
      catalog_(config.artifacts_root),
      receiver_(staging_, gate_, event_bus_, config.max_chunk_bytes),
      resolver_(staging_, catalog_),
      assembler_(staging_, catalog_, gate_, event_bus_, merge_options(config)),
      cleanup_(staging_, gate_, event_bus_),
      sweeper_(staging_, gate_, event_bus_, config.staging_ttl) {
}

Result<void> UploadService::initialize() {
    if (auto res = staging_.initialize(); res.is_error()) {
        return res;
    }
    if (auto res = catalog_.load(); res.is_error()) {
        return res;
    }
    spdlog::info("Upload service ready: artifacts={} staging={}",
                 config_.artifacts_root.string(), config_.staging_root.string());
    return Ok();
}

Result<UploadStatus> UploadService::status(const std::string& fingerprint,
                                           const std::string& artifact_name) const {
    return resolver_.resolve(fingerprint, artifact_name);
}

Result<std::unique_ptr<ChunkUpload>> UploadService::begin_chunk(const std::string& fingerprint,
                                                                const std::string& index,
                                                                std::uint64_t declared_length) {
    return receiver_.begin(fingerprint, index, declared_length);
}

Result<ChunkReceipt> UploadService::store_chunk(const std::string& fingerprint,
                                                const std::string& index,
                                                const std::vector<std::uint8_t>& bytes) {
    return receiver_.receive(fingerprint, index, bytes);
}

Result<MergeReceipt> UploadService::merge(const MergeRequest& request, const CancellationToken* cancel) {
    return assembler_.merge(request, cancel);
}

Result<bool> UploadService::discard_chunk(const std::string& fingerprint, const std::string& index) {
    return cleanup_.discard_chunk(fingerprint, index);
}

Result<std::size_t> UploadService::abandon(const std::string& fingerprint) {
    return cleanup_.abandon(fingerprint);
}

Result<std::size_t> UploadService::sweep_staging() {
    return sweeper_.sweep();
}

} // namespace chunked::server
