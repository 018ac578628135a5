#pragma once

#include "chunked/core/cancellation.hpp"
#include "chunked/core/config.hpp"
#include "chunked/core/result.hpp"
#include "chunked/events/event_bus.hpp"
#include "chunked/server/chunk_receiver.hpp"
#include "chunked/server/cleanup_handler.hpp"
#include "chunked/server/merge_assembler.hpp"
#include "chunked/server/staging_sweeper.hpp"
#include "chunked/server/status_resolver.hpp"
#include "chunked/storage/artifact_catalog.hpp"
#include "chunked/storage/fingerprint_gate.hpp"
#include "chunked/storage/staging_area.hpp"

#include <memory>
#include <string>
#include <vector>

namespace chunked::server {

/**
 * @brief The server side of the protocol behind one object
 *
 * Owns the staging area, catalog and fingerprint gate and wires the four
 * protocol components (plus abandon and sweep) to them. Transport code,
 * whether HTTP or an in-process test double, talks only to this class.
 *
 * THREAD SAFETY: every method may be called concurrently.
 */
class UploadService {
public:
    UploadService(const ServerConfig& config, events::EventBus& bus);

    UploadService(const UploadService&) = delete;
    UploadService& operator=(const UploadService&) = delete;

    /**
     * @brief Create the directories and load the artifact catalog
     *
     * Must succeed before any other call.
     */
    Result<void> initialize();

    Result<UploadStatus> status(const std::string& fingerprint, const std::string& artifact_name) const;

    Result<std::unique_ptr<ChunkUpload>> begin_chunk(const std::string& fingerprint,
                                                     const std::string& index,
                                                     std::uint64_t declared_length);

    Result<ChunkReceipt> store_chunk(const std::string& fingerprint,
                                     const std::string& index,
                                     const std::vector<std::uint8_t>& bytes);

    Result<MergeReceipt> merge(const MergeRequest& request, const CancellationToken* cancel = nullptr);

    Result<bool> discard_chunk(const std::string& fingerprint, const std::string& index);

    Result<std::size_t> abandon(const std::string& fingerprint);

    Result<std::size_t> sweep_staging();

    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }
    storage::StagingArea& staging() noexcept { return staging_; }
    storage::ArtifactCatalog& catalog() noexcept { return catalog_; }
    storage::FingerprintGate& gate() noexcept { return gate_; }

private:
    ServerConfig config_;
    events::EventBus& event_bus_;

    storage::StagingArea staging_;
    storage::ArtifactCatalog catalog_;
    storage::FingerprintGate gate_;

    ChunkReceiver receiver_;
    StatusResolver resolver_;
    MergeAssembler assembler_;
    CleanupHandler cleanup_;
    StagingSweeper sweeper_;
};

} // namespace chunked::server
