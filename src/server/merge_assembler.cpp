#include "chunked/server/merge_assembler.hpp"

#include "chunked/core/identifiers.hpp"
#include "chunked/events/events.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace chunked::server {
namespace fs = std::filesystem;

namespace {

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

MergeAssembler::MergeAssembler(storage::StagingArea& staging,
                               storage::ArtifactCatalog& catalog,
                               storage::FingerprintGate& gate,
                               events::EventBus& bus,
                               Options options)
    : staging_(staging),
      catalog_(catalog),
      gate_(gate),
      bus_(bus),
      options_(options) {
    if (options_.copy_buffer_bytes == 0) {
        options_.copy_buffer_bytes = 64 * 1024;
    }
}

Result<MergeReceipt> MergeAssembler::merge(const MergeRequest& request, const CancellationToken* cancel) {
    if (auto res = validate_fingerprint(request.fingerprint); res.is_error()) {
        return Err<MergeReceipt>(res.error());
    }
    if (auto res = validate_artifact_name(request.artifact_name); res.is_error()) {
        return Err<MergeReceipt>(res.error());
    }
    // e.g. "chunks" when the staging root sits inside the artifacts root
    std::error_code ec;
    if (fs::is_directory(catalog_.artifact_path(request.artifact_name), ec)) {
        return Err<MergeReceipt>(ErrorCode::InvalidArgument,
                                 "artifact name is taken by a directory: " + request.artifact_name);
    }

    auto lease = gate_.try_exclusive(request.fingerprint);
    if (!lease) {
        // Not a rollback: whoever holds the lease is still working on the Chunk Set
        spdlog::warn("Merge of {} refused: fingerprint busy", request.fingerprint);
        return Err<MergeReceipt>(ErrorCode::MergeInProgress,
                                 "fingerprint is busy with another merge or upload: " + request.fingerprint);
    }

    auto listed = staging_.list_indices(request.fingerprint);
    if (listed.is_error()) {
        return fail(request, listed.error());
    }
    const auto& indices = listed.value();

    // A retried merge whose first response was lost finds its work done
    if (indices.empty()) {
        auto existing = catalog_.find_by_fingerprint(request.fingerprint);
        if (existing && existing->artifact_name == request.artifact_name) {
            spdlog::info("Merge of {} already completed as {}", request.fingerprint, existing->artifact_name);
            return Ok(MergeReceipt{artifact_location(existing->artifact_name),
                                   request.total_chunks,
                                   existing->size});
        }
    }

    const auto stored = static_cast<std::uint32_t>(indices.size());
    if (stored != request.total_chunks) {
        return fail(request, Error::count_mismatch(request.total_chunks, stored));
    }
    // Sorted and distinct, so a last index of total-1 means exactly 0..total-1
    if (stored > 0 && indices.back() != stored - 1) {
        Error error = Error::count_mismatch(request.total_chunks, stored);
        error.message = "chunk indices are not contiguous from 0 (highest is " +
                        std::to_string(indices.back()) + ")";
        return fail(request, std::move(error));
    }

    return assemble(request, indices, cancel);
}

Result<MergeReceipt> MergeAssembler::assemble(const MergeRequest& request,
                                              const std::vector<std::uint32_t>& indices,
                                              const CancellationToken* cancel) {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + options_.merge_timeout;

    const auto temp_path = catalog_.root() /
        ("." + request.artifact_name + ".merging." + std::to_string(temp_counter_.fetch_add(1)));

    auto rollback = [&](Error error) {
        std::error_code ec;
        fs::remove(temp_path, ec);
        if (ec) {
            spdlog::error("Failed to delete partial artifact {}: {}", temp_path.string(), ec.message());
        }
        return fail(request, std::move(error));
    };

    std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return rollback(Error(ErrorCode::IoFailure, "failed to create artifact " + temp_path.string()));
    }

    std::vector<char> buffer(options_.copy_buffer_bytes);
    std::uint64_t total_bytes = 0;

    for (auto index : indices) {
        const auto chunk_path = staging_.chunk_path(request.fingerprint, index);
        std::ifstream input(chunk_path, std::ios::binary);
        if (!input) {
            return rollback(Error(ErrorCode::IoFailure, "failed to open chunk " + chunk_path.string()));
        }

        while (true) {
            if (is_cancelled(cancel)) {
                return rollback(Error(ErrorCode::Cancelled, "merge cancelled"));
            }
            if (std::chrono::steady_clock::now() > deadline) {
                return rollback(Error(ErrorCode::Timeout, "merge exceeded " +
                                      std::to_string(options_.merge_timeout.count()) + "ms"));
            }

            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = input.gcount();
            if (count > 0) {
                output.write(buffer.data(), count);
                if (!output) {
                    return rollback(Error(ErrorCode::IoFailure, "failed to write artifact " + temp_path.string()));
                }
                total_bytes += static_cast<std::uint64_t>(count);
            }
            if (input.eof()) {
                break;
            }
            if (!input) {
                return rollback(Error(ErrorCode::IoFailure, "failed to read chunk " + chunk_path.string()));
            }
        }
    }

    output.flush();
    output.close();
    if (output.fail()) {
        return rollback(Error(ErrorCode::IoFailure, "failed to flush artifact " + temp_path.string()));
    }

    // Last chance to back out before the artifact becomes visible
    if (is_cancelled(cancel)) {
        return rollback(Error(ErrorCode::Cancelled, "merge cancelled"));
    }

    if (request.total_size != 0 && request.total_size != total_bytes) {
        spdlog::warn("Artifact {} is {} bytes, client declared {}",
                     request.artifact_name, total_bytes, request.total_size);
    }

    // Rename and catalog update are one step, so a concurrent merge into the
    // same name cannot leave the name mapped to content it does not hold
    auto published = catalog_.publish(temp_path, storage::CatalogEntry{request.fingerprint, request.artifact_name,
                                                                       total_bytes, unix_now()});
    if (published.is_error()) {
        return rollback(published.error());
    }

    auto removed = staging_.remove_chunk_set(request.fingerprint);
    if (removed.is_error()) {
        spdlog::error("Artifact {} assembled but staging not cleared: {}",
                      request.artifact_name, removed.error().message);
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    const auto chunk_count = static_cast<std::uint32_t>(indices.size());
    bus_.emit(events::MergeCompletedEvent{request.fingerprint, request.artifact_name,
                                          chunk_count, total_bytes, duration});

    return Ok(MergeReceipt{artifact_location(request.artifact_name), chunk_count, total_bytes});
}

Result<MergeReceipt> MergeAssembler::fail(const MergeRequest& request, Error error) {
    if (error.code == ErrorCode::IoFailure) {
        spdlog::error("Merge of {} into {} failed: {}", request.fingerprint, request.artifact_name, error.message);
    }
    bus_.emit(events::MergeFailedEvent{request.fingerprint, request.artifact_name, error.code, error.message});
    return Err<MergeReceipt>(std::move(error));
}

} // namespace chunked::server
