#include "chunked/server/cleanup_handler.hpp"

#include "chunked/core/identifiers.hpp"
#include "chunked/events/events.hpp"

#include <spdlog/spdlog.h>

namespace chunked::server {

CleanupHandler::CleanupHandler(storage::StagingArea& staging,
                               storage::FingerprintGate& gate,
                               events::EventBus& bus)
    : staging_(staging),
      gate_(gate),
      bus_(bus) {
}

Result<bool> CleanupHandler::discard_chunk(const std::string& fingerprint, const std::string& index) {
    if (auto res = validate_fingerprint(fingerprint); res.is_error()) {
        return Err<bool>(res.error());
    }
    auto parsed_index = parse_chunk_index(index);
    if (parsed_index.is_error()) {
        return Err<bool>(parsed_index.error());
    }

    auto lease = gate_.try_shared(fingerprint);
    if (!lease) {
        return Err<bool>(ErrorCode::MergeInProgress, "fingerprint is being merged: " + fingerprint);
    }

    auto removed = staging_.remove_chunk(fingerprint, parsed_index.value());
    if (removed.is_error()) {
        spdlog::error("Cleanup of {}/{} failed: {}", fingerprint, index, removed.error().message);
        return removed;
    }

    // Keep "Chunk Set exists iff it holds a chunk"
    if (auto res = staging_.remove_chunk_set_if_empty(fingerprint); res.is_error()) {
        spdlog::warn("Cleanup of {}: {}", fingerprint, res.error().message);
    }

    bus_.emit(events::ChunkDiscardedEvent{fingerprint, parsed_index.value(), removed.value()});
    return removed;
}

Result<std::size_t> CleanupHandler::abandon(const std::string& fingerprint) {
    if (auto res = validate_fingerprint(fingerprint); res.is_error()) {
        return Err<std::size_t>(res.error());
    }

    auto lease = gate_.try_exclusive(fingerprint);
    if (!lease) {
        return Err<std::size_t>(ErrorCode::MergeInProgress,
                                "fingerprint is busy with a merge or upload: " + fingerprint);
    }

    auto removed = staging_.remove_chunk_set(fingerprint);
    if (removed.is_error()) {
        spdlog::error("Abandon of {} failed: {}", fingerprint, removed.error().message);
        return removed;
    }

    bus_.emit(events::ChunkSetAbandonedEvent{fingerprint, removed.value()});
    return removed;
}

} // namespace chunked::server
