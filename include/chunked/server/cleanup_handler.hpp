#pragma once

#include "chunked/core/result.hpp"
#include "chunked/events/event_bus.hpp"
#include "chunked/storage/fingerprint_gate.hpp"
#include "chunked/storage/staging_area.hpp"

#include <cstdint>
#include <string>

namespace chunked::server {

/**
 * @brief Client-driven removal of staged chunks
 *
 * discard_chunk() frees the chunk that was in flight when the client
 * cancelled; abandon() drops the whole Chunk Set when the client gives up
 * on the content entirely. Neither touches a fingerprint that is being
 * merged.
 */
class CleanupHandler {
public:
    CleanupHandler(storage::StagingArea& staging,
                   storage::FingerprintGate& gate,
                   events::EventBus& bus);

    /**
     * @brief Delete one chunk; deleting an absent chunk succeeds
     *
     * RETURNS: whether the chunk existed
     */
    Result<bool> discard_chunk(const std::string& fingerprint, const std::string& index);

    /**
     * @brief Delete every chunk staged for the fingerprint
     *
     * RETURNS: number of committed chunks removed
     */
    Result<std::size_t> abandon(const std::string& fingerprint);

private:
    storage::StagingArea& staging_;
    storage::FingerprintGate& gate_;
    events::EventBus& bus_;
};

} // namespace chunked::server
