#pragma once

#include "chunked/core/result.hpp"
#include "chunked/events/event_bus.hpp"
#include "chunked/storage/fingerprint_gate.hpp"
#include "chunked/storage/staging_area.hpp"

#include <chrono>
#include <filesystem>

namespace chunked::server {

/**
 * @brief Removes Chunk Sets nobody has touched for `ttl`
 *
 * Clients that vanish without cancelling leave their chunks behind; the
 * server runs sweep() periodically. A fingerprint under any lease is in use
 * and is skipped, however old its files look.
 */
class StagingSweeper {
public:
    StagingSweeper(storage::StagingArea& staging,
                   storage::FingerprintGate& gate,
                   events::EventBus& bus,
                   std::chrono::milliseconds ttl);

    /**
     * RETURNS: number of Chunk Sets removed
     */
    Result<std::size_t> sweep(std::filesystem::file_time_type now = std::filesystem::file_time_type::clock::now());

    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    storage::StagingArea& staging_;
    storage::FingerprintGate& gate_;
    events::EventBus& bus_;
    std::chrono::milliseconds ttl_;
};

} // namespace chunked::server
