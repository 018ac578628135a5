#include "chunked/server/staging_sweeper.hpp"

#include "chunked/core/identifiers.hpp"
#include "chunked/events/events.hpp"

#include <spdlog/spdlog.h>

namespace chunked::server {

StagingSweeper::StagingSweeper(storage::StagingArea& staging,
                               storage::FingerprintGate& gate,
                               events::EventBus& bus,
                               std::chrono::milliseconds ttl)
    : staging_(staging),
      gate_(gate),
      bus_(bus),
      ttl_(ttl) {
}

Result<std::size_t> StagingSweeper::sweep(std::filesystem::file_time_type now) {
    auto sets = staging_.list_chunk_sets();
    if (sets.is_error()) {
        return Err<std::size_t>(sets.error());
    }

    std::size_t swept = 0;
    for (const auto& info : sets.value()) {
        // Stray directories that could never have been a fingerprint are left alone
        if (validate_fingerprint(info.fingerprint).is_error()) {
            continue;
        }

        const auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - info.last_activity);
        if (idle < ttl_) {
            continue;
        }

        auto lease = gate_.try_exclusive(info.fingerprint);
        if (!lease) {
            continue;
        }

        auto removed = staging_.remove_chunk_set(info.fingerprint);
        if (removed.is_error()) {
            spdlog::error("Sweep of {} failed: {}", info.fingerprint, removed.error().message);
            continue;
        }

        ++swept;
        bus_.emit(events::StagingSweptEvent{info.fingerprint, removed.value(), idle});
    }

    return Ok(swept);
}

} // namespace chunked::server
