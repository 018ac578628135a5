/**
 * @file events.hpp
 * @brief Event types emitted by the upload server components
 *
 * NAMING CONVENTION:
 * - Events are past-tense: ChunkStoredEvent, MergeFailedEvent
 *
 * Every event carries the fingerprint it concerns so subscribers can
 * correlate a Chunk Set's history without holding any server state.
 */

#pragma once

#include "chunked/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chunked::events {

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the HTTP listener is up
 *
 * WHO EMITS: server main()
 */
struct ServerStartedEvent {
    std::uint16_t port;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerStartedEvent(std::uint16_t p)
        : port(p),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Chunk Events
// ════════════════════════════════════════════════════════

/**
 * @brief A chunk was fully received and is now part of its Chunk Set
 *
 * WHO EMITS: ChunkReceiver on commit
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct ChunkStoredEvent {
    std::string fingerprint;
    std::uint32_t index = 0;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A chunk transfer ended before its body was complete
 *
 * The partial bytes have already been deleted when this fires.
 *
 * WHO EMITS: ChunkReceiver on abort (peer disconnect, timeout, write error)
 */
struct ChunkCancelledEvent {
    std::string fingerprint;
    std::uint32_t index = 0;
    std::uint64_t bytes_discarded = 0;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A stored chunk was deleted by an explicit cleanup request
 *
 * WHO EMITS: CleanupHandler
 */
struct ChunkDiscardedEvent {
    std::string fingerprint;
    std::uint32_t index = 0;
    bool existed = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChunkSetAbandonedEvent {
    std::string fingerprint;
    std::size_t chunks_removed = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Merge Events
// ════════════════════════════════════════════════════════

struct MergeCompletedEvent {
    std::string fingerprint;
    std::string artifact_name;
    std::uint32_t chunk_count = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A merge was refused or rolled back
 *
 * The Chunk Set is still intact whenever this fires.
 */
struct MergeFailedEvent {
    std::string fingerprint;
    std::string artifact_name;
    ErrorCode code = ErrorCode::IoFailure;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Maintenance Events
// ════════════════════════════════════════════════════════

/**
 * @brief An orphaned Chunk Set was removed by the staging sweep
 */
struct StagingSweptEvent {
    std::string fingerprint;
    std::size_t chunks_removed = 0;
    std::chrono::milliseconds idle_for{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace chunked::events
