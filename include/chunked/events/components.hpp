/**
 * @file components.hpp
 * @brief Event-driven observers for the upload server
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every chunk, merge and sweep is now logged and counted.
 */

#pragma once

#include "chunked/events/event_bus.hpp"
#include "chunked/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace chunked::events {

/**
 * @brief Logger component - one log line per upload event
 *
 * Per-chunk traffic goes to debug, lifecycle to info, rollbacks to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });

        bus_.subscribe<ChunkStoredEvent>([this](const ChunkStoredEvent& e) {
            on_chunk_stored(e);
        });

        bus_.subscribe<ChunkCancelledEvent>([this](const ChunkCancelledEvent& e) {
            on_chunk_cancelled(e);
        });

        bus_.subscribe<ChunkDiscardedEvent>([this](const ChunkDiscardedEvent& e) {
            on_chunk_discarded(e);
        });

        bus_.subscribe<ChunkSetAbandonedEvent>([this](const ChunkSetAbandonedEvent& e) {
            on_chunk_set_abandoned(e);
        });

        bus_.subscribe<MergeCompletedEvent>([this](const MergeCompletedEvent& e) {
            on_merge_completed(e);
        });

        bus_.subscribe<MergeFailedEvent>([this](const MergeFailedEvent& e) {
            on_merge_failed(e);
        });

        bus_.subscribe<StagingSweptEvent>([this](const StagingSweptEvent& e) {
            on_staging_swept(e);
        });
    }

private:
    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Upload server started on port {}", e.port);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("Upload server shutting down: {}", e.reason);
    }

    void on_chunk_stored(const ChunkStoredEvent& e) {
        spdlog::debug("[ChunkStored] fingerprint={} index={} bytes={}",
                      e.fingerprint, e.index, e.bytes);
    }

    void on_chunk_cancelled(const ChunkCancelledEvent& e) {
        spdlog::warn("[ChunkCancelled] fingerprint={} index={} discarded={} reason={}",
                     e.fingerprint, e.index, e.bytes_discarded, e.reason);
    }

    void on_chunk_discarded(const ChunkDiscardedEvent& e) {
        spdlog::info("[ChunkDiscarded] fingerprint={} index={} existed={}",
                     e.fingerprint, e.index, e.existed);
    }

    void on_chunk_set_abandoned(const ChunkSetAbandonedEvent& e) {
        spdlog::info("[ChunkSetAbandoned] fingerprint={} chunks={}", e.fingerprint, e.chunks_removed);
    }

    void on_merge_completed(const MergeCompletedEvent& e) {
        spdlog::info("[MergeCompleted] fingerprint={} artifact={} chunks={} bytes={} duration={}ms",
                     e.fingerprint, e.artifact_name, e.chunk_count, e.total_bytes, e.duration.count());
    }

    void on_merge_failed(const MergeFailedEvent& e) {
        spdlog::warn("[MergeFailed] fingerprint={} artifact={} code={} message={}",
                     e.fingerprint, e.artifact_name, error_code_name(e.code), e.message);
    }

    void on_staging_swept(const StagingSweptEvent& e) {
        spdlog::info("[StagingSwept] fingerprint={} chunks={} idle={}ms",
                     e.fingerprint, e.chunks_removed, e.idle_for.count());
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - counters for the stats endpoint
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> chunks_stored{0};
        std::atomic<uint64_t> bytes_stored{0};
        std::atomic<uint64_t> chunks_cancelled{0};
        std::atomic<uint64_t> chunks_discarded{0};
        std::atomic<uint64_t> chunk_sets_abandoned{0};
        std::atomic<uint64_t> merges_completed{0};
        std::atomic<uint64_t> merges_failed{0};
        std::atomic<uint64_t> bytes_assembled{0};
        std::atomic<uint64_t> chunk_sets_swept{0};
    };

    /// Plain copy of Stats, safe to serialize
    struct Snapshot {
        uint64_t chunks_stored = 0;
        uint64_t bytes_stored = 0;
        uint64_t chunks_cancelled = 0;
        uint64_t chunks_discarded = 0;
        uint64_t chunk_sets_abandoned = 0;
        uint64_t merges_completed = 0;
        uint64_t merges_failed = 0;
        uint64_t bytes_assembled = 0;
        uint64_t chunk_sets_swept = 0;
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkStoredEvent>([this](const ChunkStoredEvent& e) {
            stats_.chunks_stored++;
            stats_.bytes_stored += e.bytes;
        });

        bus_.subscribe<ChunkCancelledEvent>([this](const ChunkCancelledEvent&) {
            stats_.chunks_cancelled++;
        });

        bus_.subscribe<ChunkDiscardedEvent>([this](const ChunkDiscardedEvent& e) {
            if (e.existed) {
                stats_.chunks_discarded++;
            }
        });

        bus_.subscribe<ChunkSetAbandonedEvent>([this](const ChunkSetAbandonedEvent&) {
            stats_.chunk_sets_abandoned++;
        });

        bus_.subscribe<MergeCompletedEvent>([this](const MergeCompletedEvent& e) {
            stats_.merges_completed++;
            stats_.bytes_assembled += e.total_bytes;
        });

        bus_.subscribe<MergeFailedEvent>([this](const MergeFailedEvent&) {
            stats_.merges_failed++;
        });

        bus_.subscribe<StagingSweptEvent>([this](const StagingSweptEvent&) {
            stats_.chunk_sets_swept++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    Snapshot snapshot() const {
        Snapshot s;
        s.chunks_stored = stats_.chunks_stored.load();
        s.bytes_stored = stats_.bytes_stored.load();
        s.chunks_cancelled = stats_.chunks_cancelled.load();
        s.chunks_discarded = stats_.chunks_discarded.load();
        s.chunk_sets_abandoned = stats_.chunk_sets_abandoned.load();
        s.merges_completed = stats_.merges_completed.load();
        s.merges_failed = stats_.merges_failed.load();
        s.bytes_assembled = stats_.bytes_assembled.load();
        s.chunk_sets_swept = stats_.chunk_sets_swept.load();
        return s;
    }

    void print_stats() const {
        const auto s = snapshot();
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Chunks stored:     {}", s.chunks_stored);
        spdlog::info("  Bytes stored:      {}", s.bytes_stored);
        spdlog::info("  Chunks cancelled:  {}", s.chunks_cancelled);
        spdlog::info("  Chunks discarded:  {}", s.chunks_discarded);
        spdlog::info("  Sets abandoned:    {}", s.chunk_sets_abandoned);
        spdlog::info("  Merges completed:  {}", s.merges_completed);
        spdlog::info("  Merges failed:     {}", s.merges_failed);
        spdlog::info("  Bytes assembled:   {}", s.bytes_assembled);
        spdlog::info("  Sets swept:        {}", s.chunk_sets_swept);
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace chunked::events
