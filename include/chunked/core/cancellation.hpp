#pragma once

#include <atomic>
#include <memory>

namespace chunked {

/**
 * @brief Cooperative cancellation signal shared by one operation's participants
 *
 * One token is created per upload session (client) or per request (server)
 * and threaded through every call that may block. Nothing is interrupted
 * preemptively: holders poll is_cancelled() at their checkpoints.
 *
 * THREAD SAFETY: cancel() and is_cancelled() may be called from any thread.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline bool is_cancelled(const CancellationToken* token) noexcept {
    return token != nullptr && token->is_cancelled();
}

} // namespace chunked
