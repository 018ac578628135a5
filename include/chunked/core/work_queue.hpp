/**
 * @file work_queue.hpp
 * @brief Closable FIFO shared by a fixed set of worker threads
 *
 * Producers push jobs, workers pop until the queue is closed and drained.
 * Used to bound how many chunk uploads a client runs at once: the number of
 * workers, not the number of jobs, decides the fan-out.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace chunked {

template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /**
     * @brief Add a job
     *
     * RETURNS: false if the queue was already closed (job dropped)
     */
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Take the next job without waiting
     */
    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /**
     * @brief Take the next job, waiting while the queue is open and empty
     *
     * RETURNS: nullopt once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !items_.empty() || closed_; });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !items_.empty() || closed_; })) {
            return std::nullopt;
        }
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /**
     * @brief Stop accepting jobs and wake every waiting worker
     *
     * Jobs already queued are still handed out unless clear() is called.
     */
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Drop queued jobs that no worker has taken yet
    std::size_t clear() {
        std::lock_guard lock(mutex_);
        const auto dropped = items_.size();
        items_.clear();
        return dropped;
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace chunked
