/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe bus between upload components
 *
 * WHY THIS FILE EXISTS:
 * The receiver, assembler, cleanup handler and sweeper report what they did
 * without knowing whether anything logs, counts or reacts to it.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ChunkStoredEvent>([](const ChunkStoredEvent& e) { ... });
 * bus.emit(ChunkStoredEvent{fingerprint, index, bytes});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace chunked::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - emit() may be called concurrently from connection and worker threads
 * - subscribe()/unsubscribe() may race with emit()
 * - Handlers run synchronously on the emitting thread, outside the lock
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS: Subscription ID for unsubscribe()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        // Get type index for this event type
        auto type_id = std::type_index(typeid(EventType));

        // Wrap handler in type-erased container
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));

        // Generate unique ID for this subscription
        size_t handler_id = next_handler_id_++;

        // Store handler
        handlers_[type_id].push_back({handler_id, wrapper});
        return handler_id;
    }

    /**
     * @brief Unsubscribe a handler
     */
    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it != handlers_.end()) {
            auto& handler_list = it->second;

            // Remove handler with matching ID
            handler_list.erase(
                std::remove_if(handler_list.begin(), handler_list.end(),
                    [handler_id](const auto& pair) {
                        return pair.first == handler_id;
                    }),
                handler_list.end()
            );
        }
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged; the remaining handlers still run and
     * the emitter never sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        // Copy handlers under lock, then call them without holding it
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        // Call all handlers (outside lock to prevent deadlocks)
        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    /**
     * @brief Get number of subscribers for an event type
     */
    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /**
     * @brief Clear all subscriptions
     */
    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    // Type-erased handler base
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    // Typed handler implementation
    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    // event type -> (handler_id, handler)
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace chunked::events
