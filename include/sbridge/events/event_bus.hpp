/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe hub between the engines and presentation
 *
 * WHY THIS FILE EXISTS:
 * The sender runs on the caller's thread and the receiver on a background
 * thread; both publish progress and milestones here. Subscribers (logger,
 * metrics, a progress bar) never need to know which engine emitted.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<TransferProgressEvent>([](const TransferProgressEvent& e) { ... });
 * bus.emit(TransferProgressEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sbridge::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - emit() may be called concurrently from the sender and receiver threads
 * - Handlers run synchronously on the emitting thread, so a handler shared
 *   by both directions must guard its own state
 * - Handlers may subscribe or unsubscribe from inside a callback
 */
class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for one event type
     *
     * RETURNS:
     * Id to pass to unsubscribe()
     */
    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const HandlerId id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(
            id, std::make_shared<TypedHandler<EventType>>(std::move(handler)));
        return id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * A handler that throws is logged and skipped; delivery continues with
     * the remaining handlers.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& [id, handler] : it->second) {
                snapshot.push_back(handler);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct TypedHandler : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit TypedHandler(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<HandlerId, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

} // namespace sbridge::events
