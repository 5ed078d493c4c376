/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe bus for provider-side notifications
 *
 * WHY THIS FILE EXISTS:
 * The provider's connection handlers should not know who is interested
 * in what they do. They publish ClientConnectedEvent, TransferCompletedEvent
 * and friends; the CLI attaches a LoggerComponent and a StatsComponent.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) { ... });
 * bus.emit(TransferCompletedEvent{...});
 */

#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace sendme::events {

/**
 * @brief Type-erased event bus keyed by event type
 *
 * THREAD SAFETY:
 * - emit() may be called from any Asio worker concurrently
 * - Handlers run synchronously on the emitting thread
 * - Handlers may subscribe from inside a handler (the list is copied first)
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * RETURNS:
     * Subscription id, accepted by unsubscribe<EventType>()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto entry = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(id, std::move(entry));
        return id;
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }

        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& item) { return item.first == handler_id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * A handler that throws is logged and skipped; the remaining
     * handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
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

        for (auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler failed for {}: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    // ════════════════════════════════════════════════════════
    // Type erasure
    // ════════════════════════════════════════════════════════

    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace sendme::events
