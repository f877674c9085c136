/**
 * @file event_bus.hpp
 * @brief Type-safe event bus connecting the transfer pipeline to its observers
 *
 * WHY THIS FILE EXISTS:
 * The pipeline (orchestrator, stability monitor, pruner) reports what it
 * does by emitting events. Logging, metrics and any presentation layer
 * subscribe to those events without the pipeline knowing about them.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<PollObservedEvent>([](const PollObservedEvent& e) { ... });
 * bus.emit(PollObservedEvent{...});
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

namespace cloudmove::events {

using SubscriptionId = std::size_t;

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * Handlers run synchronously on the emitting thread. Subscribing and
 * emitting may happen from different threads; the interrupt listener
 * emits from its own signal thread while the orchestrator emits from
 * the main one.
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for one event type
     *
     * RETURNS:
     * Subscription id accepted by unsubscribe()
     */
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back(
            {id, std::make_shared<HandlerImpl<EventType>>(std::move(handler))});
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
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
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the emitter never sees the exception.
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
    struct HandlerImpl : HandlerBase {
        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }

        std::function<void(const EventType&)> func;
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<SubscriptionId, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace cloudmove::events
