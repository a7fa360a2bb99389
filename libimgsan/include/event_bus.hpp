/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef IMGSAN_EVENT_BUS_HPP
#define IMGSAN_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace imgsan {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details The engine publishes progress events without knowing who
     * listens; the CLI subscribes to the event types it renders.
     *
     * Thread-safe: workers publish concurrently. Handlers run on the
     * publishing thread, one at a time, and must not publish or subscribe
     * themselves.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., FileProcessCompleteEvent).
         * @param handler Function to invoke for each published event of this type.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it == subscribers_.end()) return;
            for (const auto& fn : it->second) {
                fn(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace imgsan

#endif // IMGSAN_EVENT_BUS_HPP
