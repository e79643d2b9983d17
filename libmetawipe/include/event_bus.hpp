/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef METAWIPE_EVENT_BUS_HPP
#define METAWIPE_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace metawipe {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details The orchestrator publishes progress events (scan finished,
     * file started, file cleaned, backup failed) without knowing who is
     * listening; the CLI progress bar, the CSV report and the tests subscribe
     * to the event types they care about.
     *
     * Handlers are copied out under the lock and invoked without it, so a
     * handler may publish or subscribe in turn.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., FileCleanCompleteEvent).
         * @param handler Function invoked with a const reference to each published event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         * @tparam Event The event struct type.
         * @param event The event instance to publish.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Callback> handlers;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) {
                    return;
                }
                handlers = it->second;
            }
            for (const auto& fn : handlers) {
                fn(&event);
            }
        }

    private:
        ///< Type alias for the internal type-erased callback.
        using Callback = std::function<void(const void*)>;
        ///< Map of event type_index to a vector of callbacks.
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        ///< Protects the subscriber map.
        mutable std::mutex mtx_;
    };

} // namespace metawipe

#endif // METAWIPE_EVENT_BUS_HPP
