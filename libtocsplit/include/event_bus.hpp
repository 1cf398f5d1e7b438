/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef TOCSPLIT_EVENT_BUS_HPP
#define TOCSPLIT_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace tocsplit {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details SplitJobEngine publishes job lifecycle events from its
     * worker threads; the CLI and the public facade subscribe to drive
     * progress output and observers. Handlers run on the publishing
     * thread, outside the bus lock, so a handler may itself publish or
     * subscribe.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., JobProgressEvent).
         * @param handler Function invoked with a const reference to each published event.
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
        void publish(const Event& event) const {
            std::vector<Callback> callbacks;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) {
                    return;
                }
                callbacks = it->second;
            }
            for (const auto& fn : callbacks) {
                fn(&event);
            }
        }

        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it == subscribers_.end() ? 0 : it->second.size();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        mutable std::mutex mtx_;
    };

} // namespace tocsplit

#endif // TOCSPLIT_EVENT_BUS_HPP
