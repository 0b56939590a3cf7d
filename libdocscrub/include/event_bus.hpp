//
// event_bus.hpp
//

/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef DOCSCRUB_EVENT_BUS_HPP
#define DOCSCRUB_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace docscrub {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details The ProcessorExecutor publishes document lifecycle events
     * without knowing who listens; the CLI, the report generator and the
     * DocScrub facade subscribe to the types they need.
     *
     * Subscriptions and publications are thread-safe. Handlers run on the
     * publishing thread, outside the internal lock, so a handler may publish
     * further events or subscribe new handlers.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., DocumentCompleteEvent).
         * @param handler Invoked with a const reference to each published event.
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
         * @tparam Event The event struct type.
         * @param event The event instance to publish.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<Callback> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                targets = it->second;
            }
            for (const auto& fn : targets) {
                fn(&event);
            }
        }

        /**
         * @brief Number of handlers registered for @p Event.
         */
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it == subscribers_.end() ? 0 : it->second.size();
        }

    private:
        ///< Type alias for the internal type-erased callback.
        using Callback = std::function<void(const void*)>;
        ///< Map of event type_index to a vector of callbacks.
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        ///< Protects subscriber map during read/write.
        mutable std::mutex mtx_;
    };

} // namespace docscrub

#endif // DOCSCRUB_EVENT_BUS_HPP
