//
// Created by Giuseppe Francione on 03/10/26.
//

/**
 * @file event_bus.hpp
 * @brief Type-indexed publish/subscribe bus used to report batch progress.
 */

#ifndef SUBSMITH_EVENT_BUS_HPP
#define SUBSMITH_EVENT_BUS_HPP

#include <functional>
#include <unordered_map>
#include <typeindex>
#include <vector>
#include <mutex>

namespace subsmith {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details The JobScheduler publishes job lifecycle events (see events.hpp);
     * the CLI subscribes to draw the progress bar and collect the summary.
     * Handlers are invoked outside the subscriber lock, so a handler may
     * publish further events.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to one event type.
         * @tparam Event The event struct type (e.g. JobSucceededEvent).
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back([handler](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<Callback> handlers;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                handlers = it->second;
            }
            for (const auto& fn : handlers) {
                fn(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace subsmith

#endif // SUBSMITH_EVENT_BUS_HPP
