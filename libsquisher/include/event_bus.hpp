/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus used to report per-file progress.
 */

#ifndef SQUISHER_EVENT_BUS_HPP
#define SQUISHER_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace squisher {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details The executor publishes from worker threads; the CLI and the
     * report generator subscribe before a run starts. Publication holds the
     * bus mutex, so handlers run one at a time and must not publish.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Register @p handler for events of type @p Event.
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
         * @brief Deliver @p event to every handler subscribed to its type.
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

} // namespace squisher

#endif // SQUISHER_EVENT_BUS_HPP
