/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef TEXHARVEST_EVENT_BUS_HPP
#define TEXHARVEST_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace texharvest {

    /**
     * @brief Type-safe publish/subscribe bus between the pipeline and its observers.
     *
     * @details PipelineOrchestrator publishes item lifecycle events without
     * knowing who listens; the CLI progress bar and report collector
     * subscribe to the event types they need.
     *
     * Subscriptions and publications are serialised by one mutex, so handlers
     * run one at a time even when items finish on different threads. Handlers
     * must not publish or subscribe on the same bus.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g. ItemCompleteEvent).
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
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it != subscribers_.end()) {
                for (auto& fn : it->second) {
                    fn(&event);
                }
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace texharvest

#endif // TEXHARVEST_EVENT_BUS_HPP
