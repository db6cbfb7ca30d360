/**
 * @file event_queue.h
 * @brief Single-consumer event channel for platform callbacks
 *
 * Platform callbacks (WiFi event task, timers) post() events; the owning
 * state machine drains them from one context with poll(). Keeps callback
 * code from touching state machine fields directly.
 */

#ifndef EVENT_QUEUE_H
#define EVENT_QUEUE_H

#include <deque>
#include <mutex>

namespace Provisioning {

template<typename T>
class EventQueue {
public:
    EventQueue() = default;
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /**
     * @brief Enqueue an event (any producer context except ISR)
     */
    void post(const T& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    /**
     * @brief Dequeue the oldest event (consumer side)
     * @return false if the queue was empty
     */
    bool poll(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty()) {
            return false;
        }
        out = events_.front();
        events_.pop_front();
        return true;
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> events_;
};

} // namespace Provisioning

#endif // EVENT_QUEUE_H
