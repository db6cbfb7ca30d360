/**
 * @file event_sink.h
 * @brief Timestamped status log with fan-out to subscribers
 *
 * Every lifecycle component appends human-readable status lines here.
 * One instance is wired in main and injected into each component.
 *
 * Thread safety:
 * - append() may be called from any task
 * - subscribe()/unsubscribe() may race with append()
 * - Delivery runs outside the internal lock; a subscriber that throws
 *   is counted and skipped, the remaining subscribers still get the line
 */

#ifndef EVENT_SINK_H
#define EVENT_SINK_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace Provisioning {

/**
 * @brief One observable status line
 */
struct LogEvent {
    int64_t timestampMs;   ///< Wall clock, epoch milliseconds
    std::string message;

    /**
     * @brief Render as "[HH:MM:SS] message" in local time
     */
    std::string formatted() const;
};

class EventSink {
public:
    using Subscriber = std::function<void(const LogEvent&)>;
    using SubscriptionId = uint32_t;
    using Clock = std::function<int64_t()>;

    /**
     * @param clock Epoch-millisecond clock (nullptr = system clock)
     * @param historyLimit Lines kept in history (0 = unbounded)
     */
    explicit EventSink(Clock clock = nullptr, size_t historyLimit = 0);

    EventSink(const EventSink&) = delete;
    EventSink& operator=(const EventSink&) = delete;

    /**
     * @brief Append a line and deliver it to all subscribers
     */
    void append(const std::string& message);

    /**
     * @brief Register a subscriber
     * @return Id for unsubscribe()
     */
    SubscriptionId subscribe(Subscriber subscriber);

    /**
     * @brief Remove a subscriber (unknown ids are ignored)
     */
    void unsubscribe(SubscriptionId id);

    /**
     * @brief Copy of all retained lines, oldest first
     */
    std::vector<LogEvent> history() const;

    size_t size() const;
    size_t subscriberCount() const;

    /**
     * @brief Number of deliveries that threw since construction
     */
    uint32_t failedDeliveries() const;

    /**
     * @brief Current epoch-millisecond time from the system clock
     */
    static int64_t systemClockMs();

private:
    Clock clock_;
    size_t historyLimit_;

    mutable std::mutex mutex_;
    std::vector<LogEvent> history_;
    std::vector<std::pair<SubscriptionId, Subscriber>> subscribers_;
    SubscriptionId nextId_;
    uint32_t failedDeliveries_;
};

} // namespace Provisioning

#endif // EVENT_SINK_H
