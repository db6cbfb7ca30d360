/**
 * @file event_sink.cpp
 * @brief Timestamped status log implementation
 */

#include "event_sink.h"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>

namespace Provisioning {

std::string LogEvent::formatted() const {
    time_t seconds = static_cast<time_t>(timestampMs / 1000);
    struct tm local;
    localtime_r(&seconds, &local);

    char stamp[16];
    snprintf(stamp, sizeof(stamp), "[%02d:%02d:%02d] ",
             local.tm_hour, local.tm_min, local.tm_sec);
    return std::string(stamp) + message;
}

EventSink::EventSink(Clock clock, size_t historyLimit)
    : clock_(clock ? std::move(clock) : Clock(&EventSink::systemClockMs)),
      historyLimit_(historyLimit),
      nextId_(1),
      failedDeliveries_(0) {
}

int64_t EventSink::systemClockMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void EventSink::append(const std::string& message) {
    LogEvent event{clock_(), message};

    // Snapshot subscribers so delivery never holds the lock
    std::vector<std::pair<SubscriptionId, Subscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(event);
        if (historyLimit_ > 0 && history_.size() > historyLimit_) {
            history_.erase(history_.begin());
        }
        targets = subscribers_;
    }

    uint32_t failures = 0;
    for (auto& entry : targets) {
        try {
            entry.second(event);
        } catch (const std::exception&) {
            failures++;
        } catch (...) {
            failures++;
        }
    }

    if (failures > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        failedDeliveries_ += failures;
    }
}

EventSink::SubscriptionId EventSink::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = nextId_++;
    subscribers_.emplace_back(id, std::move(subscriber));
    return id;
}

void EventSink::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
        if (it->first == id) {
            subscribers_.erase(it);
            return;
        }
    }
}

std::vector<LogEvent> EventSink::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

size_t EventSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

size_t EventSink::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

uint32_t EventSink::failedDeliveries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failedDeliveries_;
}

} // namespace Provisioning
