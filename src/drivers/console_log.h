/**
 * @file console_log.h
 * @brief Mirrors EventSink lines onto the ESP log console
 */

#ifndef CONSOLE_LOG_H
#define CONSOLE_LOG_H

#include "../logging/event_sink.h"

namespace Provisioning {

class ConsoleLog {
public:
    explicit ConsoleLog(EventSink& sink);
    ~ConsoleLog();

    ConsoleLog(const ConsoleLog&) = delete;
    ConsoleLog& operator=(const ConsoleLog&) = delete;

    /**
     * @brief Print the retained history to Serial, oldest first
     */
    void dumpHistory() const;

private:
    EventSink& sink_;
    EventSink::SubscriptionId subscription_;
};

} // namespace Provisioning

#endif // CONSOLE_LOG_H
