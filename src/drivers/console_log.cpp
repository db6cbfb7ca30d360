/**
 * @file console_log.cpp
 * @brief ESP log mirror implementation
 */

#include "console_log.h"
#include <Arduino.h>
#include <esp_log.h>

static const char* TAG = "Events";

namespace Provisioning {

ConsoleLog::ConsoleLog(EventSink& sink) : sink_(sink) {
    subscription_ = sink_.subscribe([](const LogEvent& event) {
        ESP_LOGI(TAG, "%s", event.message.c_str());
    });
}

ConsoleLog::~ConsoleLog() {
    sink_.unsubscribe(subscription_);
}

void ConsoleLog::dumpHistory() const {
    std::vector<LogEvent> lines = sink_.history();
    if (lines.empty()) {
        Serial.println("(no events)");
        return;
    }
    for (const auto& line : lines) {
        Serial.println(line.formatted().c_str());
    }
}

} // namespace Provisioning
