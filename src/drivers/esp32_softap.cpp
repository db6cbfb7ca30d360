/**
 * @file esp32_softap.cpp
 * @brief Soft access point driver implementation
 */

#include "esp32_softap.h"
#include <esp_log.h>
#include <esp_random.h>

static const char* TAG = "SoftAP";

namespace Provisioning {

namespace {
    constexpr size_t FALLBACK_PASSPHRASE_LEN = 12;
    constexpr size_t MIN_WPA2_PASSPHRASE_LEN = 8;
}

Esp32SoftAp::Esp32SoftAp() : Esp32SoftAp(Config()) {
}

Esp32SoftAp::Esp32SoftAp(const Config& config)
    : config_(config), eventId_(0), activeToken_(0) {
    // Register before any start so AP_START is never missed
    eventId_ = WiFi.onEvent([this](arduino_event_id_t event, arduino_event_info_t info) {
        onWiFiEvent(event, info);
    });
}

Esp32SoftAp::~Esp32SoftAp() {
    WiFi.removeEvent(eventId_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (activeToken_ != 0) {
        WiFi.softAPdisconnect(true);
        WiFi.mode(WIFI_OFF);
        activeToken_ = 0;
    }
}

void Esp32SoftAp::setEventHandler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

bool Esp32SoftAp::requestStart(uint32_t token, const ApCredentials& preferred) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeToken_ = token;
    }

    WiFi.mode(WIFI_AP);

    IPAddress gateway;
    IPAddress netmask;
    if (!gateway.fromString(preferred.gateway.c_str()) || !netmask.fromString(config_.netmask)) {
        ESP_LOGE(TAG, "Invalid gateway %s / netmask %s", preferred.gateway.c_str(), config_.netmask);
        post(ApEvent{ApEvent::Type::Failed, token, ApCredentials(), ESP_ERR_INVALID_ARG, "invalid gateway"});
        return false;
    }
    if (!WiFi.softAPConfig(gateway, gateway, netmask)) {
        ESP_LOGW(TAG, "softAPConfig rejected %s, keeping default addressing", preferred.gateway.c_str());
    }

    ApCredentials credentials = preferred;
    if (!bringUp(credentials)) {
        credentials = fallbackCredentials(preferred);
        ESP_LOGW(TAG, "Fixed credentials rejected, falling back to %s", credentials.ssid.c_str());
        post(ApEvent{ApEvent::Type::CredentialFallback, token, credentials, 0,
                     "ssid " + preferred.ssid + " not accepted"});

        if (!bringUp(credentials)) {
            ESP_LOGE(TAG, "Soft AP start failed");
            WiFi.mode(WIFI_OFF);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                activeToken_ = 0;
            }
            post(ApEvent{ApEvent::Type::Failed, token, ApCredentials(), ESP_FAIL, "softAP rejected"});
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    active_ = credentials;
    return true;
}

void Esp32SoftAp::release(uint32_t token) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token == 0 || token != activeToken_) {
            return;
        }
        activeToken_ = 0;
        active_ = ApCredentials();
    }

    WiFi.softAPdisconnect(true);
    WiFi.mode(WIFI_OFF);
    ESP_LOGI(TAG, "Released (request %lu)", static_cast<unsigned long>(token));
}

uint8_t Esp32SoftAp::clientCount() const {
    return WiFi.softAPgetStationNum();
}

// ============================================================================
// Internals
// ============================================================================

bool Esp32SoftAp::bringUp(const ApCredentials& credentials) {
    const char* passphrase = credentials.passphrase.size() >= MIN_WPA2_PASSPHRASE_LEN
                             ? credentials.passphrase.c_str() : nullptr;
    return WiFi.softAP(credentials.ssid.c_str(), passphrase, config_.channel, 0, config_.maxClients);
}

ApCredentials Esp32SoftAp::fallbackCredentials(const ApCredentials& preferred) const {
    uint8_t mac[6];
    WiFi.softAPmacAddress(mac);

    char ssid[32];
    snprintf(ssid, sizeof(ssid), "%s-%02X%02X", config_.fallbackPrefix, mac[4], mac[5]);

    static const char hex[] = "0123456789abcdef";
    std::string passphrase;
    for (size_t i = 0; i < FALLBACK_PASSPHRASE_LEN; i++) {
        passphrase += hex[esp_random() & 0x0F];
    }

    return ApCredentials{ssid, passphrase, preferred.gateway};
}

void Esp32SoftAp::post(const ApEvent& event) {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    if (handler) {
        handler(event);
    }
}

void Esp32SoftAp::onWiFiEvent(arduino_event_id_t event, arduino_event_info_t info) {
    (void)info;

    switch (event) {
        case ARDUINO_EVENT_WIFI_AP_START: {
            ApEvent started{ApEvent::Type::Started, 0, ApCredentials(), 0, ""};
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (activeToken_ == 0) {
                    return;
                }
                started.token = activeToken_;
                started.credentials = active_;
            }
            // softAP() may not have returned yet; read what the radio reports
            started.credentials.ssid = WiFi.softAPSSID().c_str();
            started.credentials.gateway = WiFi.softAPIP().toString().c_str();
            if (started.credentials.passphrase.empty()) {
                started.credentials.passphrase = WiFi.softAPPSK().c_str();
            }
            ESP_LOGI(TAG, "AP started: %s @ %s", started.credentials.ssid.c_str(),
                     started.credentials.gateway.c_str());
            post(started);
            break;
        }

        case ARDUINO_EVENT_WIFI_AP_STOP: {
            uint32_t token;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                token = activeToken_;
            }
            // Our own release() clears the token first, so only external stops get here
            if (token != 0) {
                ESP_LOGW(TAG, "AP stopped by the system");
                post(ApEvent{ApEvent::Type::Stopped, token, ApCredentials(), 0, ""});
            }
            break;
        }

        case ARDUINO_EVENT_WIFI_AP_STACONNECTED:
            ESP_LOGI(TAG, "Client connected");
            break;

        case ARDUINO_EVENT_WIFI_AP_STADISCONNECTED:
            ESP_LOGI(TAG, "Client disconnected");
            break;

        default:
            break;
    }
}

} // namespace Provisioning
