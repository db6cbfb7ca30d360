/**
 * @file esp32_station.cpp
 * @brief Station attachment driver implementation
 */

#include "esp32_station.h"
#include <esp_log.h>

static const char* TAG = "Station";

namespace Provisioning {

namespace {
    constexpr const char* STA_IFKEY = "WIFI_STA_DEF";
}

Esp32Station::Esp32Station(uint32_t attachTimeoutMs)
    : attachTimeoutMs_(attachTimeoutMs),
      eventId_(0),
      timer_(nullptr),
      requestId_(0),
      requestSettled_(false),
      attached_(NO_NETWORK),
      nextHandle_(1),
      pinned_(nullptr),
      savedDefault_(nullptr) {
    esp_timer_create_args_t args = {};
    args.callback = &Esp32Station::onAttachTimeout;
    args.arg = this;
    args.name = "attach_timeout";
    esp_err_t err = esp_timer_create(&args, &timer_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Attach timer create failed: %s", esp_err_to_name(err));
        timer_ = nullptr;
    }

    eventId_ = WiFi.onEvent([this](arduino_event_id_t event, arduino_event_info_t info) {
        onWiFiEvent(event, info);
    });
}

Esp32Station::~Esp32Station() {
    WiFi.removeEvent(eventId_);
    stopTimer();
    if (timer_) {
        esp_timer_delete(timer_);
        timer_ = nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (pinned_ && savedDefault_) {
        esp_netif_set_default_netif(savedDefault_);
    }
    pinned_ = nullptr;
    savedDefault_ = nullptr;
    if (requestId_ != 0) {
        WiFi.disconnect(true);
        requestId_ = 0;
    }
}

void Esp32Station::setEventHandler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

bool Esp32Station::requestNetwork(uint32_t requestId, const std::string& ssid,
                                  const std::string& passphrase) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requestId_ = requestId;
        requestSettled_ = false;
        attached_ = NO_NETWORK;
    }

    WiFi.mode(WIFI_STA);
    WiFi.setAutoReconnect(false);

    wl_status_t status = WiFi.begin(ssid.c_str(), passphrase.empty() ? nullptr : passphrase.c_str());
    if (status == WL_CONNECT_FAILED) {
        ESP_LOGE(TAG, "WiFi.begin(%s) failed", ssid.c_str());
        std::lock_guard<std::mutex> lock(mutex_);
        requestId_ = 0;
        return false;
    }

    if (timer_) {
        esp_err_t err = esp_timer_start_once(timer_, static_cast<uint64_t>(attachTimeoutMs_) * 1000ULL);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Attach timer start failed: %s", esp_err_to_name(err));
        }
    }

    ESP_LOGI(TAG, "Joining %s (request %lu)", ssid.c_str(), static_cast<unsigned long>(requestId));
    return true;
}

void Esp32Station::cancelRequest(uint32_t requestId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requestId == 0 || requestId != requestId_) {
            return;
        }
        requestId_ = 0;
        requestSettled_ = true;
        attached_ = NO_NETWORK;
    }

    stopTimer();
    WiFi.disconnect(true);
    ESP_LOGI(TAG, "Request %lu cancelled", static_cast<unsigned long>(requestId));
}

bool Esp32Station::bindProcessToNetwork(NetworkHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (handle == NO_NETWORK) {
        if (pinned_ && savedDefault_) {
            esp_err_t err = esp_netif_set_default_netif(savedDefault_);
            if (err != ESP_OK) {
                ESP_LOGW(TAG, "Restore default netif failed: %s", esp_err_to_name(err));
            }
        }
        pinned_ = nullptr;
        savedDefault_ = nullptr;
        return true;
    }

    if (handle != attached_) {
        ESP_LOGW(TAG, "Pin refused: handle %lu is not attached", static_cast<unsigned long>(handle));
        return false;
    }

    esp_netif_t* sta = esp_netif_get_handle_from_ifkey(STA_IFKEY);
    if (!sta) {
        ESP_LOGE(TAG, "Station netif not found");
        return false;
    }

    esp_netif_t* previous = esp_netif_get_default_netif();
    esp_err_t err = esp_netif_set_default_netif(sta);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Set default netif failed: %s", esp_err_to_name(err));
        return false;
    }

    if (!pinned_) {
        savedDefault_ = previous;
    }
    pinned_ = sta;
    ESP_LOGI(TAG, "Default traffic pinned to station (handle %lu)", static_cast<unsigned long>(handle));
    return true;
}

// ============================================================================
// Internals
// ============================================================================

void Esp32Station::onAttachTimeout(void* arg) {
    Esp32Station* self = static_cast<Esp32Station*>(arg);

    uint32_t requestId;
    {
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (self->requestId_ == 0 || self->requestSettled_) {
            return;
        }
        requestId = self->requestId_;
        self->requestSettled_ = true;
    }

    ESP_LOGW(TAG, "Attach timed out (request %lu)", static_cast<unsigned long>(requestId));
    self->post(NetworkEvent{NetworkEvent::Type::Unavailable, requestId, NO_NETWORK, ""});
}

void Esp32Station::onWiFiEvent(arduino_event_id_t event, arduino_event_info_t info) {
    switch (event) {
        case ARDUINO_EVENT_WIFI_STA_GOT_IP: {
            NetworkEvent available{NetworkEvent::Type::Available, 0, NO_NETWORK, ""};
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (requestId_ == 0 || requestSettled_) {
                    return;
                }
                requestSettled_ = true;
                attached_ = nextHandle_++;
                if (nextHandle_ == NO_NETWORK) {
                    nextHandle_ = 1;
                }
                available.requestId = requestId_;
                available.handle = attached_;
            }
            stopTimer();
            available.gateway = IPAddress(info.got_ip.ip_info.gw.addr).toString().c_str();
            ESP_LOGI(TAG, "Got IP %s, gateway %s",
                     IPAddress(info.got_ip.ip_info.ip.addr).toString().c_str(),
                     available.gateway.c_str());
            post(available);
            break;
        }

        case ARDUINO_EVENT_WIFI_STA_DISCONNECTED: {
            NetworkEvent update{NetworkEvent::Type::Lost, 0, NO_NETWORK, ""};
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (attached_ != NO_NETWORK) {
                    update.handle = attached_;
                    attached_ = NO_NETWORK;
                } else if (requestId_ != 0 && !requestSettled_) {
                    requestSettled_ = true;
                    update.type = NetworkEvent::Type::Unavailable;
                    update.requestId = requestId_;
                } else {
                    return;
                }
            }
            stopTimer();
            ESP_LOGW(TAG, "Disconnected (reason %u)", info.wifi_sta_disconnected.reason);
            post(update);
            break;
        }

        default:
            break;
    }
}

void Esp32Station::post(const NetworkEvent& event) {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    if (handler) {
        handler(event);
    }
}

void Esp32Station::stopTimer() {
    if (timer_ && esp_timer_is_active(timer_)) {
        esp_err_t err = esp_timer_stop(timer_);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Attach timer stop failed: %s", esp_err_to_name(err));
        }
    }
}

} // namespace Provisioning
