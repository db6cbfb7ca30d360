/**
 * @file esp32_station.h
 * @brief Station attachment driver (arduino-esp32 WiFi + esp_netif)
 *
 * One scoped request at a time. A request is satisfied when the station
 * gets an address; it is unavailable on the first disconnect before
 * that, or when the attach timer expires. Auto-reconnect is disabled so
 * a dropped link surfaces as Lost instead of silently rejoining.
 *
 * Pinning makes the station netif the lwIP default route; unpinning
 * restores whatever default was active before.
 */

#ifndef ESP32_STATION_H
#define ESP32_STATION_H

#include "../network/network_platform.h"
#include "provisioner_config.h"
#include <WiFi.h>
#include <esp_netif.h>
#include <esp_timer.h>
#include <mutex>

namespace Provisioning {

class Esp32Station : public NetworkPlatform {
public:
    explicit Esp32Station(uint32_t attachTimeoutMs = PROV_ATTACH_TIMEOUT_MS);
    ~Esp32Station() override;

    void setEventHandler(EventHandler handler) override;
    bool requestNetwork(uint32_t requestId, const std::string& ssid,
                        const std::string& passphrase) override;
    void cancelRequest(uint32_t requestId) override;
    bool bindProcessToNetwork(NetworkHandle handle) override;

private:
    static void onAttachTimeout(void* arg);
    void onWiFiEvent(arduino_event_id_t event, arduino_event_info_t info);
    void post(const NetworkEvent& event);
    void stopTimer();

    uint32_t attachTimeoutMs_;
    wifi_event_id_t eventId_;
    esp_timer_handle_t timer_;

    std::mutex mutex_;
    EventHandler handler_;
    uint32_t requestId_;         ///< Outstanding request, 0 = none
    bool requestSettled_;        ///< Available/Unavailable already reported
    NetworkHandle attached_;     ///< Handle issued for the current link, 0 = none
    NetworkHandle nextHandle_;

    esp_netif_t* pinned_;        ///< Station netif while pinned
    esp_netif_t* savedDefault_;  ///< Default netif before pinning
};

} // namespace Provisioning

#endif // ESP32_STATION_H
