/**
 * @file esp32_softap.h
 * @brief Soft access point driver (arduino-esp32 WiFi)
 *
 * Brings up the host hotspot with fixed credentials and a fixed gateway
 * address. If the fixed credentials are rejected, falls back to
 * LanDiscovery-XXXX (last MAC bytes) with a random passphrase and
 * reports a CredentialFallback event before Started.
 *
 * AP_START arrives on the WiFi event task; it is forwarded as an
 * ApEvent only. Servers are started later from the main loop.
 */

#ifndef ESP32_SOFTAP_H
#define ESP32_SOFTAP_H

#include "../network/access_point_platform.h"
#include "provisioner_config.h"
#include <WiFi.h>
#include <mutex>

namespace Provisioning {

class Esp32SoftAp : public AccessPointPlatform {
public:
    struct Config {
        uint8_t channel = PROV_AP_CHANNEL;
        uint8_t maxClients = PROV_AP_MAX_CLIENTS;
        const char* netmask = PROV_AP_NETMASK;
        const char* fallbackPrefix = PROV_AP_FALLBACK_PREFIX;
    };

    Esp32SoftAp();
    explicit Esp32SoftAp(const Config& config);
    ~Esp32SoftAp() override;

    void setEventHandler(EventHandler handler) override;
    bool requestStart(uint32_t token, const ApCredentials& preferred) override;
    void release(uint32_t token) override;

    /** @brief Stations currently joined */
    uint8_t clientCount() const;

private:
    void onWiFiEvent(arduino_event_id_t event, arduino_event_info_t info);
    void post(const ApEvent& event);
    bool bringUp(const ApCredentials& credentials);
    ApCredentials fallbackCredentials(const ApCredentials& preferred) const;

    Config config_;
    wifi_event_id_t eventId_;

    std::mutex mutex_;
    EventHandler handler_;
    uint32_t activeToken_;       ///< Reservation the radio currently holds, 0 = none
    ApCredentials active_;
};

} // namespace Provisioning

#endif // ESP32_SOFTAP_H
