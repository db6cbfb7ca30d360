/**
 * @file network_platform.h
 * @brief Platform seam for the peer's scoped network attachment
 *
 * requestNetwork() is asynchronous. The outcome arrives as a NetworkEvent
 * carrying the request id; a later drop of an attached network arrives
 * as Lost carrying the network handle.
 */

#ifndef NETWORK_PLATFORM_H
#define NETWORK_PLATFORM_H

#include <cstdint>
#include <functional>
#include <string>

namespace Provisioning {

/** @brief Opaque platform network id, 0 = none */
using NetworkHandle = uint32_t;

constexpr NetworkHandle NO_NETWORK = 0;

struct NetworkEvent {
    enum class Type : uint8_t {
        Available,     ///< Request satisfied, handle valid
        Unavailable,   ///< Request could not be satisfied
        Lost           ///< Attached network dropped
    };

    Type type;
    uint32_t requestId;      ///< Valid for Available/Unavailable
    NetworkHandle handle;    ///< Valid for Available/Lost
    std::string gateway;     ///< Gateway reported with Available, may be empty
};

class NetworkPlatform {
public:
    using EventHandler = std::function<void(const NetworkEvent&)>;

    virtual ~NetworkPlatform() = default;

    virtual void setEventHandler(EventHandler handler) = 0;

    /**
     * @brief Ask for a network scoped to one SSID
     *
     * @param requestId Echoed in the resulting event
     * @param ssid Network name
     * @param passphrase WPA2 passphrase, empty for an open network
     * @return false if the request could not be issued
     */
    virtual bool requestNetwork(uint32_t requestId, const std::string& ssid,
                                const std::string& passphrase) = 0;

    /**
     * @brief Withdraw a request and drop its network if attached (idempotent)
     */
    virtual void cancelRequest(uint32_t requestId) = 0;

    /**
     * @brief Route process default traffic over handle (NO_NETWORK = unpin)
     * @return false if the platform refused
     */
    virtual bool bindProcessToNetwork(NetworkHandle handle) = 0;
};

} // namespace Provisioning

#endif // NETWORK_PLATFORM_H
