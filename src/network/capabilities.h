/**
 * @file capabilities.h
 * @brief Platform capabilities the caller must confirm before AP start
 *
 * The controllers never request capabilities themselves; the caller
 * passes the mask of what has been granted.
 */

#ifndef CAPABILITIES_H
#define CAPABILITIES_H

#include <cstdint>
#include <string>

namespace Provisioning {

using CapabilityMask = uint8_t;

enum Capability : CapabilityMask {
    CapabilityLocation      = 1 << 0,
    CapabilityNearbyDevices = 1 << 1,
    CapabilityChangeNetwork = 1 << 2,
    CapabilityWifiState     = 1 << 3
};

constexpr CapabilityMask CapabilitiesAll =
    CapabilityLocation | CapabilityNearbyDevices | CapabilityChangeNetwork | CapabilityWifiState;

/**
 * @brief Comma separated names of required capabilities missing from granted
 * @return Empty string if nothing is missing
 */
inline std::string describeMissingCapabilities(CapabilityMask required, CapabilityMask granted) {
    static const struct {
        CapabilityMask bit;
        const char* name;
    } names[] = {
        {CapabilityLocation, "location"},
        {CapabilityNearbyDevices, "nearby-devices"},
        {CapabilityChangeNetwork, "change-network"},
        {CapabilityWifiState, "wifi-state"},
    };

    std::string missing;
    for (const auto& entry : names) {
        if ((required & entry.bit) && !(granted & entry.bit)) {
            if (!missing.empty()) {
                missing += ", ";
            }
            missing += entry.name;
        }
    }
    return missing;
}

} // namespace Provisioning

#endif // CAPABILITIES_H
