/**
 * @file access_point_platform.h
 * @brief Platform seam for the host access point
 *
 * The platform start call is asynchronous: requestStart() returns once the
 * request is issued and the outcome arrives later as an ApEvent through
 * the registered handler. Every event carries the token of the request
 * it belongs to.
 */

#ifndef ACCESS_POINT_PLATFORM_H
#define ACCESS_POINT_PLATFORM_H

#include <cstdint>
#include <functional>
#include <string>

namespace Provisioning {

/**
 * @brief Credentials of a live (or requested) access point
 */
struct ApCredentials {
    std::string ssid;
    std::string passphrase;
    std::string gateway;   ///< AP IP address as seen by joined peers
};

/**
 * @brief Platform callback delivered into the controller
 */
struct ApEvent {
    enum class Type : uint8_t {
        Started,             ///< AP is up, credentials valid
        Failed,              ///< Start rejected, reason = platform code
        Stopped,             ///< Platform tore the AP down on its own
        CredentialFallback   ///< Preferred credentials rejected, using assigned ones
    };

    Type type;
    uint32_t token;
    ApCredentials credentials;
    int reason;
    std::string detail;
};

class AccessPointPlatform {
public:
    using EventHandler = std::function<void(const ApEvent&)>;

    virtual ~AccessPointPlatform() = default;

    /**
     * @brief Register the sink for platform callbacks (nullptr = detach)
     */
    virtual void setEventHandler(EventHandler handler) = 0;

    /**
     * @brief Issue an asynchronous AP start
     *
     * @param token Request token echoed in every resulting event
     * @param preferred Credentials to request; the platform may assign others
     * @return false if the request could not be issued (a Failed event follows)
     */
    virtual bool requestStart(uint32_t token, const ApCredentials& preferred) = 0;

    /**
     * @brief Close the reservation belonging to token
     *
     * Idempotent: releasing an absent or already released reservation is
     * not an error.
     */
    virtual void release(uint32_t token) = 0;
};

} // namespace Provisioning

#endif // ACCESS_POINT_PLATFORM_H
