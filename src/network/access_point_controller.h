/**
 * @file access_point_controller.h
 * @brief Host access point lifecycle state machine
 *
 *   Idle -> Starting -> Running -> Stopping -> Stopped
 *              \           \
 *               \-----------\--> Failed(reason)
 *
 * Failed and Stopped end an instance; start() re-enters at Starting.
 * stop() always lands in Idle.
 *
 * Platform callbacks are queued and applied by processEvents(), which the
 * owner calls from its main loop. start/stop/restart serialize on one
 * mutex, so a restart never overlaps teardown of the old reservation with
 * acquisition of the new one.
 */

#ifndef ACCESS_POINT_CONTROLLER_H
#define ACCESS_POINT_CONTROLLER_H

#include "access_point_platform.h"
#include "capabilities.h"
#include "../app/event_queue.h"
#include "../logging/event_sink.h"
#include "provisioner_config.h"
#include <functional>
#include <mutex>
#include <string>

namespace Provisioning {

// ============================================================================
// States
// ============================================================================

/** @brief Access point lifecycle phase */
enum class ApState : uint8_t {
    Idle,
    Starting,
    Running,
    Stopping,
    Stopped,
    Failed
};

const char* apStateName(ApState state);

/**
 * @brief Snapshot of the controller's access point
 */
struct AccessPoint {
    ApState state;
    std::string failureReason;   ///< Set only in Failed
    int failureCode;             ///< Platform reason code, 0 if none
    ApCredentials credentials;   ///< Valid only in Running
};

// ============================================================================
// Controller
// ============================================================================

class AccessPointController {
public:
    struct Config {
        ApCredentials preferred{PROV_AP_SSID, PROV_AP_PASSPHRASE, PROV_AP_GATEWAY};
        CapabilityMask required = CapabilitiesAll;
        bool logSecrets = PROV_LOG_SECRETS;
    };

    using StatusCallback = std::function<void(const AccessPoint&)>;

    AccessPointController(AccessPointPlatform& platform, EventSink& sink);
    AccessPointController(AccessPointPlatform& platform, EventSink& sink, const Config& config);
    ~AccessPointController();

    AccessPointController(const AccessPointController&) = delete;
    AccessPointController& operator=(const AccessPointController&) = delete;

    /**
     * @brief Request the access point
     *
     * No-op while Starting or Running. Missing capabilities move to
     * Failed without touching the platform.
     *
     * @param granted Capabilities the caller has confirmed
     * @return false if a precondition failed or the platform refused the request
     */
    bool start(CapabilityMask granted);

    /**
     * @brief Release the access point; always ends in Idle
     */
    void stop();

    /**
     * @brief stop() then start() with no overlap window
     */
    bool restart(CapabilityMask granted);

    /**
     * @brief Apply queued platform callbacks
     * @return Number of events consumed
     */
    size_t processEvents();

    ApState state() const;
    AccessPoint accessPoint() const;

    /**
     * @brief Observe every applied transition (called without the lock held)
     */
    void setStatusCallback(StatusCallback callback);

private:
    struct Pending;

    bool startLocked(CapabilityMask granted, Pending& pending);
    void stopLocked(Pending& pending);
    void transitionLocked(ApState next, Pending& pending);
    void applyLocked(const ApEvent& event, Pending& pending);
    void flush(const Pending& pending);
    std::string maskSecret(const std::string& secret) const;

    AccessPointPlatform& platform_;
    EventSink& sink_;
    Config config_;
    EventQueue<ApEvent> events_;

    mutable std::mutex mutex_;
    AccessPoint ap_;
    uint32_t token_;       ///< Token of the current request, 0 = none
    uint32_t nextToken_;

    std::mutex callbackMutex_;
    StatusCallback callback_;
};

} // namespace Provisioning

#endif // ACCESS_POINT_CONTROLLER_H
