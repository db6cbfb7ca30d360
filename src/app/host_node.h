/**
 * @file host_node.h
 * @brief Host role: access point first, control listener once it is up
 *
 * The listener is bound only after the controller reports Running, and
 * is closed on any transition out of Running. Listener start is deferred
 * to update() so it runs in main loop context rather than inside a
 * platform callback.
 */

#ifndef HOST_NODE_H
#define HOST_NODE_H

#include "../network/access_point_controller.h"
#include "../network/control_listener.h"
#include "../network/provisioning_payload.h"
#include "../logging/event_sink.h"
#include <atomic>
#include <mutex>
#include <string>

namespace Provisioning {

class HostNode {
public:
    struct Config {
        AccessPointController::Config accessPoint;
        ControlListener::Config listener;
        CapabilityMask granted = CapabilitiesAll;
        bool logSecrets = PROV_LOG_SECRETS;
    };

    HostNode(AccessPointPlatform& platform, ServerBackend& backend, EventSink& sink);
    HostNode(AccessPointPlatform& platform, ServerBackend& backend, EventSink& sink,
             const Config& config);

    HostNode(const HostNode&) = delete;
    HostNode& operator=(const HostNode&) = delete;

    bool start();
    void stop();

    /**
     * @brief Close the listener, then restart the access point
     */
    bool restart();

    /**
     * @brief Main loop hook: apply platform events, bind a pending listener
     */
    void update();

    /**
     * @brief Capabilities used by the next start()/restart()
     */
    void setGrantedCapabilities(CapabilityMask granted);

    /** @brief One-line operator status */
    std::string statusText() const;

    bool isListening() const { return listener_.isRunning(); }

    /**
     * @brief Most recent accepted payload
     * @return false if none received since boot
     */
    bool lastPayload(ProvisioningPayload* out) const;

    AccessPointController& controller() { return controller_; }
    ControlListener& listener() { return listener_; }

private:
    void onAccessPoint(const AccessPoint& ap);
    void onPayload(const ProvisioningPayload& payload);

    EventSink& sink_;
    Config config_;
    AccessPointController controller_;
    ControlListener listener_;

    std::atomic<bool> listenerPending_;
    std::atomic<bool> listenerFailed_;
    std::atomic<CapabilityMask> granted_;

    mutable std::mutex payloadMutex_;
    bool hasPayload_;
    ProvisioningPayload lastPayload_;
};

} // namespace Provisioning

#endif // HOST_NODE_H
