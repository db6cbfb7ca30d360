/**
 * @file control_listener.h
 * @brief Host control-plane listener lifecycle
 *
 * Owns at most one ListenerHandle. start() always closes the previous
 * handle before binding a new one, so a restart never holds two sockets.
 * Requests are routed through a ProvisioningEndpoint.
 */

#ifndef CONTROL_LISTENER_H
#define CONTROL_LISTENER_H

#include "server_backend.h"
#include "provisioning_endpoint.h"
#include "../logging/event_sink.h"
#include "provisioner_config.h"
#include <memory>
#include <mutex>
#include <string>

namespace Provisioning {

/**
 * @brief A bound server instance; replaced on restart, never mutated
 */
struct ListenerHandle {
    uint16_t port;
    std::unique_ptr<ServerSocket> socket;
};

class ControlListener {
public:
    struct Config {
        uint16_t port = PROV_CONTROL_PORT;
        std::string path = PROV_CONTROL_PATH;
        size_t maxBodyBytes = PROV_MAX_BODY_BYTES;
    };

    using PayloadCallback = ProvisioningEndpoint::PayloadCallback;

    ControlListener(ServerBackend& backend, EventSink& sink);
    ControlListener(ServerBackend& backend, EventSink& sink, const Config& config);
    ~ControlListener();

    ControlListener(const ControlListener&) = delete;
    ControlListener& operator=(const ControlListener&) = delete;

    /**
     * @brief Bind the control port, replacing any previous handle
     * @return false if binding failed (logged)
     */
    bool start();

    /**
     * @brief Close the current handle; no-op if none
     */
    void stop();

    bool isRunning() const;
    uint16_t port() const { return config_.port; }

    /**
     * @brief Receives every accepted payload with a non-empty target name
     *
     * Called synchronously from the server task.
     */
    void setPayloadCallback(PayloadCallback callback);

private:
    void closeLocked();

    ServerBackend& backend_;
    EventSink& sink_;
    Config config_;
    ProvisioningEndpoint endpoint_;

    mutable std::mutex mutex_;
    std::unique_ptr<ListenerHandle> handle_;
};

} // namespace Provisioning

#endif // CONTROL_LISTENER_H
