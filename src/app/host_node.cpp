/**
 * @file host_node.cpp
 * @brief Host role implementation
 */

#include "host_node.h"

namespace Provisioning {

HostNode::HostNode(AccessPointPlatform& platform, ServerBackend& backend, EventSink& sink)
    : HostNode(platform, backend, sink, Config()) {
}

HostNode::HostNode(AccessPointPlatform& platform, ServerBackend& backend, EventSink& sink,
                   const Config& config)
    : sink_(sink),
      config_(config),
      controller_(platform, sink, config.accessPoint),
      listener_(backend, sink, config.listener),
      listenerPending_(false),
      listenerFailed_(false),
      granted_(config.granted),
      hasPayload_(false) {
    controller_.setStatusCallback([this](const AccessPoint& ap) {
        onAccessPoint(ap);
    });
    listener_.setPayloadCallback([this](const ProvisioningPayload& payload) {
        onPayload(payload);
    });
}

bool HostNode::start() {
    return controller_.start(granted_.load());
}

void HostNode::stop() {
    listenerPending_ = false;
    listener_.stop();
    controller_.stop();
}

bool HostNode::restart() {
    listenerPending_ = false;
    listener_.stop();
    return controller_.restart(granted_.load());
}

void HostNode::update() {
    controller_.processEvents();

    if (!listenerPending_.exchange(false)) {
        return;
    }
    if (controller_.state() != ApState::Running) {
        return;
    }
    listenerFailed_ = !listener_.start();
}

void HostNode::setGrantedCapabilities(CapabilityMask granted) {
    granted_ = granted;
}

std::string HostNode::statusText() const {
    AccessPoint ap = controller_.accessPoint();

    switch (ap.state) {
        case ApState::Idle:
            return "Hotspot idle";
        case ApState::Starting:
            return "Starting hotspot...";
        case ApState::Running: {
            std::string text = "Running: SSID " + ap.credentials.ssid +
                               " / passphrase " + ap.credentials.passphrase;
            if (listenerFailed_.load()) {
                text += " (control listener down)";
            }
            return text;
        }
        case ApState::Stopping:
            return "Stopping hotspot...";
        case ApState::Stopped:
            return "Hotspot stopped";
        case ApState::Failed:
            if (ap.failureCode != 0) {
                return "Hotspot failed (reason " + std::to_string(ap.failureCode) + ")";
            }
            return "Hotspot failed (" + ap.failureReason + ")";
    }
    return "Unknown";
}

bool HostNode::lastPayload(ProvisioningPayload* out) const {
    std::lock_guard<std::mutex> lock(payloadMutex_);
    if (!hasPayload_) {
        return false;
    }
    if (out) *out = lastPayload_;
    return true;
}

// ============================================================================
// Callbacks
// ============================================================================

void HostNode::onAccessPoint(const AccessPoint& ap) {
    if (ap.state == ApState::Running) {
        listenerPending_ = true;
        return;
    }

    listenerPending_ = false;
    listenerFailed_ = false;
    listener_.stop();
}

void HostNode::onPayload(const ProvisioningPayload& payload) {
    std::string secret;
    if (payload.targetSecret.empty()) {
        secret = "(none)";
    } else {
        secret = config_.logSecrets ? payload.targetSecret : std::string("********");
    }
    sink_.append("Received payload: ssid=" + payload.targetNetworkName + ", passphrase=" + secret);

    std::lock_guard<std::mutex> lock(payloadMutex_);
    lastPayload_ = payload;
    hasPayload_ = true;
}

} // namespace Provisioning
