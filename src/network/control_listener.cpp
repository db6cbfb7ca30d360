/**
 * @file control_listener.cpp
 * @brief Host control-plane listener implementation
 */

#include "control_listener.h"

namespace Provisioning {

namespace {
    ProvisioningEndpoint::Config endpointConfig(const ControlListener::Config& config) {
        ProvisioningEndpoint::Config out;
        out.path = config.path;
        out.maxBodyBytes = config.maxBodyBytes;
        return out;
    }
}

ControlListener::ControlListener(ServerBackend& backend, EventSink& sink)
    : ControlListener(backend, sink, Config()) {
}

ControlListener::ControlListener(ServerBackend& backend, EventSink& sink, const Config& config)
    : backend_(backend),
      sink_(sink),
      config_(config),
      endpoint_(sink, endpointConfig(config)) {
}

ControlListener::~ControlListener() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

bool ControlListener::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Stop-before-start: the old socket must free the port first
    closeLocked();

    std::string error;
    ProvisioningEndpoint* endpoint = &endpoint_;
    std::unique_ptr<ServerSocket> socket = backend_.open(
        config_.port,
        [endpoint](const HttpRequest& request) { return endpoint->handle(request); },
        &error);

    if (!socket) {
        sink_.append("HTTP server failed: " + (error.empty() ? std::string("unknown error") : error));
        return false;
    }

    handle_.reset(new ListenerHandle{config_.port, std::move(socket)});
    sink_.append("HTTP server started on port " + std::to_string(config_.port));
    return true;
}

void ControlListener::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_) {
        closeLocked();
        sink_.append("HTTP server stopped");
    }
}

bool ControlListener::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ && handle_->socket && handle_->socket->isOpen();
}

void ControlListener::setPayloadCallback(PayloadCallback callback) {
    endpoint_.setPayloadCallback(std::move(callback));
}

void ControlListener::closeLocked() {
    if (!handle_) {
        return;
    }
    if (handle_->socket) {
        handle_->socket->close();
    }
    handle_.reset();
}

} // namespace Provisioning
