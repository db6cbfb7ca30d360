/**
 * @file provisioning_endpoint.cpp
 * @brief Control-plane endpoint implementation
 */

#include "provisioning_endpoint.h"
#include <exception>

namespace Provisioning {

namespace {
    constexpr const char* METHOD_POST = "POST";

    constexpr const char* BODY_NOT_FOUND = "Not Found";
    constexpr const char* BODY_MISSING = "Missing request body";
    constexpr const char* BODY_TOO_LARGE = "Request body too large";
    constexpr const char* BODY_ACCEPTED = "Provisioning payload accepted";
    constexpr const char* SERVER_ERROR_PREFIX = "Server error: ";
}

ProvisioningEndpoint::ProvisioningEndpoint(EventSink& sink, const Config& config)
    : sink_(sink), config_(config), delivered_(0) {
}

void ProvisioningEndpoint::setPayloadCallback(PayloadCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = std::move(callback);
}

HttpResponse ProvisioningEndpoint::handle(const HttpRequest& request) {
    if (request.method != METHOD_POST || request.path != config_.path) {
        return HttpResponse{HttpStatus::NotFound, BODY_NOT_FOUND};
    }

    if (request.body.empty()) {
        sink_.append("Rejected provisioning request: missing body");
        return HttpResponse{HttpStatus::BadRequest, BODY_MISSING};
    }

    if (request.body.size() > config_.maxBodyBytes) {
        sink_.append("Rejected provisioning request: body of " +
                     std::to_string(request.body.size()) + " bytes");
        return HttpResponse{HttpStatus::BadRequest, BODY_TOO_LARGE};
    }

    ProvisioningPayload payload;
    std::string error;
    if (!PayloadCodec::decode(request.body, &payload, &error)) {
        sink_.append("Rejected provisioning request: " + error);
        return HttpResponse{HttpStatus::InternalError, SERVER_ERROR_PREFIX + error};
    }

    // Transport stays lenient; the application never sees an empty name
    if (payload.targetNetworkName.empty()) {
        sink_.append("Provisioning payload without targetSsid ignored");
    } else {
        deliver(payload);
    }

    return HttpResponse{HttpStatus::Ok, BODY_ACCEPTED};
}

void ProvisioningEndpoint::deliver(const ProvisioningPayload& payload) {
    PayloadCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = callback_;
    }

    delivered_++;
    if (!callback) {
        return;
    }

    try {
        callback(payload);
    } catch (const std::exception& e) {
        sink_.append(std::string("Payload handler failed: ") + e.what());
    } catch (...) {
        sink_.append("Payload handler failed: unknown error");
    }
}

} // namespace Provisioning
