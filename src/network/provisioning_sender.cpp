/**
 * @file provisioning_sender.cpp
 * @brief Peer-side payload delivery implementation
 */

#include "provisioning_sender.h"
#include "provisioning_payload.h"

namespace Provisioning {

namespace {
    constexpr const char* CONTENT_TYPE = "application/json; charset=utf-8";
}

const char* sendResultName(SendResult result) {
    switch (result) {
        case SendResult::Sent:        return "Sent";
        case SendResult::NotAttached: return "NotAttached";
        case SendResult::Failed:      return "Failed";
    }
    return "Unknown";
}

ProvisioningSender::ProvisioningSender(HttpTransport& transport, EventSink& sink)
    : ProvisioningSender(transport, sink, Config()) {
}

ProvisioningSender::ProvisioningSender(HttpTransport& transport, EventSink& sink,
                                       const Config& config, Clock clock)
    : transport_(transport),
      sink_(sink),
      config_(config),
      clock_(clock ? clock : Clock(&EventSink::systemClockMs)) {
}

std::string ProvisioningSender::targetUrl(const Attachment& attachment) const {
    const std::string& host = config_.host.empty() ? attachment.gateway : config_.host;
    if (host.empty()) {
        return std::string();
    }
    return "http://" + host + ":" + std::to_string(config_.port) + config_.path;
}

SendResult ProvisioningSender::send(const Attachment& attachment,
                                    const std::string& targetSsid,
                                    const std::string& targetPassphrase) {
    if (attachment.state != AttachmentState::Bound || attachment.handle == NO_NETWORK) {
        sink_.append("Cannot send provisioning payload: not connected");
        return SendResult::NotAttached;
    }

    HttpPostRequest request;
    request.network = attachment.handle;
    request.url = targetUrl(attachment);
    request.contentType = CONTENT_TYPE;
    request.body = PayloadCodec::encode(targetSsid, targetPassphrase, clock_());
    request.connectTimeoutMs = config_.connectTimeoutMs;
    request.readTimeoutMs = config_.readTimeoutMs;

    if (request.url.empty()) {
        sink_.append("Failed to send provisioning payload: no host address for " + attachment.ssid);
        return SendResult::Failed;
    }

    sink_.append("Sending provisioning payload to " + request.url);
    HttpPostResult result = transport_.post(request);

    if (!result.completed) {
        sink_.append("Failed to send provisioning payload: " +
                     (result.error.empty() ? std::string("transport error") : result.error));
        return SendResult::Failed;
    }

    if (result.status != 200) {
        std::string line = "Failed to send provisioning payload: HTTP " + std::to_string(result.status);
        if (!result.body.empty()) {
            line += " " + result.body;
        }
        sink_.append(line);
        return SendResult::Failed;
    }

    sink_.append("Provisioning payload sent");
    return SendResult::Sent;
}

} // namespace Provisioning
