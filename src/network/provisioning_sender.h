/**
 * @file provisioning_sender.h
 * @brief Peer-side single-shot payload delivery
 *
 * Blocking; run it from a worker task, never from the WiFi event task.
 */

#ifndef PROVISIONING_SENDER_H
#define PROVISIONING_SENDER_H

#include "attachment_manager.h"
#include "http_transport.h"
#include "../logging/event_sink.h"
#include "provisioner_config.h"
#include <string>

namespace Provisioning {

enum class SendResult : uint8_t {
    Sent,          ///< Host answered 200
    NotAttached,   ///< No bound attachment, nothing sent
    Failed         ///< Transport error, timeout or non-200 status
};

const char* sendResultName(SendResult result);

class ProvisioningSender {
public:
    struct Config {
        std::string host = PROV_TARGET_HOST;   ///< Empty = attachment gateway
        uint16_t port = PROV_TARGET_PORT;
        std::string path = PROV_CONTROL_PATH;
        uint32_t connectTimeoutMs = PROV_CONNECT_TIMEOUT_MS;
        uint32_t readTimeoutMs = PROV_READ_TIMEOUT_MS;
    };

    using Clock = EventSink::Clock;

    ProvisioningSender(HttpTransport& transport, EventSink& sink);
    ProvisioningSender(HttpTransport& transport, EventSink& sink, const Config& config,
                       Clock clock = nullptr);

    /**
     * @brief POST the payload once over the attachment
     *
     * @param attachment Snapshot from AttachmentManager::attachment()
     * @param targetSsid Network the host should join
     * @param targetPassphrase May be empty
     */
    SendResult send(const Attachment& attachment,
                    const std::string& targetSsid,
                    const std::string& targetPassphrase);

    /**
     * @brief Destination URL for this attachment, empty if none can be formed
     */
    std::string targetUrl(const Attachment& attachment) const;

private:
    HttpTransport& transport_;
    EventSink& sink_;
    Config config_;
    Clock clock_;
};

} // namespace Provisioning

#endif // PROVISIONING_SENDER_H
