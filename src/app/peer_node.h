/**
 * @file peer_node.h
 * @brief Peer role: join the host's access point, then push a payload
 *
 * Sending is enabled only while the attachment is Bound. A loss
 * disables it synchronously inside update(), before any later send()
 * can observe the old attachment.
 */

#ifndef PEER_NODE_H
#define PEER_NODE_H

#include "../network/attachment_manager.h"
#include "../network/provisioning_sender.h"
#include "../logging/event_sink.h"
#include <atomic>
#include <mutex>
#include <string>

namespace Provisioning {

class PeerNode {
public:
    using Clock = ProvisioningSender::Clock;

    PeerNode(NetworkPlatform& platform, HttpTransport& transport, EventSink& sink);
    PeerNode(NetworkPlatform& platform, HttpTransport& transport, EventSink& sink,
             const ProvisioningSender::Config& senderConfig, Clock clock = nullptr);

    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;

    /**
     * @brief Join the host's access point
     * @return false if ssid is blank or a request is already outstanding
     */
    bool connect(const std::string& ssid, const std::string& passphrase);

    void disconnect();

    /**
     * @brief Deliver target credentials to the host (blocking)
     * @return true if the host accepted the payload
     */
    bool send(const std::string& targetSsid, const std::string& targetPassphrase);

    /**
     * @brief Main loop hook: apply platform events
     */
    void update();

    /**
     * @brief Release the attachment (device going idle or role teardown)
     */
    void shutdown();

    bool canSend() const { return sendEnabled_.load(); }

    /** @brief Last operator-facing status line */
    std::string statusText() const;

    /** @brief Result of the last send that reached the sender */
    SendResult lastSendResult() const;

    AttachmentManager& attachments() { return attachments_; }

private:
    void onAttachment(const Attachment& attachment);
    void setStatus(const std::string& text);

    AttachmentManager attachments_;
    ProvisioningSender sender_;

    std::atomic<bool> sendEnabled_;

    mutable std::mutex statusMutex_;
    std::string status_;
    SendResult lastSendResult_;
};

} // namespace Provisioning

#endif // PEER_NODE_H
