/**
 * @file peer_node.cpp
 * @brief Peer role implementation
 */

#include "peer_node.h"
#include <cctype>

namespace Provisioning {

namespace {
    bool isBlank(const std::string& value) {
        for (char c : value) {
            if (!isspace(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }
}

PeerNode::PeerNode(NetworkPlatform& platform, HttpTransport& transport, EventSink& sink)
    : PeerNode(platform, transport, sink, ProvisioningSender::Config()) {
}

PeerNode::PeerNode(NetworkPlatform& platform, HttpTransport& transport, EventSink& sink,
                   const ProvisioningSender::Config& senderConfig, Clock clock)
    : attachments_(platform, sink),
      sender_(transport, sink, senderConfig, clock),
      sendEnabled_(false),
      status_("Not connected"),
      lastSendResult_(SendResult::NotAttached) {
    attachments_.setStatusCallback([this](const Attachment& attachment) {
        onAttachment(attachment);
    });
}

bool PeerNode::connect(const std::string& ssid, const std::string& passphrase) {
    if (isBlank(ssid)) {
        setStatus("Enter the server SSID");
        return false;
    }
    return attachments_.connect(ssid, passphrase);
}

void PeerNode::disconnect() {
    attachments_.disconnect();
}

bool PeerNode::send(const std::string& targetSsid, const std::string& targetPassphrase) {
    if (isBlank(targetSsid)) {
        setStatus("Enter the target SSID");
        return false;
    }
    if (!sendEnabled_.load()) {
        setStatus("Not connected to the hotspot");
        return false;
    }

    SendResult result = sender_.send(attachments_.attachment(), targetSsid, targetPassphrase);
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        lastSendResult_ = result;
    }

    switch (result) {
        case SendResult::Sent:
            setStatus("Provisioning payload sent");
            return true;
        case SendResult::NotAttached:
            setStatus("Not connected to the hotspot");
            return false;
        case SendResult::Failed:
            setStatus("Failed to send provisioning payload");
            return false;
    }
    return false;
}

void PeerNode::update() {
    attachments_.processEvents();
}

void PeerNode::shutdown() {
    attachments_.disconnect();
}

std::string PeerNode::statusText() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

SendResult PeerNode::lastSendResult() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return lastSendResult_;
}

void PeerNode::onAttachment(const Attachment& attachment) {
    sendEnabled_ = (attachment.state == AttachmentState::Bound);

    switch (attachment.state) {
        case AttachmentState::Idle:
            setStatus("Not connected");
            break;
        case AttachmentState::Requesting:
            setStatus("Connecting to " + attachment.ssid + "...");
            break;
        case AttachmentState::Bound:
            setStatus("Connected to " + attachment.ssid);
            break;
        case AttachmentState::Unavailable:
            setStatus("Could not connect to " + attachment.ssid);
            break;
        case AttachmentState::Lost:
            setStatus("Connection to " + attachment.ssid + " lost");
            break;
    }
}

void PeerNode::setStatus(const std::string& text) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    status_ = text;
}

} // namespace Provisioning
