/**
 * @file attachment_manager.cpp
 * @brief Peer-side scoped network attachment implementation
 */

#include "attachment_manager.h"
#include <cctype>
#include <vector>

namespace Provisioning {

namespace {
    const char* stateNames[] = {
        "Idle",
        "Requesting",
        "Bound",
        "Unavailable",
        "Lost"
    };

    bool isBlank(const std::string& value) {
        for (char c : value) {
            if (!isspace(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }
}

struct AttachmentManager::Pending {
    std::vector<Attachment> changes;
    std::vector<std::string> lines;
};

const char* attachmentStateName(AttachmentState state) {
    return stateNames[static_cast<uint8_t>(state)];
}

AttachmentManager::AttachmentManager(NetworkPlatform& platform, EventSink& sink)
    : platform_(platform),
      sink_(sink),
      requesting_(false),
      attachment_{AttachmentState::Idle, NO_NETWORK, "", ""},
      requestId_(0),
      nextRequestId_(1) {
    platform_.setEventHandler([this](const NetworkEvent& event) {
        events_.post(event);
    });
}

AttachmentManager::~AttachmentManager() {
    platform_.setEventHandler(nullptr);

    std::lock_guard<std::mutex> lock(mutex_);
    releaseLocked();
}

// ============================================================================
// Public API
// ============================================================================

bool AttachmentManager::connect(const std::string& ssid, const std::string& passphrase) {
    bool expected = false;
    if (!requesting_.compare_exchange_strong(expected, true)) {
        return false;
    }

    Pending pending;
    bool issued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requesting_ = true;

        if (attachment_.state == AttachmentState::Bound) {
            pending.lines.push_back("Releasing connection to " + attachment_.ssid);
        }
        releaseLocked();

        requestId_ = nextRequestId_++;
        attachment_.ssid = ssid;
        attachment_.gateway.clear();
        transitionLocked(AttachmentState::Requesting, pending);
        pending.lines.push_back("Connecting to " + ssid);

        std::string secret = isBlank(passphrase) ? std::string() : passphrase;
        issued = platform_.requestNetwork(requestId_, ssid, secret);
        if (!issued) {
            requestId_ = 0;
            transitionLocked(AttachmentState::Unavailable, pending);
            pending.lines.push_back("Network request for " + ssid + " could not be issued");
            requesting_ = false;
        }
    }
    flush(pending);
    return issued;
}

void AttachmentManager::disconnect() {
    Pending pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool active = attachment_.state == AttachmentState::Requesting ||
                      attachment_.state == AttachmentState::Bound;

        releaseLocked();
        transitionLocked(AttachmentState::Idle, pending);
        requesting_ = false;

        if (active) {
            pending.lines.push_back("Disconnected from " + attachment_.ssid);
        }
    }
    flush(pending);
}

size_t AttachmentManager::processEvents() {
    size_t consumed = 0;
    NetworkEvent event;
    while (events_.poll(event)) {
        Pending pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            applyLocked(event, pending);
        }
        flush(pending);
        consumed++;
    }
    return consumed;
}

Attachment AttachmentManager::attachment() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attachment_;
}

AttachmentState AttachmentManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attachment_.state;
}

void AttachmentManager::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = std::move(callback);
}

// ============================================================================
// Transitions
// ============================================================================

void AttachmentManager::releaseLocked() {
    if (requestId_ != 0) {
        platform_.cancelRequest(requestId_);
        requestId_ = 0;
    }
    if (attachment_.handle != NO_NETWORK) {
        platform_.bindProcessToNetwork(NO_NETWORK);
        attachment_.handle = NO_NETWORK;
    }
}

void AttachmentManager::transitionLocked(AttachmentState next, Pending& pending) {
    if (next == attachment_.state) {
        return;
    }
    attachment_.state = next;
    pending.changes.push_back(attachment_);
}

void AttachmentManager::applyLocked(const NetworkEvent& event, Pending& pending) {
    switch (event.type) {
        case NetworkEvent::Type::Available:
            if (event.requestId != requestId_ || attachment_.state != AttachmentState::Requesting) {
                pending.lines.push_back("[stale] Network available for request " +
                                        std::to_string(event.requestId) + " ignored");
                return;
            }
            if (event.handle == NO_NETWORK || !platform_.bindProcessToNetwork(event.handle)) {
                // Never Bound without the pin
                platform_.cancelRequest(requestId_);
                requestId_ = 0;
                requesting_ = false;
                transitionLocked(AttachmentState::Unavailable, pending);
                pending.lines.push_back("Could not route traffic over " + attachment_.ssid);
                return;
            }
            attachment_.handle = event.handle;
            attachment_.gateway = event.gateway;
            requesting_ = false;
            transitionLocked(AttachmentState::Bound, pending);
            pending.lines.push_back("Connected to " + attachment_.ssid);
            break;

        case NetworkEvent::Type::Unavailable:
            if (event.requestId != requestId_ || attachment_.state != AttachmentState::Requesting) {
                pending.lines.push_back("[stale] Network unavailable for request " +
                                        std::to_string(event.requestId) + " ignored");
                return;
            }
            platform_.cancelRequest(requestId_);
            requestId_ = 0;
            requesting_ = false;
            transitionLocked(AttachmentState::Unavailable, pending);
            pending.lines.push_back("Network " + attachment_.ssid + " unavailable");
            break;

        case NetworkEvent::Type::Lost:
            if (attachment_.state != AttachmentState::Bound || event.handle != attachment_.handle) {
                return;
            }
            releaseLocked();
            transitionLocked(AttachmentState::Lost, pending);
            pending.lines.push_back("Connection to " + attachment_.ssid + " lost");
            break;
    }
}

void AttachmentManager::flush(const Pending& pending) {
    for (const auto& line : pending.lines) {
        sink_.append(line);
    }

    if (pending.changes.empty()) {
        return;
    }

    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = callback_;
    }
    if (!callback) {
        return;
    }
    for (const auto& change : pending.changes) {
        callback(change);
    }
}

} // namespace Provisioning
