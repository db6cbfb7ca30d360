/**
 * @file attachment_manager.h
 * @brief Peer-side scoped network attachment
 *
 *   Idle -> Requesting -> Bound -> Lost
 *               \
 *                \--> Unavailable
 *
 * Bound holds exactly while process default traffic is pinned to the
 * attachment's network. Every exit from Bound unpins, including
 * destruction. Only one request may be outstanding at a time.
 */

#ifndef ATTACHMENT_MANAGER_H
#define ATTACHMENT_MANAGER_H

#include "network_platform.h"
#include "../app/event_queue.h"
#include "../logging/event_sink.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace Provisioning {

enum class AttachmentState : uint8_t {
    Idle,
    Requesting,
    Bound,
    Unavailable,
    Lost
};

const char* attachmentStateName(AttachmentState state);

/**
 * @brief Snapshot of the current attachment
 */
struct Attachment {
    AttachmentState state;
    NetworkHandle handle;   ///< Non-zero only while Bound
    std::string ssid;
    std::string gateway;    ///< As reported by the platform, may be empty
};

class AttachmentManager {
public:
    using StatusCallback = std::function<void(const Attachment&)>;

    AttachmentManager(NetworkPlatform& platform, EventSink& sink);
    ~AttachmentManager();

    AttachmentManager(const AttachmentManager&) = delete;
    AttachmentManager& operator=(const AttachmentManager&) = delete;

    /**
     * @brief Request a network scoped to ssid
     *
     * Ignored while a request is already outstanding. Any existing
     * attachment is released first.
     *
     * @param ssid Network name
     * @param passphrase Passed to the platform only when not blank
     * @return true if a new request was issued
     */
    bool connect(const std::string& ssid, const std::string& passphrase);

    /**
     * @brief Cancel the request, unpin and return to Idle (idempotent)
     */
    void disconnect();

    /**
     * @brief Apply queued platform callbacks
     * @return Number of events consumed
     */
    size_t processEvents();

    Attachment attachment() const;
    AttachmentState state() const;
    bool isRequesting() const { return requesting_.load(); }

    void setStatusCallback(StatusCallback callback);

private:
    struct Pending;

    void releaseLocked();
    void transitionLocked(AttachmentState next, Pending& pending);
    void applyLocked(const NetworkEvent& event, Pending& pending);
    void flush(const Pending& pending);

    NetworkPlatform& platform_;
    EventSink& sink_;
    EventQueue<NetworkEvent> events_;

    // Single-flight guard, claimed before the lock is taken
    std::atomic<bool> requesting_;

    mutable std::mutex mutex_;
    Attachment attachment_;
    uint32_t requestId_;       ///< Outstanding request, 0 = none
    uint32_t nextRequestId_;

    std::mutex callbackMutex_;
    StatusCallback callback_;
};

} // namespace Provisioning

#endif // ATTACHMENT_MANAGER_H
