/**
 * @file access_point_controller.cpp
 * @brief Host access point lifecycle implementation
 */

#include "access_point_controller.h"
#include <cstdio>
#include <vector>

namespace Provisioning {

namespace {
    const char* stateNames[] = {
        "Idle",
        "Starting",
        "Running",
        "Stopping",
        "Stopped",
        "Failed"
    };

    const char* eventName(ApEvent::Type type) {
        switch (type) {
            case ApEvent::Type::Started:            return "started";
            case ApEvent::Type::Failed:             return "failed";
            case ApEvent::Type::Stopped:            return "stopped";
            case ApEvent::Type::CredentialFallback: return "credential fallback";
        }
        return "unknown";
    }

    const char* orUnknown(const std::string& value) {
        return value.empty() ? "unknown" : value.c_str();
    }
}

/**
 * @brief Work collected under the lock and flushed after it is released
 */
struct AccessPointController::Pending {
    std::vector<AccessPoint> changes;
    std::vector<std::string> lines;
};

const char* apStateName(ApState state) {
    return stateNames[static_cast<uint8_t>(state)];
}

AccessPointController::AccessPointController(AccessPointPlatform& platform, EventSink& sink)
    : AccessPointController(platform, sink, Config()) {
}

AccessPointController::AccessPointController(AccessPointPlatform& platform, EventSink& sink,
                                             const Config& config)
    : platform_(platform),
      sink_(sink),
      config_(config),
      ap_{ApState::Idle, "", 0, ApCredentials()},
      token_(0),
      nextToken_(1) {
    platform_.setEventHandler([this](const ApEvent& event) {
        events_.post(event);
    });
}

AccessPointController::~AccessPointController() {
    platform_.setEventHandler(nullptr);

    // Guaranteed release on teardown; observers may already be gone
    std::lock_guard<std::mutex> lock(mutex_);
    if (token_ != 0) {
        platform_.release(token_);
        token_ = 0;
    }
}

// ============================================================================
// Public API
// ============================================================================

bool AccessPointController::start(CapabilityMask granted) {
    Pending pending;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ok = startLocked(granted, pending);
    }
    flush(pending);
    return ok;
}

void AccessPointController::stop() {
    Pending pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopLocked(pending);
    }
    flush(pending);
}

bool AccessPointController::restart(CapabilityMask granted) {
    Pending pending;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.lines.push_back("Restarting hotspot");
        stopLocked(pending);
        ok = startLocked(granted, pending);
    }
    flush(pending);
    return ok;
}

size_t AccessPointController::processEvents() {
    size_t consumed = 0;
    ApEvent event;
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

ApState AccessPointController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ap_.state;
}

AccessPoint AccessPointController::accessPoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ap_;
}

void AccessPointController::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = std::move(callback);
}

// ============================================================================
// Transitions
// ============================================================================

bool AccessPointController::startLocked(CapabilityMask granted, Pending& pending) {
    // Collapse onto the in-flight or live instance
    if (ap_.state == ApState::Starting || ap_.state == ApState::Running) {
        return true;
    }

    std::string missing = describeMissingCapabilities(config_.required, granted);
    if (!missing.empty()) {
        ap_.failureReason = "missing capability: " + missing;
        ap_.failureCode = 0;
        ap_.credentials = ApCredentials();
        transitionLocked(ApState::Failed, pending);
        pending.lines.push_back("Hotspot not started, " + ap_.failureReason);
        return false;
    }

    // Stop-before-start: the previous reservation goes first
    if (token_ != 0) {
        platform_.release(token_);
        token_ = 0;
    }

    token_ = nextToken_++;
    ap_.failureReason.clear();
    ap_.failureCode = 0;
    ap_.credentials = ApCredentials();
    transitionLocked(ApState::Starting, pending);
    pending.lines.push_back("Starting hotspot");

    if (!platform_.requestStart(token_, config_.preferred)) {
        // The platform posts a Failed event with the reason code
        pending.lines.push_back("Hotspot start request was refused by the platform");
        return false;
    }
    return true;
}

void AccessPointController::stopLocked(Pending& pending) {
    bool active = (ap_.state == ApState::Starting || ap_.state == ApState::Running);
    uint32_t released = token_;
    token_ = 0;

    if (active) {
        transitionLocked(ApState::Stopping, pending);
    }
    if (released != 0) {
        platform_.release(released);
    }

    ap_.failureReason.clear();
    ap_.failureCode = 0;
    ap_.credentials = ApCredentials();
    transitionLocked(ApState::Idle, pending);

    if (active) {
        pending.lines.push_back("Hotspot released");
    }
}

void AccessPointController::transitionLocked(ApState next, Pending& pending) {
    if (next == ap_.state && next != ApState::Failed) {
        return;
    }
    ap_.state = next;
    pending.changes.push_back(ap_);
}

void AccessPointController::applyLocked(const ApEvent& event, Pending& pending) {
    char line[192];

    if (event.token == 0 || event.token != token_) {
        snprintf(line, sizeof(line), "[stale] Hotspot %s event for request %lu ignored",
                 eventName(event.type), static_cast<unsigned long>(event.token));
        pending.lines.push_back(line);

        // A late start still holds a reservation; close it
        if (event.type == ApEvent::Type::Started && event.token != 0) {
            platform_.release(event.token);
        }
        return;
    }

    switch (event.type) {
        case ApEvent::Type::Started:
            if (ap_.state != ApState::Starting) {
                return;
            }
            ap_.credentials = event.credentials;
            transitionLocked(ApState::Running, pending);
            snprintf(line, sizeof(line), "Hotspot ready: ssid=%s passphrase=%s gateway=%s",
                     orUnknown(event.credentials.ssid),
                     maskSecret(event.credentials.passphrase).c_str(),
                     orUnknown(event.credentials.gateway));
            pending.lines.push_back(line);
            break;

        case ApEvent::Type::Failed:
            platform_.release(token_);
            token_ = 0;
            ap_.failureCode = event.reason;
            ap_.failureReason = "platform error " + std::to_string(event.reason);
            ap_.credentials = ApCredentials();
            transitionLocked(ApState::Failed, pending);
            snprintf(line, sizeof(line), "Hotspot failed to start (reason %d)", event.reason);
            pending.lines.push_back(line);
            break;

        case ApEvent::Type::Stopped:
            if (ap_.state != ApState::Starting && ap_.state != ApState::Running) {
                return;
            }
            platform_.release(token_);
            token_ = 0;
            ap_.credentials = ApCredentials();
            transitionLocked(ApState::Stopped, pending);
            pending.lines.push_back("Hotspot stopped");
            break;

        case ApEvent::Type::CredentialFallback:
            pending.lines.push_back("Preferred hotspot credentials rejected (" + event.detail +
                                    "), using platform-assigned credentials");
            break;
    }
}

void AccessPointController::flush(const Pending& pending) {
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

std::string AccessPointController::maskSecret(const std::string& secret) const {
    if (secret.empty()) {
        return "unknown";
    }
    return config_.logSecrets ? secret : std::string("********");
}

} // namespace Provisioning
