/**
 * @file test_access_point_controller.cpp
 * @brief Unit tests for the host access point lifecycle
 *
 * Tests:
 * - Start/stop/restart transitions and collapse of duplicate starts
 * - Capability precondition
 * - Platform Started/Failed/Stopped/CredentialFallback callbacks
 * - Stale callbacks after a restart
 * - Passphrase masking in the log
 * - Release on destruction
 * - Concurrent start/stop/restart never holds two reservations
 */

#include <unity.h>
#include "network/access_point_controller.h"
#include "fake_access_point_platform.h"
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace Provisioning;

static EventSink* sink;
static FakeAccessPointPlatform* platform;
static AccessPointController* controller;

static std::mutex observedMutex;
static std::vector<ApState> observed;

static bool logContains(const std::string& needle) {
    for (const auto& event : sink->history()) {
        if (event.message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static std::vector<ApState> observedStates() {
    std::lock_guard<std::mutex> lock(observedMutex);
    return observed;
}

static void startRunning() {
    TEST_ASSERT_TRUE(controller->start(CapabilitiesAll));
    platform->emitStarted(platform->lastToken());
    controller->processEvents();
    TEST_ASSERT_EQUAL(ApState::Running, controller->state());
}

void setUp() {
    sink = new EventSink();
    platform = new FakeAccessPointPlatform();
    controller = new AccessPointController(*platform, *sink);
    {
        std::lock_guard<std::mutex> lock(observedMutex);
        observed.clear();
    }
    controller->setStatusCallback([](const AccessPoint& ap) {
        std::lock_guard<std::mutex> lock(observedMutex);
        observed.push_back(ap.state);
    });
}

void tearDown() {
    delete controller;
    delete platform;
    delete sink;
    controller = nullptr;
    platform = nullptr;
    sink = nullptr;
}

// ============================================================================
// Start
// ============================================================================

void test_controller_starts_idle() {
    TEST_ASSERT_EQUAL(ApState::Idle, controller->state());
    TEST_ASSERT_EQUAL_STRING("Idle", apStateName(controller->state()));
    TEST_ASSERT_TRUE(platform->hasHandler());
}

void test_start_requests_preferred_credentials() {
    TEST_ASSERT_TRUE(controller->start(CapabilitiesAll));

    TEST_ASSERT_EQUAL(ApState::Starting, controller->state());
    TEST_ASSERT_EQUAL(1, platform->startCount());
    TEST_ASSERT_EQUAL_STRING("LanDiscoveryAP", platform->lastPreferred().ssid.c_str());
    TEST_ASSERT_EQUAL_STRING("lan123456", platform->lastPreferred().passphrase.c_str());
    TEST_ASSERT_EQUAL_STRING("192.168.49.1", platform->lastPreferred().gateway.c_str());
    TEST_ASSERT_TRUE(logContains("Starting hotspot"));
}

void test_started_event_moves_to_running() {
    startRunning();

    AccessPoint ap = controller->accessPoint();
    TEST_ASSERT_EQUAL_STRING("LanDiscoveryAP", ap.credentials.ssid.c_str());
    TEST_ASSERT_EQUAL_STRING("lan123456", ap.credentials.passphrase.c_str());
    TEST_ASSERT_TRUE(logContains("Hotspot ready: ssid=LanDiscoveryAP"));
    TEST_ASSERT_TRUE(logContains("gateway=192.168.49.1"));

    std::vector<ApState> states = observedStates();
    TEST_ASSERT_EQUAL(2, states.size());
    TEST_ASSERT_EQUAL(ApState::Starting, states[0]);
    TEST_ASSERT_EQUAL(ApState::Running, states[1]);
}

void test_passphrase_masked_in_log() {
    startRunning();

    TEST_ASSERT_FALSE(logContains("lan123456"));
    TEST_ASSERT_TRUE(logContains("passphrase=********"));
}

void test_passphrase_logged_when_enabled() {
    AccessPointController::Config config;
    config.logSecrets = true;
    delete controller;
    controller = new AccessPointController(*platform, *sink, config);

    startRunning();

    TEST_ASSERT_TRUE(logContains("passphrase=lan123456"));
}

void test_start_while_starting_collapses() {
    TEST_ASSERT_TRUE(controller->start(CapabilitiesAll));
    TEST_ASSERT_TRUE(controller->start(CapabilitiesAll));

    TEST_ASSERT_EQUAL(1, platform->startCount());
    TEST_ASSERT_EQUAL(ApState::Starting, controller->state());
}

void test_start_while_running_collapses() {
    startRunning();
    TEST_ASSERT_TRUE(controller->start(CapabilitiesAll));

    TEST_ASSERT_EQUAL(1, platform->startCount());
    TEST_ASSERT_EQUAL(ApState::Running, controller->state());
}

void test_missing_capability_fails_without_platform_call() {
    TEST_ASSERT_FALSE(controller->start(CapabilityLocation | CapabilityWifiState));

    AccessPoint ap = controller->accessPoint();
    TEST_ASSERT_EQUAL(ApState::Failed, ap.state);
    TEST_ASSERT_EQUAL_STRING("missing capability: nearby-devices, change-network",
                             ap.failureReason.c_str());
    TEST_ASSERT_EQUAL(0, platform->startCount());
    TEST_ASSERT_TRUE(logContains("Hotspot not started"));
}

void test_refused_request_reports_failure() {
    platform->refuseStart = true;

    TEST_ASSERT_FALSE(controller->start(CapabilitiesAll));
    controller->processEvents();

    AccessPoint ap = controller->accessPoint();
    TEST_ASSERT_EQUAL(ApState::Failed, ap.state);
    TEST_ASSERT_EQUAL(7, ap.failureCode);
    TEST_ASSERT_EQUAL(0, platform->reservedCount());
}

// ============================================================================
// Platform callbacks
// ============================================================================

void test_platform_failure_releases_and_records_reason() {
    controller->start(CapabilitiesAll);
    uint32_t token = platform->lastToken();

    platform->emitFailed(token, 2);
    TEST_ASSERT_EQUAL(1, controller->processEvents());

    AccessPoint ap = controller->accessPoint();
    TEST_ASSERT_EQUAL(ApState::Failed, ap.state);
    TEST_ASSERT_EQUAL(2, ap.failureCode);
    TEST_ASSERT_EQUAL_STRING("platform error 2", ap.failureReason.c_str());
    TEST_ASSERT_TRUE(logContains("reason 2"));

    std::vector<uint32_t> releases = platform->releases();
    TEST_ASSERT_EQUAL(1, releases.size());
    TEST_ASSERT_EQUAL(token, releases[0]);
}

void test_platform_stop_moves_to_stopped() {
    startRunning();

    platform->emitStopped(platform->lastToken());
    controller->processEvents();

    TEST_ASSERT_EQUAL(ApState::Stopped, controller->state());
    TEST_ASSERT_TRUE(controller->accessPoint().credentials.ssid.empty());
    TEST_ASSERT_TRUE(logContains("Hotspot stopped"));
}

void test_credential_fallback_is_logged_and_start_continues() {
    controller->start(CapabilitiesAll);
    uint32_t token = platform->lastToken();

    platform->emitFallback(token, "ssid LanDiscoveryAP not accepted");
    platform->emitStarted(token, ApCredentials{"LanDiscovery-3F2A", "0a1b2c3d4e5f", "192.168.49.1"});
    controller->processEvents();

    AccessPoint ap = controller->accessPoint();
    TEST_ASSERT_EQUAL(ApState::Running, ap.state);
    TEST_ASSERT_EQUAL_STRING("LanDiscovery-3F2A", ap.credentials.ssid.c_str());
    TEST_ASSERT_TRUE(logContains("Preferred hotspot credentials rejected"));
}

void test_stale_started_is_released_and_ignored() {
    controller->start(CapabilitiesAll);
    uint32_t oldToken = platform->lastToken();
    controller->stop();
    controller->start(CapabilitiesAll);
    uint32_t newToken = platform->lastToken();
    TEST_ASSERT_TRUE(newToken != oldToken);

    platform->emitStarted(oldToken);
    controller->processEvents();

    TEST_ASSERT_EQUAL(ApState::Starting, controller->state());
    TEST_ASSERT_TRUE(logContains("[stale]"));

    // The old reservation was closed both by stop() and by the stale event
    std::vector<uint32_t> releases = platform->releases();
    TEST_ASSERT_EQUAL(2, releases.size());
    TEST_ASSERT_EQUAL(oldToken, releases[1]);

    platform->emitStarted(newToken);
    controller->processEvents();
    TEST_ASSERT_EQUAL(ApState::Running, controller->state());
}

void test_stale_failure_does_not_touch_live_instance() {
    controller->start(CapabilitiesAll);
    uint32_t oldToken = platform->lastToken();
    controller->restart(CapabilitiesAll);
    platform->emitStarted(platform->lastToken());

    platform->emitFailed(oldToken, 5);
    controller->processEvents();

    TEST_ASSERT_EQUAL(ApState::Running, controller->state());
    TEST_ASSERT_EQUAL(0, controller->accessPoint().failureCode);
}

// ============================================================================
// Stop / restart
// ============================================================================

void test_stop_from_running_passes_through_stopping() {
    startRunning();
    controller->stop();

    std::vector<ApState> states = observedStates();
    TEST_ASSERT_EQUAL(4, states.size());
    TEST_ASSERT_EQUAL(ApState::Stopping, states[2]);
    TEST_ASSERT_EQUAL(ApState::Idle, states[3]);
    TEST_ASSERT_EQUAL(0, platform->reservedCount());
    TEST_ASSERT_TRUE(logContains("Hotspot released"));
}

void test_stop_is_idempotent() {
    controller->stop();
    controller->stop();

    TEST_ASSERT_EQUAL(ApState::Idle, controller->state());
    TEST_ASSERT_EQUAL(0, platform->releases().size());
    TEST_ASSERT_EQUAL(0, observedStates().size());
}

void test_stop_from_failed_returns_to_idle() {
    controller->start(CapabilityLocation);
    controller->stop();

    AccessPoint ap = controller->accessPoint();
    TEST_ASSERT_EQUAL(ApState::Idle, ap.state);
    TEST_ASSERT_TRUE(ap.failureReason.empty());
}

void test_restart_releases_before_new_request() {
    startRunning();
    uint32_t first = platform->lastToken();

    TEST_ASSERT_TRUE(controller->restart(CapabilitiesAll));
    uint32_t second = platform->lastToken();

    std::vector<std::string> ops = platform->operations();
    TEST_ASSERT_EQUAL(3, ops.size());
    TEST_ASSERT_EQUAL_STRING(("start:" + std::to_string(first)).c_str(), ops[0].c_str());
    TEST_ASSERT_EQUAL_STRING(("release:" + std::to_string(first)).c_str(), ops[1].c_str());
    TEST_ASSERT_EQUAL_STRING(("start:" + std::to_string(second)).c_str(), ops[2].c_str());
    TEST_ASSERT_EQUAL(1, platform->maxReserved());
    TEST_ASSERT_EQUAL(ApState::Starting, controller->state());
    TEST_ASSERT_TRUE(logContains("Restarting hotspot"));
}

void test_restart_from_failed_starts_again() {
    controller->start(CapabilitiesAll);
    platform->emitFailed(platform->lastToken(), 1);
    controller->processEvents();

    TEST_ASSERT_TRUE(controller->restart(CapabilitiesAll));
    platform->emitStarted(platform->lastToken());
    controller->processEvents();

    TEST_ASSERT_EQUAL(ApState::Running, controller->state());
}

void test_destructor_releases_reservation() {
    startRunning();

    delete controller;
    controller = nullptr;

    TEST_ASSERT_EQUAL(0, platform->reservedCount());
    TEST_ASSERT_FALSE(platform->hasHandler());
}

// ============================================================================
// Concurrency
// ============================================================================

void test_concurrent_operations_hold_one_reservation() {
    controller->setStatusCallback(nullptr);
    platform->autoStart = true;

    std::atomic<bool> done(false);
    std::atomic<int> torn(0);

    std::thread pump([&]() {
        while (!done.load()) {
            controller->processEvents();
            AccessPoint ap = controller->accessPoint();
            if (ap.state == ApState::Running && ap.credentials.ssid.empty()) torn++;
            if (ap.state == ApState::Failed && ap.failureReason.empty()) torn++;
            if (ap.state == ApState::Idle && !ap.credentials.ssid.empty()) torn++;
        }
    });

    std::vector<std::thread> callers;
    for (int t = 0; t < 3; t++) {
        callers.emplace_back([t]() {
            for (int i = 0; i < 200; i++) {
                switch ((i + t) % 3) {
                    case 0: controller->start(CapabilitiesAll); break;
                    case 1: controller->stop(); break;
                    case 2: controller->restart(CapabilitiesAll); break;
                }
            }
        });
    }

    for (auto& caller : callers) {
        caller.join();
    }
    done = true;
    pump.join();

    controller->stop();
    controller->processEvents();

    TEST_ASSERT_EQUAL(0, torn.load());
    TEST_ASSERT_TRUE(platform->maxReserved() <= 1);
    TEST_ASSERT_EQUAL(0, platform->reservedCount());
    TEST_ASSERT_EQUAL(ApState::Idle, controller->state());
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    UNITY_BEGIN();

    // Start
    RUN_TEST(test_controller_starts_idle);
    RUN_TEST(test_start_requests_preferred_credentials);
    RUN_TEST(test_started_event_moves_to_running);
    RUN_TEST(test_passphrase_masked_in_log);
    RUN_TEST(test_passphrase_logged_when_enabled);
    RUN_TEST(test_start_while_starting_collapses);
    RUN_TEST(test_start_while_running_collapses);
    RUN_TEST(test_missing_capability_fails_without_platform_call);
    RUN_TEST(test_refused_request_reports_failure);

    // Platform callbacks
    RUN_TEST(test_platform_failure_releases_and_records_reason);
    RUN_TEST(test_platform_stop_moves_to_stopped);
    RUN_TEST(test_credential_fallback_is_logged_and_start_continues);
    RUN_TEST(test_stale_started_is_released_and_ignored);
    RUN_TEST(test_stale_failure_does_not_touch_live_instance);

    // Stop / restart
    RUN_TEST(test_stop_from_running_passes_through_stopping);
    RUN_TEST(test_stop_is_idempotent);
    RUN_TEST(test_stop_from_failed_returns_to_idle);
    RUN_TEST(test_restart_releases_before_new_request);
    RUN_TEST(test_restart_from_failed_starts_again);
    RUN_TEST(test_destructor_releases_reservation);

    // Concurrency
    RUN_TEST(test_concurrent_operations_hold_one_reservation);

    return UNITY_END();
}
