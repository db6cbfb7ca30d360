/**
 * @file test_peer_node.cpp
 * @brief Unit tests for peer role orchestration
 *
 * Tests:
 * - Input checks happen before any network I/O
 * - Send is enabled only while Bound
 * - Loss disables send inside update()
 */

#include <unity.h>
#include "app/peer_node.h"
#include "fake_network_platform.h"
#include "fake_http_transport.h"

using namespace Provisioning;

static EventSink* sink;
static FakeNetworkPlatform* platform;
static FakeHttpTransport* transport;
static PeerNode* peer;

static void attach(NetworkHandle handle) {
    TEST_ASSERT_TRUE(peer->connect("LanDiscoveryAP", "lan123456"));
    platform->emitAvailable(platform->lastRequestId(), handle);
    peer->update();
    TEST_ASSERT_TRUE(peer->canSend());
}

void setUp() {
    sink = new EventSink();
    platform = new FakeNetworkPlatform();
    transport = new FakeHttpTransport();
    peer = new PeerNode(*platform, *transport, *sink, ProvisioningSender::Config(),
                        []() { return static_cast<int64_t>(42); });
}

void tearDown() {
    delete peer;
    delete transport;
    delete platform;
    delete sink;
    peer = nullptr;
    transport = nullptr;
    platform = nullptr;
    sink = nullptr;
}

// ============================================================================
// Connect
// ============================================================================

void test_peer_starts_not_connected() {
    TEST_ASSERT_FALSE(peer->canSend());
    TEST_ASSERT_EQUAL_STRING("Not connected", peer->statusText().c_str());
    TEST_ASSERT_EQUAL(SendResult::NotAttached, peer->lastSendResult());
}

void test_blank_server_ssid_is_rejected() {
    TEST_ASSERT_FALSE(peer->connect("  ", "lan123456"));

    TEST_ASSERT_EQUAL_STRING("Enter the server SSID", peer->statusText().c_str());
    TEST_ASSERT_EQUAL(0, platform->requestCount());
}

void test_connect_reports_progress() {
    TEST_ASSERT_TRUE(peer->connect("LanDiscoveryAP", "lan123456"));

    TEST_ASSERT_EQUAL_STRING("Connecting to LanDiscoveryAP...", peer->statusText().c_str());
    TEST_ASSERT_FALSE(peer->canSend());
}

void test_bound_enables_send() {
    attach(7);

    TEST_ASSERT_EQUAL_STRING("Connected to LanDiscoveryAP", peer->statusText().c_str());
}

void test_unavailable_reports_failure() {
    peer->connect("LanDiscoveryAP", "wrong-pass");
    platform->emitUnavailable(platform->lastRequestId());
    peer->update();

    TEST_ASSERT_FALSE(peer->canSend());
    TEST_ASSERT_EQUAL_STRING("Could not connect to LanDiscoveryAP", peer->statusText().c_str());
}

// ============================================================================
// Send
// ============================================================================

void test_blank_target_is_rejected_without_io() {
    attach(7);

    TEST_ASSERT_FALSE(peer->send("", "pw"));

    TEST_ASSERT_EQUAL_STRING("Enter the target SSID", peer->statusText().c_str());
    TEST_ASSERT_EQUAL(0, transport->requests.size());
}

void test_send_before_connect_performs_no_io() {
    TEST_ASSERT_FALSE(peer->send("HomeWifi", "pw"));

    TEST_ASSERT_EQUAL_STRING("Not connected to the hotspot", peer->statusText().c_str());
    TEST_ASSERT_EQUAL(0, transport->requests.size());
}

void test_send_while_requesting_performs_no_io() {
    peer->connect("LanDiscoveryAP", "lan123456");

    TEST_ASSERT_FALSE(peer->send("HomeWifi", "pw"));
    TEST_ASSERT_EQUAL(0, transport->requests.size());
}

void test_send_when_bound_posts_payload() {
    attach(7);

    TEST_ASSERT_TRUE(peer->send("HomeWifi", "pw"));

    TEST_ASSERT_EQUAL(1, transport->requests.size());
    TEST_ASSERT_EQUAL(7, transport->requests[0].network);
    TEST_ASSERT_EQUAL_STRING(
        "{\"targetSsid\":\"HomeWifi\",\"targetPassphrase\":\"pw\",\"timestamp\":42}",
        transport->requests[0].body.c_str());
    TEST_ASSERT_EQUAL(SendResult::Sent, peer->lastSendResult());
    TEST_ASSERT_EQUAL_STRING("Provisioning payload sent", peer->statusText().c_str());
}

void test_rejected_send_reports_failure() {
    attach(7);
    transport->answer(500, "Server error: InvalidInput");

    TEST_ASSERT_FALSE(peer->send("HomeWifi", "pw"));

    TEST_ASSERT_EQUAL(SendResult::Failed, peer->lastSendResult());
    TEST_ASSERT_EQUAL_STRING("Failed to send provisioning payload", peer->statusText().c_str());
    // Still attached, operator may retry
    TEST_ASSERT_TRUE(peer->canSend());
}

// ============================================================================
// Release
// ============================================================================

void test_lost_disables_send_in_update() {
    attach(7);

    platform->emitLost(7);
    TEST_ASSERT_TRUE(peer->canSend());
    peer->update();

    TEST_ASSERT_FALSE(peer->canSend());
    TEST_ASSERT_EQUAL_STRING("Connection to LanDiscoveryAP lost", peer->statusText().c_str());
    TEST_ASSERT_FALSE(peer->send("HomeWifi", "pw"));
    TEST_ASSERT_EQUAL(0, transport->requests.size());
}

void test_disconnect_disables_send() {
    attach(7);

    peer->disconnect();

    TEST_ASSERT_FALSE(peer->canSend());
    TEST_ASSERT_EQUAL_STRING("Not connected", peer->statusText().c_str());
    TEST_ASSERT_EQUAL(NO_NETWORK, platform->pinned());
}

void test_shutdown_unpins() {
    attach(7);

    peer->shutdown();

    TEST_ASSERT_EQUAL(NO_NETWORK, platform->pinned());
    TEST_ASSERT_EQUAL(AttachmentState::Idle, peer->attachments().state());
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    UNITY_BEGIN();

    // Connect
    RUN_TEST(test_peer_starts_not_connected);
    RUN_TEST(test_blank_server_ssid_is_rejected);
    RUN_TEST(test_connect_reports_progress);
    RUN_TEST(test_bound_enables_send);
    RUN_TEST(test_unavailable_reports_failure);

    // Send
    RUN_TEST(test_blank_target_is_rejected_without_io);
    RUN_TEST(test_send_before_connect_performs_no_io);
    RUN_TEST(test_send_while_requesting_performs_no_io);
    RUN_TEST(test_send_when_bound_posts_payload);
    RUN_TEST(test_rejected_send_reports_failure);

    // Release
    RUN_TEST(test_lost_disables_send_in_update);
    RUN_TEST(test_disconnect_disables_send);
    RUN_TEST(test_shutdown_unpins);

    return UNITY_END();
}
