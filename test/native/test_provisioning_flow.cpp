/**
 * @file test_provisioning_flow.cpp
 * @brief End-to-end host/peer exchange over in-process fakes
 *
 * The peer's POST is routed into the host's listener through a loopback
 * transport, so the wire body produced by the sender is the one decoded
 * by the endpoint.
 */

#include <unity.h>
#include "app/host_node.h"
#include "app/peer_node.h"
#include "fake_access_point_platform.h"
#include "fake_network_platform.h"
#include "fake_server_backend.h"

using namespace Provisioning;

namespace {

// Forwards to the backend if the URL names the port it listens on
class LoopbackTransport : public HttpTransport {
public:
    explicit LoopbackTransport(FakeServerBackend& backend) : backend_(backend) {}

    HttpPostResult post(const HttpPostRequest& request) override {
        const std::string scheme = "http://";
        if (request.url.compare(0, scheme.size(), scheme) != 0) {
            return HttpPostResult{false, 0, "", "unsupported URL"};
        }
        size_t colon = request.url.find(':', scheme.size());
        size_t slash = request.url.find('/', scheme.size());
        if (colon == std::string::npos || slash == std::string::npos || colon > slash) {
            return HttpPostResult{false, 0, "", "unsupported URL"};
        }

        int port = std::stoi(request.url.substr(colon + 1, slash - colon - 1));
        if (port != backend_.port() || backend_.openSockets() == 0) {
            return HttpPostResult{false, 0, "", "connection refused"};
        }

        HttpResponse response = backend_.request("POST", request.url.substr(slash), request.body);
        return HttpPostResult{true, response.status, response.body, ""};
    }

private:
    FakeServerBackend& backend_;
};

}

static EventSink* hostLog;
static EventSink* peerLog;
static FakeAccessPointPlatform* radio;
static FakeServerBackend* backend;
static FakeNetworkPlatform* station;
static LoopbackTransport* loopback;
static HostNode* host;
static PeerNode* peer;

static void bringUpHost() {
    TEST_ASSERT_TRUE(host->start());
    radio->emitStarted(radio->lastToken());
    host->update();
    TEST_ASSERT_TRUE(host->isListening());
}

static void joinHost() {
    TEST_ASSERT_TRUE(peer->connect("LanDiscoveryAP", "lan123456"));
    station->emitAvailable(station->lastRequestId(), 3, "192.168.49.1");
    peer->update();
    TEST_ASSERT_TRUE(peer->canSend());
}

void setUp() {
    hostLog = new EventSink();
    peerLog = new EventSink();
    radio = new FakeAccessPointPlatform();
    backend = new FakeServerBackend();
    station = new FakeNetworkPlatform();
    loopback = new LoopbackTransport(*backend);
    host = new HostNode(*radio, *backend, *hostLog);
    peer = new PeerNode(*station, *loopback, *peerLog, ProvisioningSender::Config(),
                        []() { return static_cast<int64_t>(1700000000000LL); });
}

void tearDown() {
    delete peer;
    delete host;
    delete loopback;
    delete station;
    delete backend;
    delete radio;
    delete peerLog;
    delete hostLog;
}

// ============================================================================
// Flow
// ============================================================================

void test_home_wifi_reaches_host() {
    bringUpHost();
    joinHost();

    TEST_ASSERT_TRUE(peer->send("HomeWifi", "pw"));

    ProvisioningPayload payload;
    TEST_ASSERT_TRUE(host->lastPayload(&payload));
    TEST_ASSERT_EQUAL_STRING("HomeWifi", payload.targetNetworkName.c_str());
    TEST_ASSERT_EQUAL_STRING("pw", payload.targetSecret.c_str());
    TEST_ASSERT_TRUE(payload.submittedAtEpochMillis == 1700000000000LL);
    TEST_ASSERT_EQUAL_STRING("Provisioning payload sent", peer->statusText().c_str());
}

void test_send_after_host_stop_fails() {
    bringUpHost();
    joinHost();

    host->stop();

    TEST_ASSERT_FALSE(peer->send("HomeWifi", "pw"));
    TEST_ASSERT_EQUAL(SendResult::Failed, peer->lastSendResult());
    TEST_ASSERT_FALSE(host->lastPayload(nullptr));
}

void test_send_before_listener_bound_fails() {
    TEST_ASSERT_TRUE(host->start());
    joinHost();

    TEST_ASSERT_FALSE(peer->send("HomeWifi", "pw"));
    TEST_ASSERT_EQUAL(SendResult::Failed, peer->lastSendResult());
}

void test_open_network_payload() {
    bringUpHost();
    joinHost();

    TEST_ASSERT_TRUE(peer->send("Guest", ""));

    ProvisioningPayload payload;
    TEST_ASSERT_TRUE(host->lastPayload(&payload));
    TEST_ASSERT_EQUAL_STRING("Guest", payload.targetNetworkName.c_str());
    TEST_ASSERT_TRUE(payload.targetSecret.empty());
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    UNITY_BEGIN();

    RUN_TEST(test_home_wifi_reaches_host);
    RUN_TEST(test_send_after_host_stop_fails);
    RUN_TEST(test_send_before_listener_bound_fails);
    RUN_TEST(test_open_network_payload);

    return UNITY_END();
}
