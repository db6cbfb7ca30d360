/**
 * @file main.cpp
 * @brief ESP32 Hotspot Provisioner - Main Entry Point
 *
 * Device-to-device provisioning over a locally created access point:
 * - Host role: creates the hotspot, then serves POST /provision
 * - Peer role: joins the hotspot and pushes target network credentials
 *
 * The role is fixed at build time with PROV_DEVICE_ROLE. Both roles are
 * driven from the serial console (type "help").
 */

#include <Arduino.h>
#include <esp_log.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/task.h>
#include <memory>
#include "provisioner_config.h"
#include "logging/event_sink.h"
#include "app/command_console.h"
#include "drivers/console_log.h"

#if PROV_DEVICE_ROLE == PROV_ROLE_HOST
#include "app/host_node.h"
#include "drivers/esp32_softap.h"
#include "drivers/esp32_http_server.h"
#else
#include "app/peer_node.h"
#include "drivers/esp32_station.h"
#include "drivers/esp32_http_client.h"
#endif

static const char* TAG = "Main";

using namespace Provisioning;

namespace {
    constexpr size_t MAX_LINE = 160;

    std::unique_ptr<EventSink> events;
    std::unique_ptr<ConsoleLog> consoleLog;
    String lineBuffer;

#if PROV_DEVICE_ROLE == PROV_ROLE_HOST
    constexpr CommandConsole::Role ROLE = CommandConsole::Role::Host;

    std::unique_ptr<Esp32SoftAp> softAp;
    std::unique_ptr<Esp32HttpServer> httpServer;
    std::unique_ptr<HostNode> node;
#else
    constexpr CommandConsole::Role ROLE = CommandConsole::Role::Peer;

    std::unique_ptr<Esp32Station> station;
    std::unique_ptr<Esp32HttpClient> httpClient;
    std::unique_ptr<PeerNode> node;

    // Sends block for up to connect + read timeout; keep them off loop()
    struct SendJob {
        char ssid[33];
        char passphrase[65];
    };

    QueueHandle_t sendQueue = nullptr;

    void sendWorker(void* arg) {
        (void)arg;
        SendJob job;
        for (;;) {
            if (xQueueReceive(sendQueue, &job, portMAX_DELAY) == pdTRUE) {
                node->send(job.ssid, job.passphrase);
                Serial.println(node->statusText().c_str());
            }
        }
    }

    void queueSend(const std::string& ssid, const std::string& passphrase) {
        if (!sendQueue) {
            Serial.println("Send worker unavailable");
            return;
        }
        SendJob job = {};
        strncpy(job.ssid, ssid.c_str(), sizeof(job.ssid) - 1);
        strncpy(job.passphrase, passphrase.c_str(), sizeof(job.passphrase) - 1);
        if (xQueueSend(sendQueue, &job, 0) != pdTRUE) {
            Serial.println("A send is already queued");
        }
    }
#endif

    void printStatus() {
        Serial.println(node->statusText().c_str());
#if PROV_DEVICE_ROLE == PROV_ROLE_HOST
        if (node->controller().state() == ApState::Running) {
            Serial.printf("Clients joined: %u\n", static_cast<unsigned>(softAp->clientCount()));
        }
#endif
    }

    void execute(const CommandConsole::Command& cmd) {
        switch (cmd.type) {
            case CommandConsole::CommandType::None:
                return;
            case CommandConsole::CommandType::Invalid:
                Serial.println(cmd.error.c_str());
                return;
            case CommandConsole::CommandType::Help:
                Serial.println(CommandConsole::helpText(ROLE));
                return;
            case CommandConsole::CommandType::Status:
                printStatus();
                return;
            case CommandConsole::CommandType::Logs:
                consoleLog->dumpHistory();
                return;
            default:
                break;
        }

#if PROV_DEVICE_ROLE == PROV_ROLE_HOST
        switch (cmd.type) {
            case CommandConsole::CommandType::Start:
                node->start();
                break;
            case CommandConsole::CommandType::Stop:
                node->stop();
                break;
            case CommandConsole::CommandType::Restart:
                node->restart();
                break;
            default:
                break;
        }
#else
        std::string passphrase = cmd.args.size() > 1 ? cmd.args[1] : std::string();
        switch (cmd.type) {
            case CommandConsole::CommandType::Connect:
                node->connect(cmd.args[0], passphrase);
                break;
            case CommandConsole::CommandType::Disconnect:
                node->disconnect();
                break;
            case CommandConsole::CommandType::Send:
                if (!node->canSend()) {
                    Serial.println("Not connected to the hotspot");
                    return;
                }
                queueSend(cmd.args[0], passphrase);
                return;
            default:
                break;
        }
#endif
        printStatus();
    }

    void readConsole() {
        while (Serial.available() > 0) {
            char c = static_cast<char>(Serial.read());
            if (c == '\r') {
                continue;
            }
            if (c == '\n') {
                execute(CommandConsole::parse(lineBuffer.c_str(), ROLE));
                lineBuffer = "";
                continue;
            }
            if (lineBuffer.length() < MAX_LINE) {
                lineBuffer += c;
            }
        }
    }
}

void setup() {
    Serial.begin(115200);
    while (!Serial && millis() < 3000); // Wait for USB CDC

    Serial.println();
    Serial.println("=====================================");
    Serial.println("  Hotspot Provisioner v1.0");
#if PROV_DEVICE_ROLE == PROV_ROLE_HOST
    Serial.println("  Role: host");
#else
    Serial.println("  Role: peer");
#endif
    Serial.println("=====================================");
    Serial.println();

    events.reset(new EventSink(nullptr, PROV_LOG_HISTORY_LIMIT));
    consoleLog.reset(new ConsoleLog(*events));

#if PROV_DEVICE_ROLE == PROV_ROLE_HOST
    softAp.reset(new Esp32SoftAp());
    httpServer.reset(new Esp32HttpServer());
    node.reset(new HostNode(*softAp, *httpServer, *events));

    // Listener follows from loop() once the AP reports ready
    ESP_LOGI(TAG, "Starting hotspot");
    if (!node->start()) {
        ESP_LOGE(TAG, "Hotspot start failed");
    }
#else
    station.reset(new Esp32Station());
    httpClient.reset(new Esp32HttpClient());
    node.reset(new PeerNode(*station, *httpClient, *events));

    sendQueue = xQueueCreate(PROV_WORKER_QUEUE_LEN, sizeof(SendJob));
    if (!sendQueue) {
        ESP_LOGE(TAG, "Send queue allocation failed");
    } else if (xTaskCreate(sendWorker, "send_worker", PROV_WORKER_STACK_SIZE, nullptr,
                           PROV_WORKER_PRIORITY, nullptr) != pdPASS) {
        ESP_LOGE(TAG, "Send worker creation failed");
    }
#endif

    Serial.println(CommandConsole::helpText(ROLE));
    Serial.println();
    ESP_LOGI(TAG, "Setup complete");
}

void loop() {
    // Platform callbacks are applied here, never on the WiFi event task
    node->update();

    readConsole();

    delay(10);
}
