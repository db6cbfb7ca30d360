/**
 * @file esp32_http_server.h
 * @brief Control-plane server backend on esp_http_server
 *
 * Every method and URI is routed into the RequestHandler, which owns the
 * routing decision. The server's own 404/405 paths answer with the same
 * "404 Not Found" text so nothing else leaks out.
 */

#ifndef ESP32_HTTP_SERVER_H
#define ESP32_HTTP_SERVER_H

#include "../network/server_backend.h"
#include "provisioner_config.h"

namespace Provisioning {

class Esp32HttpServer : public ServerBackend {
public:
    /**
     * @param maxBodyBytes Body bytes read per request; anything past
     *        maxBodyBytes + 1 is discarded unread
     */
    explicit Esp32HttpServer(size_t maxBodyBytes = PROV_MAX_BODY_BYTES);

    std::unique_ptr<ServerSocket> open(uint16_t port,
                                       RequestHandler handler,
                                       std::string* error) override;

private:
    size_t maxBodyBytes_;
};

} // namespace Provisioning

#endif // ESP32_HTTP_SERVER_H
