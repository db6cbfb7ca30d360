/**
 * @file esp32_http_client.h
 * @brief Outbound POST transport on arduino-esp32 HTTPClient
 *
 * Requests follow the lwIP default route, which the station driver pins
 * to the attachment while it is Bound.
 */

#ifndef ESP32_HTTP_CLIENT_H
#define ESP32_HTTP_CLIENT_H

#include "../network/http_transport.h"

namespace Provisioning {

class Esp32HttpClient : public HttpTransport {
public:
    HttpPostResult post(const HttpPostRequest& request) override;
};

} // namespace Provisioning

#endif // ESP32_HTTP_CLIENT_H
