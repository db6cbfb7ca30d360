/**
 * @file http_transport.h
 * @brief Platform seam for the peer's outbound HTTP POST
 */

#ifndef HTTP_TRANSPORT_H
#define HTTP_TRANSPORT_H

#include "network_platform.h"
#include <cstdint>
#include <string>

namespace Provisioning {

struct HttpPostRequest {
    NetworkHandle network;      ///< Attachment the request must travel over
    std::string url;
    std::string contentType;
    std::string body;
    uint32_t connectTimeoutMs;
    uint32_t readTimeoutMs;
};

struct HttpPostResult {
    bool completed;       ///< false on connect/read/transport error
    int status;           ///< HTTP status when completed
    std::string body;
    std::string error;    ///< Transport error text when not completed
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform one blocking POST (no retry)
     */
    virtual HttpPostResult post(const HttpPostRequest& request) = 0;
};

} // namespace Provisioning

#endif // HTTP_TRANSPORT_H
