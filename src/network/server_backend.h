/**
 * @file server_backend.h
 * @brief Platform seam for the control-plane HTTP server
 */

#ifndef SERVER_BACKEND_H
#define SERVER_BACKEND_H

#include "http_types.h"
#include <cstdint>
#include <memory>
#include <string>

namespace Provisioning {

/**
 * @brief An open listening socket; closed on destruction
 */
class ServerSocket {
public:
    virtual ~ServerSocket() = default;

    /** @brief Stop accepting and free the port (idempotent) */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
};

class ServerBackend {
public:
    virtual ~ServerBackend() = default;

    /**
     * @brief Bind all interfaces on port and serve every request through handler
     *
     * @param port TCP port
     * @param handler Called from the server task for each request
     * @param error Output: bind failure reason
     * @return Open socket, or nullptr on failure
     */
    virtual std::unique_ptr<ServerSocket> open(uint16_t port,
                                               RequestHandler handler,
                                               std::string* error) = 0;
};

} // namespace Provisioning

#endif // SERVER_BACKEND_H
