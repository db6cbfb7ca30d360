/**
 * @file http_types.h
 * @brief Minimal HTTP request/response shapes shared by listener and sender
 */

#ifndef HTTP_TYPES_H
#define HTTP_TYPES_H

#include <cstdint>
#include <functional>
#include <string>

namespace Provisioning {

namespace HttpStatus {
    constexpr int Ok = 200;
    constexpr int BadRequest = 400;
    constexpr int NotFound = 404;
    constexpr int InternalError = 500;

    /** @brief Status line text, e.g. "404 Not Found" */
    inline const char* line(int status) {
        switch (status) {
            case Ok:            return "200 OK";
            case BadRequest:    return "400 Bad Request";
            case NotFound:      return "404 Not Found";
            case InternalError: return "500 Internal Server Error";
            default:            return "500 Internal Server Error";
        }
    }
}

struct HttpRequest {
    std::string method;   ///< Upper case, e.g. "POST"
    std::string path;     ///< Without query string
    std::string body;
};

struct HttpResponse {
    int status;
    std::string body;
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

} // namespace Provisioning

#endif // HTTP_TYPES_H
