/**
 * @file provisioning_endpoint.h
 * @brief Routing and validation for the single control-plane endpoint
 *
 * Responses:
 *   POST <path>, valid JSON object  -> 200 "Provisioning payload accepted"
 *   POST <path>, empty body         -> 400 "Missing request body"
 *   POST <path>, body over limit    -> 400 "Request body too large"
 *   POST <path>, JSON parse failure -> 500 "Server error: <reason>"
 *   anything else                   -> 404 "Not Found"
 *
 * Only the 200 case reaches the payload callback, and only when the
 * target name is non-empty. The callback cannot change the response.
 */

#ifndef PROVISIONING_ENDPOINT_H
#define PROVISIONING_ENDPOINT_H

#include "http_types.h"
#include "provisioning_payload.h"
#include "../logging/event_sink.h"
#include "provisioner_config.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace Provisioning {

class ProvisioningEndpoint {
public:
    struct Config {
        std::string path = PROV_CONTROL_PATH;
        size_t maxBodyBytes = PROV_MAX_BODY_BYTES;
    };

    using PayloadCallback = std::function<void(const ProvisioningPayload&)>;

    ProvisioningEndpoint(EventSink& sink, const Config& config);

    ProvisioningEndpoint(const ProvisioningEndpoint&) = delete;
    ProvisioningEndpoint& operator=(const ProvisioningEndpoint&) = delete;

    void setPayloadCallback(PayloadCallback callback);

    /**
     * @brief Handle one request (called from the server task)
     */
    HttpResponse handle(const HttpRequest& request);

    /** @brief Payloads delivered to the callback so far */
    uint32_t deliveredCount() const { return delivered_.load(); }

private:
    void deliver(const ProvisioningPayload& payload);

    EventSink& sink_;
    Config config_;

    std::mutex callbackMutex_;
    PayloadCallback callback_;
    std::atomic<uint32_t> delivered_;
};

} // namespace Provisioning

#endif // PROVISIONING_ENDPOINT_H
