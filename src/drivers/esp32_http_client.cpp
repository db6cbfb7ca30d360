/**
 * @file esp32_http_client.cpp
 * @brief HTTPClient transport implementation
 */

#include "esp32_http_client.h"
#include <HTTPClient.h>
#include <esp_log.h>

static const char* TAG = "HttpClient";

namespace Provisioning {

HttpPostResult Esp32HttpClient::post(const HttpPostRequest& request) {
    HttpPostResult result{false, 0, "", ""};

    HTTPClient http;
    http.setConnectTimeout(static_cast<int32_t>(request.connectTimeoutMs));
    http.setTimeout(static_cast<uint16_t>(request.readTimeoutMs));
    http.setReuse(false);

    if (!http.begin(request.url.c_str())) {
        result.error = "invalid URL " + request.url;
        return result;
    }

    http.addHeader("Content-Type", request.contentType.c_str());

    ESP_LOGD(TAG, "POST %s over network %lu (%u bytes)", request.url.c_str(),
             static_cast<unsigned long>(request.network), static_cast<unsigned>(request.body.size()));

    int code = http.POST(reinterpret_cast<uint8_t*>(const_cast<char*>(request.body.data())),
                         request.body.size());
    if (code < 0) {
        result.error = HTTPClient::errorToString(code).c_str();
        ESP_LOGW(TAG, "POST failed: %s", result.error.c_str());
    } else {
        result.completed = true;
        result.status = code;
        result.body = http.getString().c_str();
        ESP_LOGI(TAG, "POST answered %d", code);
    }

    http.end();
    return result;
}

} // namespace Provisioning
