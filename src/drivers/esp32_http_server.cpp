/**
 * @file esp32_http_server.cpp
 * @brief esp_http_server backend implementation
 */

#include "esp32_http_server.h"
#include <esp_http_server.h>
#include <esp_log.h>

static const char* TAG = "HttpServer";

namespace Provisioning {

namespace {
    constexpr const char* TEXT_PLAIN = "text/plain; charset=utf-8";
    constexpr uint32_t SERVER_STACK_SIZE = 6144;
    constexpr int RECV_TIMEOUT_RETRIES = 3;

    const httpd_method_t routedMethods[] = {
        HTTP_GET,
        HTTP_POST,
        HTTP_PUT,
        HTTP_DELETE,
        HTTP_PATCH,
        HTTP_HEAD
    };

    // ========================================================================
    // Socket
    // ========================================================================

    class Esp32HttpSocket : public ServerSocket {
    public:
        Esp32HttpSocket(RequestHandler handler, size_t maxBodyBytes)
            : handler_(std::move(handler)), maxBodyBytes_(maxBodyBytes), server_(nullptr) {
        }

        ~Esp32HttpSocket() override {
            close();
        }

        bool begin(uint16_t port, std::string* error);

        void close() override {
            if (!server_) {
                return;
            }
            esp_err_t err = httpd_stop(server_);
            if (err != ESP_OK) {
                ESP_LOGW(TAG, "httpd_stop: %s", esp_err_to_name(err));
            }
            server_ = nullptr;
            ESP_LOGI(TAG, "Server closed");
        }

        bool isOpen() const override {
            return server_ != nullptr;
        }

        HttpResponse dispatch(const HttpRequest& request) {
            return handler_(request);
        }

        size_t maxBodyBytes() const { return maxBodyBytes_; }

    private:
        RequestHandler handler_;
        size_t maxBodyBytes_;
        httpd_handle_t server_;
    };

    // Context lifetime belongs to the unique_ptr, not to httpd
    void keepContext(void* ctx) {
        (void)ctx;
    }

    void sendResponse(httpd_req_t* req, const HttpResponse& response) {
        httpd_resp_set_status(req, HttpStatus::line(response.status));
        httpd_resp_set_type(req, TEXT_PLAIN);
        esp_err_t err = httpd_resp_send(req, response.body.data(), response.body.size());
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Response send failed: %s", esp_err_to_name(err));
        }
    }

    /**
     * @brief Read up to limit bytes of the body
     * @return false on socket error
     */
    bool readBody(httpd_req_t* req, size_t limit, std::string* body) {
        size_t wanted = req->content_len < limit ? req->content_len : limit;
        body->resize(wanted);

        size_t received = 0;
        int timeouts = 0;
        while (received < wanted) {
            int len = httpd_req_recv(req, &(*body)[received], wanted - received);
            if (len == HTTPD_SOCK_ERR_TIMEOUT && ++timeouts <= RECV_TIMEOUT_RETRIES) {
                continue;
            }
            if (len <= 0) {
                return false;
            }
            received += static_cast<size_t>(len);
        }
        return true;
    }

    esp_err_t handleRequest(httpd_req_t* req) {
        Esp32HttpSocket* socket = static_cast<Esp32HttpSocket*>(httpd_get_global_user_ctx(req->handle));
        if (!socket) {
            return ESP_FAIL;
        }

        HttpRequest request;
        request.method = http_method_str(static_cast<enum http_method>(req->method));

        request.path = req->uri;
        size_t query = request.path.find('?');
        if (query != std::string::npos) {
            request.path.erase(query);
        }

        // One byte past the limit is enough for the endpoint to reject it
        if (!readBody(req, socket->maxBodyBytes() + 1, &request.body)) {
            ESP_LOGW(TAG, "Body read failed for %s %s", request.method.c_str(), request.path.c_str());
            return ESP_FAIL;
        }

        ESP_LOGD(TAG, "%s %s (%u bytes)", request.method.c_str(), request.path.c_str(),
                 static_cast<unsigned>(request.body.size()));
        sendResponse(req, socket->dispatch(request));
        return ESP_OK;
    }

    esp_err_t handleUnrouted(httpd_req_t* req, httpd_err_code_t error) {
        (void)error;
        sendResponse(req, HttpResponse{HttpStatus::NotFound, "Not Found"});
        return ESP_OK;
    }

    bool Esp32HttpSocket::begin(uint16_t port, std::string* error) {
        httpd_config_t config = HTTPD_DEFAULT_CONFIG();
        config.server_port = port;
        config.uri_match_fn = httpd_uri_match_wildcard;
        config.max_uri_handlers = sizeof(routedMethods) / sizeof(routedMethods[0]);
        config.stack_size = SERVER_STACK_SIZE;
        config.global_user_ctx = this;
        config.global_user_ctx_free_fn = keepContext;
        config.lru_purge_enable = true;

        esp_err_t ret = httpd_start(&server_, &config);
        if (ret != ESP_OK) {
            server_ = nullptr;
            if (error) *error = esp_err_to_name(ret);
            return false;
        }

        for (httpd_method_t method : routedMethods) {
            httpd_uri_t route = {};
            route.uri = "/*";
            route.method = method;
            route.handler = handleRequest;
            route.user_ctx = nullptr;
            esp_err_t err = httpd_register_uri_handler(server_, &route);
            if (err != ESP_OK) {
                ESP_LOGW(TAG, "Route %s failed: %s", http_method_str(static_cast<enum http_method>(method)),
                         esp_err_to_name(err));
            }
        }

        httpd_register_err_handler(server_, HTTPD_404_NOT_FOUND, handleUnrouted);
        httpd_register_err_handler(server_, HTTPD_405_METHOD_NOT_ALLOWED, handleUnrouted);

        ESP_LOGI(TAG, "Listening on port %u", port);
        return true;
    }
}

Esp32HttpServer::Esp32HttpServer(size_t maxBodyBytes) : maxBodyBytes_(maxBodyBytes) {
}

std::unique_ptr<ServerSocket> Esp32HttpServer::open(uint16_t port,
                                                    RequestHandler handler,
                                                    std::string* error) {
    std::unique_ptr<Esp32HttpSocket> socket(new Esp32HttpSocket(std::move(handler), maxBodyBytes_));
    if (!socket->begin(port, error)) {
        ESP_LOGE(TAG, "Server start on port %u failed", port);
        return nullptr;
    }
    return std::move(socket);
}

} // namespace Provisioning
