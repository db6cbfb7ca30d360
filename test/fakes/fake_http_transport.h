/**
 * @file fake_http_transport.h
 * @brief Recording HttpTransport for native tests
 */

#ifndef FAKE_HTTP_TRANSPORT_H
#define FAKE_HTTP_TRANSPORT_H

#include "network/http_transport.h"
#include <vector>

class FakeHttpTransport : public Provisioning::HttpTransport {
public:
    Provisioning::HttpPostResult next{true, 200, "Provisioning payload accepted", ""};

    Provisioning::HttpPostResult post(const Provisioning::HttpPostRequest& request) override {
        requests.push_back(request);
        return next;
    }

    void failWith(const std::string& error) {
        next = Provisioning::HttpPostResult{false, 0, "", error};
    }

    void answer(int status, const std::string& body) {
        next = Provisioning::HttpPostResult{true, status, body, ""};
    }

    std::vector<Provisioning::HttpPostRequest> requests;
};

#endif // FAKE_HTTP_TRANSPORT_H
