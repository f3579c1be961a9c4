#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "net/cancellation.hpp"

namespace kbengine {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
    const CancellationToken* cancellation = nullptr;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// The request never reached a response: DNS, connect, TLS or timeout failure.
class HttpTransportError : public std::runtime_error {
public:
    HttpTransportError(const std::string& message, bool timed_out)
        : std::runtime_error(message), timed_out_(timed_out) {}

    bool timed_out() const noexcept { return timed_out_; }

private:
    bool timed_out_;
};

// Throws HttpTransportError on transport failure and OperationCancelled when the
// request's cancellation token fires mid-transfer. Any HTTP status is returned as-is.
HttpResponse perform_http_request(const HttpRequest& request);

using HttpTransport = std::function<HttpResponse(const HttpRequest&)>;

}  // namespace kbengine
