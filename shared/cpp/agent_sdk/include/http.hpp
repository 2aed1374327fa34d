#pragma once
#include <stdexcept>
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Transport failure (DNS, connect, reset). Non-2xx statuses are not errors here.
class HttpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class HttpTimeout : public HttpError {
public:
    using HttpError::HttpError;
};

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);
HttpResponse http_get(const std::string& url, long timeout_ms = 5000);
