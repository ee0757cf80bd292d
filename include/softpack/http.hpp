#pragma once

#include <softpack/result.hpp>
#include <string>

namespace softpack {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking HTTP client over libcurl. Every request carries both a connect
// and a total timeout; expiry is a Timeout error, any other transport
// failure a Network error. HTTP status codes are returned, not judged.
class HttpClient {
public:
    explicit HttpClient(int timeout_seconds = 10) : timeout_seconds_(timeout_seconds) {}

    Result<HttpResponse> get(const std::string& url) const;
    Result<HttpResponse> post_json(const std::string& url, const std::string& body) const;

    int timeout() const { return timeout_seconds_; }

private:
    Result<HttpResponse> perform(const std::string& url, const std::string* body) const;

    int timeout_seconds_;
};

} // namespace softpack
