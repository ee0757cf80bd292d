#include <softpack/http.hpp>
#include <softpack/log.hpp>

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace softpack {

namespace {

constexpr char kUserAgent[] = "softpack-core/0.1";

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

Status ensure_initialized() {
    static std::once_flag once;
    static CURLcode init_code = CURLE_OK;
    std::call_once(once, [] { init_code = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (init_code != CURLE_OK) {
        return SoftpackError{SoftpackError::Network,
            std::string("curl_global_init failed: ") + curl_easy_strerror(init_code)};
    }
    return ok_status();
}

} // namespace

Result<HttpResponse> HttpClient::get(const std::string& url) const {
    return perform(url, nullptr);
}

Result<HttpResponse> HttpClient::post_json(const std::string& url,
                                           const std::string& body) const {
    return perform(url, &body);
}

Result<HttpResponse> HttpClient::perform(const std::string& url,
                                         const std::string* body) const {
    SOFTPACK_TRY(ensure_initialized());

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{curl_easy_init(),
                                                               &curl_easy_cleanup};
    if (!handle) {
        return SoftpackError{SoftpackError::Network, "curl_easy_init failed"};
    }

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers{nullptr,
                                                                        &curl_slist_free_all};
    HttpResponse response;
    CURL* h = handle.get();

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

    if (body) {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        return SoftpackError{SoftpackError::Timeout,
            url + " timed out after " + std::to_string(timeout_seconds_) + "s"};
    }
    if (rc != CURLE_OK) {
        return SoftpackError{SoftpackError::Network,
            url + ": " + curl_easy_strerror(rc)};
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    softpack::log::trace("%s %s -> %ld", body ? "POST" : "GET", url.c_str(), response.status);
    return Result<HttpResponse>::ok(std::move(response));
}

} // namespace softpack
