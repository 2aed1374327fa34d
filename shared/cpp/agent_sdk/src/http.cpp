#include "../include/http.hpp"
#include <curl/curl.h>
#include <mutex>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

// curl_global_init is not thread-safe on every libcurl build; run it once
// before the first handle is created from any agent thread.
void ensure_curl_init() {
    static std::once_flag once;
    std::call_once(once, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlHandle {
    CURL* h{nullptr};
    struct curl_slist* headers{nullptr};
    CurlHandle() {
        ensure_curl_init();
        h = curl_easy_init();
        if (!h) throw HttpError("curl_easy_init failed");
    }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
};

HttpResponse perform(CurlHandle& c, const std::string& url, long timeout_ms) {
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);

    CURLcode code = curl_easy_perform(c.h);
    if (code == CURLE_OPERATION_TIMEDOUT) {
        throw HttpTimeout(url + " timed out after " + std::to_string(timeout_ms) + "ms");
    }
    if (code != CURLE_OK) {
        throw HttpError(std::string("curl_easy_perform failed: ") + curl_easy_strerror(code));
    }
    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms) {
    CurlHandle c;
    c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    return perform(c, url, timeout_ms);
}

HttpResponse http_get(const std::string& url, long timeout_ms) {
    CurlHandle c;
    curl_easy_setopt(c.h, CURLOPT_HTTPGET, 1L);
    return perform(c, url, timeout_ms);
}
