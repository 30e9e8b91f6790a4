#include "../include/http.hpp"
#include "../include/errors.hpp"
#include <curl/curl.h>
#include <mutex>

namespace ragcore {

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

std::once_flag g_curl_init;

struct CurlHandle {
    CURL* h{nullptr};
    struct curl_slist* headers{nullptr};
    CurlHandle() {
        std::call_once(g_curl_init, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
        h = curl_easy_init();
        if (!h) throw ProviderUnavailable("curl_easy_init failed");
    }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
};
}

HttpResponse http_request(const std::string& method, const std::string& url, const std::string& body,
                          long timeout_ms, const std::vector<std::string>& headers) {
    CurlHandle c;
    c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
    for (auto& h : headers) c.headers = curl_slist_append(c.headers, h.c_str());

    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    if (method == "GET") {
        curl_easy_setopt(c.h, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body.size());
    }

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw ProviderUnavailable(method + " " + url + " failed: " + curl_easy_strerror(code));
    }
    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms,
                            const std::vector<std::string>& headers) {
    return http_request("POST", url, json_body, timeout_ms, headers);
}

HttpResponse http_get(const std::string& url, long timeout_ms, const std::vector<std::string>& headers) {
    return http_request("GET", url, {}, timeout_ms, headers);
}

} // namespace ragcore
