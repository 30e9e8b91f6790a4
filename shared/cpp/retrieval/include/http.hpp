#pragma once
#include <string>
#include <vector>

namespace ragcore {

struct HttpResponse {
    long status{0};
    std::string body;
    bool ok() const { return status >= 200 && status < 300; }
};

// Transport failures throw ProviderUnavailable; HTTP error statuses are
// returned to the caller.
HttpResponse http_request(const std::string& method, const std::string& url, const std::string& body,
                          long timeout_ms = 30000, const std::vector<std::string>& headers = {});

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000,
                            const std::vector<std::string>& headers = {});

HttpResponse http_get(const std::string& url, long timeout_ms = 30000,
                      const std::vector<std::string>& headers = {});

} // namespace ragcore
