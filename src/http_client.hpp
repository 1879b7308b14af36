#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace smap {

struct HttpRequest {
    std::string url;
    std::string user_agent;
    long timeout_ms = 30000;
    // basic auth credentials, sent when set
    std::optional<std::pair<std::string, std::string>> credentials;
};

struct HttpResponse {
    long status_code = 0;
    std::map<std::string, std::string> headers;   // keys lower case
    std::string final_url;                        // after redirects
    std::string body;
    std::string error;                            // non-empty on transport failure

    bool network_error() const { return !error.empty(); }
    std::string header(const std::string& name) const;
};

// Transport seam. Implementations follow redirects and must be callable from
// several worker threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const HttpRequest& request) = 0;
};

class CprHttpClient : public HttpClient {
public:
    HttpResponse get(const HttpRequest& request) override;
};

} // namespace smap
