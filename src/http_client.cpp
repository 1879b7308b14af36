#include "http_client.hpp"
#include "url.hpp"

#include <cpr/cpr.h>

namespace smap {

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

HttpResponse CprHttpClient::get(const HttpRequest& request) {
    cpr::Header hdr{{"User-Agent", request.user_agent}};

    cpr::Response r;
    if (request.credentials) {
        r = cpr::Get(cpr::Url{request.url},
                     hdr,
                     cpr::Authentication{request.credentials->first, request.credentials->second,
                                         cpr::AuthMode::BASIC},
                     cpr::Timeout{request.timeout_ms},
                     cpr::Redirect{true});
    } else {
        r = cpr::Get(cpr::Url{request.url}, hdr, cpr::Timeout{request.timeout_ms}, cpr::Redirect{true});
    }

    HttpResponse out;
    if (r.error) {
        out.error = r.error.message.empty() ? std::string("transport error") : r.error.message;
        out.final_url = request.url;
        return out;
    }

    out.status_code = r.status_code;
    out.final_url = r.url.str().empty() ? request.url : r.url.str();
    for (const auto& kv : r.header) out.headers[to_lower(kv.first)] = kv.second;
    out.body = std::move(r.text);
    return out;
}

} // namespace smap
