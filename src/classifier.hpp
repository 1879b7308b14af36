#pragma once

#include "config.hpp"
#include "http_client.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace smap {

struct HtmlPage {
    std::string final_url;
    std::string body;
    std::map<std::string, std::string> headers;
};

struct SitemapIndex {
    std::vector<std::string> sitemap_urls;
};

struct SitemapLeaf {
    std::vector<std::string> page_urls;
    bool redirected_to_target = false;
};

// Not downloaded; still listed in the sitemap.
struct Unfetched {
    std::string reason;
};

struct FetchError {
    long status_code = 0;   // 0 for transport errors
    std::string message;
};

// Fetched but out of scope (off-domain redirect, non-2xx final status).
struct Dropped {
    std::string reason;
};

using ResponseClassification =
    std::variant<HtmlPage, SitemapIndex, SitemapLeaf, Unfetched, FetchError, Dropped>;

// Decides what a successfully fetched response is.
class ContentClassifier {
public:
    explicit ContentClassifier(const CrawlContext& ctx) : ctx_(ctx) {}

    ResponseClassification classify(const std::string& request_url, const HttpResponse& response) const;

    static bool looks_like_sitemap(const std::string& url);

private:
    const CrawlContext& ctx_;
};

// Last-Modified (else Date) header as YYYY-MM-DDTHH:MM:SS+00:00.
std::optional<std::string> last_modified(const std::map<std::string, std::string>& headers);

std::optional<std::string> format_http_date(const std::string& http_date);

} // namespace smap
