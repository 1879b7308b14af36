#include "classifier.hpp"
#include "log.hpp"
#include "sitemap_xml.hpp"
#include "url.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace smap {

bool ContentClassifier::looks_like_sitemap(const std::string& url) {
    return ends_with(url, ".xml") || to_lower(url).find("sitemap") != std::string::npos;
}

ResponseClassification ContentClassifier::classify(const std::string& request_url,
                                                   const HttpResponse& response) const {
    const std::string final_url = response.final_url.empty() ? request_url : response.final_url;
    const std::string content_type = to_lower(response.header("content-type"));

    if (content_type.find("xml") != std::string::npos || looks_like_sitemap(request_url)) {
        if (auto doc = parse_sitemap(response.body)) {
            if (doc->kind == SitemapKind::Index) {
                log_info("Found sitemap index at " + request_url);
                return SitemapIndex{std::move(doc->locations)};
            }
            log_info("Found sitemap at " + request_url);
            const std::string request_host = split_url(request_url).host;
            const std::string final_host = split_url(final_url).host;
            SitemapLeaf leaf;
            leaf.page_urls = std::move(doc->locations);
            leaf.redirected_to_target = request_host != ctx_.target_host && final_host == ctx_.target_host;
            return leaf;
        }
        // not a sitemap after all, handle as a page
    }

    const std::string final_host = split_url(final_url).host;
    if (final_host != ctx_.target_host) {
        return Dropped{"redirected to different domain (" + final_host + " != " + ctx_.target_host + ")"};
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        return Dropped{"non-2XX status code: " + std::to_string(response.status_code)};
    }
    return HtmlPage{final_url, response.body, response.headers};
}

std::optional<std::string> format_http_date(const std::string& http_date) {
    std::tm tm{};
    std::istringstream iss(http_date);
    iss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (iss.fail()) return std::nullopt;

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "+00:00";
    return oss.str();
}

std::optional<std::string> last_modified(const std::map<std::string, std::string>& headers) {
    auto it = headers.find("last-modified");
    if (it == headers.end()) it = headers.find("date");
    if (it == headers.end()) return std::nullopt;

    auto formatted = format_http_date(it->second);
    if (!formatted) log_debug("Unparsable date header: " + it->second);
    return formatted;
}

} // namespace smap
