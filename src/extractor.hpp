#pragma once

#include "config.hpp"
#include "frontier.hpp"
#include "robots.hpp"

#include <regex>
#include <string>
#include <vector>

namespace smap {

// Pattern-based link and image extraction plus the candidate filters.
class LinkExtractor {
public:
    LinkExtractor(const CrawlContext& ctx, const RobotsPolicy& robots);

    // Same-domain anchor links of a page, each with its policy verdict.
    std::vector<Candidate> extract_links(const std::string& html, const std::string& page_url) const;

    // Same-domain, robots-allowed image URLs, first occurrence order.
    std::vector<std::string> extract_images(const std::string& html, const std::string& page_url) const;

    // <url><loc> values of a leaf sitemap, rewritten onto the target host when
    // the sitemap was reached through a redirect to it.
    std::vector<Candidate> screen_sitemap_urls(const std::vector<std::string>& urls,
                                               bool redirected_to_target) const;

    // Canonical form of one href found on `page_url`, "" when discarded.
    std::string canonical_link(const std::string& href, const std::string& page_url) const;

    bool excluded_by_substring(const std::string& url) const;

private:
    Verdict screen(const std::string& url, const std::string& path) const;

    const CrawlContext& ctx_;
    const RobotsPolicy& robots_;
    std::vector<std::regex> drop_;
};

} // namespace smap
