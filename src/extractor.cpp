#include "extractor.hpp"
#include "log.hpp"
#include "url.hpp"

#include <algorithm>
#include <unordered_set>

namespace smap {

namespace {

const char* const kSpace = " \t\r\n";

// Values of `attribute` in every tag opened by `tag_re`. The regex only
// locates the tag name; attribute values are delimited with find() so their
// length never reaches the regex engine. Inline data: values and values over
// the sitemap <loc> limit are skipped here.
std::vector<std::string> attribute_values(const std::string& html, const std::regex& tag_re,
                                          const std::string& attribute) {
    std::vector<std::string> out;
    for (std::sregex_iterator it(html.begin(), html.end(), tag_re), end; it != end; ++it) {
        size_t pos = static_cast<size_t>(it->position(0) + it->length(0));
        while (pos < html.size()) {
            pos = html.find_first_not_of(" \t\r\n/", pos);
            if (pos == std::string::npos || html[pos] == '>') break;

            size_t name_end = html.find_first_of(" \t\r\n=>/", pos);
            if (name_end == std::string::npos) break;
            if (name_end == pos) { ++pos; continue; }   // stray '='
            const std::string name = to_lower(html.substr(pos, name_end - pos));

            pos = html.find_first_not_of(kSpace, name_end);
            if (pos == std::string::npos) break;
            if (html[pos] != '=') continue;   // attribute without value
            pos = html.find_first_not_of(kSpace, pos + 1);
            if (pos == std::string::npos) break;

            size_t value_begin = pos;
            size_t value_end;
            if (html[pos] == '"' || html[pos] == '\'') {
                value_begin = pos + 1;
                value_end = html.find(html[pos], value_begin);
                if (value_end == std::string::npos) break;
                pos = value_end + 1;
            } else {
                value_end = html.find_first_of(" \t\r\n>", pos);
                if (value_end == std::string::npos) value_end = html.size();
                pos = value_end;
            }
            if (name != attribute) continue;

            size_t a = html.find_first_not_of(kSpace, value_begin);
            if (a != std::string::npos && a < value_end) {
                size_t b = html.find_last_not_of(kSpace, value_end - 1);
                if (b - a + 1 > kMaxUrlLength) {
                    log_debug("Skipping " + attribute + " value of " + std::to_string(b - a + 1) + " characters");
                } else if (!starts_with(to_lower(html.substr(a, 5)), "data:")) {
                    out.push_back(html.substr(a, b - a + 1));
                }
            }
            break;   // first occurrence only
        }
    }
    return out;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

} // namespace

LinkExtractor::LinkExtractor(const CrawlContext& ctx, const RobotsPolicy& robots)
    : ctx_(ctx), robots_(robots) {
    for (const auto& pattern : ctx_.drop) drop_.emplace_back(pattern);
}

bool LinkExtractor::excluded_by_substring(const std::string& url) const {
    for (const auto& ex : ctx_.exclude) {
        if (url.find(ex) != std::string::npos) return true;
    }
    return false;
}

Verdict LinkExtractor::screen(const std::string& url, const std::string& path) const {
    if (!robots_.is_allowed(url)) return Verdict::BlockedByRobots;

    const std::string ext = path_extension(path);
    if (std::find(ctx_.skip_extensions.begin(), ctx_.skip_extensions.end(), ext) != ctx_.skip_extensions.end()) {
        return Verdict::ExcludedByPolicy;
    }
    if (excluded_by_substring(url)) return Verdict::ExcludedByPolicy;
    return Verdict::Accept;
}

std::string LinkExtractor::canonical_link(const std::string& href, const std::string& page_url) const {
    if (href.empty()) return "";
    const UrlParts page = split_url(page_url);
    const std::string lower = to_lower(href);

    std::string link;
    if (starts_with(href, "//")) {
        link = page.scheme + ":" + href;
    } else if (href[0] == '/') {
        link = page.scheme + "://" + page.host + href;
    } else if (href[0] == '#') {
        link = page.scheme + "://" + page.host + page.path + href;
    } else if (starts_with(lower, "mailto") || starts_with(lower, "tel")) {
        return "";
    } else if (!is_absolute_url(href)) {
        link = resolve_url(page_url, href);
    } else {
        link = href;
    }

    link = strip_fragment(normalize_url(link));
    return apply_drop_patterns(link, drop_);
}

std::vector<Candidate> LinkExtractor::extract_links(const std::string& html, const std::string& page_url) const {
    static const std::regex a_tag_re(R"(<\s*a\b)", std::regex::icase);

    std::vector<Candidate> out;
    for (const auto& href : attribute_values(html, a_tag_re, "href")) {
        log_debug("Found : " + href);
        std::string link = canonical_link(href, page_url);
        if (link.empty()) continue;

        auto in_domain = in_target_domain(ctx_, link);
        if (!in_domain) continue;
        link = *in_domain;

        const UrlParts parts = split_url(link);
        if ((parts.path.empty() || parts.path == "/") && parts.query.empty()) continue;
        if (link.find("javascript") != std::string::npos) continue;
        if (is_image_path(parts.path)) continue;
        if (starts_with(parts.path, "data:")) continue;

        out.push_back(Candidate{link, screen(link, parts.path)});
    }
    return out;
}

std::vector<std::string> LinkExtractor::extract_images(const std::string& html, const std::string& page_url) const {
    static const std::regex img_tag_re(R"(<\s*img\b)", std::regex::icase);

    const UrlParts page = split_url(page_url);
    std::string domain_root = ctx_.domain;
    while (!domain_root.empty() && domain_root.back() == '/') domain_root.pop_back();

    std::unordered_set<std::string> seen;
    std::vector<std::string> images;
    for (auto link : attribute_values(html, img_tag_re, "src")) {
        if (!seen.insert(link).second) continue;

        if (starts_with(link, "//")) {
            link = page.scheme + ":" + link;
        } else if (!starts_with(link, "http")) {
            if (link[0] != '/') link = "/" + link;
            link = domain_root + replace_all(link, "./", "/");
        }

        if (excluded_by_substring(link)) continue;

        auto in_domain = in_target_domain(ctx_, link);
        if (!in_domain) continue;

        if (robots_.is_allowed(*in_domain)) {
            log_debug("Found image : " + *in_domain);
            if (std::find(images.begin(), images.end(), *in_domain) == images.end()) {
                images.push_back(*in_domain);
            }
        }
    }
    return images;
}

std::vector<Candidate> LinkExtractor::screen_sitemap_urls(const std::vector<std::string>& urls,
                                                          bool redirected_to_target) const {
    std::vector<Candidate> out;
    for (const auto& raw : urls) {
        if (raw.size() > kMaxUrlLength) {
            log_debug("Skipping sitemap URL of " + std::to_string(raw.size()) + " characters");
            continue;
        }
        std::string url = raw;
        if (redirected_to_target) {
            UrlParts p = split_url(url);
            if (p.host != ctx_.target_host) {
                p.scheme = ctx_.scheme;
                p.host = ctx_.target_host;
                p.has_authority = true;
                url = unsplit_url(p);
                log_debug("Normalized " + raw + " -> " + url);
            }
        }

        auto in_domain = in_target_domain(ctx_, url);
        if (!in_domain) {
            log_debug("Skipping off-domain sitemap URL: " + url);
            continue;
        }
        if (excluded_by_substring(*in_domain)) {
            log_debug("Excluded URL from sitemap: " + *in_domain);
            out.push_back(Candidate{*in_domain, Verdict::ExcludedByPolicy});
            continue;
        }
        out.push_back(Candidate{*in_domain, Verdict::Accept});
    }
    return out;
}

} // namespace smap
