#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace smap {

extern const char* const kDefaultHttpUserAgent;

// Raised for invalid run configuration, always before any network activity.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Per-run configuration. Built once, then owned read-only by one Crawler.
struct CrawlContext {
    std::string domain;
    std::string scheme;        // derived from domain by validate()
    std::string target_host;   // host[:port], lower case

    int num_workers = 1;

    bool parse_robots = false;
    std::string robots_user_agent = "*";
    std::string http_user_agent = kDefaultHttpUserAgent;

    bool auth = false;
    std::string username;
    std::string password;

    std::string output;        // empty: write to stdout
    bool as_index = false;
    bool sort_alphabetically = true;

    std::vector<std::string> exclude;
    std::vector<std::string> skip_extensions;
    std::vector<std::string> drop;
    std::vector<std::string> domain_aliases;

    bool images = false;
    std::vector<std::string> sitemap_urls;
    bool sitemap_only = false;

    std::optional<std::size_t> max_url_diff;
    std::optional<double> max_url_diff_percent;

    long timeout_ms = 30000;

    bool report = false;
    bool verbose = false;
    bool debug = false;
};

// Checks the context and fills the derived fields. Throws ConfigError.
void validate(CrawlContext& ctx);

// Loads a JSON array (or a single object) of per-domain overrides applied on
// top of `defaults`. Throws ConfigError if the file is unreadable or malformed.
std::vector<CrawlContext> load_contexts(const std::string& path, const CrawlContext& defaults);

// Returns `url` when its host is the target domain, the URL rewritten onto the
// target scheme and host when its host is a configured alias, nullopt otherwise.
std::optional<std::string> in_target_domain(const CrawlContext& ctx, const std::string& url);

// Same as load_contexts, from JSON text.
std::vector<CrawlContext> parse_contexts(const std::string& json_text, const CrawlContext& defaults);

} // namespace smap
