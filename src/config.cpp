#include "config.hpp"
#include "url.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <regex>
#include <sstream>

using nlohmann::json;

namespace smap {

const char* const kDefaultHttpUserAgent = "SitemapCrawler/1.0 (+sitemap generator)";

namespace {

std::vector<std::string> string_list(const json& v) {
    std::vector<std::string> out;
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
    } else if (v.is_array()) {
        for (const auto& item : v) out.push_back(item.get<std::string>());
    } else if (!v.is_null()) {
        throw ConfigError("expected a string or an array of strings");
    }
    return out;
}

CrawlContext apply_overrides(const json& obj, const CrawlContext& defaults) {
    if (!obj.is_object()) throw ConfigError("config entries must be JSON objects");

    CrawlContext ctx = defaults;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const std::string& key = it.key();
        const json& v = it.value();
        try {
            if (key == "domain") ctx.domain = v.get<std::string>();
            else if (key == "num_workers") ctx.num_workers = v.get<int>();
            else if (key == "parserobots") ctx.parse_robots = v.get<bool>();
            else if (key == "user_agent") ctx.robots_user_agent = v.get<std::string>();
            else if (key == "http_user_agent") ctx.http_user_agent = v.get<std::string>();
            else if (key == "auth") ctx.auth = v.get<bool>();
            else if (key == "username") ctx.username = v.get<std::string>();
            else if (key == "password") ctx.password = v.get<std::string>();
            else if (key == "output") ctx.output = v.is_null() ? std::string() : v.get<std::string>();
            else if (key == "as_index") ctx.as_index = v.get<bool>();
            else if (key == "sort_alphabetically") ctx.sort_alphabetically = v.get<bool>();
            else if (key == "exclude") ctx.exclude = string_list(v);
            else if (key == "skipext") ctx.skip_extensions = string_list(v);
            else if (key == "drop") ctx.drop = string_list(v);
            else if (key == "domain_aliases") ctx.domain_aliases = string_list(v);
            else if (key == "images") ctx.images = v.get<bool>();
            else if (key == "sitemap_url") ctx.sitemap_urls = string_list(v);
            else if (key == "sitemap_only") ctx.sitemap_only = v.get<bool>();
            else if (key == "max_url_diff") {
                if (v.is_null()) ctx.max_url_diff.reset();
                else if (v.is_number() && v.get<double>() < 0)
                    throw ConfigError("max_url_diff must not be negative");
                else ctx.max_url_diff = v.get<std::size_t>();
            } else if (key == "max_url_diff_percent") {
                if (v.is_null()) ctx.max_url_diff_percent.reset();
                else if (v.get<double>() < 0) throw ConfigError("max_url_diff_percent must not be negative");
                else ctx.max_url_diff_percent = v.get<double>();
            }
            else if (key == "timeout_ms") ctx.timeout_ms = v.get<long>();
            else if (key == "report") ctx.report = v.get<bool>();
            else if (key == "verbose") ctx.verbose = v.get<bool>();
            else if (key == "debug") ctx.debug = v.get<bool>();
            // unknown keys are ignored, like unknown command-line defaults
        } catch (const json::exception& e) {
            throw ConfigError("invalid value for '" + key + "': " + e.what());
        }
    }
    return ctx;
}

} // namespace

void validate(CrawlContext& ctx) {
    auto parts = parse_absolute_url(ctx.domain);
    if (!parts || (parts->scheme != "http" && parts->scheme != "https")) {
        throw ConfigError("Invalid domain: '" + ctx.domain + "'");
    }
    ctx.scheme = parts->scheme;
    ctx.target_host = parts->host;

    if (ctx.num_workers <= 0) throw ConfigError("Number of workers must be positive");

    if (ctx.as_index && ctx.output.empty()) {
        throw ConfigError("When specifying an index file as an output option, you must include an output file name");
    }

    if (ctx.timeout_ms <= 0) throw ConfigError("Timeout must be positive");

    for (const auto& pattern : ctx.drop) {
        try {
            std::regex re(pattern);
        } catch (const std::regex_error& e) {
            throw ConfigError("Invalid drop pattern '" + pattern + "': " + e.what());
        }
    }

    for (auto& ext : ctx.skip_extensions) {
        if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    }
    for (auto& alias : ctx.domain_aliases) alias = to_lower(alias);
}

std::optional<std::string> in_target_domain(const CrawlContext& ctx, const std::string& url) {
    UrlParts p = split_url(url);
    if (p.host == ctx.target_host) return url;
    for (const auto& alias : ctx.domain_aliases) {
        if (p.host == alias) {
            p.scheme = ctx.scheme;
            p.host = ctx.target_host;
            p.has_authority = true;
            return unsplit_url(p);
        }
    }
    return std::nullopt;
}

std::vector<CrawlContext> parse_contexts(const std::string& json_text, const CrawlContext& defaults) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Malformed config: ") + e.what());
    }

    std::vector<CrawlContext> out;
    if (root.is_array()) {
        for (const auto& entry : root) out.push_back(apply_overrides(entry, defaults));
    } else {
        out.push_back(apply_overrides(root, defaults));
    }
    return out;
}

std::vector<CrawlContext> load_contexts(const std::string& path, const CrawlContext& defaults) {
    std::ifstream ifs(path);
    if (!ifs) throw ConfigError("Cannot open config file: " + path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return parse_contexts(ss.str(), defaults);
}

} // namespace smap
