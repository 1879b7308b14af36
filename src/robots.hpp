#pragma once

#include "config.hpp"
#include "http_client.hpp"

#include <optional>
#include <string>
#include <vector>

namespace smap {

// Parsed robots.txt, grouped by User-agent.
class RobotsTxt {
public:
    static RobotsTxt parse(const std::string& body);

    // Longest matching rule wins; ties go to Allow.
    bool allowed(const std::string& user_agent, const std::string& url) const;

    bool empty() const { return groups_.empty(); }

private:
    struct Group {
        std::vector<std::string> agents;   // lower case
        std::vector<std::string> allow;
        std::vector<std::string> disallow;
    };

    const Group* group_for(const std::string& user_agent) const;

    std::vector<Group> groups_;
};

// Crawl politeness for one run. Fails open: when disabled, not loaded, or on
// any error, every URL is allowed.
class RobotsPolicy {
public:
    explicit RobotsPolicy(const CrawlContext& ctx);

    // Fetches scheme://host/robots.txt once.
    void load(HttpClient& client);
    void load_from_text(const std::string& body);

    bool is_allowed(const std::string& url) const;

    bool loaded() const { return rules_.has_value(); }

private:
    const CrawlContext& ctx_;
    bool enabled_;
    std::optional<RobotsTxt> rules_;
};

} // namespace smap
