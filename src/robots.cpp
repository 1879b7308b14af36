#include "robots.hpp"
#include "log.hpp"
#include "url.hpp"

#include <sstream>

namespace smap {

namespace {
void trim(std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    size_t b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) { s.clear(); return; }
    s = s.substr(a, b - a + 1);
}
} // namespace

// -------------------- robots.txt --------------------
RobotsTxt RobotsTxt::parse(const std::string& body) {
    RobotsTxt out;
    std::istringstream iss(body);
    std::string line;
    bool in_agents = false;   // last directive was User-agent

    while (std::getline(iss, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        trim(line);
        if (line.empty()) continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = to_lower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        trim(key);
        trim(value);

        if (key == "user-agent") {
            if (!in_agents || out.groups_.empty()) out.groups_.emplace_back();
            // a blank agent opens a group that matches no crawler
            if (!value.empty()) out.groups_.back().agents.push_back(to_lower(value));
            in_agents = true;
        } else if (key == "allow" || key == "disallow") {
            in_agents = false;
            if (out.groups_.empty()) continue;   // rules before any User-agent
            if (key == "allow") out.groups_.back().allow.push_back(value);
            else out.groups_.back().disallow.push_back(value);
        } else {
            in_agents = false;
        }
    }
    return out;
}

const RobotsTxt::Group* RobotsTxt::group_for(const std::string& user_agent) const {
    // product token only, e.g. "Googlebot/2.1" -> "googlebot"
    std::string token = to_lower(user_agent.substr(0, user_agent.find('/')));
    const Group* fallback = nullptr;
    for (const auto& g : groups_) {
        for (const auto& agent : g.agents) {
            if (agent == "*") {
                if (!fallback) fallback = &g;
            } else if (!token.empty() && token != "*" && token.find(agent) != std::string::npos) {
                return &g;
            }
        }
    }
    return fallback;
}

bool RobotsTxt::allowed(const std::string& user_agent, const std::string& url) const {
    const Group* g = group_for(user_agent);
    if (!g) return true;

    UrlParts p = split_url(url);
    std::string path = p.path.empty() ? "/" : p.path;
    if (!p.query.empty()) path += "?" + p.query;

    size_t dis_len = 0;
    bool dis_hit = false;
    for (const auto& d : g->disallow) {
        if (d.empty()) continue;
        if (starts_with(path, d) && d.size() >= dis_len) { dis_len = d.size(); dis_hit = true; }
    }
    if (!dis_hit) return true;
    size_t allow_len = 0;
    bool allow_hit = false;
    for (const auto& a : g->allow) {
        if (a.empty()) continue;
        if (starts_with(path, a) && a.size() >= allow_len) { allow_len = a.size(); allow_hit = true; }
    }
    return allow_hit && allow_len >= dis_len;
}

// -------------------- policy --------------------
RobotsPolicy::RobotsPolicy(const CrawlContext& ctx)
    : ctx_(ctx), enabled_(ctx.parse_robots) {}

void RobotsPolicy::load(HttpClient& client) {
    if (!enabled_) return;
    const std::string robots_url = ctx_.scheme + "://" + ctx_.target_host + "/robots.txt";

    HttpRequest req;
    req.url = robots_url;
    req.user_agent = ctx_.http_user_agent;
    req.timeout_ms = ctx_.timeout_ms;
    HttpResponse r = client.get(req);

    if (r.network_error()) {
        log_warning("robots.txt unreachable (" + r.error + "), allowing all URLs");
        return;
    }
    if (r.status_code < 200 || r.status_code >= 300) {
        log_info("robots.txt returned status " + std::to_string(r.status_code) + ", allowing all URLs");
        return;
    }
    load_from_text(r.body);
}

void RobotsPolicy::load_from_text(const std::string& body) {
    try {
        rules_ = RobotsTxt::parse(body);
        log_info("Loaded robots.txt for " + ctx_.target_host);
    } catch (const std::exception& e) {
        log_warning(std::string("Error parsing robots.txt, allowing all URLs: ") + e.what());
        rules_.reset();
    }
}

bool RobotsPolicy::is_allowed(const std::string& url) const {
    if (!enabled_ || !rules_) return true;
    try {
        if (rules_->allowed(ctx_.robots_user_agent, url)) return true;
        log_debug("Crawling of " + url + " disabled by robots.txt");
        return false;
    } catch (const std::exception& e) {
        log_debug(std::string("Error during robots.txt check: ") + e.what());
        return true;
    }
}

} // namespace smap
