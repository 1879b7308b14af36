#include "frontier.hpp"

namespace smap {

bool Frontier::known_locked(const std::string& url) const {
    return to_crawl_.count(url) || crawled_or_crawling_.count(url) || excluded_.count(url);
}

void Frontier::exclude_locked(const std::string& url, Verdict verdict) {
    excluded_.insert(url);
    if (verdict == Verdict::BlockedByRobots) ++counters_.blocked_by_robots;
    else ++counters_.excluded_by_policy;
}

bool Frontier::enqueue(const std::string& url) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (known_locked(url)) return false;
    to_crawl_.insert(url);
    ++counters_.discovered;
    return true;
}

bool Frontier::enqueue_sitemap(const std::string& url) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (crawled_or_crawling_.count(url) || to_crawl_.count(url)) return false;
    if (!excluded_.erase(url)) ++counters_.discovered;
    to_crawl_.insert(url);
    return true;
}

bool Frontier::mark_excluded(const std::string& url) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (known_locked(url)) return false;
    excluded_.insert(url);
    return true;
}

std::vector<std::string> Frontier::take_all() {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> batch(to_crawl_.begin(), to_crawl_.end());
    for (const auto& url : batch) crawled_or_crawling_.insert(url);
    to_crawl_.clear();
    return batch;
}

std::optional<std::string> Frontier::take_one() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (to_crawl_.empty()) return std::nullopt;
    auto it = to_crawl_.begin();
    std::string url = *it;
    to_crawl_.erase(it);
    crawled_or_crawling_.insert(url);
    return url;
}

std::size_t Frontier::merge(const std::vector<Candidate>& candidates) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::size_t queued = 0;
    for (const auto& c : candidates) {
        if (known_locked(c.url)) continue;
        ++counters_.discovered;
        if (c.verdict != Verdict::Accept) {
            exclude_locked(c.url, c.verdict);
            continue;
        }
        to_crawl_.insert(c.url);
        ++queued;
    }
    return queued;
}

std::vector<std::string> Frontier::claim(const std::vector<Candidate>& candidates) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> claimed;
    for (const auto& c : candidates) {
        if (crawled_or_crawling_.count(c.url) || excluded_.count(c.url)) continue;
        if (!to_crawl_.erase(c.url)) ++counters_.discovered;
        if (c.verdict != Verdict::Accept) {
            exclude_locked(c.url, c.verdict);
            continue;
        }
        crawled_or_crawling_.insert(c.url);
        claimed.push_back(c.url);
    }
    return claimed;
}

bool Frontier::empty() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return to_crawl_.empty();
}

std::size_t Frontier::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return to_crawl_.size();
}

std::size_t Frontier::crawled() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return crawled_or_crawling_.size();
}

std::size_t Frontier::excluded() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return excluded_.size();
}

bool Frontier::is_pending(const std::string& url) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return to_crawl_.count(url) > 0;
}

bool Frontier::is_crawled(const std::string& url) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return crawled_or_crawling_.count(url) > 0;
}

bool Frontier::is_excluded(const std::string& url) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return excluded_.count(url) > 0;
}

bool Frontier::disjoint() const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& url : to_crawl_) {
        if (crawled_or_crawling_.count(url) || excluded_.count(url)) return false;
    }
    for (const auto& url : crawled_or_crawling_) {
        if (excluded_.count(url)) return false;
    }
    return true;
}

CrawlCounters Frontier::counters() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return counters_;
}

} // namespace smap
