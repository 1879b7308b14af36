#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace smap {

enum class Verdict { Accept, BlockedByRobots, ExcludedByPolicy };

// A same-domain link that passed the stateless filters, with its policy verdict.
struct Candidate {
    std::string url;
    Verdict verdict = Verdict::Accept;
};

struct CrawlCounters {
    std::size_t discovered = 0;
    std::size_t blocked_by_robots = 0;
    std::size_t excluded_by_policy = 0;
};

// The to-crawl / crawled-or-crawling / excluded sets of one run.
// Every operation holds the lock for its whole duration, so the three sets
// stay pairwise disjoint between calls.
class Frontier {
public:
    // No-op if the URL is already in any set.
    bool enqueue(const std::string& url);

    // Sitemap-index entries bypass exclusion: queued unless already crawled or
    // crawling, taken back out of the excluded set if an html link put it there.
    // Counters are never decremented.
    bool enqueue_sitemap(const std::string& url);

    // Idempotent. Ignored for URLs already queued or crawled.
    bool mark_excluded(const std::string& url);

    // Moves every queued URL to crawled-or-crawling and returns them.
    std::vector<std::string> take_all();
    std::optional<std::string> take_one();

    // Dedups candidates against all three sets, then queues or excludes them
    // by verdict. Returns how many were queued.
    std::size_t merge(const std::vector<Candidate>& candidates);

    // Sitemap-sourced URLs go straight to crawled-or-crawling. Returns the
    // URLs that were newly claimed, in input order.
    std::vector<std::string> claim(const std::vector<Candidate>& candidates);

    bool empty() const;
    std::size_t pending() const;
    std::size_t crawled() const;
    std::size_t excluded() const;

    bool is_pending(const std::string& url) const;
    bool is_crawled(const std::string& url) const;
    bool is_excluded(const std::string& url) const;

    bool disjoint() const;
    CrawlCounters counters() const;

private:
    bool known_locked(const std::string& url) const;
    void exclude_locked(const std::string& url, Verdict verdict);

    mutable std::mutex mtx_;
    std::unordered_set<std::string> to_crawl_;
    std::unordered_set<std::string> crawled_or_crawling_;
    std::unordered_set<std::string> excluded_;
    CrawlCounters counters_;
};

} // namespace smap
