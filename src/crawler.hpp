#pragma once

#include "config.hpp"
#include "extractor.hpp"
#include "fetcher.hpp"
#include "frontier.hpp"
#include "http_client.hpp"
#include "robots.hpp"
#include "sitemap_writer.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace smap {

enum class CrawlState { Seeding, Crawling, Draining, Writing, Done, Aborted };

// Crawls one domain and writes its sitemap. Owns all state of the run.
class Crawler {
public:
    // Validates the context; throws ConfigError before any network activity.
    explicit Crawler(CrawlContext ctx,
                     std::shared_ptr<HttpClient> client = std::make_shared<CprHttpClient>());

    Crawler(const Crawler&) = delete;
    Crawler& operator=(const Crawler&) = delete;

    // Seeds, crawls until the frontier drains, then writes. Only once per instance.
    WriteResult run();

    void make_report(std::ostream& os) const;

    CrawlState state() const { return state_; }
    const Frontier& frontier() const { return frontier_; }
    std::vector<SitemapEntry> entries() const;
    std::size_t num_crawled() const { return num_crawled_; }

private:
    static constexpr int kMaxSitemapDepth = 8;

    static CrawlContext validated(CrawlContext ctx);

    void seed();
    void crawl_sequential();
    void crawl_rounds();
    void crawl_url(const std::string& url);

    void on_html(const std::string& url, const HtmlPage& page);
    void on_sitemap_index(const std::string& url, const SitemapIndex& index);
    void on_sitemap_leaf(const SitemapLeaf& leaf);
    void add_entry(SitemapEntry entry);

    CrawlContext ctx_;
    std::shared_ptr<HttpClient> client_;
    RobotsPolicy robots_;
    Fetcher fetcher_;
    LinkExtractor extractor_;
    SitemapWriter writer_;
    Frontier frontier_;

    mutable std::mutex entries_mtx_;
    std::vector<SitemapEntry> entries_;
    std::unordered_set<std::string> entry_locations_;

    std::mutex depth_mtx_;
    std::unordered_map<std::string, int> sitemap_depth_;

    std::atomic<std::size_t> num_crawled_{0};
    std::atomic<CrawlState> state_{CrawlState::Seeding};
};

} // namespace smap
