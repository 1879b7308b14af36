#include "crawler.hpp"
#include "log.hpp"
#include "url.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <variant>

namespace smap {

// -------------------- ctor --------------------
namespace {
std::shared_ptr<HttpClient> non_null(std::shared_ptr<HttpClient> client) {
    if (!client) throw std::invalid_argument("Crawler needs an HTTP client");
    return client;
}
} // namespace

CrawlContext Crawler::validated(CrawlContext ctx) {
    validate(ctx);
    return ctx;
}

Crawler::Crawler(CrawlContext ctx, std::shared_ptr<HttpClient> client)
    : ctx_(validated(std::move(ctx))),
      client_(non_null(std::move(client))),
      robots_(ctx_),
      fetcher_(ctx_, *client_),
      extractor_(ctx_, robots_),
      writer_(ctx_) {}

std::vector<SitemapEntry> Crawler::entries() const {
    std::lock_guard<std::mutex> lk(entries_mtx_);
    return entries_;
}

// -------------------- seeding --------------------
void Crawler::seed() {
    for (const auto& sitemap_url : ctx_.sitemap_urls) {
        const std::string url = normalize_url(sitemap_url);
        if (frontier_.enqueue(url)) {
            std::lock_guard<std::mutex> lk(depth_mtx_);
            sitemap_depth_[url] = 0;
        }
        log_info("Added sitemap URL to crawl queue: " + sitemap_url);
    }

    if (!ctx_.sitemap_only) {
        frontier_.enqueue(normalize_url(ctx_.domain));
    } else if (ctx_.sitemap_urls.empty()) {
        log_warning("sitemap_only set but no sitemap URL provided, falling back to domain");
        frontier_.enqueue(normalize_url(ctx_.domain));
    }
}

// -------------------- per-URL pipeline --------------------
void Crawler::add_entry(SitemapEntry entry) {
    std::lock_guard<std::mutex> lk(entries_mtx_);
    if (!entry_locations_.insert(entry.location).second) return;
    entries_.push_back(std::move(entry));
}

void Crawler::on_html(const std::string& url, const HtmlPage& page) {
    SitemapEntry entry;
    entry.location = page.final_url;
    entry.last_modified = last_modified(page.headers);
    if (ctx_.images) entry.images = extractor_.extract_images(page.body, url);
    add_entry(std::move(entry));

    auto links = extractor_.extract_links(page.body, url);
    size_t queued = frontier_.merge(links);
    log_debug(std::to_string(queued) + " new links queued from " + url);
}

void Crawler::on_sitemap_index(const std::string& url, const SitemapIndex& index) {
    std::lock_guard<std::mutex> lk(depth_mtx_);
    auto it = sitemap_depth_.find(url);
    const int depth = (it == sitemap_depth_.end() ? 0 : it->second) + 1;
    if (depth > kMaxSitemapDepth) {
        log_warning("Sitemap index nesting deeper than " + std::to_string(kMaxSitemapDepth) +
                    " levels, skipping " + url);
        return;
    }
    // index entries bypass exclusion filtering
    for (const auto& loc : index.sitemap_urls) {
        const std::string sitemap_url = normalize_url(loc);
        if (frontier_.enqueue_sitemap(sitemap_url)) {
            sitemap_depth_[sitemap_url] = depth;
            log_debug("Added sitemap to crawl: " + sitemap_url);
        }
    }
}

void Crawler::on_sitemap_leaf(const SitemapLeaf& leaf) {
    auto candidates = extractor_.screen_sitemap_urls(leaf.page_urls, leaf.redirected_to_target);
    for (const auto& page_url : frontier_.claim(candidates)) {
        SitemapEntry entry;
        entry.location = page_url;
        add_entry(std::move(entry));
        log_debug("Added URL from sitemap to output: " + page_url);
    }
}

void Crawler::crawl_url(const std::string& url) {
    const size_t n = num_crawled_++;
    log_info("Crawling #" + std::to_string(n) + ": " + url);

    try {
        ResponseClassification result = fetcher_.fetch(url);
        std::visit([&](auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, HtmlPage>) {
                on_html(url, r);
            } else if constexpr (std::is_same_v<T, SitemapIndex>) {
                on_sitemap_index(url, r);
            } else if constexpr (std::is_same_v<T, SitemapLeaf>) {
                on_sitemap_leaf(r);
            } else if constexpr (std::is_same_v<T, Unfetched>) {
                SitemapEntry entry;
                entry.location = url;
                add_entry(std::move(entry));
            } else if constexpr (std::is_same_v<T, FetchError>) {
                log_debug("Fetch failed (" + r.message + ") ==> " + url);
            } else {
                log_info("Skipping " + url + " - " + r.reason);
            }
        }, result);
    } catch (const std::exception& e) {
        log_error("Error while crawling " + url + ": " + e.what());
    }
}

// -------------------- scheduling --------------------
void Crawler::crawl_sequential() {
    while (auto url = frontier_.take_one()) {
        crawl_url(*url);
    }
}

void Crawler::crawl_rounds() {
    for (;;) {
        const std::vector<std::string> batch = frontier_.take_all();
        if (batch.empty()) break;

        std::atomic<size_t> next{0};
        const size_t n = std::min(static_cast<size_t>(ctx_.num_workers), batch.size());
        std::vector<std::thread> workers;
        workers.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            workers.emplace_back([&] {
                for (size_t j = next++; j < batch.size(); j = next++) crawl_url(batch[j]);
            });
        }

        log_debug("waiting on " + std::to_string(batch.size()) + " crawl tasks to complete");
        for (auto& t : workers) t.join();
        log_debug("all crawl tasks have completed");
    }
}

// -------------------- orchestration --------------------
WriteResult Crawler::run() {
    if (state_ != CrawlState::Seeding) throw std::logic_error("Crawler::run called twice");

    robots_.load(*client_);
    seed();

    state_ = CrawlState::Crawling;
    log_info("Start the crawling process");
    if (ctx_.num_workers == 1) crawl_sequential();
    else crawl_rounds();

    state_ = CrawlState::Draining;
    log_info("Crawling has reached end of all found links");

    state_ = CrawlState::Writing;
    WriteResult result = writer_.write(entries());
    state_ = result.ok() ? CrawlState::Done : CrawlState::Aborted;
    return result;
}

void Crawler::make_report(std::ostream& os) const {
    const CrawlCounters c = frontier_.counters();
    os << "Number of found URL : " << c.discovered << "\n";
    os << "Number of links crawled : " << num_crawled_.load() << "\n";
    if (ctx_.parse_robots) os << "Number of link block by robots.txt : " << c.blocked_by_robots << "\n";
    if (!ctx_.skip_extensions.empty() || !ctx_.exclude.empty()) {
        os << "Number of link exclude : " << c.excluded_by_policy << "\n";
    }
    for (const auto& kv : fetcher_.response_codes()) {
        os << "Nb Code HTTP " << kv.first << " : " << kv.second << "\n";
    }
    for (const auto& kv : fetcher_.marked()) {
        os << "Link with status " << kv.first << ":\n";
        for (const auto& uri : kv.second) os << "\t- " << uri << "\n";
    }
}

} // namespace smap
