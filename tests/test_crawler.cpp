/*
 * test_crawler.cpp
 *
 * End-to-end crawls against an in-memory site: seeding, html and sitemap
 * ingestion, scope drops, rounds with several workers and the write stage.
 */

#include <assert.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "unittest.h"
#include "fake_http.h"
#include "crawler.hpp"
#include "sitemap_xml.hpp"

using namespace smap;
namespace fs = std::filesystem;

static fs::path temp_output(const std::string& name)
{
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::temp_directory_path() / ("smap_crawler_" + name + "_" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir / "sitemap.xml";
}

static CrawlContext site_context(const fs::path& output)
{
  CrawlContext ctx;
  ctx.domain = "http://example.com/";
  ctx.output = output.string();
  return ctx;
}

static std::set<std::string> locations(const Crawler& crawler)
{
  std::set<std::string> out;
  for (const auto& e : crawler.entries()) out.insert(e.location);
  return out;
}

static std::string urlset(const std::vector<std::string>& locs)
{
  std::string xml = "<?xml version=\"1.0\"?>\n<urlset xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">\n";
  for (const auto& l : locs) xml += "<url><loc>" + l + "</loc></url>\n";
  return xml + "</urlset>\n";
}

TEST(crawls_same_domain_links)
{
  fs::path out = temp_output("basic");
  auto client = std::make_shared<FakeHttpClient>();
  client->page("http://example.com/",
               "<a href=\"/about\">About</a><a href=\"https://other.com/x\">ext</a>");
  client->page("http://example.com/about", "<a href=\"/\">home</a><a href=\"#team\">team</a>");

  Crawler crawler(site_context(out), client);
  assert(crawler.state() == CrawlState::Seeding);
  WriteResult result = crawler.run();
  assert(result.ok());
  assert(crawler.state() == CrawlState::Done);

  std::set<std::string> expected = {"http://example.com/", "http://example.com/about"};
  assert(locations(crawler) == expected);
  assert(client->count("https://other.com/x") == 0);
  assert(client->count("http://example.com/about") == 1);
  assert(count_sitemap_urls(out.string()) == std::optional<std::size_t>(2));
  assert(crawler.frontier().disjoint());

  fs::remove_all(out.parent_path());
}

TEST(off_domain_redirect_is_dropped)
{
  fs::path out = temp_output("redirect");
  auto client = std::make_shared<FakeHttpClient>();
  client->page("http://example.com/", "<a href=\"/page\">page</a>");
  client->redirect("http://example.com/page", "https://cdn.example.com/page");
  client->page("https://cdn.example.com/page", "<a href=\"http://example.com/secret\">s</a>");

  Crawler crawler(site_context(out), client);
  assert(crawler.run().ok());

  std::set<std::string> expected = {"http://example.com/"};
  assert(locations(crawler) == expected);
  assert(client->count("http://example.com/secret") == 0);

  fs::remove_all(out.parent_path());
}

TEST(sitemap_index_ingestion)
{
  fs::path out = temp_output("index");
  auto client = std::make_shared<FakeHttpClient>();
  client->page("http://example.com/sitemap_index.xml",
               "<sitemapindex xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">"
               "<sitemap><loc>http://example.com/sitemap-posts.xml</loc></sitemap>"
               "<sitemap><loc>http://example.com/private/sitemap-pages.xml</loc></sitemap>"
               "</sitemapindex>", "application/xml");
  client->page("http://example.com/sitemap-posts.xml",
               urlset({"http://example.com/post-1", "http://example.com/post-2"}), "application/xml");
  client->page("http://example.com/private/sitemap-pages.xml",
               urlset({"http://example.com/page-1", "http://example.com/private/page-2"}), "application/xml");

  CrawlContext ctx = site_context(out);
  ctx.sitemap_urls = {"http://example.com/sitemap_index.xml"};
  ctx.sitemap_only = true;
  ctx.exclude = {"private"};

  Crawler crawler(ctx, client);
  assert(crawler.run().ok());

  // index entries bypass the exclusion, their page URLs do not
  assert(client->count("http://example.com/private/sitemap-pages.xml") == 1);
  std::set<std::string> expected = {
    "http://example.com/post-1", "http://example.com/post-2", "http://example.com/page-1"};
  assert(locations(crawler) == expected);

  // sitemap URLs are final, never fetched
  assert(client->count("http://example.com/post-1") == 0);
  assert(client->count("http://example.com/") == 0);
  assert(crawler.frontier().is_excluded("http://example.com/private/page-2"));
  assert(crawler.frontier().counters().excluded_by_policy == 1);

  fs::remove_all(out.parent_path());
}

TEST(index_entry_overrides_earlier_html_exclusion)
{
  fs::path out = temp_output("index_after_html");
  auto client = std::make_shared<FakeHttpClient>();
  // the root is crawled alone first, then /hub, then the index it links to
  client->page("http://example.com/",
               "<a href=\"/private/sitemap-pages.xml\">pages</a><a href=\"/hub\">hub</a>");
  client->page("http://example.com/hub", "<a href=\"/sitemap_index.xml\">index</a>");
  client->page("http://example.com/sitemap_index.xml",
               "<sitemapindex xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">"
               "<sitemap><loc>http://example.com/private/sitemap-pages.xml</loc></sitemap>"
               "</sitemapindex>", "application/xml");
  client->page("http://example.com/private/sitemap-pages.xml",
               urlset({"http://example.com/post-1"}), "application/xml");

  CrawlContext ctx = site_context(out);
  ctx.exclude = {"private"};
  Crawler crawler(ctx, client);
  assert(crawler.run().ok());

  assert(client->count("http://example.com/private/sitemap-pages.xml") == 1);
  std::set<std::string> expected = {
    "http://example.com/", "http://example.com/hub", "http://example.com/post-1"};
  assert(locations(crawler) == expected);
  assert(!crawler.frontier().is_excluded("http://example.com/private/sitemap-pages.xml"));
  assert(crawler.frontier().counters().excluded_by_policy == 1);
  assert(crawler.frontier().disjoint());

  fs::remove_all(out.parent_path());
}

TEST(mirrored_sitemap_rewritten_to_target)
{
  fs::path out = temp_output("mirror");
  auto client = std::make_shared<FakeHttpClient>();
  client->redirect("http://mirror.test/sitemap.xml", "http://example.com/sitemap.xml");
  client->page("http://example.com/sitemap.xml",
               urlset({"http://mirror.test/a", "http://mirror.test/b?x=1"}), "text/xml");

  CrawlContext ctx = site_context(out);
  ctx.sitemap_urls = {"http://mirror.test/sitemap.xml"};
  ctx.sitemap_only = true;

  Crawler crawler(ctx, client);
  assert(crawler.run().ok());
  std::set<std::string> expected = {"http://example.com/a", "http://example.com/b?x=1"};
  assert(locations(crawler) == expected);

  fs::remove_all(out.parent_path());
}

TEST(sitemap_only_without_sitemaps_crawls_domain)
{
  fs::path out = temp_output("fallback");
  auto client = std::make_shared<FakeHttpClient>();
  client->page("http://example.com/", "<p>hello</p>");

  CrawlContext ctx = site_context(out);
  ctx.sitemap_only = true;
  Crawler crawler(ctx, client);
  assert(crawler.run().ok());
  assert(client->count("http://example.com/") == 1);

  fs::remove_all(out.parent_path());
}

TEST(not_parseable_resources_listed_without_download)
{
  fs::path out = temp_output("pdf");
  auto client = std::make_shared<FakeHttpClient>();
  client->page("http://example.com/", "<a href=\"/docs/guide.pdf\">guide</a>");

  Crawler crawler(site_context(out), client);
  assert(crawler.run().ok());
  assert(client->count("http://example.com/docs/guide.pdf") == 0);
  assert(locations(crawler).count("http://example.com/docs/guide.pdf") == 1);

  fs::remove_all(out.parent_path());
}

TEST(robots_blocked_links_are_excluded)
{
  fs::path out = temp_output("robots");
  auto client = std::make_shared<FakeHttpClient>();
  client->page("http://example.com/robots.txt", "User-agent: *\nDisallow: /private\n", "text/plain");
  client->page("http://example.com/", "<a href=\"/private/a\">a</a><a href=\"/public\">b</a>");
  client->page("http://example.com/public", "<a href=\"/private/a\">a</a>");

  CrawlContext ctx = site_context(out);
  ctx.parse_robots = true;
  Crawler crawler(ctx, client);
  assert(crawler.run().ok());

  assert(client->count("http://example.com/private/a") == 0);
  assert(crawler.frontier().is_excluded("http://example.com/private/a"));
  assert(crawler.frontier().counters().blocked_by_robots == 1);

  std::ostringstream report;
  crawler.make_report(report);
  assert(report.str().find("Number of link block by robots.txt : 1") != std::string::npos);

  fs::remove_all(out.parent_path());
}

TEST(multi_worker_rounds_reach_every_page)
{
  fs::path out = temp_output("workers");
  auto client = std::make_shared<FakeHttpClient>();

  // a binary tree of pages, every page also links back to the root and its parent
  const int kPages = 63;
  for (int i = 1; i <= kPages; i++) {
    std::string body = "<a href=\"/p1\">root</a><a href=\"/p" + std::to_string(std::max(1, i / 2)) + "\">up</a>";
    if (2 * i <= kPages) body += "<a href=\"/p" + std::to_string(2 * i) + "\">l</a>";
    if (2 * i + 1 <= kPages) body += "<a href=\"p" + std::to_string(2 * i + 1) + "#frag\">r</a>";
    client->page("http://example.com/p" + std::to_string(i), body);
  }
  client->page("http://example.com/", "<a href=\"/p1\">start</a>");

  CrawlContext ctx = site_context(out);
  ctx.num_workers = 4;
  Crawler crawler(ctx, client);
  assert(crawler.run().ok());

  assert(locations(crawler).size() == static_cast<size_t>(kPages + 1));
  for (int i = 1; i <= kPages; i++) {
    assert(client->count("http://example.com/p" + std::to_string(i)) == 1);
  }
  assert(crawler.frontier().disjoint());
  assert(crawler.frontier().empty());
  assert(crawler.num_crawled() == static_cast<size_t>(kPages + 1));
  assert(count_sitemap_urls(out.string()) == std::optional<std::size_t>(kPages + 1));

  fs::remove_all(out.parent_path());
}

TEST(drift_abort_keeps_previous_output)
{
  fs::path out = temp_output("drift");
  {
    std::vector<std::string> locs;
    for (int i = 0; i < 100; i++) locs.push_back("http://example.com/old-" + std::to_string(i));
    std::ofstream ofs(out);
    ofs << urlset(locs);
  }
  std::ifstream before_stream(out);
  std::stringstream before;
  before << before_stream.rdbuf();

  auto client = std::make_shared<FakeHttpClient>();
  client->page("http://example.com/", "<a href=\"/about\">About</a>");
  client->page("http://example.com/about", "");

  CrawlContext ctx = site_context(out);
  ctx.max_url_diff = 50;
  Crawler crawler(ctx, client);
  WriteResult result = crawler.run();

  assert(result.status == WriteStatus::DriftExceeded);
  assert(result.drift->old_count == 100 && result.drift->new_count == 2 && result.drift->diff == 98);
  assert(crawler.state() == CrawlState::Aborted);

  std::ifstream after_stream(out);
  std::stringstream after;
  after << after_stream.rdbuf();
  assert(after.str() == before.str());

  fs::remove_all(out.parent_path());
}

TEST(configuration_errors_fail_before_network)
{
  auto client = std::make_shared<FakeHttpClient>();

  CrawlContext bad_workers;
  bad_workers.domain = "http://example.com/";
  bad_workers.num_workers = 0;

  CrawlContext bad_domain;
  bad_domain.domain = "not a url";

  CrawlContext index_without_output;
  index_without_output.domain = "http://example.com/";
  index_without_output.as_index = true;

  for (const auto& ctx : {bad_workers, bad_domain, index_without_output}) {
    bool thrown = false;
    try {
      Crawler crawler(ctx, client);
    } catch (const ConfigError&) {
      thrown = true;
    }
    assert(thrown);
  }
  assert(client->requested().empty());
}

TEST(run_only_once)
{
  fs::path out = temp_output("once");
  auto client = std::make_shared<FakeHttpClient>();
  client->page("http://example.com/", "<p>hi</p>");

  Crawler crawler(site_context(out), client);
  assert(crawler.run().ok());
  bool thrown = false;
  try {
    crawler.run();
  } catch (const std::logic_error&) {
    thrown = true;
  }
  assert(thrown);

  fs::remove_all(out.parent_path());
}

int main()
{
  RUN_TEST(crawls_same_domain_links);
  RUN_TEST(off_domain_redirect_is_dropped);
  RUN_TEST(sitemap_index_ingestion);
  RUN_TEST(index_entry_overrides_earlier_html_exclusion);
  RUN_TEST(mirrored_sitemap_rewritten_to_target);
  RUN_TEST(sitemap_only_without_sitemaps_crawls_domain);
  RUN_TEST(not_parseable_resources_listed_without_download);
  RUN_TEST(robots_blocked_links_are_excluded);
  RUN_TEST(multi_worker_rounds_reach_every_page);
  RUN_TEST(drift_abort_keeps_previous_output);
  RUN_TEST(configuration_errors_fail_before_network);
  RUN_TEST(run_only_once);
  return 0;
}
