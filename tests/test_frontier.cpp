/*
 * test_frontier.cpp
 *
 * Set-union semantics, exclusion and counters of the crawl frontier.
 */

#include <assert.h>
#include <algorithm>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "unittest.h"
#include "frontier.hpp"

using namespace smap;

TEST(enqueue_dedups_across_sets)
{
  Frontier f;
  assert(f.enqueue("http://e.com/a"));
  assert(!f.enqueue("http://e.com/a"));
  assert(f.pending() == 1);

  auto batch = f.take_all();
  assert(batch.size() == 1 && batch[0] == "http://e.com/a");
  assert(f.empty());
  assert(f.is_crawled("http://e.com/a"));

  // crawled URLs are never queued again
  assert(!f.enqueue("http://e.com/a"));
  assert(f.empty());

  assert(f.mark_excluded("http://e.com/x"));
  assert(!f.mark_excluded("http://e.com/x"));
  assert(!f.enqueue("http://e.com/x"));
  assert(f.disjoint());
}

TEST(take_one_marks_crawled)
{
  Frontier f;
  f.enqueue("http://e.com/a");
  f.enqueue("http://e.com/b");
  auto first = f.take_one();
  auto second = f.take_one();
  assert(first && second && *first != *second);
  assert(!f.take_one());
  assert(f.crawled() == 2);
}

TEST(merge_applies_verdicts_and_counters)
{
  Frontier f;
  f.enqueue("http://e.com/");
  f.take_all();

  std::vector<Candidate> candidates = {
    {"http://e.com/about", Verdict::Accept},
    {"http://e.com/about", Verdict::Accept},
    {"http://e.com/private", Verdict::BlockedByRobots},
    {"http://e.com/file.zip", Verdict::ExcludedByPolicy},
    {"http://e.com/", Verdict::Accept},
  };
  assert(f.merge(candidates) == 1);
  assert(f.is_pending("http://e.com/about"));
  assert(f.is_excluded("http://e.com/private"));
  assert(f.is_excluded("http://e.com/file.zip"));

  CrawlCounters c = f.counters();
  assert(c.discovered == 4);   // seed + about + private + file.zip
  assert(c.blocked_by_robots == 1);
  assert(c.excluded_by_policy == 1);

  // exclusion is monotonic, even if the URL later shows up as acceptable
  assert(f.merge({{"http://e.com/private", Verdict::Accept}}) == 0);
  assert(f.is_excluded("http://e.com/private"));
  assert(f.counters().discovered == 4);
  assert(f.disjoint());
}

TEST(claim_moves_sitemap_urls_to_crawled)
{
  Frontier f;
  f.enqueue("http://e.com/queued");
  auto claimed = f.claim({
    {"http://e.com/queued", Verdict::Accept},
    {"http://e.com/new", Verdict::Accept},
    {"http://e.com/new", Verdict::Accept},
    {"http://e.com/skip", Verdict::ExcludedByPolicy},
  });
  assert(claimed.size() == 2);
  assert(claimed[0] == "http://e.com/queued" && claimed[1] == "http://e.com/new");
  assert(!f.is_pending("http://e.com/queued"));
  assert(f.is_crawled("http://e.com/queued"));
  assert(f.is_excluded("http://e.com/skip"));
  assert(f.counters().excluded_by_policy == 1);
  assert(f.claim({{"http://e.com/new", Verdict::Accept}}).empty());
  assert(f.disjoint());
}

TEST(sitemap_entries_lift_exclusion)
{
  Frontier f;
  f.merge({{"http://e.com/private/sitemap.xml", Verdict::ExcludedByPolicy}});
  assert(f.is_excluded("http://e.com/private/sitemap.xml"));
  assert(!f.enqueue("http://e.com/private/sitemap.xml"));

  assert(f.enqueue_sitemap("http://e.com/private/sitemap.xml"));
  assert(f.is_pending("http://e.com/private/sitemap.xml"));
  assert(!f.is_excluded("http://e.com/private/sitemap.xml"));
  assert(f.counters().discovered == 1);
  assert(f.counters().excluded_by_policy == 1);
  assert(!f.enqueue_sitemap("http://e.com/private/sitemap.xml"));

  f.take_all();
  assert(!f.enqueue_sitemap("http://e.com/private/sitemap.xml"));
  assert(f.enqueue_sitemap("http://e.com/other.xml"));
  assert(f.counters().discovered == 2);
  assert(f.disjoint());
}

TEST(concurrent_merges_stay_disjoint)
{
  Frontier f;
  const int kThreads = 8;
  const int kUrls = 500;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; t++) {
    threads.emplace_back([&f, t] {
      std::vector<Candidate> batch;
      for (int i = 0; i < kUrls; i++) {
        Verdict v = (i % 10 == 0) ? Verdict::ExcludedByPolicy : Verdict::Accept;
        batch.push_back({"http://e.com/p" + std::to_string(i), v});
      }
      // every thread pulls in parallel with the merges of the others
      f.merge(batch);
      if (t % 2 == 0) f.take_all();
    });
  }
  for (auto& th : threads) th.join();

  assert(f.disjoint());
  assert(f.counters().discovered == static_cast<size_t>(kUrls));
  assert(f.excluded() == static_cast<size_t>(kUrls / 10));
  assert(f.pending() + f.crawled() + f.excluded() == static_cast<size_t>(kUrls));
}

int main()
{
  RUN_TEST(enqueue_dedups_across_sets);
  RUN_TEST(take_one_marks_crawled);
  RUN_TEST(merge_applies_verdicts_and_counters);
  RUN_TEST(claim_moves_sitemap_urls_to_crawled);
  RUN_TEST(sitemap_entries_lift_exclusion);
  RUN_TEST(concurrent_merges_stay_disjoint);
  return 0;
}
