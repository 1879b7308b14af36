#pragma once

#include "classifier.hpp"
#include "config.hpp"
#include "http_client.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace smap {

// One GET per frontier URL, classified. Safe to call from several workers.
class Fetcher {
public:
    Fetcher(const CrawlContext& ctx, HttpClient& client);

    ResponseClassification fetch(const std::string& url);

    // Binary, office, archive and media paths are never downloaded.
    static bool is_not_parseable(const std::string& path);

    std::map<long, std::size_t> response_codes() const;
    std::map<long, std::vector<std::string>> marked() const;

private:
    void record_status(long status, const std::string& url, bool failed);

    const CrawlContext& ctx_;
    HttpClient& client_;
    ContentClassifier classifier_;

    mutable std::mutex stats_mtx_;
    std::map<long, std::size_t> response_codes_;
    std::map<long, std::vector<std::string>> marked_;
};

} // namespace smap
