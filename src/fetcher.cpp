#include "fetcher.hpp"
#include "log.hpp"
#include "url.hpp"

namespace smap {

Fetcher::Fetcher(const CrawlContext& ctx, HttpClient& client)
    : ctx_(ctx), client_(client), classifier_(ctx) {}

bool Fetcher::is_not_parseable(const std::string& path) {
    static const std::vector<std::string> kNotParseable = {
        ".epub", ".mobi", ".xlsx", ".docx", ".doc", ".opf", ".7z", ".ibooks", ".cbr", ".avi",
        ".mkv", ".mp4", ".jpg", ".jpeg", ".png", ".gif", ".iso", ".rar", ".tar", ".tgz",
        ".zip", ".dmg", ".exe", ".pdf"};
    const std::string lower = to_lower(path);
    for (const auto& ext : kNotParseable) {
        if (ends_with(lower, ext)) return true;
    }
    return false;
}

ResponseClassification Fetcher::fetch(const std::string& url) {
    if (is_not_parseable(split_url(url).path)) {
        log_debug("Ignore " + url + " content might be not parseable.");
        return Unfetched{"not-parseable"};
    }

    HttpRequest req;
    req.url = url;
    req.user_agent = ctx_.http_user_agent;
    req.timeout_ms = ctx_.timeout_ms;
    if (ctx_.auth) req.credentials = std::make_pair(ctx_.username, ctx_.password);

    HttpResponse r = client_.get(req);
    if (r.network_error()) {
        log_debug(r.error + " ==> " + url);
        return FetchError{0, r.error};
    }
    if (r.status_code >= 400) {
        record_status(r.status_code, url, true);
        log_debug("HTTP Error " + std::to_string(r.status_code) + " ==> " + url);
        return FetchError{r.status_code, "HTTP " + std::to_string(r.status_code)};
    }
    record_status(r.status_code, url, false);

    if (to_lower(r.body).find("anubis") != std::string::npos) {
        log_warning("'anubis' detected in response from " + url);
    }

    return classifier_.classify(url, r);
}

void Fetcher::record_status(long status, const std::string& url, bool failed) {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    ++response_codes_[status];
    if (failed && ctx_.report) marked_[status].push_back(url);
}

std::map<long, std::size_t> Fetcher::response_codes() const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    return response_codes_;
}

std::map<long, std::vector<std::string>> Fetcher::marked() const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    return marked_;
}

} // namespace smap
