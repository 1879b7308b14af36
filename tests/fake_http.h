/*
 * fake_http.h
 *
 * In-memory HttpClient for crawler tests. Unknown URLs answer 404.
 */

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "http_client.hpp"

class FakeHttpClient : public smap::HttpClient {
public:
  void page(const std::string& url, const std::string& body,
            const std::string& content_type = "text/html", long status = 200)
  {
    smap::HttpResponse r;
    r.status_code = status;
    r.final_url = url;
    r.body = body;
    r.headers["content-type"] = content_type;
    responses_[url] = r;
  }

  void redirect(const std::string& from, const std::string& to)
  {
    redirects_[from] = to;
  }

  void fail(const std::string& url, const std::string& error)
  {
    smap::HttpResponse r;
    r.error = error;
    r.final_url = url;
    responses_[url] = r;
  }

  smap::HttpResponse get(const smap::HttpRequest& request) override
  {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      requested_.push_back(request.url);
      last_request_ = request;
    }

    std::string url = request.url;
    auto redirect = redirects_.find(url);
    if (redirect != redirects_.end()) url = redirect->second;

    auto it = responses_.find(url);
    if (it == responses_.end()) {
      smap::HttpResponse r;
      r.status_code = 404;
      r.final_url = url;
      return r;
    }
    smap::HttpResponse r = it->second;
    r.final_url = url;
    return r;
  }

  std::vector<std::string> requested() const
  {
    std::lock_guard<std::mutex> lk(mtx_);
    return requested_;
  }

  size_t count(const std::string& url) const
  {
    std::lock_guard<std::mutex> lk(mtx_);
    size_t n = 0;
    for (const auto& u : requested_) if (u == url) n++;
    return n;
  }

  smap::HttpRequest last_request() const
  {
    std::lock_guard<std::mutex> lk(mtx_);
    return last_request_;
  }

private:
  std::map<std::string, smap::HttpResponse> responses_;
  std::map<std::string, std::string> redirects_;
  mutable std::mutex mtx_;
  std::vector<std::string> requested_;
  smap::HttpRequest last_request_;
};
