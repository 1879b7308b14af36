#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "sitemap_writer.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace smap {

// One domain whose output was left untouched.
struct BatchFailure {
    std::string domain;
    WriteStatus status = WriteStatus::DriftExceeded;
    std::optional<DriftReport> drift;
};

struct BatchResult {
    std::size_t completed = 0;
    std::size_t config_errors = 0;
    std::vector<BatchFailure> failures;
};

using ClientFactory = std::function<std::shared_ptr<HttpClient>()>;

// Runs every context with its own Crawler. Configuration errors and
// safety aborts of one domain never stop the others.
BatchResult run_batch(const std::vector<CrawlContext>& contexts,
                      const ClientFactory& make_client = [] { return std::make_shared<CprHttpClient>(); },
                      std::ostream* report_out = nullptr);

std::string failure_summary(const std::vector<BatchFailure>& failures);

// Writes failure_summary() to `path`; throws std::runtime_error on I/O failure.
void write_failure_summary(const std::vector<BatchFailure>& failures, const std::string& path);

LogLevel log_level_for(const CrawlContext& ctx);

} // namespace smap
