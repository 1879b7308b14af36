#include "batch.hpp"
#include "crawler.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace smap {

LogLevel log_level_for(const CrawlContext& ctx) {
    if (ctx.debug) return LogLevel::Debug;
    if (ctx.verbose) return LogLevel::Info;
    return LogLevel::Error;
}

BatchResult run_batch(const std::vector<CrawlContext>& contexts,
                      const ClientFactory& make_client,
                      std::ostream* report_out) {
    BatchResult result;
    for (const auto& ctx : contexts) {
        set_log_level(log_level_for(ctx));

        if (ctx.domain.empty()) {
            log_error("You must provide a domain to use the crawler.");
            ++result.config_errors;
            continue;
        }

        try {
            Crawler crawler(ctx, make_client());
            WriteResult written = crawler.run();
            if (ctx.report && report_out) crawler.make_report(*report_out);

            if (written.ok()) {
                ++result.completed;
                continue;
            }

            BatchFailure failure;
            failure.domain = ctx.domain;
            failure.status = written.status;
            failure.drift = written.drift;
            if (written.status == WriteStatus::EmptySitemap) {
                log_error("SKIPPED: " + ctx.domain + " - Sitemap is empty (0 URLs)");
            } else {
                log_error("SKIPPED: " + ctx.domain + " - URL count changed by " +
                          std::to_string(written.drift ? written.drift->diff : 0));
            }
            result.failures.push_back(std::move(failure));
        } catch (const ConfigError& e) {
            log_error(ctx.domain + ": " + e.what());
            ++result.config_errors;
        }
    }
    return result;
}

std::string failure_summary(const std::vector<BatchFailure>& failures) {
    const std::string rule(80, '=');
    std::ostringstream os;
    os << rule << "\nSITEMAP GENERATION FAILURES:\n" << rule << "\n";
    for (const auto& f : failures) {
        os << "\nDomain: " << f.domain << "\n";
        if (f.status == WriteStatus::EmptySitemap) {
            os << "  Old URL count: N/A\n"
               << "  New URL count: 0\n"
               << "  Difference: N/A (100.0%)\n"
               << "  Threshold: N/A\n";
            continue;
        }
        if (!f.drift) continue;
        const DriftReport& d = *f.drift;
        os << "  Old URL count: " << d.old_count << "\n"
           << "  New URL count: " << d.new_count << "\n"
           << "  Difference: " << d.diff << " (" << std::fixed << std::setprecision(1) << d.diff_percent << "%)\n"
           << "  Threshold: ";
        if (d.threshold) os << *d.threshold;
        if (d.threshold && d.threshold_percent) os << " / ";
        if (d.threshold_percent) os << *d.threshold_percent << "%";
        os << "\n";
    }
    os << "\n" << rule << "\nTotal failures: " << failures.size() << "\n" << rule << "\n";
    return os.str();
}

void write_failure_summary(const std::vector<BatchFailure>& failures, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) throw std::runtime_error("Cannot write failure summary: " + path);
    ofs << failure_summary(failures);
}

} // namespace smap
