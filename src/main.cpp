#include "batch.hpp"
#include "config.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

const char* kUsage =
    "usage: sitemap_crawler (--domain URL | --config FILE) [options]\n"
    "  --output FILE              output file (default: stdout)\n"
    "  -n, --num-workers N        number of workers (default: 1)\n"
    "  --parserobots              honour robots.txt\n"
    "  --user-agent AGENT         robots.txt user agent (default: *)\n"
    "  --auth                     send basic auth (--username/--password)\n"
    "  --as-index                 split into an index when over 50,000 URLs\n"
    "  --no-sort                  keep crawl order\n"
    "  --exclude TEXT             exclude URLs containing TEXT (repeatable)\n"
    "  --skipext EXT              skip links with extension EXT (repeatable)\n"
    "  --drop REGEX               drop REGEX from links (repeatable)\n"
    "  --images                   add images to the sitemap\n"
    "  --sitemap-url URL          sitemap or sitemap index to ingest (repeatable)\n"
    "  --sitemap-only             only process sitemaps\n"
    "  --domain-aliases HOST      alternate host for the domain (repeatable)\n"
    "  --max-url-diff N           abort if URL count changes by more than N\n"
    "  --max-url-diff-percent P   abort if URL count changes by more than P%\n"
    "  --timeout-ms MS            per request timeout (default: 30000)\n"
    "  --report                   print a report\n"
    "  -v, --verbose              verbose output\n"
    "  --debug                    debug output\n";

const char* kFailuresFile = "sitemap_failures.txt";

} // namespace

int main(int argc, char** argv) {
    smap::CrawlContext defaults;
    std::string config_path;
    std::vector<smap::CrawlContext> contexts;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw smap::ConfigError("missing value for " + arg);
                return argv[++i];
            };
            auto number = [&]() -> long {
                const std::string v = value();
                try {
                    return std::stol(v);
                } catch (const std::exception&) {
                    throw smap::ConfigError("expected a number for " + arg + ", got '" + v + "'");
                }
            };

            if (arg == "-h" || arg == "--help") { std::cout << kUsage; return 0; }
            else if (arg == "--domain") defaults.domain = value();
            else if (arg == "--config") config_path = value();
            else if (arg == "--output") defaults.output = value();
            else if (arg == "-n" || arg == "--num-workers") defaults.num_workers = static_cast<int>(number());
            else if (arg == "--parserobots") defaults.parse_robots = true;
            else if (arg == "--user-agent") defaults.robots_user_agent = value();
            else if (arg == "--auth") defaults.auth = true;
            else if (arg == "--username") defaults.username = value();
            else if (arg == "--password") defaults.password = value();
            else if (arg == "--as-index") defaults.as_index = true;
            else if (arg == "--no-sort") defaults.sort_alphabetically = false;
            else if (arg == "--exclude") defaults.exclude.push_back(value());
            else if (arg == "--skipext") defaults.skip_extensions.push_back(value());
            else if (arg == "--drop") defaults.drop.push_back(value());
            else if (arg == "--images") defaults.images = true;
            else if (arg == "--sitemap-url") defaults.sitemap_urls.push_back(value());
            else if (arg == "--sitemap-only") defaults.sitemap_only = true;
            else if (arg == "--domain-aliases") defaults.domain_aliases.push_back(value());
            else if (arg == "--max-url-diff") {
                long v = number();
                if (v < 0) throw smap::ConfigError("--max-url-diff must not be negative");
                defaults.max_url_diff = static_cast<std::size_t>(v);
            } else if (arg == "--max-url-diff-percent") {
                const std::string v = value();
                try {
                    defaults.max_url_diff_percent = std::stod(v);
                } catch (const std::exception&) {
                    throw smap::ConfigError("expected a number for " + arg + ", got '" + v + "'");
                }
                if (*defaults.max_url_diff_percent < 0) {
                    throw smap::ConfigError("--max-url-diff-percent must not be negative");
                }
            }
            else if (arg == "--timeout-ms") defaults.timeout_ms = number();
            else if (arg == "--report") defaults.report = true;
            else if (arg == "-v" || arg == "--verbose") defaults.verbose = true;
            else if (arg == "--debug") defaults.debug = true;
            else throw smap::ConfigError("unknown argument: " + arg);
        }

        if (!config_path.empty() && !defaults.domain.empty()) {
            throw smap::ConfigError("--config and --domain are mutually exclusive");
        }
        if (!config_path.empty()) contexts = smap::load_contexts(config_path, defaults);
        else contexts.push_back(defaults);
    } catch (const smap::ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << "\n" << kUsage;
        return 1;
    }

    try {
        smap::BatchResult result = smap::run_batch(
            contexts, [] { return std::make_shared<smap::CprHttpClient>(); }, &std::cout);

        if (!result.failures.empty()) {
            const std::string summary = smap::failure_summary(result.failures);
            std::cout << "\n" << summary;
            smap::write_failure_summary(result.failures, kFailuresFile);
            return 2;
        }
        if (result.completed == 0 && result.config_errors > 0) return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
