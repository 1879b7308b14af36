#pragma once

#include "config.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace smap {

constexpr std::size_t kMaxUrlsPerSitemap = 50000;

struct SitemapEntry {
    std::string location;
    std::optional<std::string> last_modified;   // already formatted
    std::vector<std::string> images;

    // <url><loc>..</loc>[<lastmod>..</lastmod>][<image:image>..]</url>
    std::string to_xml() const;
};

enum class WriteStatus { Written, DriftExceeded, EmptySitemap };

struct DriftReport {
    std::size_t old_count = 0;
    std::size_t new_count = 0;
    std::size_t diff = 0;
    double diff_percent = 0.0;
    std::optional<std::size_t> threshold;
    std::optional<double> threshold_percent;
};

struct WriteResult {
    WriteStatus status = WriteStatus::Written;
    std::size_t url_count = 0;
    std::optional<DriftReport> drift;     // set whenever a comparison ran
    std::vector<std::string> files;       // written, index first

    bool ok() const { return status == WriteStatus::Written; }
};

// Compares against prior output and persists the sitemap (or index + parts).
// Nothing at the output path is touched unless the result is Written.
class SitemapWriter {
public:
    explicit SitemapWriter(const CrawlContext& ctx) : ctx_(ctx) {}

    WriteResult write(const std::vector<SitemapEntry>& entries) const;

    // Writes to `out` instead of ctx.output (single file, no drift check).
    WriteResult write(const std::vector<SitemapEntry>& entries, std::ostream& out) const;

    // Name of the i-th part file: <basename>-<i><ext>.
    static std::string part_filename(const std::string& output, std::size_t i);

    // Exceeds when either configured threshold is exceeded.
    static bool exceeds(const DriftReport& drift);

private:
    std::vector<std::string> serialize(const std::vector<SitemapEntry>& entries) const;
    std::optional<DriftReport> compare_with_existing(std::size_t new_count) const;

    const CrawlContext& ctx_;
};

} // namespace smap
