#include "sitemap_writer.hpp"
#include "log.hpp"
#include "sitemap_xml.hpp"
#include "url.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace smap {

namespace {

void write_urlset(std::ostream& os, const std::vector<std::string>& lines, size_t begin, size_t end) {
    os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
       << "<urlset xmlns=\"" << kSitemapNamespace << "\" xmlns:image=\"" << kImageNamespace << "\">\n";
    for (size_t i = begin; i < end; ++i) os << lines[i] << "\n";
    os << "</urlset>\n";
}

void write_index(std::ostream& os, const std::vector<std::string>& locations) {
    os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
       << "<sitemapindex xmlns=\"" << kSitemapNamespace << "\">\n";
    for (const auto& loc : locations) os << "<sitemap><loc>" << escape_loc(loc) << "</loc></sitemap>\n";
    os << "</sitemapindex>\n";
}

// Writes beside the target then renames over it.
template <class Fn>
void write_file(const std::string& path, Fn&& body) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) throw std::runtime_error("Output file not available: " + path);
        body(ofs);
        ofs.flush();
        if (!ofs) throw std::runtime_error("Could not write sitemap file: " + path);
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("Could not replace sitemap file: " + path);
    }
    log_info("Sitemap written: " + path);
}

} // namespace

std::string SitemapEntry::to_xml() const {
    std::string s = "<url><loc>" + escape_loc(location) + "</loc>";
    if (last_modified) s += "<lastmod>" + *last_modified + "</lastmod>";
    for (const auto& image : images) {
        s += "<image:image><image:loc>" + escape_loc(image) + "</image:loc></image:image>";
    }
    s += "</url>";
    return s;
}

std::string SitemapWriter::part_filename(const std::string& output, std::size_t i) {
    const fs::path p(output);
    const std::string stem = (p.parent_path() / p.stem()).string();
    return stem + "-" + std::to_string(i) + p.extension().string();
}

bool SitemapWriter::exceeds(const DriftReport& drift) {
    if (drift.threshold && drift.diff > *drift.threshold) return true;
    if (drift.threshold_percent && drift.diff_percent > *drift.threshold_percent) return true;
    return false;
}

std::vector<std::string> SitemapWriter::serialize(const std::vector<SitemapEntry>& entries) const {
    std::vector<std::string> lines;
    lines.reserve(entries.size());
    for (const auto& e : entries) lines.push_back(e.to_xml());
    if (ctx_.sort_alphabetically) std::sort(lines.begin(), lines.end());
    return lines;
}

std::optional<DriftReport> SitemapWriter::compare_with_existing(std::size_t new_count) const {
    if ((!ctx_.max_url_diff && !ctx_.max_url_diff_percent) || ctx_.output.empty()) return std::nullopt;

    auto old_count = count_sitemap_urls(ctx_.output);
    if (!old_count) return std::nullopt;

    DriftReport d;
    d.old_count = *old_count;
    d.new_count = new_count;
    d.diff = d.new_count > d.old_count ? d.new_count - d.old_count : d.old_count - d.new_count;
    if (d.old_count > 0) d.diff_percent = 100.0 * static_cast<double>(d.diff) / static_cast<double>(d.old_count);
    else d.diff_percent = d.new_count > 0 ? 100.0 : 0.0;
    d.threshold = ctx_.max_url_diff;
    d.threshold_percent = ctx_.max_url_diff_percent;

    log_info("URL count comparison - Old: " + std::to_string(d.old_count) + ", New: " +
             std::to_string(d.new_count) + ", Diff: " + std::to_string(d.diff));
    return d;
}

WriteResult SitemapWriter::write(const std::vector<SitemapEntry>& entries, std::ostream& out) const {
    WriteResult result;
    result.url_count = entries.size();
    const auto lines = serialize(entries);
    write_urlset(out, lines, 0, lines.size());
    return result;
}

WriteResult SitemapWriter::write(const std::vector<SitemapEntry>& entries) const {
    if (ctx_.output.empty()) return write(entries, std::cout);

    WriteResult result;
    result.url_count = entries.size();

    if (entries.empty()) {
        log_error("Sitemap for " + ctx_.domain + " is empty (0 URLs). Skipping update.");
        result.status = WriteStatus::EmptySitemap;
        return result;
    }

    result.drift = compare_with_existing(entries.size());
    if (result.drift) {
        if (exceeds(*result.drift)) {
            log_error("URL count difference (" + std::to_string(result.drift->diff) +
                      ") exceeds threshold. Skipping update for " + ctx_.domain + ".");
            log_error("Old sitemap had " + std::to_string(result.drift->old_count) + " URLs, new would have " +
                      std::to_string(result.drift->new_count) + " URLs.");
            result.status = WriteStatus::DriftExceeded;
            return result;
        }
        log_info("URL count difference check passed");
    }

    const auto lines = serialize(entries);

    if (lines.size() > kMaxUrlsPerSitemap && ctx_.as_index) {
        const std::size_t parts = (lines.size() + kMaxUrlsPerSitemap - 1) / kMaxUrlsPerSitemap;
        std::vector<std::string> part_files;
        std::vector<std::string> locations;
        for (std::size_t i = 0; i < parts; ++i) {
            part_files.push_back(part_filename(ctx_.output, i));
            locations.push_back(ctx_.scheme + "://" + ctx_.target_host + "/" +
                                fs::path(part_files.back()).filename().string());
        }

        for (std::size_t i = 0; i < parts; ++i) {
            const std::size_t begin = i * kMaxUrlsPerSitemap;
            const std::size_t end = std::min(lines.size(), begin + kMaxUrlsPerSitemap);
            write_file(part_files[i], [&](std::ostream& os) { write_urlset(os, lines, begin, end); });
        }
        write_file(ctx_.output, [&](std::ostream& os) { write_index(os, locations); });

        result.files.push_back(ctx_.output);
        result.files.insert(result.files.end(), part_files.begin(), part_files.end());
        return result;
    }

    write_file(ctx_.output, [&](std::ostream& os) { write_urlset(os, lines, 0, lines.size()); });
    result.files.push_back(ctx_.output);
    return result;
}

} // namespace smap
