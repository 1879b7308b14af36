#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace smap {

// Longest URL the sitemap protocol accepts in <loc>.
constexpr std::size_t kMaxUrlLength = 2048;

// Components of a URL split per RFC 3986 appendix B.
// `host` is the full authority (host[:port]), compared as a unit.
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string path;
    std::string query;
    std::string fragment;
    bool has_authority = false;
};

// -------------------- string helpers --------------------
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& pre);
bool ends_with(const std::string& s, const std::string& suf);

// -------------------- parsing --------------------
UrlParts split_url(const std::string& url);
std::string unsplit_url(const UrlParts& parts);

// Returns nullopt unless the URL carries both a scheme and a host.
std::optional<UrlParts> parse_absolute_url(const std::string& url);

bool is_absolute_url(const std::string& url);

// -------------------- canonicalization --------------------

// Resolves "." and ".." segments left to right. A ".." with nothing left to
// pop is dropped.
std::string resolve_path(const std::string& path);

// Splits, resolves the path and reassembles. Query and fragment untouched.
std::string normalize_url(const std::string& url);

// Standard reference resolution of `link` against `base`.
std::string resolve_url(const std::string& base, const std::string& link);

std::string strip_fragment(const std::string& url);

// Removes every match of each pattern, in order.
std::string apply_drop_patterns(std::string url, const std::vector<std::regex>& patterns);

// Extension of the last path segment without the dot ("" if none).
std::string path_extension(const std::string& path);

bool is_image_path(const std::string& path);

// Escapes space, &, ", < and > for use inside <loc>.
std::string escape_loc(const std::string& text);

} // namespace smap
