#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace smap {

// -------------------- small utils --------------------
std::string to_lower(const std::string& s) {
    std::string r = s;
    for (auto& ch : r) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return r;
}

bool starts_with(const std::string& s, const std::string& pre) {
    return s.rfind(pre, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suf) {
    if (s.size() < suf.size()) return false;
    return std::equal(s.end() - suf.size(), s.end(), suf.begin());
}

// -------------------- parsing --------------------
UrlParts split_url(const std::string& url) {
    static const std::regex re(
        R"(^(?:([A-Za-z][A-Za-z0-9+.\-]*):)?(?://([^/?#]*))?([^?#]*)(?:\?([^#]*))?(?:#([\s\S]*))?$)");
    UrlParts p;
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        p.path = url;
        return p;
    }
    p.scheme = to_lower(m[1].str());
    p.has_authority = m[2].matched;
    p.host = to_lower(m[2].str());
    p.path = m[3].str();
    p.query = m[4].str();
    p.fragment = m[5].str();
    return p;
}

std::string unsplit_url(const UrlParts& parts) {
    std::string url = parts.path;
    if (parts.has_authority || !parts.host.empty()) {
        if (!url.empty() && url[0] != '/') url = "/" + url;
        url = "//" + parts.host + url;
    }
    if (!parts.scheme.empty()) url = parts.scheme + ":" + url;
    if (!parts.query.empty()) url += "?" + parts.query;
    if (!parts.fragment.empty()) url += "#" + parts.fragment;
    return url;
}

std::optional<UrlParts> parse_absolute_url(const std::string& url) {
    UrlParts p = split_url(url);
    if (p.scheme.empty() || p.host.empty()) return std::nullopt;
    return p;
}

bool is_absolute_url(const std::string& url) {
    static const std::regex re(R"(^[A-Za-z][A-Za-z0-9+.\-]*:)");
    return std::regex_search(url, re);
}

// -------------------- canonicalization --------------------
std::string resolve_path(const std::string& path) {
    // split on '/', keeping the separator attached to every segment but the last
    std::vector<std::string> segments;
    size_t start = 0;
    for (;;) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, slash - start + 1));
        start = slash + 1;
    }

    std::vector<std::string> resolved;
    for (const auto& seg : segments) {
        if (seg == "../" || seg == "..") {
            // the root separator of an absolute path is never popped
            const bool only_root = resolved.size() == 1 && resolved[0] == "/";
            if (!resolved.empty() && !only_root) resolved.pop_back();
        } else if (seg != "./" && seg != ".") {
            resolved.push_back(seg);
        }
    }

    std::string out;
    for (const auto& seg : resolved) out += seg;
    return out;
}

std::string normalize_url(const std::string& url) {
    UrlParts p = split_url(url);
    p.path = resolve_path(p.path);
    return unsplit_url(p);
}

std::string resolve_url(const std::string& base, const std::string& link) {
    if (link.empty()) return base;

    UrlParts b = split_url(base);
    UrlParts r = split_url(link);
    UrlParts t;

    if (!r.scheme.empty()) {
        t = r;
        t.path = resolve_path(r.path);
        return unsplit_url(t);
    }

    t.scheme = b.scheme;
    if (r.has_authority) {
        t.has_authority = true;
        t.host = r.host;
        t.path = resolve_path(r.path);
        t.query = r.query;
    } else {
        t.has_authority = b.has_authority;
        t.host = b.host;
        if (r.path.empty()) {
            t.path = b.path;
            t.query = r.query.empty() ? b.query : r.query;
        } else {
            if (r.path[0] == '/') {
                t.path = resolve_path(r.path);
            } else {
                // merge with the base directory
                std::string dir;
                if ((b.has_authority || !b.host.empty()) && b.path.empty()) {
                    dir = "/";
                } else {
                    auto pos = b.path.rfind('/');
                    dir = pos == std::string::npos ? "" : b.path.substr(0, pos + 1);
                }
                t.path = resolve_path(dir + r.path);
            }
            t.query = r.query;
        }
    }
    t.fragment = r.fragment;
    return unsplit_url(t);
}

std::string strip_fragment(const std::string& url) {
    auto hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

std::string apply_drop_patterns(std::string url, const std::vector<std::regex>& patterns) {
    for (const auto& re : patterns) url = std::regex_replace(url, re, "");
    return url;
}

std::string path_extension(const std::string& path) {
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    // leading dots belong to the name, not the extension
    size_t first = name.find_first_not_of('.');
    if (first == std::string::npos) return "";
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot < first) return "";
    return name.substr(dot + 1);
}

bool is_image_path(const std::string& path) {
    static const std::unordered_set<std::string> kImageExtensions = {
        "apng", "avif", "bmp", "gif", "heic", "heif", "ico", "ief", "jpe", "jpeg", "jpg",
        "pbm", "pgm", "png", "pnm", "ppm", "ras", "rgb", "svg", "tif", "tiff", "webp",
        "xbm", "xpm", "xwd"};
    return kImageExtensions.count(to_lower(path_extension(path))) > 0;
}

std::string escape_loc(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case ' ': out += "%20"; break;
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c;
        }
    }
    return out;
}

} // namespace smap
