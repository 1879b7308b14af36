#include "sitemap_xml.hpp"
#include "log.hpp"
#include "url.hpp"

#include <libxml/xpathInternals.h>

#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace smap {

const char* const kSitemapNamespace = "http://www.sitemaps.org/schemas/sitemap/0.9";
const char* const kImageNamespace = "http://www.google.com/schemas/sitemap-image/1.1";

namespace {

constexpr int kMaxIndexDepth = 8;
constexpr int kParseOptions = XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NONET;

void silent_error_handler(void*, const char*, ...) {}

std::string trimmed(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::optional<std::size_t> count_recursive(const std::string& path, int depth) {
    if (!fs::exists(path)) return std::nullopt;
    if (depth > kMaxIndexDepth) {
        log_warning("Sitemap index nesting too deep at " + path);
        return std::nullopt;
    }

    XmlDocument doc = XmlDocument::from_file(path);
    if (!doc.valid()) {
        log_error("Error parsing sitemap file " + path);
        return std::nullopt;
    }

    const std::string root = doc.root_name();
    if (root == "urlset") {
        std::size_t n = doc.count("/sm:urlset/sm:url | /sm2:urlset/sm2:url");
        if (n == 0) n = doc.count("/urlset/url");
        return n;
    }
    if (root == "sitemapindex") {
        auto locs = doc.texts("/sm:sitemapindex/sm:sitemap/sm:loc");
        if (locs.empty()) locs = doc.texts("/sitemapindex/sitemap/loc");

        const fs::path base_dir = fs::path(path).parent_path();
        std::size_t total = 0;
        for (const auto& loc : locs) {
            const std::string url_path = split_url(loc).path;
            const std::string name = fs::path(url_path).filename().string();
            const std::string child = (base_dir / name).string();
            auto n = count_recursive(child, depth + 1);
            if (n) total += *n;
            else log_warning("Could not count URLs in referenced sitemap: " + child);
        }
        return total;
    }
    log_warning("Unknown sitemap root tag: " + root);
    return std::nullopt;
}

} // namespace

void init_xml() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
    // the error handler is per thread in libxml2
    xmlSetGenericErrorFunc(nullptr, silent_error_handler);
}

// -------------------- XmlDocument --------------------
XmlDocument::XmlDocument(xmlDocPtr doc) : doc_(doc) {
    if (!doc_) return;
    xpath_ctx_ = xmlXPathNewContext(doc_);
    if (xpath_ctx_) {
        xmlXPathRegisterNs(xpath_ctx_, BAD_CAST "sm", BAD_CAST kSitemapNamespace);
        xmlXPathRegisterNs(xpath_ctx_, BAD_CAST "sm2",
                           BAD_CAST "http://www.google.com/schemas/sitemap/0.84");
    }
}

XmlDocument XmlDocument::from_memory(const std::string& content) {
    init_xml();
    return XmlDocument(xmlReadMemory(content.c_str(), static_cast<int>(content.size()),
                                     nullptr, nullptr, kParseOptions));
}

XmlDocument XmlDocument::from_file(const std::string& path) {
    init_xml();
    return XmlDocument(xmlReadFile(path.c_str(), nullptr, kParseOptions));
}

XmlDocument::~XmlDocument() {
    if (xpath_ctx_) xmlXPathFreeContext(xpath_ctx_);
    if (doc_) xmlFreeDoc(doc_);
}

XmlDocument::XmlDocument(XmlDocument&& other) noexcept
    : doc_(other.doc_), xpath_ctx_(other.xpath_ctx_) {
    other.doc_ = nullptr;
    other.xpath_ctx_ = nullptr;
}

std::string XmlDocument::root_name() const {
    if (!doc_) return "";
    xmlNodePtr root = xmlDocGetRootElement(doc_);
    if (!root || !root->name) return "";
    return reinterpret_cast<const char*>(root->name);
}

std::vector<std::string> XmlDocument::texts(const char* xpath) const {
    std::vector<std::string> out;
    if (!valid()) return out;

    xmlXPathObjectPtr result = xmlXPathEvalExpression(BAD_CAST xpath, xpath_ctx_);
    if (!result) return out;
    if (result->nodesetval) {
        for (int i = 0; i < result->nodesetval->nodeNr; ++i) {
            xmlChar* content = xmlNodeGetContent(result->nodesetval->nodeTab[i]);
            if (!content) continue;
            std::string text = trimmed(reinterpret_cast<const char*>(content));
            xmlFree(content);
            if (!text.empty()) out.push_back(std::move(text));
        }
    }
    xmlXPathFreeObject(result);
    return out;
}

std::size_t XmlDocument::count(const char* xpath) const {
    if (!valid()) return 0;
    xmlXPathObjectPtr result = xmlXPathEvalExpression(BAD_CAST xpath, xpath_ctx_);
    if (!result) return 0;
    std::size_t n = result->nodesetval ? static_cast<std::size_t>(result->nodesetval->nodeNr) : 0;
    xmlXPathFreeObject(result);
    return n;
}

// -------------------- sitemap parsing --------------------
std::optional<SitemapDocument> parse_sitemap(const std::string& content) {
    XmlDocument doc = XmlDocument::from_memory(content);
    if (!doc.valid()) {
        log_debug("Failed to parse sitemap XML");
        return std::nullopt;
    }

    const std::string root = doc.root_name();
    if (root == "sitemapindex") {
        SitemapDocument out{SitemapKind::Index, {}};
        out.locations = doc.texts("//sm:sitemap/sm:loc | //sm2:sitemap/sm2:loc");
        if (out.locations.empty()) out.locations = doc.texts("//sitemap/loc");
        return out;
    }
    if (root == "urlset") {
        SitemapDocument out{SitemapKind::UrlSet, {}};
        out.locations = doc.texts("//sm:url/sm:loc | //sm2:url/sm2:loc");
        if (out.locations.empty()) out.locations = doc.texts("//url/loc");
        return out;
    }
    return std::nullopt;
}

std::optional<std::size_t> count_sitemap_urls(const std::string& path) {
    return count_recursive(path, 0);
}

} // namespace smap
