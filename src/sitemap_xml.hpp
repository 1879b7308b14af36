#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <libxml/parser.h>
#include <libxml/xpath.h>

namespace smap {

extern const char* const kSitemapNamespace;
extern const char* const kImageNamespace;

enum class SitemapKind { Index, UrlSet };

struct SitemapDocument {
    SitemapKind kind;
    std::vector<std::string> locations;   // <sitemap><loc> or <url><loc>, in document order
};

// RAII wrapper for a libxml2 document and its XPath context with the sitemap
// namespaces registered as "sm" and "sm2".
class XmlDocument {
public:
    static XmlDocument from_memory(const std::string& content);
    static XmlDocument from_file(const std::string& path);

    ~XmlDocument();
    XmlDocument(const XmlDocument&) = delete;
    XmlDocument& operator=(const XmlDocument&) = delete;
    XmlDocument(XmlDocument&& other) noexcept;
    XmlDocument& operator=(XmlDocument&& other) = delete;

    bool valid() const { return doc_ != nullptr && xpath_ctx_ != nullptr; }

    // Local name of the root element, "" if none.
    std::string root_name() const;

    std::vector<std::string> texts(const char* xpath) const;
    std::size_t count(const char* xpath) const;

private:
    explicit XmlDocument(xmlDocPtr doc);

    xmlDocPtr doc_ = nullptr;
    xmlXPathContextPtr xpath_ctx_ = nullptr;
};

void init_xml();

// nullopt unless the content parses and its root is <sitemapindex> or <urlset>.
// Namespaced lookup first, non-namespaced as fallback.
std::optional<SitemapDocument> parse_sitemap(const std::string& content);

// Counts <url> entries of an existing sitemap file, descending through index
// files into sibling files named after each <loc>'s last path segment.
// nullopt if the file is missing or unreadable.
std::optional<std::size_t> count_sitemap_urls(const std::string& path);

} // namespace smap
