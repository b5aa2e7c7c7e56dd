#include <mlget/manifest/manifest.h>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <memory>
#include <mutex>

namespace mlget::manifest {

using downloader::Checksum;
using downloader::parseHashAlgo;

namespace {

constexpr std::string_view kMetalinkNamespace = "urn:ietf:params:xml:ns:metalink";

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* s) const noexcept { xmlFree(s); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

void init_libxml() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

std::string trimmed(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string from_xml(const xmlChar* s) {
    return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}

// Unqualified elements are accepted; qualified ones must be Metalink 4
bool is_element(const xmlNode* node, std::string_view name) {
    if (node->type != XML_ELEMENT_NODE || from_xml(node->name) != name)
        return false;
    return node->ns == nullptr || from_xml(node->ns->href) == kMetalinkNamespace;
}

std::optional<std::string> attribute(xmlNode* node, const char* name) {
    XmlCharPtr value(xmlGetProp(node, reinterpret_cast<const xmlChar*>(name)));
    if (!value)
        return std::nullopt;
    return trimmed(from_xml(value.get()));
}

std::string text_of(xmlNode* node) {
    XmlCharPtr content(xmlNodeGetContent(node));
    return trimmed(from_xml(content.get()));
}

template <typename T> std::optional<T> parse_number(const std::string& text) {
    T out{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        return std::nullopt;
    return out;
}

Error invalid(const std::string& where, const std::string& what) {
    return Error{ErrorCode::ManifestInvalid, where + ": " + what};
}

Result<UrlCandidate> parse_url(xmlNode* node, const std::string& where) {
    UrlCandidate c;
    c.url = text_of(node);
    if (c.url.empty())
        return invalid(where, "<url> must not be empty");
    if (auto priority = attribute(node, "priority")) {
        auto value = parse_number<int>(*priority);
        if (!value)
            return invalid(where, "<url priority> must be an integer, got '" + *priority + "'");
        c.priority = *value;
    }
    if (auto location = attribute(node, "location"); location && !location->empty())
        c.location = *location;
    return c;
}

Result<PieceDescriptor> parse_pieces(xmlNode* node, const std::string& where) {
    auto typeName = attribute(node, "type");
    if (!typeName)
        return invalid(where, "<pieces type> is required");
    auto algo = parseHashAlgo(*typeName);
    if (!algo)
        return invalid(where, "unknown piece hash type '" + *typeName + "'");

    auto lengthText = attribute(node, "length");
    auto length = lengthText ? parse_number<std::uint64_t>(*lengthText) : std::nullopt;
    if (!length || *length == 0)
        return invalid(where, "<pieces length> must be a positive integer");

    PieceDescriptor out;
    out.algo = *algo;
    out.length = *length;
    for (auto* child = node->children; child; child = child->next) {
        if (is_element(child, "hash"))
            out.hashes.push_back(lower(text_of(child)));
    }
    return out;
}

Result<FileDescriptor> parse_file(xmlNode* node, std::size_t index) {
    std::string where = "file[" + std::to_string(index) + "]";
    auto name = attribute(node, "name");
    if (!name || name->empty())
        return invalid(where, "<file name> is required");

    FileDescriptor fd;
    fd.name = *name;
    where += " (" + fd.name + ")";

    std::vector<UrlCandidate> urls;
    for (auto* child = node->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE)
            continue;

        if (is_element(child, "size")) {
            auto text = text_of(child);
            auto size = parse_number<std::uint64_t>(text);
            if (!size)
                return invalid(where, "<size> must be a non-negative integer, got '" + text + "'");
            fd.size = *size;
        } else if (is_element(child, "url")) {
            auto url = parse_url(child, where);
            if (!url)
                return url.error();
            urls.push_back(std::move(url).value());
        } else if (is_element(child, "hash")) {
            auto typeName = attribute(child, "type").value_or("");
            auto algo = parseHashAlgo(typeName);
            if (!algo) {
                spdlog::debug("{}: skipping unknown hash type '{}'", where, typeName);
                continue;
            }
            fd.hashes.push_back(Checksum{*algo, lower(text_of(child))});
        } else if (is_element(child, "pieces")) {
            auto pieces = parse_pieces(child, where);
            if (!pieces)
                return pieces.error();
            fd.pieces = std::move(pieces).value();
        }
    }

    if (!urls.empty()) {
        sortUrlsByPriority(urls);
        fd.urls = std::move(urls);
    }
    return fd;
}

std::string last_xml_error() {
    const xmlError* err = xmlGetLastError();
    if (!err || !err->message)
        return "unknown parser error";
    return fmt::format("line {}: {}", err->line, trimmed(err->message));
}

} // namespace

Result<std::vector<FileDescriptor>> parseMetalink(std::string_view document) {
    if (document.size() > static_cast<std::size_t>(INT_MAX))
        return Error{ErrorCode::ManifestInvalid, "Metalink document is too large"};

    init_libxml();
    xmlResetLastError();
    XmlDocPtr doc(xmlReadMemory(document.data(), static_cast<int>(document.size()), nullptr,
                                nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc)
        return Error{ErrorCode::ManifestInvalid, "Malformed Metalink: " + last_xml_error()};

    auto* root = xmlDocGetRootElement(doc.get());
    if (!root || !is_element(root, "metalink"))
        return Error{ErrorCode::ManifestInvalid, "Not a Metalink 4 document"};

    std::vector<FileDescriptor> files;
    for (auto* child = root->children; child; child = child->next) {
        if (!is_element(child, "file"))
            continue;
        auto fd = parse_file(child, files.size());
        if (!fd)
            return fd.error();
        files.push_back(std::move(fd).value());
    }

    if (files.empty())
        return Error{ErrorCode::ManifestInvalid, "Metalink lists no <file> elements"};
    return files;
}

} // namespace mlget::manifest
