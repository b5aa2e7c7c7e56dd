#include <mlget/manifest/manifest.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace mlget::manifest {

using json = nlohmann::json;
using downloader::Checksum;
using downloader::parseHashAlgo;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Error invalid(const std::string& where, const std::string& what) {
    return Error{ErrorCode::ManifestInvalid, where + ": " + what};
}

Result<std::vector<UrlCandidate>> parse_urls(const json& arr, const std::string& where) {
    if (!arr.is_array())
        return invalid(where, "'urls' must be an array");

    std::vector<UrlCandidate> out;
    for (const auto& u : arr) {
        UrlCandidate c;
        if (u.is_string()) {
            c.url = u.get<std::string>();
        } else if (u.is_object() && u.contains("url") && u["url"].is_string()) {
            c.url = u["url"].get<std::string>();
            if (u.contains("priority") && u["priority"].is_number_integer())
                c.priority = u["priority"].get<int>();
            if (u.contains("location") && u["location"].is_string())
                c.location = u["location"].get<std::string>();
        } else {
            return invalid(where, "url entries need a string 'url'");
        }
        out.push_back(std::move(c));
    }

    sortUrlsByPriority(out);
    return out;
}

Result<PieceDescriptor> parse_pieces(const json& p, const std::string& where) {
    if (!p.is_object())
        return invalid(where, "'pieces' must be an object");
    if (!p.contains("type") || !p["type"].is_string())
        return invalid(where, "'pieces.type' is required");

    auto typeName = p["type"].get<std::string>();
    auto algo = parseHashAlgo(typeName);
    if (!algo)
        return invalid(where, "unknown piece hash type '" + typeName + "'");

    if (!p.contains("length") || !p["length"].is_number_unsigned() ||
        p["length"].get<std::uint64_t>() == 0) {
        return invalid(where, "'pieces.length' must be a positive integer");
    }
    if (!p.contains("hashes") || !p["hashes"].is_array())
        return invalid(where, "'pieces.hashes' must be an array");

    PieceDescriptor out;
    out.algo = *algo;
    out.length = p["length"].get<std::uint64_t>();
    for (const auto& h : p["hashes"]) {
        if (!h.is_string())
            return invalid(where, "piece hashes must be strings");
        out.hashes.push_back(lower(h.get<std::string>()));
    }
    return out;
}

Result<FileDescriptor> parse_file(const json& f, std::size_t index) {
    std::string where = "files[" + std::to_string(index) + "]";
    if (!f.is_object())
        return invalid(where, "entry must be an object");
    if (!f.contains("name") || !f["name"].is_string() || f["name"].get<std::string>().empty())
        return invalid(where, "'name' is required");

    FileDescriptor fd;
    fd.name = f["name"].get<std::string>();
    where += " (" + fd.name + ")";

    if (f.contains("size") && !f["size"].is_null()) {
        if (!f["size"].is_number_unsigned())
            return invalid(where, "'size' must be a non-negative integer");
        fd.size = f["size"].get<std::uint64_t>();
    }

    if (f.contains("urls")) {
        auto urls = parse_urls(f["urls"], where);
        if (!urls)
            return urls.error();
        fd.urls = std::move(urls).value();
    }

    if (f.contains("hashes")) {
        if (!f["hashes"].is_array())
            return invalid(where, "'hashes' must be an array");
        for (const auto& h : f["hashes"]) {
            if (!h.is_object() || !h.contains("type") || !h.contains("value") ||
                !h["type"].is_string() || !h["value"].is_string()) {
                return invalid(where, "hash entries need string 'type' and 'value'");
            }
            auto typeName = h["type"].get<std::string>();
            auto algo = parseHashAlgo(typeName);
            if (!algo) {
                spdlog::debug("{}: skipping unknown hash type '{}'", where, typeName);
                continue;
            }
            fd.hashes.push_back(Checksum{*algo, lower(h["value"].get<std::string>())});
        }
    }

    if (f.contains("pieces") && !f["pieces"].is_null()) {
        auto pieces = parse_pieces(f["pieces"], where);
        if (!pieces)
            return pieces.error();
        fd.pieces = std::move(pieces).value();
    }

    return fd;
}

} // namespace

void sortUrlsByPriority(std::vector<UrlCandidate>& urls) {
    std::stable_sort(urls.begin(), urls.end(), [](const UrlCandidate& a, const UrlCandidate& b) {
        if (a.priority && b.priority)
            return *a.priority < *b.priority;
        return a.priority.has_value() && !b.priority.has_value();
    });
}

ManifestFormat detectManifestFormat(const std::filesystem::path& path, std::string_view document) {
    const auto ext = lower(path.extension().string());
    if (ext == ".meta4" || ext == ".metalink")
        return ManifestFormat::Metalink;
    if (ext == ".json")
        return ManifestFormat::Json;

    if (document.substr(0, 3) == "\xEF\xBB\xBF")
        document.remove_prefix(3);
    auto first = std::find_if_not(document.begin(), document.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    return first != document.end() && *first == '<' ? ManifestFormat::Metalink
                                                     : ManifestFormat::Json;
}

Result<std::vector<FileDescriptor>> parseManifest(std::string_view document) {
    json root;
    try {
        root = json::parse(document.begin(), document.end());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::ManifestInvalid, std::string("Malformed manifest: ") + e.what()};
    }

    if (!root.is_object() || !root.contains("files") || !root["files"].is_array()) {
        return Error{ErrorCode::ManifestInvalid, "Manifest must contain a 'files' array"};
    }

    std::vector<FileDescriptor> files;
    const auto& arr = root["files"];
    files.reserve(arr.size());
    for (std::size_t i = 0; i < arr.size(); ++i) {
        auto fd = parse_file(arr[i], i);
        if (!fd)
            return fd.error();
        files.push_back(std::move(fd).value());
    }
    return files;
}

Result<std::vector<FileDescriptor>> loadManifest(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::ManifestInvalid, "Cannot open manifest"}.withPath(path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    const auto document = ss.str();
    const auto format = detectManifestFormat(path, document);
    auto parsed = format == ManifestFormat::Metalink ? parseMetalink(document)
                                                     : parseManifest(document);
    if (!parsed)
        return Error{parsed.error()}.withPath(path);
    spdlog::debug("Loaded {} manifest {} with {} file(s)",
                  format == ManifestFormat::Metalink ? "Metalink" : "JSON", path.string(),
                  parsed.value().size());
    return parsed;
}

} // namespace mlget::manifest
