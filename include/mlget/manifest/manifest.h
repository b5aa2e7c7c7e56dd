#pragma once

#include <mlget/core/types.h>
#include <mlget/downloader/downloader.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mlget::manifest {

// Candidate source location for a file
struct UrlCandidate {
    std::string url;
    std::optional<int> priority;         // lower is preferred
    std::optional<std::string> location; // ISO 3166 country code
};

// Per-chunk hash layout
struct PieceDescriptor {
    downloader::HashAlgo algo{downloader::HashAlgo::Sha1};
    std::uint64_t length{0};
    std::vector<std::string> hashes;
};

// One file as described by the manifest
struct FileDescriptor {
    std::string name;
    std::optional<std::uint64_t> size;
    std::optional<std::vector<UrlCandidate>> urls; // nullopt when the manifest lists none
    std::vector<downloader::Checksum> hashes;
    std::optional<PieceDescriptor> pieces;
};

enum class ManifestFormat { Json, Metalink };

/**
 * Parse a JSON manifest document:
 *
 *   {"files": [{"name": "...", "size": 123,
 *               "urls": [{"url": "https://...", "priority": 1, "location": "de"}],
 *               "hashes": [{"type": "sha-256", "value": "..."}],
 *               "pieces": {"type": "sha-1", "length": 262144, "hashes": ["..."]}}]}
 *
 * URLs are ordered by ascending priority (missing priority last); unknown whole-file
 * hash types are skipped; an unknown piece hash type is a ManifestInvalid error.
 */
Result<std::vector<FileDescriptor>> parseManifest(std::string_view document);

/**
 * Parse an RFC 5854 Metalink 4 document. Reads <file name>, <size>,
 * <url priority location>, <hash type> and <pieces type length><hash/>; other
 * elements (metaurl, signature, publisher, ...) are ignored. URL ordering and
 * hash handling follow parseManifest.
 */
Result<std::vector<FileDescriptor>> parseMetalink(std::string_view document);

// .meta4 and .metalink are Metalink, .json is JSON; otherwise a leading '<' means Metalink.
ManifestFormat detectManifestFormat(const std::filesystem::path& path, std::string_view document);

// Stable sort by ascending priority; candidates without a priority go last.
void sortUrlsByPriority(std::vector<UrlCandidate>& urls);

Result<std::vector<FileDescriptor>> loadManifest(const std::filesystem::path& path);

} // namespace mlget::manifest
