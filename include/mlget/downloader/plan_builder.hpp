#pragma once

#include <mlget/downloader/downloader.hpp>
#include <mlget/manifest/manifest.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mlget::downloader {

/**
 * Turns manifest descriptors into concrete file plans rooted at a base directory,
 * and strips already-satisfied work from a plan by re-reading the target files.
 */
class PlanBuilder {
public:
    explicit PlanBuilder(std::filesystem::path baseDir);

    Result<FilePlan> buildFile(const manifest::FileDescriptor& descriptor) const;
    Result<Plan> build(const std::vector<manifest::FileDescriptor>& descriptors) const;

    /**
     * Drop files and chunks whose bytes on disk already verify. Files without any
     * digest are always kept. The returned plan has totalSize recomputed.
     */
    Result<Plan> minimize(const Plan& plan) const;

    /**
     * Ad hoc plan for a bare URL: chunked without digests above `threshold` bytes,
     * single-shot otherwise or when the size is unknown.
     */
    Result<Plan> planForUrl(const std::string& url, std::optional<std::uint64_t> size,
                            std::uint64_t blockSize = kDownloadFileBlockSize,
                            std::uint64_t threshold = kSingleShotThreshold) const;

    const std::filesystem::path& baseDir() const noexcept { return baseDir_; }

private:
    Result<std::filesystem::path> resolveTarget(const std::string& name) const;
    Result<std::optional<FilePlan>> minimizeFile(const FilePlan& file) const;

    std::filesystem::path baseDir_;
};

// Strongest digest by the fixed MD2 < ... < SHAKE256 ordering.
std::optional<Checksum> strongestChecksum(const std::vector<Checksum>& hashes);

// Last non-empty path segment of a URL (query and fragment stripped).
std::string fileNameFromUrl(const std::string& url);

} // namespace mlget::downloader
