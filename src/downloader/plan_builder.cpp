#include <mlget/downloader/checksum_engine.hpp>
#include <mlget/downloader/chunk_partitioner.hpp>
#include <mlget/downloader/plan_builder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <string_view>

namespace mlget::downloader {

namespace fs = std::filesystem;

std::uint64_t FilePlan::remainingBytes() const noexcept {
    if (chunks) {
        std::uint64_t sum = 0;
        for (const auto& c : *chunks)
            sum += c.size();
        return sum;
    }
    return expectedSize.value_or(0);
}

void Plan::recomputeTotal() noexcept {
    totalSize = 0;
    for (const auto& f : files)
        totalSize += f.remainingBytes();
}

std::optional<Checksum> strongestChecksum(const std::vector<Checksum>& hashes) {
    if (hashes.empty())
        return std::nullopt;
    auto it = std::max_element(hashes.begin(), hashes.end(),
                               [](const Checksum& a, const Checksum& b) {
                                   return static_cast<int>(a.algo) < static_cast<int>(b.algo);
                               });
    return *it;
}

std::string fileNameFromUrl(const std::string& url) {
    std::string_view s(url);
    if (auto cut = s.find_first_of("?#"); cut != std::string_view::npos)
        s = s.substr(0, cut);

    std::size_t pathStart = 0;
    if (auto scheme = s.find("://"); scheme != std::string_view::npos) {
        pathStart = s.find('/', scheme + 3);
        if (pathStart == std::string_view::npos)
            return {};
    }

    auto path = s.substr(pathStart);
    while (!path.empty() && path.back() == '/')
        path.remove_suffix(1);
    auto slash = path.rfind('/');
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

PlanBuilder::PlanBuilder(fs::path baseDir) : baseDir_(std::move(baseDir)) {}

Result<fs::path> PlanBuilder::resolveTarget(const std::string& name) const {
    fs::path rel(name);
    if (name.empty() || rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) {
        return Error{ErrorCode::ManifestInvalid, "File name must be a relative path: '" + name +
                                                     "'"};
    }
    for (const auto& part : rel) {
        if (part == "..") {
            return Error{ErrorCode::ManifestInvalid,
                         "File name must not leave the target directory: '" + name + "'"};
        }
    }
    return baseDir_ / rel;
}

Result<FilePlan> PlanBuilder::buildFile(const manifest::FileDescriptor& descriptor) const {
    auto target = resolveTarget(descriptor.name);
    if (!target)
        return target.error();
    const auto& path = target.value();

    FilePlan plan;
    plan.targetPath = path;
    plan.expectedSize = descriptor.size;

    if (descriptor.pieces) {
        if (!descriptor.size) {
            return Error{ErrorCode::MissingSizeForPieces}.withPath(path);
        }
        const auto& pieces = *descriptor.pieces;
        auto chunks =
            attachChecksums(calculateRanges(*descriptor.size, pieces.length), pieces.algo,
                            pieces.hashes, path);
        if (!chunks)
            return chunks.error();
        plan.chunks = std::move(chunks).value();
    } else if (!descriptor.hashes.empty()) {
        plan.wholeFileChecksum = strongestChecksum(descriptor.hashes);
    }

    if (!descriptor.urls) {
        return Error{ErrorCode::NoLocationSpecified}.withPath(path);
    }
    if (descriptor.urls->empty()) {
        return Error{ErrorCode::NoUrlsAvailable}.withPath(path);
    }
    plan.sourceUrl = descriptor.urls->front().url;
    return plan;
}

Result<Plan> PlanBuilder::build(const std::vector<manifest::FileDescriptor>& descriptors) const {
    Plan plan;
    plan.files.reserve(descriptors.size());
    for (const auto& d : descriptors) {
        auto file = buildFile(d);
        if (!file)
            return file.error();
        plan.files.push_back(std::move(file).value());
    }
    plan.recomputeTotal();
    return plan;
}

Result<std::optional<FilePlan>> PlanBuilder::minimizeFile(const FilePlan& file) const {
    using Kept = std::optional<FilePlan>;
    const auto& target = file.targetPath;

    std::error_code ec;
    if (!fs::exists(target, ec)) {
        return Kept{file};
    }
    const auto onDisk = fs::file_size(target, ec);
    if (ec) {
        return Error{ErrorCode::FilesystemError, "Failed to stat target: " + ec.message()}
            .withPath(target);
    }

    if (file.chunks) {
        std::ifstream in(target, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::FilesystemError, "Failed to open target for verification"}
                .withPath(target);
        }

        std::vector<ChunkMetadata> pending;
        for (const auto& chunk : *file.chunks) {
            if (!chunk.checksum || chunk.end >= onDisk) {
                pending.push_back(chunk);
                continue;
            }
            in.clear();
            in.seekg(static_cast<std::streamoff>(chunk.start));
            auto digest = ChecksumEngine::digestStream(chunk.checksum->algo, in, chunk.size());
            if (!digest) {
                return Error{digest.error()}.withPath(target).withOffset(chunk.start);
            }
            if (digest.value() != chunk.checksum->hex)
                pending.push_back(chunk);
        }

        spdlog::debug("{}: {}/{} chunk(s) already valid", target.string(),
                      file.chunks->size() - pending.size(), file.chunks->size());
        if (pending.empty()) {
            spdlog::info("{}: already complete", target.string());
            return Kept{};
        }
        FilePlan reduced = file;
        reduced.chunks = std::move(pending);
        return Kept{std::move(reduced)};
    }

    if (file.wholeFileChecksum) {
        if (file.expectedSize && *file.expectedSize != onDisk) {
            spdlog::debug("{}: size {} differs from expected {}", target.string(), onDisk,
                          *file.expectedSize);
            return Kept{file};
        }
        auto ok = ChecksumEngine::validateFile(*file.wholeFileChecksum, target);
        if (!ok)
            return ok.error();
        if (ok.value()) {
            spdlog::info("{}: already complete", target.string());
            return Kept{};
        }
        return Kept{file};
    }

    // Nothing to verify against
    spdlog::debug("{}: no digest available, scheduling re-download", target.string());
    return Kept{file};
}

Result<Plan> PlanBuilder::minimize(const Plan& plan) const {
    Plan out;
    for (const auto& file : plan.files) {
        auto kept = minimizeFile(file);
        if (!kept)
            return kept.error();
        if (kept.value())
            out.files.push_back(std::move(*kept.value()));
    }
    out.recomputeTotal();
    spdlog::debug("Minimized plan: {} -> {} file(s), {} byte(s) remaining", plan.files.size(),
                  out.files.size(), out.totalSize);
    return out;
}

Result<Plan> PlanBuilder::planForUrl(const std::string& url, std::optional<std::uint64_t> size,
                                     std::uint64_t blockSize, std::uint64_t threshold) const {
    auto name = fileNameFromUrl(url);
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Cannot derive a file name from url"}.withUrl(
            url);
    }
    auto target = resolveTarget(name);
    if (!target)
        return Error{target.error()}.withUrl(url);

    FilePlan file;
    file.targetPath = target.value();
    file.sourceUrl = url;
    file.expectedSize = size;
    if (size && *size > threshold) {
        file.chunks = uncheckedChunks(calculateRanges(*size, blockSize), file.targetPath);
    }

    Plan plan;
    plan.files.push_back(std::move(file));
    plan.recomputeTotal();
    return plan;
}

} // namespace mlget::downloader
