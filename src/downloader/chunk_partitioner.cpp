#include <mlget/downloader/chunk_partitioner.hpp>

namespace mlget::downloader {

std::vector<ByteRange> calculateRanges(std::uint64_t totalSize, std::uint64_t blockSize) {
    std::vector<ByteRange> ranges;
    if (totalSize == 0 || blockSize == 0)
        return ranges;

    ranges.reserve(static_cast<std::size_t>((totalSize + blockSize - 1) / blockSize));
    std::uint64_t start = 0;
    std::uint64_t remaining = totalSize;
    while (remaining > blockSize) {
        ranges.push_back(ByteRange{start, start + blockSize - 1});
        start += blockSize;
        remaining -= blockSize;
    }
    ranges.push_back(ByteRange{start, start + remaining - 1});
    return ranges;
}

Result<std::vector<ChunkMetadata>> attachChecksums(const std::vector<ByteRange>& ranges,
                                                   HashAlgo algo,
                                                   const std::vector<std::string>& hashes,
                                                   const std::filesystem::path& target) {
    if (ranges.size() != hashes.size()) {
        return Error{ErrorCode::ChunkCountMismatch,
                     "Expected " + std::to_string(ranges.size()) + " piece hashes, manifest has " +
                         std::to_string(hashes.size())}
            .withPath(target);
    }

    std::vector<ChunkMetadata> chunks;
    chunks.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        chunks.push_back(
            ChunkMetadata{ranges[i].start, ranges[i].end, Checksum{algo, hashes[i]}, target});
    }
    return chunks;
}

std::vector<ChunkMetadata> uncheckedChunks(const std::vector<ByteRange>& ranges,
                                           const std::filesystem::path& target) {
    std::vector<ChunkMetadata> chunks;
    chunks.reserve(ranges.size());
    for (const auto& r : ranges) {
        chunks.push_back(ChunkMetadata{r.start, r.end, std::nullopt, target});
    }
    return chunks;
}

} // namespace mlget::downloader
