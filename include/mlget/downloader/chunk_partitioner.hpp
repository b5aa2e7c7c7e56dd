#pragma once

#include <mlget/downloader/downloader.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mlget::downloader {

/**
 * Split [0, totalSize) into contiguous inclusive ranges of blockSize bytes;
 * the last range holds the remainder (1..=blockSize bytes).
 * Returns an empty list when either argument is zero.
 */
std::vector<ByteRange> calculateRanges(std::uint64_t totalSize, std::uint64_t blockSize);

/**
 * Pair ranges with piece hashes in order. Fails with ChunkCountMismatch when the
 * counts differ.
 */
Result<std::vector<ChunkMetadata>> attachChecksums(const std::vector<ByteRange>& ranges,
                                                   HashAlgo algo,
                                                   const std::vector<std::string>& hashes,
                                                   const std::filesystem::path& target);

/**
 * Chunks without digests, used when only a size is known.
 */
std::vector<ChunkMetadata> uncheckedChunks(const std::vector<ByteRange>& ranges,
                                           const std::filesystem::path& target);

} // namespace mlget::downloader
