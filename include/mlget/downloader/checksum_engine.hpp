#pragma once

#include <mlget/downloader/downloader.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace mlget::downloader {

/**
 * Digest computation and validation over buffers, streams and files.
 * Files and streams are read in DEFAULT_BUFFER_SIZE blocks, never loaded whole.
 * Digests are lower-case hex; validation is exact string equality.
 */
class ChecksumEngine {
public:
    static Result<std::string> digest(HashAlgo algo, ByteSpan bytes);
    static Result<std::string> digest(HashAlgo algo, std::string_view text);
    static Result<std::string> digestFile(HashAlgo algo, const std::filesystem::path& path);

    /**
     * Hash exactly `length` bytes from the stream's current read position.
     * Fails with InvalidData when the stream ends early.
     */
    static Result<std::string> digestStream(HashAlgo algo, std::istream& in, std::uint64_t length);

    static Result<bool> validate(const Checksum& expected, ByteSpan bytes);
    static Result<bool> validateFile(const Checksum& expected, const std::filesystem::path& path);
};

} // namespace mlget::downloader
