#include <mlget/downloader/checksum_engine.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <vector>

namespace mlget::downloader {

namespace fs = std::filesystem;

namespace {

Result<void> check_verifiable(HashAlgo algo) {
    if (!isVerifiable(algo)) {
        return Error{ErrorCode::UnsupportedAlgorithm,
                     std::string(hashAlgoName(algo)) + " digests cannot be verified"};
    }
    return {};
}

} // namespace

Result<std::string> ChecksumEngine::digest(HashAlgo algo, ByteSpan bytes) {
    if (auto ok = check_verifiable(algo); !ok)
        return ok.error();

    auto verifier = makeIntegrityVerifier();
    if (auto r = verifier->reset(algo); !r)
        return r.error();
    verifier->update(bytes);
    return verifier->finalize();
}

Result<std::string> ChecksumEngine::digest(HashAlgo algo, std::string_view text) {
    return digest(algo, ByteSpan{reinterpret_cast<const std::byte*>(text.data()), text.size()});
}

Result<std::string> ChecksumEngine::digestStream(HashAlgo algo, std::istream& in,
                                                 std::uint64_t length) {
    if (auto ok = check_verifiable(algo); !ok)
        return ok.error();

    auto verifier = makeIntegrityVerifier();
    if (auto r = verifier->reset(algo); !r)
        return r.error();

    std::vector<char> buf(DEFAULT_BUFFER_SIZE);
    std::uint64_t remaining = length;
    while (remaining > 0) {
        const auto want =
            static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buf.size()));
        in.read(buf.data(), want);
        const auto got = in.gcount();
        if (got <= 0) {
            return Error{ErrorCode::InvalidData,
                         "Stream ended " + std::to_string(remaining) + " bytes early"};
        }
        verifier->update(ByteSpan{reinterpret_cast<const std::byte*>(buf.data()),
                                  static_cast<std::size_t>(got)});
        remaining -= static_cast<std::uint64_t>(got);
    }
    return verifier->finalize();
}

Result<std::string> ChecksumEngine::digestFile(HashAlgo algo, const fs::path& path) {
    if (auto ok = check_verifiable(algo); !ok)
        return Error{ok.error()}.withPath(path);

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::FilesystemError, "Failed to stat file: " + ec.message()}.withPath(
            path);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FilesystemError, "Failed to open file for hashing"}.withPath(path);
    }

    auto r = digestStream(algo, in, size);
    if (!r)
        return Error{r.error()}.withPath(path);
    return r;
}

Result<bool> ChecksumEngine::validate(const Checksum& expected, ByteSpan bytes) {
    auto actual = digest(expected.algo, bytes);
    if (!actual)
        return actual.error();
    return actual.value() == expected.hex;
}

Result<bool> ChecksumEngine::validateFile(const Checksum& expected, const fs::path& path) {
    auto actual = digestFile(expected.algo, path);
    if (!actual)
        return actual.error();
    if (actual.value() != expected.hex) {
        spdlog::debug("{} mismatch for {}: expected {}, got {}", hashAlgoName(expected.algo),
                      path.string(), expected.hex, actual.value());
        return false;
    }
    return true;
}

} // namespace mlget::downloader
