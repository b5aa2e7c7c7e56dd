#pragma once

/*
 * mlget Downloader - Public Types and Service Interfaces (C++20)
 *
 * This header defines the data model shared by the planning and execution
 * layers (checksums, chunks, file plans) together with the abstract interfaces
 * of the HTTP transport and the streaming integrity verifier. Implementations
 * live in src/downloader and are reached through factory functions.
 *
 * Design principles:
 * - Resumability is derived from re-validating on-disk bytes; no side state
 * - Every byte range is addressed by absolute offset so completion order is irrelevant
 * - Clear separation of concerns (transport, retry, verification, writing, orchestration)
 */

#include <mlget/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mlget::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms known to the manifest format, ordered from weakest to strongest.
 * SHAKE128/SHAKE256 are recognized by name but cannot be verified.
 */
enum class HashAlgo { Md2, Md5, Sha1, Sha224, Sha256, Sha384, Sha512, Shake128, Shake256 };

/**
 * Severity applied when a file fails with an unrecoverable error.
 */
enum class FailurePolicy {
    CancelRun, // cancel every in-flight file of the run
    CancelFile // cancel only the failing file; siblings continue
};

inline constexpr std::uint64_t kDownloadFileBlockSize = 1024 * 1024;        // 1 MiB
inline constexpr std::uint64_t kSingleShotThreshold = 1024 * 1024;          // 1 MiB
inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{20000};   // 20 s

// Registry helpers (hash_algo.cpp)
std::optional<HashAlgo> parseHashAlgo(std::string_view name);
std::string_view hashAlgoName(HashAlgo algo);
bool isVerifiable(HashAlgo algo);
std::optional<FailurePolicy> parseFailurePolicy(std::string_view name);
std::string_view failurePolicyName(FailurePolicy policy);

// ===================
// Small data objects
// ===================

/**
 * Checksum descriptor (algorithm + lower-case hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex;
};

/**
 * Inclusive byte interval [start, end].
 */
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    std::uint64_t size() const noexcept { return end - start + 1; }
    bool operator==(const ByteRange&) const = default;
};

/**
 * One independently fetchable and verifiable slice of a target file.
 */
struct ChunkMetadata {
    std::uint64_t start{0};
    std::uint64_t end{0}; // inclusive
    std::optional<Checksum> checksum;
    std::filesystem::path target;

    std::uint64_t size() const noexcept { return end - start + 1; }
};

/**
 * Concrete download work for one target file. Either a chunk list (range based)
 * or a single-shot fetch relying on the whole-file checksum and size.
 */
struct FilePlan {
    std::filesystem::path targetPath;
    std::string sourceUrl;
    std::optional<std::uint64_t> expectedSize;
    std::optional<Checksum> wholeFileChecksum;
    std::optional<std::vector<ChunkMetadata>> chunks;

    // Bytes this plan still has to transfer (0 when the size is unknown).
    std::uint64_t remainingBytes() const noexcept;
};

/**
 * The full set of work for one invocation.
 */
struct Plan {
    std::vector<FilePlan> files;
    std::uint64_t totalSize{0};

    void recomputeTotal() noexcept;
};

/**
 * Retry/backoff policy applied by the transport decorator.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
};

/**
 * TLS configuration. Verification is always on; only the trust store can change.
 */
struct TlsConfig {
    std::string caPath; // empty = system default
};

/**
 * Downloader configuration (defaults, overridden by config file, env and CLI).
 */
struct DownloaderConfig {
    std::string userAgent;
    int maxThreadsPerFile{4};
    int maxParallelFiles{2};
    bool verifyChunkChecksums{true};
    int chunkRetryAttempts{3};
    std::chrono::milliseconds requestTimeout{kDefaultRequestTimeout};
    RetryPolicy retry{};
    TlsConfig tls{};
    FailurePolicy failurePolicy{FailurePolicy::CancelRun};
};

/**
 * Aggregate progress snapshot for a run.
 */
struct ProgressEvent {
    std::uint64_t downloadedBytes{0};
    std::uint64_t totalBytes{0};
    std::optional<float> percentage{}; // 0.0 - 100.0 (approx)
    std::optional<std::uint64_t> speedBps{};
    std::optional<std::uint32_t> etaSeconds{};
    bool finished{false};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// Receives body bytes addressed by their offset in the response. A transport
// retry restarts delivery at offset 0.
using BodySink = std::function<Result<void>(std::uint64_t offset, ByteSpan bytes)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Blocking HTTP transport. Implementations must be safe to share across threads.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * Content length reported by a HEAD request; nullopt when the server does not say.
     */
    virtual Result<std::optional<std::uint64_t>> headSize(std::string_view url) = 0;

    /**
     * GET the inclusive byte range [start, end]. The body must be exactly end - start + 1 bytes.
     */
    virtual Result<ByteVector> getRange(std::string_view url, std::uint64_t start,
                                        std::uint64_t end) = 0;

    /**
     * GET the whole body, streaming it into sink. Returns the number of bytes received.
     */
    virtual Result<std::uint64_t> getFull(std::string_view url, const BodySink& sink) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual Result<void> reset(HashAlgo algo) = 0;
    virtual void update(ByteSpan data) = 0;
    virtual Result<std::string> finalize() = 0;
};

// Factories
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier();

} // namespace mlget::downloader
