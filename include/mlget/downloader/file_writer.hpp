#pragma once

#include <mlget/core/cancellation.h>
#include <mlget/downloader/downloader.hpp>
#include <mlget/downloader/progress.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <variant>

namespace mlget::downloader {

// Verified bytes destined for an absolute offset of the target file.
struct WriteChunk {
    std::uint64_t offset{0};
    ByteVector bytes;
};

// Flush, fsync and stop. Always the last command a writer receives.
struct FinishWriting {};

using WriteCommand = std::variant<WriteChunk, FinishWriting>;

using WriterInbox =
    boost::asio::experimental::concurrent_channel<boost::asio::any_io_executor,
                                                  void(boost::system::error_code, WriteCommand)>;

enum class OpenMode {
    Truncate, // start from an empty file
    Preserve  // keep existing bytes (resume); create if missing
};

/**
 * Exclusive, blocking handle on one target file with positional writes.
 */
class TargetFile {
public:
    static Result<TargetFile> open(const std::filesystem::path& path,
                                   std::optional<std::uint64_t> size, OpenMode mode);

    Result<void> writeAt(std::uint64_t offset, ByteSpan bytes);
    Result<void> truncate(std::uint64_t size);
    // Flush, close and fsync. The handle is unusable afterwards.
    Result<void> finish();

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    TargetFile(std::filesystem::path path, std::fstream stream)
        : path_(std::move(path)), stream_(std::move(stream)) {}

    std::filesystem::path path_;
    std::fstream stream_;
};

/**
 * Sole writer of one target file.
 *
 * Consumes WriteChunk commands from its inbox in arrival order and writes each at
 * its offset, so chunk completion order does not matter. On the first failure it
 * requests cancellation and keeps draining the inbox until FinishWriting so that
 * no sender stays blocked.
 */
class FileWriter {
public:
    FileWriter(boost::asio::any_io_executor executor, boost::asio::any_io_executor blocking,
               std::filesystem::path target, std::optional<std::uint64_t> size, OpenMode mode,
               std::size_t inboxCapacity, std::shared_ptr<ProgressSink> progress,
               std::shared_ptr<CancellationSignal> cancel);

    WriterInbox& inbox() noexcept { return inbox_; }

    boost::asio::awaitable<Result<void>> run();

    std::uint64_t bytesWritten() const noexcept { return bytesWritten_; }

private:
    boost::asio::any_io_executor blocking_;
    std::filesystem::path target_;
    std::optional<std::uint64_t> size_;
    OpenMode mode_;
    WriterInbox inbox_;
    std::shared_ptr<ProgressSink> progress_;
    std::shared_ptr<CancellationSignal> cancel_;
    std::uint64_t bytesWritten_{0};
};

} // namespace mlget::downloader
