/*
 * mlget/src/downloader/file_writer.cpp
 *
 * Target file handling for the download engine:
 * - Parent directories are created on demand
 * - Resumed files are opened without truncation and pre-extended to their size
 * - Every write is positional; the file is flushed and fsync'ed before success
 */

#include <mlget/core/async.h>
#include <mlget/downloader/file_writer.hpp>

#include <spdlog/spdlog.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace mlget::downloader {

namespace fs = std::filesystem;

namespace {

Result<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::FilesystemError, "open() failed for fsync"}.withPath(p);
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::FilesystemError, "fsync() failed"}.withPath(p);
    }
    ::close(fd);
    return Result<void>{};
}

Error fs_error(std::string message, const fs::path& p, const std::error_code& ec = {}) {
    if (ec)
        message += ": " + ec.message();
    return Error{ErrorCode::FilesystemError, std::move(message)}.withPath(p);
}

} // namespace

// ---------- TargetFile ----------

Result<TargetFile> TargetFile::open(const fs::path& path, std::optional<std::uint64_t> size,
                                    OpenMode mode) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec)
            return fs_error("Failed to create parent directories", path, ec);
    }

    const bool exists = fs::exists(path, ec);
    if (mode == OpenMode::Truncate || !exists) {
        std::ofstream create(path, std::ios::binary | std::ios::trunc);
        if (!create)
            return fs_error("Failed to create target file", path);
    }

    if (size) {
        // Pre-extend (sparse on most filesystems); shrink stale longer files too
        fs::resize_file(path, *size, ec);
        if (ec)
            return fs_error("Failed to size target file", path, ec);
    }

    std::fstream stream(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!stream)
        return fs_error("Failed to open target file for writing", path);
    return TargetFile(path, std::move(stream));
}

Result<void> TargetFile::writeAt(std::uint64_t offset, ByteSpan bytes) {
    stream_.seekp(static_cast<std::streamoff>(offset));
    if (!stream_)
        return Error{fs_error("Failed to seek", path_)}.withOffset(offset);
    stream_.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    stream_.flush();
    if (!stream_)
        return Error{fs_error("Failed to write", path_)}.withOffset(offset);
    return Result<void>{};
}

Result<void> TargetFile::truncate(std::uint64_t size) {
    stream_.flush();
    if (!stream_)
        return fs_error("Failed to flush", path_);
    std::error_code ec;
    fs::resize_file(path_, size, ec);
    if (ec)
        return fs_error("Failed to truncate target file", path_, ec);
    return Result<void>{};
}

Result<void> TargetFile::finish() {
    stream_.flush();
    const bool flushed = static_cast<bool>(stream_);
    stream_.close();
    if (!flushed || stream_.fail())
        return fs_error("Failed to flush target file", path_);
    return fsync_file(path_);
}

// ---------- FileWriter ----------

FileWriter::FileWriter(boost::asio::any_io_executor executor,
                       boost::asio::any_io_executor blocking, fs::path target,
                       std::optional<std::uint64_t> size, OpenMode mode,
                       std::size_t inboxCapacity, std::shared_ptr<ProgressSink> progress,
                       std::shared_ptr<CancellationSignal> cancel)
    : blocking_(std::move(blocking)), target_(std::move(target)), size_(size), mode_(mode),
      inbox_(executor, inboxCapacity), progress_(std::move(progress)),
      cancel_(std::move(cancel)) {}

boost::asio::awaitable<Result<void>> FileWriter::run() {
    std::optional<Error> failure;
    std::optional<TargetFile> file;

    auto opened = co_await offload(
        blocking_, [this] { return TargetFile::open(target_, size_, mode_); });
    if (opened) {
        file.emplace(std::move(opened).value());
    } else {
        failure = opened.error();
        spdlog::error("{}", failure->describe());
        cancel_->request();
    }

    for (;;) {
        auto [ec, command] =
            co_await inbox_.async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec) {
            if (!failure)
                failure = fs_error("Writer inbox closed before finish", target_);
            break;
        }
        if (std::holds_alternative<FinishWriting>(command))
            break;
        if (failure)
            continue; // drain

        auto& chunk = std::get<WriteChunk>(command);
        auto written = co_await offload(
            blocking_, [&file, &chunk] { return file->writeAt(chunk.offset, chunk.bytes); });
        if (!written) {
            failure = written.error();
            spdlog::error("{}", failure->describe());
            cancel_->request();
            continue;
        }
        bytesWritten_ += chunk.bytes.size();
        if (progress_)
            progress_->progressed(chunk.bytes.size());
    }

    if (!failure && file) {
        auto finished = co_await offload(blocking_, [&file] { return file->finish(); });
        if (!finished)
            failure = finished.error();
    }

    if (failure)
        co_return *failure;
    spdlog::debug("{}: {} byte(s) written", target_.string(), bytesWritten_);
    co_return Result<void>{};
}

} // namespace mlget::downloader
