#pragma once

#include <mlget/core/async.h>
#include <mlget/core/cancellation.h>
#include <mlget/downloader/downloader.hpp>
#include <mlget/downloader/progress.hpp>

#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <memory>

namespace mlget::downloader {

/**
 * Executes a Plan: up to maxParallelFiles files at once, each either through a
 * worker pool and a dedicated writer (chunked) or as one streamed request
 * (single-shot).
 *
 * With FailurePolicy::CancelRun the first failing file cancels all others and its
 * error is returned. With CancelFile the remaining files continue and the run
 * fails afterwards if any file failed.
 */
class FileOrchestrator {
public:
    FileOrchestrator(Runtime& runtime, std::shared_ptr<IHttpClient> http, DownloaderConfig config);

    boost::asio::awaitable<Result<void>> run(Plan plan, ProgressCallback onProgress = {});

    // Blocking wrapper around run() for callers outside the runtime.
    Result<void> execute(Plan plan, ProgressCallback onProgress = {});

    // Threads the blocking pool needs so no transfer waits for a free thread.
    static std::size_t blockingThreadsFor(const DownloaderConfig& config) noexcept;

private:
    struct RunState;

    boost::asio::awaitable<void> lane(RunState& state);
    boost::asio::awaitable<Result<void>> downloadFile(const FilePlan& file,
                                                      std::shared_ptr<ProgressSink> progress,
                                                      std::shared_ptr<CancellationSignal> cancel);
    boost::asio::awaitable<Result<void>> downloadChunked(const FilePlan& file,
                                                         std::shared_ptr<ProgressSink> progress,
                                                         std::shared_ptr<CancellationSignal> cancel);
    boost::asio::awaitable<Result<void>> downloadWhole(const FilePlan& file,
                                                       std::shared_ptr<ProgressSink> progress,
                                                       std::shared_ptr<CancellationSignal> cancel);

    Runtime& runtime_;
    std::shared_ptr<IHttpClient> http_;
    DownloaderConfig config_;
};

} // namespace mlget::downloader
