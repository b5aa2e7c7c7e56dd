#pragma once

#include <mlget/core/cancellation.h>
#include <mlget/downloader/downloader.hpp>
#include <mlget/downloader/file_writer.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace mlget::downloader {

struct PoolEvent {
    enum class Kind { ChunkDone, ChunkFailed, WorkerExited, ProducerExited };

    Kind kind{Kind::ChunkDone};
    std::uint64_t offset{0};
    std::optional<Error> error;
};

using PoolEventChannel =
    boost::asio::experimental::concurrent_channel<boost::asio::any_io_executor,
                                                  void(boost::system::error_code, PoolEvent)>;

/**
 * One unit of work on the job queue. A job without a chunk tells the receiving
 * worker to exit.
 */
struct DownloadJob {
    std::string url;
    std::optional<ChunkMetadata> chunk;
    WriterInbox* sink{nullptr};
    PoolEventChannel* completion{nullptr};
};

using JobQueue =
    boost::asio::experimental::concurrent_channel<boost::asio::any_io_executor,
                                                  void(boost::system::error_code, DownloadJob)>;

struct WorkerPoolOptions {
    int maxThreads{4};
    bool verifyChunks{true};
    int chunkAttempts{3};
};

/**
 * Fetches the chunks of one file with a bounded set of workers.
 *
 * A producer feeds a queue sized to the worker count. Each worker fetches its
 * chunk through the blocking executor, verifies it (refetching up to
 * chunkAttempts times on mismatch) and hands the bytes to the file's writer.
 * The first failure requests cancellation; no new chunk starts afterwards.
 */
class DownloadWorkerPool {
public:
    DownloadWorkerPool(boost::asio::any_io_executor executor,
                       boost::asio::any_io_executor blocking, std::shared_ptr<IHttpClient> http,
                       WorkerPoolOptions options, std::shared_ptr<CancellationSignal> cancel);

    // max(1, min(maxThreads - 1, chunkCount)); one thread's worth is left to the writer.
    static std::size_t workerCount(int maxThreads, std::size_t chunkCount) noexcept;

    boost::asio::awaitable<Result<void>> run(const FilePlan& file, WriterInbox& sink);

private:
    boost::asio::awaitable<void> produce(const FilePlan& file, JobQueue& jobs, WriterInbox& sink,
                                         PoolEventChannel& events, std::size_t workers);
    boost::asio::awaitable<void> work(JobQueue& jobs, PoolEventChannel& events);
    boost::asio::awaitable<void> workLoop(JobQueue& jobs);
    boost::asio::awaitable<Result<ByteVector>> fetchChunk(const DownloadJob& job);

    boost::asio::any_io_executor executor_;
    boost::asio::any_io_executor blocking_;
    std::shared_ptr<IHttpClient> http_;
    WorkerPoolOptions options_;
    std::shared_ptr<CancellationSignal> cancel_;
};

} // namespace mlget::downloader
