#include <mlget/core/async.h>
#include <mlget/downloader/checksum_engine.hpp>
#include <mlget/downloader/worker_pool.hpp>

#include <spdlog/spdlog.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/cancellation_state.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <exception>

namespace mlget::downloader {

namespace {

boost::asio::awaitable<void> post_event(PoolEventChannel& events, PoolEvent event) {
    // Sized for every event a run can produce; the send never waits
    auto [ec] = co_await events.async_send(boost::system::error_code{}, std::move(event),
                                           boost::asio::as_tuple(boost::asio::use_awaitable));
    if (ec)
        spdlog::debug("pool event dropped: {}", ec.message());
}

} // namespace

DownloadWorkerPool::DownloadWorkerPool(boost::asio::any_io_executor executor,
                                       boost::asio::any_io_executor blocking,
                                       std::shared_ptr<IHttpClient> http,
                                       WorkerPoolOptions options,
                                       std::shared_ptr<CancellationSignal> cancel)
    : executor_(std::move(executor)), blocking_(std::move(blocking)), http_(std::move(http)),
      options_(options), cancel_(std::move(cancel)) {}

std::size_t DownloadWorkerPool::workerCount(int maxThreads, std::size_t chunkCount) noexcept {
    const auto budget = static_cast<std::size_t>(std::max(1, maxThreads - 1));
    return std::max<std::size_t>(1, std::min(budget, chunkCount));
}

boost::asio::awaitable<Result<void>> DownloadWorkerPool::run(const FilePlan& file,
                                                             WriterInbox& sink) {
    static const std::vector<ChunkMetadata> kNoChunks;
    const auto& chunks = file.chunks ? *file.chunks : kNoChunks;

    // Fail fast on digests this build cannot compute, before any transfer
    if (options_.verifyChunks) {
        auto withDigest = std::find_if(chunks.begin(), chunks.end(),
                                       [](const ChunkMetadata& c) { return c.checksum.has_value(); });
        if (withDigest != chunks.end()) {
            auto verifier = makeIntegrityVerifier();
            if (auto r = verifier->reset(withDigest->checksum->algo); !r) {
                cancel_->request();
                co_return Error{r.error()}.withPath(file.targetPath);
            }
        }
    }

    co_await boost::asio::this_coro::throw_if_cancelled(false);

    const auto workers = workerCount(options_.maxThreads, chunks.size());
    JobQueue jobs(executor_, workers);
    PoolEventChannel events(executor_, chunks.size() + 2 * workers + 1);

    spdlog::debug("{}: {} chunk(s) across {} worker(s)", file.targetPath.string(), chunks.size(),
                  workers);

    for (std::size_t i = 0; i < workers; ++i)
        boost::asio::co_spawn(executor_, work(jobs, events), boost::asio::detached);
    boost::asio::co_spawn(executor_, produce(file, jobs, sink, events, workers),
                          boost::asio::detached);

    // Every spawned coroutine references this frame; wait for all of them
    std::optional<Error> firstError;
    std::size_t done = 0;
    std::size_t exited = 0;
    while (exited < workers + 1) {
        auto [ec, event] =
            co_await events.async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec) {
            // Outer cancellation stops the pool; the wait for its coroutines goes on
            spdlog::debug("{}: pool wait interrupted: {}", file.targetPath.string(), ec.message());
            cancel_->request();
            co_await boost::asio::this_coro::reset_cancellation_state(
                boost::asio::disable_cancellation());
            continue;
        }
        switch (event.kind) {
            case PoolEvent::Kind::ChunkDone:
                ++done;
                break;
            case PoolEvent::Kind::ChunkFailed:
                if (!firstError)
                    firstError = event.error;
                break;
            case PoolEvent::Kind::WorkerExited:
            case PoolEvent::Kind::ProducerExited:
                ++exited;
                break;
        }
    }

    if (firstError)
        co_return *firstError;
    if (cancel_->requested())
        co_return Error{ErrorCode::OperationCancelled}.withPath(file.targetPath);
    if (done != chunks.size()) {
        co_return Error{ErrorCode::InternalError,
                        fmt::format("{} of {} chunk(s) completed", done, chunks.size())}
            .withPath(file.targetPath);
    }
    co_return Result<void>{};
}

boost::asio::awaitable<void> DownloadWorkerPool::produce(const FilePlan& file, JobQueue& jobs,
                                                         WriterInbox& sink,
                                                         PoolEventChannel& events,
                                                         std::size_t workers) {
    using namespace boost::asio::experimental::awaitable_operators;

    std::optional<Error> crash;
    try {
        bool stopped = false;
        if (file.chunks) {
            for (const auto& chunk : *file.chunks) {
                if (cancel_->requested()) {
                    stopped = true;
                    break;
                }
                auto race = co_await (
                    jobs.async_send(boost::system::error_code{},
                                    DownloadJob{file.sourceUrl, chunk, &sink, &events},
                                    boost::asio::as_tuple(boost::asio::use_awaitable)) ||
                    cancel_->wait());
                if (race.index() == 1) {
                    stopped = true;
                    break;
                }
            }
        }

        // Workers leave on cancellation by themselves; otherwise stop each one
        for (std::size_t i = 0; !stopped && i < workers; ++i) {
            auto race = co_await (
                jobs.async_send(boost::system::error_code{},
                                DownloadJob{file.sourceUrl, std::nullopt, &sink, &events},
                                boost::asio::as_tuple(boost::asio::use_awaitable)) ||
                cancel_->wait());
            if (race.index() == 1)
                stopped = true;
        }
    } catch (const std::exception& e) {
        crash = Error{ErrorCode::InternalError, std::string("Chunk producer failed: ") + e.what()}
                    .withPath(file.targetPath);
    }

    if (crash) {
        cancel_->request();
        co_await post_event(events, PoolEvent{PoolEvent::Kind::ChunkFailed, 0, crash});
    }
    co_await post_event(events, PoolEvent{PoolEvent::Kind::ProducerExited, 0, std::nullopt});
}

boost::asio::awaitable<void> DownloadWorkerPool::work(JobQueue& jobs, PoolEventChannel& events) {
    std::optional<Error> crash;
    try {
        co_await workLoop(jobs);
    } catch (const std::exception& e) {
        crash = Error{ErrorCode::InternalError, std::string("Chunk worker failed: ") + e.what()};
    }

    if (crash) {
        cancel_->request();
        co_await post_event(events, PoolEvent{PoolEvent::Kind::ChunkFailed, 0, crash});
    }
    co_await post_event(events, PoolEvent{PoolEvent::Kind::WorkerExited, 0, std::nullopt});
}

boost::asio::awaitable<void> DownloadWorkerPool::workLoop(JobQueue& jobs) {
    using namespace boost::asio::experimental::awaitable_operators;

    for (;;) {
        if (cancel_->requested())
            co_return;

        auto race = co_await (jobs.async_receive(boost::asio::as_tuple(boost::asio::use_awaitable)) ||
                              cancel_->wait());
        if (race.index() == 1)
            co_return;

        auto [ec, job] = std::get<0>(std::move(race));
        if (ec || !job.chunk)
            co_return;
        if (cancel_->requested()) {
            spdlog::debug("{}: chunk at {} skipped after cancellation",
                          job.chunk->target.string(), job.chunk->start);
            co_return;
        }

        const auto& chunk = *job.chunk;
        auto bytes = co_await fetchChunk(job);
        if (!bytes) {
            Error failure = bytes.error();
            failure.withPath(chunk.target).withUrl(job.url).withOffset(chunk.start);
            spdlog::error("{}", failure.describe());
            cancel_->request();
            co_await post_event(*job.completion,
                                PoolEvent{PoolEvent::Kind::ChunkFailed, chunk.start, failure});
            co_return;
        }

        auto [sendEc] = co_await job.sink->async_send(
            boost::system::error_code{},
            WriteCommand{WriteChunk{chunk.start, std::move(bytes).value()}},
            boost::asio::as_tuple(boost::asio::use_awaitable));
        if (sendEc) {
            cancel_->request();
            co_await post_event(
                *job.completion,
                PoolEvent{PoolEvent::Kind::ChunkFailed, chunk.start,
                          Error{ErrorCode::InternalError, "Writer inbox rejected chunk"}
                              .withPath(chunk.target)
                              .withOffset(chunk.start)});
            co_return;
        }
        co_await post_event(*job.completion,
                            PoolEvent{PoolEvent::Kind::ChunkDone, chunk.start, std::nullopt});
    }
}

boost::asio::awaitable<Result<ByteVector>> DownloadWorkerPool::fetchChunk(const DownloadJob& job) {
    const auto& chunk = *job.chunk;
    const bool verify = options_.verifyChunks && chunk.checksum.has_value();
    const int attempts = verify ? std::max(1, options_.chunkAttempts) : 1;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto fetched = co_await offload(blocking_, [&]() -> Result<ByteVector> {
            auto bytes = http_->getRange(job.url, chunk.start, chunk.end);
            if (!bytes || !verify)
                return bytes;
            auto matches = ChecksumEngine::validate(*chunk.checksum, bytes.value());
            if (!matches)
                return matches.error();
            if (!matches.value())
                return Error{ErrorCode::ChecksumMismatch, "Chunk digest mismatch"};
            return bytes;
        });
        if (fetched)
            co_return std::move(fetched);
        if (fetched.error().code != ErrorCode::ChecksumMismatch)
            co_return std::move(fetched);
        spdlog::warn("{}: chunk {}-{} failed {} verification (attempt {}/{})",
                     chunk.target.string(), chunk.start, chunk.end,
                     hashAlgoName(chunk.checksum->algo), attempt, attempts);
    }

    co_return Error{ErrorCode::ChecksumMismatch,
                    fmt::format("Chunk failed {} verification after {} attempt(s)",
                                hashAlgoName(chunk.checksum->algo), attempts)};
}

} // namespace mlget::downloader
