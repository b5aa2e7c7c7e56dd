#include <mlget/downloader/checksum_engine.hpp>
#include <mlget/downloader/file_writer.hpp>
#include <mlget/downloader/orchestrator.hpp>
#include <mlget/downloader/worker_pool.hpp>

#include <spdlog/spdlog.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <vector>

namespace mlget::downloader {

using LaneDoneChannel =
    boost::asio::experimental::concurrent_channel<boost::asio::any_io_executor,
                                                  void(boost::system::error_code)>;

struct FileOrchestrator::RunState {
    RunState(const Plan& p, std::shared_ptr<CancellationSignal> c, std::shared_ptr<ProgressSink> s,
             LaneDoneChannel& d)
        : plan(p), cancel(std::move(c)), progress(std::move(s)), lanesDone(d) {}

    void recordFailure(Error error) {
        std::lock_guard lock(mutex);
        errors.push_back(std::move(error));
    }

    const Plan& plan;
    std::shared_ptr<CancellationSignal> cancel;
    std::shared_ptr<ProgressSink> progress;
    LaneDoneChannel& lanesDone;
    std::atomic<std::size_t> next{0};
    std::mutex mutex;
    std::vector<Error> errors;
};

FileOrchestrator::FileOrchestrator(Runtime& runtime, std::shared_ptr<IHttpClient> http,
                                   DownloaderConfig config)
    : runtime_(runtime), http_(std::move(http)), config_(std::move(config)) {}

std::size_t FileOrchestrator::blockingThreadsFor(const DownloaderConfig& config) noexcept {
    const auto files = static_cast<std::size_t>(std::max(1, config.maxParallelFiles));
    const auto threads = static_cast<std::size_t>(std::max(1, config.maxThreadsPerFile));
    return files * threads + 2;
}

boost::asio::awaitable<Result<void>> FileOrchestrator::run(Plan plan, ProgressCallback onProgress) {
    using namespace boost::asio::experimental::awaitable_operators;

    auto executor = runtime_.scheduler();
    const auto fileCount = plan.files.size();
    const auto lanes = std::max<std::size_t>(
        1, std::min(static_cast<std::size_t>(std::max(1, config_.maxParallelFiles)), fileCount));

    spdlog::info("Downloading {} file(s), {} byte(s) outstanding, {} at a time", fileCount,
                 plan.totalSize, lanes);

    ProgressAggregator aggregator(executor, plan.totalSize, std::move(onProgress));
    LaneDoneChannel lanesDone(executor, lanes);
    RunState state(plan, CancellationSignal::create(executor), aggregator.sink(), lanesDone);

    auto driveLanes = [&]() -> boost::asio::awaitable<void> {
        for (std::size_t i = 0; i < lanes; ++i)
            boost::asio::co_spawn(executor, lane(state), boost::asio::detached);
        for (std::size_t i = 0; i < lanes; ++i) {
            auto [ec] =
                co_await lanesDone.async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
            if (ec)
                spdlog::debug("lane completion: {}", ec.message());
        }
        co_await aggregator.finish();
    };

    co_await (driveLanes() && aggregator.run());

    if (state.errors.empty()) {
        spdlog::info("Downloaded {} byte(s)", aggregator.downloaded());
        co_return Result<void>{};
    }
    if (config_.failurePolicy == FailurePolicy::CancelRun || state.errors.size() == 1)
        co_return state.errors.front();

    Error summary = state.errors.front();
    summary.message = fmt::format("{} of {} file(s) failed; first: {}", state.errors.size(),
                                  fileCount, state.errors.front().message);
    co_return summary;
}

boost::asio::awaitable<void> FileOrchestrator::lane(RunState& state) {
    for (;;) {
        if (state.cancel->requested())
            break;
        const auto index = state.next.fetch_add(1);
        if (index >= state.plan.files.size())
            break;

        const auto& file = state.plan.files[index];
        auto fileCancel = state.cancel->child();

        Result<void> result;
        try {
            result = co_await downloadFile(file, state.progress, fileCancel);
        } catch (const std::exception& e) {
            result = Error{ErrorCode::InternalError, e.what()}.withPath(file.targetPath);
        }

        if (result) {
            spdlog::info("{}: complete", file.targetPath.string());
            continue;
        }
        // Collateral of a failure already recorded elsewhere
        if (result.error().code == ErrorCode::OperationCancelled && state.cancel->requested())
            break;

        spdlog::error("{}: {}", file.targetPath.string(), result.error().describe());
        state.recordFailure(result.error());
        if (config_.failurePolicy == FailurePolicy::CancelRun)
            state.cancel->request();
    }

    auto [ec] = co_await state.lanesDone.async_send(
        boost::system::error_code{}, boost::asio::as_tuple(boost::asio::use_awaitable));
    if (ec)
        spdlog::debug("lane exit notification: {}", ec.message());
}

boost::asio::awaitable<Result<void>>
FileOrchestrator::downloadFile(const FilePlan& file, std::shared_ptr<ProgressSink> progress,
                               std::shared_ptr<CancellationSignal> cancel) {
    if (cancel->requested())
        co_return Error{ErrorCode::OperationCancelled}.withPath(file.targetPath);
    if (file.chunks)
        co_return co_await downloadChunked(file, std::move(progress), std::move(cancel));
    co_return co_await downloadWhole(file, std::move(progress), std::move(cancel));
}

boost::asio::awaitable<Result<void>>
FileOrchestrator::downloadChunked(const FilePlan& file, std::shared_ptr<ProgressSink> progress,
                                  std::shared_ptr<CancellationSignal> cancel) {
    using namespace boost::asio::experimental::awaitable_operators;

    const auto& chunks = *file.chunks;
    spdlog::info("{}: {} chunk(s) from {}", file.targetPath.string(), chunks.size(),
                 file.sourceUrl);

    FileWriter writer(runtime_.scheduler(), runtime_.blocking(), file.targetPath,
                      file.expectedSize, OpenMode::Preserve, chunks.size() + 1, progress, cancel);
    DownloadWorkerPool pool(runtime_.scheduler(), runtime_.blocking(), http_,
                            WorkerPoolOptions{config_.maxThreadsPerFile,
                                              config_.verifyChunkChecksums,
                                              config_.chunkRetryAttempts},
                            cancel);

    auto drive = [&]() -> boost::asio::awaitable<Result<void>> {
        auto fetched = co_await pool.run(file, writer.inbox());
        // The writer always gets its finish command, also after a failure
        auto [ec] = co_await writer.inbox().async_send(
            boost::system::error_code{}, WriteCommand{FinishWriting{}},
            boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec && fetched) {
            co_return Error{ErrorCode::InternalError, "Writer inbox closed: " + ec.message()}
                .withPath(file.targetPath);
        }
        co_return fetched;
    };

    auto [written, fetched] = co_await (writer.run() && drive());
    if (!written)
        co_return written;
    co_return fetched;
}

boost::asio::awaitable<Result<void>>
FileOrchestrator::downloadWhole(const FilePlan& file, std::shared_ptr<ProgressSink> progress,
                                std::shared_ptr<CancellationSignal> cancel) {
    spdlog::info("{}: single request to {}", file.targetPath.string(), file.sourceUrl);

    // Checked before the target is truncated or any byte is requested
    if (file.wholeFileChecksum && !isVerifiable(file.wholeFileChecksum->algo)) {
        co_return Error{ErrorCode::UnsupportedAlgorithm,
                        fmt::format("Cannot compute {} digests",
                                    hashAlgoName(file.wholeFileChecksum->algo))}
            .withPath(file.targetPath)
            .withUrl(file.sourceUrl);
    }

    co_return co_await offload(runtime_.blocking(), [&]() -> Result<void> {
        auto opened = TargetFile::open(file.targetPath, std::nullopt, OpenMode::Truncate);
        if (!opened)
            return opened.error();
        auto target = std::move(opened).value();

        // A transport retry replays the body from offset 0; count each byte once
        std::uint64_t highWater = 0;
        auto received = http_->getFull(
            file.sourceUrl, [&](std::uint64_t offset, ByteSpan bytes) -> Result<void> {
                if (cancel->requested())
                    return Error{ErrorCode::OperationCancelled};
                if (auto w = target.writeAt(offset, bytes); !w)
                    return w;
                const auto end = offset + bytes.size();
                if (end > highWater) {
                    if (progress)
                        progress->progressed(end - highWater);
                    highWater = end;
                }
                return Result<void>{};
            });
        if (!received)
            return Error{received.error()}.withPath(file.targetPath).withUrl(file.sourceUrl);

        if (received.value() < highWater) {
            if (auto t = target.truncate(received.value()); !t)
                return t;
        }
        if (auto f = target.finish(); !f)
            return f;

        if (file.expectedSize && *file.expectedSize != received.value()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Expected {} byte(s), received {}", *file.expectedSize,
                                     received.value())}
                .withPath(file.targetPath)
                .withUrl(file.sourceUrl);
        }

        if (file.wholeFileChecksum) {
            auto matches = ChecksumEngine::validateFile(*file.wholeFileChecksum, file.targetPath);
            if (!matches)
                return Error{matches.error()}.withPath(file.targetPath);
            if (!matches.value()) {
                return Error{ErrorCode::ChecksumMismatch,
                             fmt::format("Downloaded file does not match its {} digest",
                                         hashAlgoName(file.wholeFileChecksum->algo))}
                    .withPath(file.targetPath)
                    .withUrl(file.sourceUrl);
            }
        }
        return Result<void>{};
    });
}

Result<void> FileOrchestrator::execute(Plan plan, ProgressCallback onProgress) {
    std::promise<Result<void>> done;
    auto future = done.get_future();

    boost::asio::co_spawn(
        runtime_.scheduler(),
        [this, &done, plan = std::move(plan),
         onProgress = std::move(onProgress)]() mutable -> boost::asio::awaitable<void> {
            auto result = co_await run(std::move(plan), std::move(onProgress));
            done.set_value(std::move(result));
        },
        [&done](std::exception_ptr ep) {
            if (!ep)
                return;
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                done.set_value(Error{ErrorCode::InternalError, e.what()});
            } catch (...) {
                done.set_value(Error{ErrorCode::InternalError, "Unknown exception in download run"});
            }
        });

    return future.get();
}

} // namespace mlget::downloader
