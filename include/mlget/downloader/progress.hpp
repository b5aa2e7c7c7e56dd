#pragma once

#include <mlget/downloader/downloader.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace mlget::downloader {

enum class ProgressKind { Progressed, Finished };

using ProgressChannel =
    boost::asio::experimental::concurrent_channel<boost::asio::any_io_executor,
                                                  void(boost::system::error_code, ProgressKind)>;

namespace detail {
struct ProgressState {
    explicit ProgressState(boost::asio::any_io_executor executor) : channel(executor, 64) {}
    std::atomic<std::uint64_t> pending{0};
    ProgressChannel channel;
};
} // namespace detail

// Thread-safe byte counter handed to writers. Never blocks.
class ProgressSink {
public:
    explicit ProgressSink(std::shared_ptr<detail::ProgressState> state) : state_(std::move(state)) {}

    void progressed(std::uint64_t bytes);

private:
    std::shared_ptr<detail::ProgressState> state_;
};

/**
 * Single consumer for progress events of a whole run.
 *
 * Sinks add bytes to a shared counter and nudge the aggregator through a bounded
 * channel; run() folds the counter into snapshots (rate limited to `interval`)
 * and reports a final snapshot with finished=true after finish().
 */
class ProgressAggregator {
public:
    ProgressAggregator(boost::asio::any_io_executor executor, std::uint64_t totalBytes,
                       ProgressCallback callback,
                       std::chrono::milliseconds interval = std::chrono::milliseconds(200));

    std::shared_ptr<ProgressSink> sink() const { return std::make_shared<ProgressSink>(state_); }

    boost::asio::awaitable<void> run();
    boost::asio::awaitable<void> finish();

    std::uint64_t downloaded() const noexcept { return downloaded_.load(); }

private:
    void emit(bool finished);

    std::shared_ptr<detail::ProgressState> state_;
    std::uint64_t totalBytes_;
    ProgressCallback callback_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point startedAt_;
    std::atomic<std::uint64_t> downloaded_{0};
};

} // namespace mlget::downloader
