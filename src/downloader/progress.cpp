#include <mlget/downloader/progress.hpp>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>

namespace mlget::downloader {

void ProgressSink::progressed(std::uint64_t bytes) {
    if (bytes == 0)
        return;
    state_->pending.fetch_add(bytes, std::memory_order_relaxed);
    // A full channel is fine: pending bytes are folded in on the next receive
    static_cast<void>(
        state_->channel.try_send(boost::system::error_code{}, ProgressKind::Progressed));
}

ProgressAggregator::ProgressAggregator(boost::asio::any_io_executor executor,
                                       std::uint64_t totalBytes, ProgressCallback callback,
                                       std::chrono::milliseconds interval)
    : state_(std::make_shared<detail::ProgressState>(executor)), totalBytes_(totalBytes),
      callback_(std::move(callback)), interval_(interval),
      startedAt_(std::chrono::steady_clock::now()) {}

boost::asio::awaitable<void> ProgressAggregator::run() {
    startedAt_ = std::chrono::steady_clock::now();
    auto lastEmit = startedAt_ - interval_;
    for (;;) {
        auto [ec, kind] =
            co_await state_->channel.async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
        downloaded_.fetch_add(state_->pending.exchange(0));
        if (ec || kind == ProgressKind::Finished)
            break;
        auto now = std::chrono::steady_clock::now();
        if (now - lastEmit >= interval_) {
            emit(false);
            lastEmit = now;
        }
    }
    emit(true);
}

boost::asio::awaitable<void> ProgressAggregator::finish() {
    auto [ec] = co_await state_->channel.async_send(
        boost::system::error_code{}, ProgressKind::Finished,
        boost::asio::as_tuple(boost::asio::use_awaitable));
    if (ec)
        state_->channel.close();
}

void ProgressAggregator::emit(bool finished) {
    if (!callback_)
        return;

    ProgressEvent event;
    event.downloadedBytes = downloaded_.load();
    event.totalBytes = totalBytes_;
    event.finished = finished;

    if (totalBytes_ > 0) {
        auto pct = static_cast<float>(event.downloadedBytes) * 100.0f /
                   static_cast<float>(totalBytes_);
        event.percentage = std::min(pct, 100.0f);
    }

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt_);
    if (elapsed.count() > 0.0 && event.downloadedBytes > 0) {
        const double rate = static_cast<double>(event.downloadedBytes) / elapsed.count();
        event.speedBps = static_cast<std::uint64_t>(rate);
        if (totalBytes_ > event.downloadedBytes && rate > 0.0) {
            event.etaSeconds = static_cast<std::uint32_t>(
                static_cast<double>(totalBytes_ - event.downloadedBytes) / rate);
        } else if (totalBytes_ > 0) {
            event.etaSeconds = 0;
        }
    }

    callback_(event);
}

} // namespace mlget::downloader
