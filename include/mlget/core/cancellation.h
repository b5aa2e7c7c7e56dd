#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace mlget {

/**
 * Cooperative cancellation flag that coroutines can also await.
 *
 * request() is idempotent and thread-safe. Waiters are released by closing an
 * internal channel, so a wait() that starts after the request completes at once.
 * Children created with child() are cancelled together with their parent but
 * can be cancelled on their own.
 */
class CancellationSignal : public std::enable_shared_from_this<CancellationSignal> {
public:
    static std::shared_ptr<CancellationSignal> create(boost::asio::any_io_executor executor);

    std::shared_ptr<CancellationSignal> child();

    void request();
    bool requested() const noexcept { return requested_.load(std::memory_order_acquire); }

    // Completes once request() has been called (or the awaiting operation is cancelled).
    boost::asio::awaitable<void> wait();

private:
    explicit CancellationSignal(boost::asio::any_io_executor executor);

    using Channel = boost::asio::experimental::concurrent_channel<boost::asio::any_io_executor,
                                                                  void(boost::system::error_code)>;

    boost::asio::any_io_executor executor_;
    std::atomic<bool> requested_{false};
    Channel channel_;
    std::mutex mutex_;
    std::vector<std::weak_ptr<CancellationSignal>> children_;
};

} // namespace mlget
