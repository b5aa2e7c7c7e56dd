#include <mlget/core/cancellation.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>

namespace mlget {

CancellationSignal::CancellationSignal(boost::asio::any_io_executor executor)
    : executor_(executor), channel_(executor, 0) {}

std::shared_ptr<CancellationSignal>
CancellationSignal::create(boost::asio::any_io_executor executor) {
    return std::shared_ptr<CancellationSignal>(new CancellationSignal(std::move(executor)));
}

std::shared_ptr<CancellationSignal> CancellationSignal::child() {
    auto c = create(executor_);
    {
        std::lock_guard lock(mutex_);
        if (!requested()) {
            std::erase_if(children_, [](const auto& w) { return w.expired(); });
            children_.push_back(c);
            return c;
        }
    }
    c->request();
    return c;
}

void CancellationSignal::request() {
    if (requested_.exchange(true, std::memory_order_acq_rel))
        return;
    channel_.close();

    std::vector<std::weak_ptr<CancellationSignal>> children;
    {
        std::lock_guard lock(mutex_);
        children.swap(children_);
    }
    for (auto& w : children) {
        if (auto c = w.lock())
            c->request();
    }
}

boost::asio::awaitable<void> CancellationSignal::wait() {
    auto self = shared_from_this();
    if (requested())
        co_return;
    // Nothing is ever sent; the receive ends with channel_closed on request()
    auto [ec] = co_await channel_.async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
    static_cast<void>(ec);
}

} // namespace mlget
