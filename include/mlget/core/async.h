#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>

namespace mlget {

/**
 * Executors for a download run: a scheduler pool multiplexing coroutines and a
 * blocking pool for network and file I/O calls that cannot suspend.
 */
class Runtime {
public:
    Runtime(std::size_t schedulerThreads, std::size_t blockingThreads);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    boost::asio::any_io_executor scheduler() { return scheduler_.get_executor(); }
    boost::asio::any_io_executor blocking() { return blocking_.get_executor(); }

private:
    boost::asio::thread_pool scheduler_;
    boost::asio::thread_pool blocking_;
};

/**
 * Run a blocking callable on `executor`; the awaiting coroutine resumes on its own
 * executor with the callable's result. Exceptions propagate to the awaiter.
 */
template <typename Fn>
boost::asio::awaitable<std::invoke_result_t<Fn&>> offload(boost::asio::any_io_executor executor,
                                                          Fn fn) {
    using R = std::invoke_result_t<Fn&>;
    // co_spawn needs a default-constructible value type; Result<T> is not one
    auto out = co_await boost::asio::co_spawn(
        executor,
        [fn = std::move(fn)]() mutable -> boost::asio::awaitable<std::optional<R>> {
            co_return std::optional<R>(fn());
        },
        boost::asio::use_awaitable);
    co_return std::move(*out);
}

} // namespace mlget
