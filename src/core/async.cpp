#include <mlget/core/async.h>

#include <algorithm>

namespace mlget {

Runtime::Runtime(std::size_t schedulerThreads, std::size_t blockingThreads)
    : scheduler_(std::max<std::size_t>(1, schedulerThreads)),
      blocking_(std::max<std::size_t>(1, blockingThreads)) {}

Runtime::~Runtime() {
    scheduler_.stop();
    blocking_.stop();
    scheduler_.join();
    blocking_.join();
}

} // namespace mlget
