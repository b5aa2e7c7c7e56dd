#include <mlget/downloader/http_client.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace mlget::downloader {

bool isTransient(const Error& error) {
    switch (error.code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ServerError:
            return true;
        default:
            return false;
    }
}

std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int attempt, double jitter) {
    const double initial = static_cast<double>(policy.initialBackoff.count());
    const double ceiling = static_cast<double>(policy.maxBackoff.count());
    const double base =
        std::min(initial * std::pow(policy.multiplier, std::max(0, attempt - 1)), ceiling);
    // Full range is [base/2, base], then clamped into [initial, max]
    const double jittered = base * (0.5 + 0.5 * std::clamp(jitter, 0.0, 1.0));
    const double delay = std::clamp(jittered, std::min(initial, ceiling), ceiling);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(delay)));
}

namespace {

double next_jitter() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

class RetryingHttpClient final : public IHttpClient {
public:
    RetryingHttpClient(std::shared_ptr<IHttpClient> inner, RetryPolicy policy, Sleeper sleeper)
        : inner_(std::move(inner)), policy_(policy), sleeper_(std::move(sleeper)) {
        if (!sleeper_) {
            sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
        }
    }

    Result<std::optional<std::uint64_t>> headSize(std::string_view url) override {
        return withRetry("HEAD", url, [&] { return inner_->headSize(url); });
    }

    Result<ByteVector> getRange(std::string_view url, std::uint64_t start,
                                std::uint64_t end) override {
        return withRetry("GET range", url, [&] { return inner_->getRange(url, start, end); });
    }

    Result<std::uint64_t> getFull(std::string_view url, const BodySink& sink) override {
        return withRetry("GET", url, [&] { return inner_->getFull(url, sink); });
    }

private:
    template <typename Fn>
    auto withRetry(std::string_view method, std::string_view url, Fn&& fn) -> decltype(fn()) {
        const int attempts = std::max(1, policy_.maxAttempts);
        for (int attempt = 1;; ++attempt) {
            auto r = fn();
            if (r)
                return r;
            if (!isTransient(r.error()))
                return r;
            if (attempt >= attempts) {
                spdlog::warn("{} {} failed after {} attempt(s): {}", method, url, attempt,
                             r.error().message);
                return r;
            }
            auto delay = backoffDelay(policy_, attempt, next_jitter());
            spdlog::warn("{} {} failed (attempt {}/{}): {}; retrying in {} ms", method, url,
                         attempt, attempts, r.error().message, delay.count());
            sleeper_(delay);
        }
    }

    std::shared_ptr<IHttpClient> inner_;
    RetryPolicy policy_;
    Sleeper sleeper_;
};

} // namespace

std::shared_ptr<IHttpClient> makeRetryingHttpClient(std::shared_ptr<IHttpClient> inner,
                                                     RetryPolicy policy, Sleeper sleeper) {
    return std::make_shared<RetryingHttpClient>(std::move(inner), policy, std::move(sleeper));
}

std::shared_ptr<IHttpClient> makeHttpClient(const HttpClientOptions& options) {
    return makeRetryingHttpClient(makeCurlHttpClient(options), options.retry);
}

} // namespace mlget::downloader
