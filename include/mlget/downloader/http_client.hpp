#pragma once

#include <mlget/downloader/downloader.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace mlget::downloader {

/**
 * Transport settings shared by every request of a client.
 */
struct HttpClientOptions {
    std::string userAgent;
    std::chrono::milliseconds timeout{kDefaultRequestTimeout};
    TlsConfig tls{};
    RetryPolicy retry{};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * HTTPS-only libcurl client with compression, fixed timeout and a shared
 * connection/DNS/TLS-session cache. Performs exactly one attempt per call.
 */
std::shared_ptr<IHttpClient> makeCurlHttpClient(const HttpClientOptions& options);

/**
 * Decorator retrying transient failures (network, timeout, 5xx/408/429) with
 * jittered exponential backoff, up to policy.maxAttempts attempts in total.
 * `sleeper` defaults to std::this_thread::sleep_for.
 */
std::shared_ptr<IHttpClient> makeRetryingHttpClient(std::shared_ptr<IHttpClient> inner,
                                                     RetryPolicy policy, Sleeper sleeper = {});

/**
 * Curl client wrapped in the retry decorator.
 */
std::shared_ptr<IHttpClient> makeHttpClient(const HttpClientOptions& options);

bool isTransient(const Error& error);

// Delay before retry number `attempt` (1-based), jitter in [0, 1].
std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int attempt, double jitter);

} // namespace mlget::downloader
