#include <mlget/config/config_helpers.h>
#include <mlget/config/downloader_config.h>
#include <mlget/version.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace mlget::config {

namespace {

Error invalid(const std::string& key, const std::string& value, std::string_view expected) {
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("Invalid value '{}' for {}: expected {}", value, key, expected)};
}

Result<int> parse_int(const std::string& key, const std::string& value) {
    int out = 0;
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last)
        return invalid(key, value, "an integer");
    return out;
}

Result<bool> parse_bool(const std::string& key, std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on")
        return true;
    if (value == "false" || value == "0" || value == "no" || value == "off")
        return false;
    return invalid(key, value, "a boolean");
}

const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

std::string default_user_agent() {
    return std::string("mlget/") + MLGET_VERSION_STRING;
}

downloader::DownloaderConfig default_downloader_config() {
    downloader::DownloaderConfig cfg;
    cfg.userAgent = default_user_agent();
    return cfg;
}

Result<downloader::DownloaderConfig> load_downloader_config(const std::filesystem::path& path,
                                                            downloader::DownloaderConfig base) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}'; using defaults", path.string());
        return base;
    }
    spdlog::debug("Loading [download] settings from {}", path.string());

    auto value = [&path](const char* key) { return parse_config_value(path, "download", key); };

    if (auto v = value("user_agent"); !v.empty())
        base.userAgent = v;
    if (auto v = value("ca_path"); !v.empty())
        base.tls.caPath = expand_tilde(v).string();

    struct IntKey {
        const char* key;
        int* target;
    };
    int timeoutMs = static_cast<int>(base.requestTimeout.count());
    int initialMs = static_cast<int>(base.retry.initialBackoff.count());
    int maxMs = static_cast<int>(base.retry.maxBackoff.count());
    const IntKey intKeys[] = {
        {"max_threads_per_file", &base.maxThreadsPerFile},
        {"max_parallel_files", &base.maxParallelFiles},
        {"chunk_retry_attempts", &base.chunkRetryAttempts},
        {"timeout_ms", &timeoutMs},
        {"retry.max_attempts", &base.retry.maxAttempts},
        {"retry.initial_backoff_ms", &initialMs},
        {"retry.max_backoff_ms", &maxMs},
    };
    for (const auto& k : intKeys) {
        auto raw = value(k.key);
        if (raw.empty())
            continue;
        auto parsed = parse_int(k.key, raw);
        if (!parsed)
            return Error{parsed.error()}.withPath(path);
        *k.target = parsed.value();
    }
    base.requestTimeout = std::chrono::milliseconds(timeoutMs);
    base.retry.initialBackoff = std::chrono::milliseconds(initialMs);
    base.retry.maxBackoff = std::chrono::milliseconds(maxMs);

    if (auto raw = value("verify_chunk_checksums"); !raw.empty()) {
        auto parsed = parse_bool("verify_chunk_checksums", raw);
        if (!parsed)
            return Error{parsed.error()}.withPath(path);
        base.verifyChunkChecksums = parsed.value();
    }

    if (auto raw = value("failure_policy"); !raw.empty()) {
        auto policy = downloader::parseFailurePolicy(raw);
        if (!policy)
            return Error{invalid("failure_policy", raw, "cancel-run or cancel-file")}.withPath(path);
        base.failurePolicy = *policy;
    }

    return base;
}

Result<downloader::DownloaderConfig> apply_environment(downloader::DownloaderConfig base) {
    if (const char* ua = env_value("MLGET_USER_AGENT"))
        base.userAgent = ua;
    if (const char* threads = env_value("MLGET_MAX_THREADS")) {
        auto parsed = parse_int("MLGET_MAX_THREADS", threads);
        if (!parsed)
            return parsed.error();
        base.maxThreadsPerFile = parsed.value();
    }
    if (const char* files = env_value("MLGET_MAX_PARALLEL_FILES")) {
        auto parsed = parse_int("MLGET_MAX_PARALLEL_FILES", files);
        if (!parsed)
            return parsed.error();
        base.maxParallelFiles = parsed.value();
    }
    return base;
}

Result<void> validate_downloader_config(const downloader::DownloaderConfig& config,
                                        int minThreadsPerFile) {
    if (config.maxThreadsPerFile < minThreadsPerFile) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("max threads per file must be at least {} (got {})",
                                 minThreadsPerFile, config.maxThreadsPerFile)};
    }
    if (config.maxThreadsPerFile > kMaxThreadsPerFile) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("max threads per file must be at most {} (got {})",
                                 kMaxThreadsPerFile, config.maxThreadsPerFile)};
    }
    if (config.maxParallelFiles < 1 || config.maxParallelFiles > kMaxParallelFiles) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("max parallel files must be between 1 and {} (got {})",
                                 kMaxParallelFiles, config.maxParallelFiles)};
    }
    if (config.chunkRetryAttempts < 1 || config.retry.maxAttempts < 1) {
        return Error{ErrorCode::InvalidArgument, "retry attempts must be at least 1"};
    }
    if (config.requestTimeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "timeout_ms must be positive"};
    }
    if (config.retry.initialBackoff.count() < 0 ||
        config.retry.maxBackoff < config.retry.initialBackoff) {
        return Error{ErrorCode::InvalidArgument,
                     "retry backoff must satisfy 0 <= initial_backoff_ms <= max_backoff_ms"};
    }
    return Result<void>{};
}

} // namespace mlget::config
