#pragma once

#include <mlget/core/types.h>
#include <mlget/downloader/downloader.hpp>

#include <filesystem>
#include <string>

namespace mlget::config {

// "mlget/<version>"
std::string default_user_agent();

downloader::DownloaderConfig default_downloader_config();

/**
 * Overlay the [download] section of a TOML file onto `base`.
 *
 * Recognized keys: user_agent, max_threads_per_file, max_parallel_files,
 * verify_chunk_checksums, chunk_retry_attempts, timeout_ms, retry.max_attempts,
 * retry.initial_backoff_ms, retry.max_backoff_ms, failure_policy, ca_path.
 * A missing file leaves `base` unchanged; a malformed value is InvalidArgument.
 */
Result<downloader::DownloaderConfig> load_downloader_config(const std::filesystem::path& path,
                                                            downloader::DownloaderConfig base);

// Overlay MLGET_USER_AGENT, MLGET_MAX_THREADS and MLGET_MAX_PARALLEL_FILES.
Result<downloader::DownloaderConfig> apply_environment(downloader::DownloaderConfig base);

// Upper bounds; the blocking pool holds files * threads + 2 OS threads.
inline constexpr int kMaxThreadsPerFile = 64;
inline constexpr int kMaxParallelFiles = 64;

// Range checks shared by every entry point; download-file needs two threads.
Result<void> validate_downloader_config(const downloader::DownloaderConfig& config,
                                        int minThreadsPerFile = 1);

} // namespace mlget::config
