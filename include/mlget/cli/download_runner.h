#pragma once

#include <mlget/core/types.h>
#include <mlget/downloader/downloader.hpp>

#include <string>

namespace mlget::cli {

struct RunOptions {
    bool showProgress{true};
};

/**
 * Execute a plan with the curl transport: sizes the runtime pools from the
 * config, drives the orchestrator and renders progress on stderr.
 */
Result<void> runDownloadPlan(const downloader::Plan& plan,
                             const downloader::DownloaderConfig& config,
                             const RunOptions& options = {});

// One line per file: target, url, size, chunk count, checksum
std::string describePlan(const downloader::Plan& plan);

} // namespace mlget::cli
