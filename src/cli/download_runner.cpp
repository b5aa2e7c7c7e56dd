#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <sstream>
#include <thread>
#include <mlget/cli/download_runner.h>
#include <mlget/cli/progress_indicator.h>
#include <mlget/core/async.h>
#include <mlget/downloader/http_client.hpp>
#include <mlget/downloader/orchestrator.hpp>

namespace mlget::cli {

using namespace mlget::downloader;

Result<void> runDownloadPlan(const Plan& plan, const DownloaderConfig& config,
                             const RunOptions& options) {
    if (plan.files.empty()) {
        spdlog::info("Nothing to download");
        return Result<void>{};
    }

    HttpClientOptions httpOptions;
    httpOptions.userAgent = config.userAgent;
    httpOptions.timeout = config.requestTimeout;
    httpOptions.tls = config.tls;
    httpOptions.retry = config.retry;

    unsigned int schedulerThreads = std::thread::hardware_concurrency();
    if (schedulerThreads == 0)
        schedulerThreads = 2;
    schedulerThreads = std::min(schedulerThreads, 4u);

    Runtime runtime(schedulerThreads, FileOrchestrator::blockingThreadsFor(config));
    FileOrchestrator orchestrator(runtime, makeHttpClient(httpOptions), config);

    std::unique_ptr<ProgressIndicator> indicator;
    ProgressCallback onProgress;
    if (options.showProgress) {
        indicator = std::make_unique<ProgressIndicator>(ProgressIndicator::defaultStyle());
        onProgress = [&indicator](const ProgressEvent& event) { indicator->update(event); };
    }

    auto result = orchestrator.execute(plan, onProgress);
    if (indicator)
        indicator->stop();
    return result;
}

std::string describePlan(const Plan& plan) {
    std::ostringstream oss;
    for (const auto& file : plan.files) {
        oss << file.targetPath.string() << "\n";
        oss << "  url:      " << file.sourceUrl << "\n";
        oss << "  size:     "
            << (file.expectedSize ? std::to_string(*file.expectedSize) : std::string("unknown"))
            << "\n";
        if (file.chunks) {
            oss << "  chunks:   " << file.chunks->size();
            if (!file.chunks->empty() && file.chunks->front().checksum)
                oss << " (" << hashAlgoName(file.chunks->front().checksum->algo) << ")";
            oss << "\n";
        } else {
            oss << "  chunks:   single request\n";
        }
        if (file.wholeFileChecksum) {
            oss << "  checksum: " << hashAlgoName(file.wholeFileChecksum->algo) << ":"
                << file.wholeFileChecksum->hex << "\n";
        }
    }
    oss << plan.files.size() << " file(s), " << plan.totalSize << " byte(s) to transfer\n";
    return oss.str();
}

} // namespace mlget::cli
