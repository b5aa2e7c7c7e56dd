#include <spdlog/spdlog.h>
#include <filesystem>
#include <mlget/cli/command.h>
#include <mlget/cli/download_runner.h>
#include <mlget/cli/mlget_cli.h>
#include <mlget/config/downloader_config.h>
#include <mlget/downloader/http_client.hpp>
#include <mlget/downloader/plan_builder.hpp>

namespace mlget::cli {

namespace fs = std::filesystem;

class DownloadFileCommand : public ICommand {
public:
    std::string getName() const override { return "download-file"; }

    std::string getDescription() const override {
        return "Download a single URL, in parallel 1 MiB ranges when the server reports a size";
    }

    void registerCommand(CLI::App& app, MlgetCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("download-file", getDescription());
        cmd->add_option("url", url_, "HTTPS URL to download")->required();
        cmd->add_option("-d,--target-dir", targetDir_, "Directory to write into")
            ->default_val(".");
        userAgentOpt_ = cmd->add_option("--user-agent", userAgent_, "User-Agent header");
        maxThreadsOpt_ = cmd->add_option("-t,--max-threads", maxThreads_,
                                         "Threads for this file, one of them writing (min 2)");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfg = cli_->loadDownloaderConfig();
        if (!cfg)
            return cfg.error();
        auto config = std::move(cfg).value();
        if (userAgentOpt_->count() > 0)
            config.userAgent = userAgent_;
        if (maxThreadsOpt_->count() > 0)
            config.maxThreadsPerFile = maxThreads_;
        if (auto valid = config::validate_downloader_config(config, 2); !valid)
            return valid.error();

        downloader::HttpClientOptions httpOptions;
        httpOptions.userAgent = config.userAgent;
        httpOptions.timeout = config.requestTimeout;
        httpOptions.tls = config.tls;
        httpOptions.retry = config.retry;
        auto size = downloader::makeHttpClient(httpOptions)->headSize(url_);
        if (!size)
            return Error{size.error()}.withUrl(url_);
        spdlog::debug("{}: server reports {}", url_,
                      size.value() ? std::to_string(*size.value()) + " byte(s)" : "no size");

        downloader::PlanBuilder builder(fs::path(targetDir_));
        auto plan = builder.planForUrl(url_, size.value());
        if (!plan)
            return plan.error();

        return runDownloadPlan(plan.value(), config);
    }

private:
    MlgetCLI* cli_ = nullptr;
    std::string url_;
    std::string targetDir_ = ".";
    std::string userAgent_;
    int maxThreads_ = 4;
    CLI::Option* userAgentOpt_ = nullptr;
    CLI::Option* maxThreadsOpt_ = nullptr;
};

// Factory function
std::unique_ptr<ICommand> createDownloadFileCommand() {
    return std::make_unique<DownloadFileCommand>();
}

} // namespace mlget::cli
