#include <spdlog/spdlog.h>
#include <filesystem>
#include <mlget/cli/command.h>
#include <mlget/cli/download_runner.h>
#include <mlget/cli/mlget_cli.h>
#include <mlget/config/downloader_config.h>
#include <mlget/downloader/plan_builder.hpp>
#include <mlget/manifest/manifest.h>

namespace mlget::cli {

namespace fs = std::filesystem;

class DownloadMetalinkCommand : public ICommand {
public:
    std::string getName() const override { return "download-metalink"; }

    std::string getDescription() const override {
        return "Download every file of a manifest, resuming and verifying against its digests";
    }

    void registerCommand(CLI::App& app, MlgetCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("download-metalink", getDescription());
        cmd->add_option("manifest", manifestPath_, "Metalink 4 (.meta4) or JSON manifest file")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("-d,--target-dir", targetDir_, "Directory to write into")
            ->default_val(".");
        userAgentOpt_ = cmd->add_option("--user-agent", userAgent_, "User-Agent header");
        maxThreadsOpt_ = cmd->add_option("--max-threads-per-file", maxThreadsPerFile_,
                                         "Threads per file, one of them writing");
        maxFilesOpt_ = cmd->add_option("--max-parallel-files", maxParallelFiles_,
                                       "Files downloaded at the same time");
        cmd->add_flag("--no-verify-chunks", noVerifyChunks_,
                      "Write chunks without checking their digests");
        policyOpt_ = cmd->add_option("--failure-policy", failurePolicy_,
                                     "What a failed file cancels: cancel-run or cancel-file")
                         ->check(CLI::IsMember({"cancel-run", "cancel-file"}));
        cmd->add_flag("--no-progress", noProgress_, "Do not render progress on stderr");

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
            config.maxThreadsPerFile = maxThreadsPerFile_;
        if (maxFilesOpt_->count() > 0)
            config.maxParallelFiles = maxParallelFiles_;
        if (noVerifyChunks_)
            config.verifyChunkChecksums = false;
        if (policyOpt_->count() > 0) {
            auto policy = downloader::parseFailurePolicy(failurePolicy_);
            if (!policy)
                return Error{ErrorCode::InvalidArgument,
                             "Unknown failure policy: " + failurePolicy_};
            config.failurePolicy = *policy;
        }
        if (auto valid = config::validate_downloader_config(config, 1); !valid)
            return valid.error();

        auto descriptors = manifest::loadManifest(manifestPath_);
        if (!descriptors)
            return descriptors.error();

        downloader::PlanBuilder builder(fs::path(targetDir_));
        auto plan = builder.build(descriptors.value());
        if (!plan)
            return plan.error();
        auto remaining = builder.minimize(plan.value());
        if (!remaining)
            return remaining.error();

        const auto skipped = plan.value().files.size() - remaining.value().files.size();
        if (skipped > 0)
            spdlog::info("{} file(s) already complete", skipped);

        RunOptions options;
        options.showProgress = !noProgress_;
        return runDownloadPlan(remaining.value(), config, options);
    }

private:
    MlgetCLI* cli_ = nullptr;
    std::string manifestPath_;
    std::string targetDir_ = ".";
    std::string userAgent_;
    int maxThreadsPerFile_ = 4;
    int maxParallelFiles_ = 2;
    bool noVerifyChunks_ = false;
    std::string failurePolicy_;
    bool noProgress_ = false;
    CLI::Option* userAgentOpt_ = nullptr;
    CLI::Option* maxThreadsOpt_ = nullptr;
    CLI::Option* maxFilesOpt_ = nullptr;
    CLI::Option* policyOpt_ = nullptr;
};

// Factory function
std::unique_ptr<ICommand> createDownloadMetalinkCommand() {
    return std::make_unique<DownloadMetalinkCommand>();
}

} // namespace mlget::cli
