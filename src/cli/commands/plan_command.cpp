#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>
#include <mlget/cli/command.h>
#include <mlget/cli/download_runner.h>
#include <mlget/cli/mlget_cli.h>
#include <mlget/downloader/plan_builder.hpp>
#include <mlget/manifest/manifest.h>

namespace mlget::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json checksumToJson(const downloader::Checksum& c) {
    return json{{"type", std::string(downloader::hashAlgoName(c.algo))}, {"value", c.hex}};
}

json planToJson(const downloader::Plan& plan) {
    json files = json::array();
    for (const auto& file : plan.files) {
        json entry{{"path", file.targetPath.string()}, {"url", file.sourceUrl}};
        entry["size"] = file.expectedSize ? json(*file.expectedSize) : json(nullptr);
        entry["checksum"] =
            file.wholeFileChecksum ? checksumToJson(*file.wholeFileChecksum) : json(nullptr);
        if (file.chunks) {
            json chunks = json::array();
            for (const auto& chunk : *file.chunks) {
                json c{{"start", chunk.start}, {"end", chunk.end}};
                c["checksum"] = chunk.checksum ? checksumToJson(*chunk.checksum) : json(nullptr);
                chunks.push_back(std::move(c));
            }
            entry["chunks"] = std::move(chunks);
        } else {
            entry["chunks"] = nullptr;
        }
        files.push_back(std::move(entry));
    }
    return json{{"files", std::move(files)}, {"total_size", plan.totalSize}};
}

} // namespace

class PlanCommand : public ICommand {
public:
    std::string getName() const override { return "plan"; }

    std::string getDescription() const override {
        return "Show the download plan for a manifest and what remains after checking disk";
    }

    void registerCommand(CLI::App& app, MlgetCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("plan", getDescription());
        cmd->add_option("manifest", manifestPath_, "Metalink 4 (.meta4) or JSON manifest file")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("-d,--target-dir", targetDir_, "Directory the files would be written to")
            ->default_val(".");
        cmd->add_flag("--json", json_, "Print both plans as JSON on stdout");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
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

        if (json_) {
            json out{{"plan", planToJson(plan.value())},
                     {"minimized", planToJson(remaining.value())}};
            std::cout << out.dump(2) << std::endl;
            return Result<void>{};
        }

        std::cout << "Plan:\n" << describePlan(plan.value()) << "\n";
        std::cout << "Remaining after checking " << builder.baseDir().string() << ":\n"
                  << describePlan(remaining.value());
        return Result<void>{};
    }

private:
    MlgetCLI* cli_ = nullptr;
    std::string manifestPath_;
    std::string targetDir_ = ".";
    bool json_ = false;
};

// Factory function
std::unique_ptr<ICommand> createPlanCommand() {
    return std::make_unique<PlanCommand>();
}

} // namespace mlget::cli
