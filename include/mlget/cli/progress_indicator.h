#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include <mlget/downloader/downloader.hpp>

namespace mlget::cli {

/**
 * @brief Renders download progress snapshots on stderr
 *
 * Bar style on a terminal, a plain percentage line otherwise. Safe to call
 * from the thread delivering progress events.
 */
class ProgressIndicator {
public:
    enum class Style {
        Percentage, // [ 45%] 12.0 MiB / 26.7 MiB
        Bar         // [########............] 45% 12.0 MiB / 26.7 MiB
    };

    explicit ProgressIndicator(Style style = Style::Bar);
    ~ProgressIndicator();

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;

    // Style::Bar on a terminal, Style::Percentage when stderr is redirected
    static Style defaultStyle();

    void update(const downloader::ProgressEvent& event);
    void stop();

    // "12.0 MiB"
    static std::string formatBytes(std::uint64_t bytes);
    // Rendered line without carriage return, exposed for tests
    std::string renderLine(const downloader::ProgressEvent& event) const;

private:
    Style style_;
    bool active_{false};
    std::size_t lastWidth_{0};
    std::mutex mutex_;
};

} // namespace mlget::cli
