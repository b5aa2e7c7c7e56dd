#include <algorithm>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <mlget/cli/progress_indicator.h>

#include <unistd.h>

namespace mlget::cli {

namespace {

constexpr int kBarWidth = 24;

std::string formatEta(std::uint32_t seconds) {
    std::ostringstream oss;
    if (seconds >= 3600) {
        oss << seconds / 3600 << "h" << std::setw(2) << std::setfill('0') << (seconds % 3600) / 60
            << "m";
    } else if (seconds >= 60) {
        oss << seconds / 60 << "m" << std::setw(2) << std::setfill('0') << seconds % 60 << "s";
    } else {
        oss << seconds << "s";
    }
    return oss.str();
}

} // namespace

ProgressIndicator::ProgressIndicator(Style style) : style_(style) {}

ProgressIndicator::~ProgressIndicator() {
    stop();
}

ProgressIndicator::Style ProgressIndicator::defaultStyle() {
    return ::isatty(STDERR_FILENO) ? Style::Bar : Style::Percentage;
}

std::string ProgressIndicator::formatBytes(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << value << " " << kUnits[unit];
    }
    return oss.str();
}

std::string ProgressIndicator::renderLine(const downloader::ProgressEvent& event) const {
    std::ostringstream oss;
    if (event.percentage) {
        const int percent = static_cast<int>(*event.percentage);
        if (style_ == Style::Bar) {
            const int filled = std::min(kBarWidth, percent * kBarWidth / 100);
            oss << "[" << std::string(static_cast<std::size_t>(filled), '#')
                << std::string(static_cast<std::size_t>(kBarWidth - filled), '.') << "] ";
            oss << std::setw(3) << percent << "% ";
        } else {
            oss << "[" << std::setw(3) << percent << "%] ";
        }
        oss << formatBytes(event.downloadedBytes) << " / " << formatBytes(event.totalBytes);
    } else {
        oss << formatBytes(event.downloadedBytes);
    }
    if (event.speedBps)
        oss << "  " << formatBytes(*event.speedBps) << "/s";
    if (event.etaSeconds && !event.finished)
        oss << "  ETA " << formatEta(*event.etaSeconds);
    return oss.str();
}

void ProgressIndicator::update(const downloader::ProgressEvent& event) {
    std::lock_guard lock(mutex_);
    auto line = renderLine(event);
    std::string pad;
    if (line.size() < lastWidth_)
        pad.assign(lastWidth_ - line.size(), ' ');
    lastWidth_ = line.size();
    active_ = true;

    if (style_ == Style::Bar) {
        std::cerr << "\r" << line << pad << std::flush;
        if (event.finished) {
            std::cerr << "\n";
            active_ = false;
        }
    } else {
        std::cerr << line << "\n";
        active_ = !event.finished;
    }
}

void ProgressIndicator::stop() {
    std::lock_guard lock(mutex_);
    if (!active_)
        return;
    if (style_ == Style::Bar)
        std::cerr << "\n" << std::flush;
    active_ = false;
}

} // namespace mlget::cli
