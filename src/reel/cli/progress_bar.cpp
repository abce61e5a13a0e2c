// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace reel::cli {

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(const core::ProgressSnapshot& snapshot) noexcept {
    if (finished_ || snapshot.total == 0) return;

    // Only redraw on visible change: every 1% or a new failure
    const auto scaled = static_cast<std::uint64_t>(snapshot.percent());
    const auto last_scaled = static_cast<std::uint64_t>(last_.percent());
    const bool changed = !drawn_ || scaled > last_scaled || snapshot.failed != last_.failed
        || snapshot.finished() == snapshot.total;

    last_ = snapshot;
    if (changed) {
        draw(snapshot);
    }
}

void ProgressBar::draw(const core::ProgressSnapshot& snapshot) noexcept {
    drawn_ = true;
    const double percent = std::clamp(snapshot.percent(), 0.0, 100.0);

    // Build status line
    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);

    line += " ";
    const int pct_int = static_cast<int>(percent);
    if (pct_int < 10) line += " ";
    if (pct_int < 100) line += " ";
    line += std::to_string(pct_int) + "%";

    line += " " + std::to_string(snapshot.finished()) + "/" + std::to_string(snapshot.total);
    line += " (" + format_bytes(snapshot.bytes_so_far) + ")";

    const auto speed = snapshot.speed_bps();
    if (speed > 0) {
        line += " @ ";
        line += format_speed(speed);
    }

    // ETA from the average time per finished segment
    const auto done = snapshot.finished();
    if (done > 0 && done < snapshot.total) {
        const auto per_segment = static_cast<std::uint64_t>(snapshot.elapsed.count()) / done;
        const auto eta = per_segment * (snapshot.total - done) / 1000;
        line += " ETA: ";
        line += format_time(eta);
    }

    if (snapshot.failed > 0) {
        line += " [" + std::to_string(snapshot.failed) + " failed]";
    }

    // Clear rest of line
    line += std::string(10, ' ');

    std::cout << line << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    if (drawn_) {
        draw(last_);
        std::cout << std::endl;
    }
    finished_ = true;
}

void ProgressBar::clear() noexcept {
    if (drawn_) {
        std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
    }
    finished_ = true;
}

std::string ProgressBar::render_bar(double percent) noexcept {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += ">";
    bar.append(static_cast<std::size_t>(std::max(empty, 0)), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    if (bps >= GB) {
        ss << (static_cast<double>(bps) / GB) << " GB/s";
    } else if (bps >= MB) {
        ss << (static_cast<double>(bps) / MB) << " MB/s";
    } else if (bps >= KB) {
        ss << (static_cast<double>(bps) / KB) << " KB/s";
    } else {
        return std::to_string(bps) + " B/s";
    }
    return ss.str();
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    std::ostringstream ss;
    ss << std::fixed;
    if (bytes >= TB) {
        ss << std::setprecision(2) << (static_cast<double>(bytes) / TB) << " TB";
    } else if (bytes >= GB) {
        ss << std::setprecision(2) << (static_cast<double>(bytes) / GB) << " GB";
    } else if (bytes >= MB) {
        ss << std::setprecision(1) << (static_cast<double>(bytes) / MB) << " MB";
    } else if (bytes >= KB) {
        ss << std::setprecision(0) << (static_cast<double>(bytes) / KB) << " KB";
    } else {
        return std::to_string(bytes) + " B";
    }
    return ss.str();
}

std::string ProgressBar::format_time(std::uint64_t seconds) noexcept {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
        return ss.str();
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace reel::cli
