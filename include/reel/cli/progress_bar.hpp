// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/progress.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace reel::cli {

// Minimal segment progress bar for CLI. Not thread-safe; the scheduler
// already serialises progress callbacks.
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // Redraw for a new snapshot
    void update(const core::ProgressSnapshot& snapshot) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    [[nodiscard]] static std::string format_speed(std::uint64_t bps) noexcept;
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes) noexcept;
    [[nodiscard]] static std::string format_time(std::uint64_t seconds) noexcept;

private:
    void draw(const core::ProgressSnapshot& snapshot) noexcept;
    [[nodiscard]] static std::string render_bar(double percent) noexcept;

    core::ProgressSnapshot last_;
    std::string label_;
    bool drawn_{false};
    bool finished_{false};
};

} // namespace reel::cli
