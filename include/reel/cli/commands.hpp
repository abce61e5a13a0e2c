// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/orchestrator.hpp>
#include <reel/core/settings.hpp>
#include <reel/media/descriptor.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace reel::cli {

// Process exit codes
constexpr int EXIT_DONE = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CANCELLED = 130;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string descriptor;          // --descriptor FILE
    std::string output_file;
    std::string output_dir;
    std::string config_path;
    std::string fallback_url;
    std::string mux_output;
    std::optional<std::uint32_t> concurrency;
    std::optional<std::uint32_t> retries;
    std::optional<std::uint32_t> connections;
    std::optional<std::uint32_t> resolution;
    bool lowest{false};
    bool direct{false};
    bool list_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;               // Set when the command line is unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Fold the command line over loaded (or default) settings
[[nodiscard]] std::expected<core::Settings, std::error_code> build_settings(const CliArgs& args);

// Descriptor for a bare URL: direct for known container extensions or
// --direct, segmented otherwise
[[nodiscard]] media::ResolvedMedia media_from_url(const CliArgs& args, const core::Settings& settings);

// Where the acquired file goes
[[nodiscard]] std::filesystem::path output_path_for(const CliArgs& args,
                                                    const core::Settings& settings,
                                                    const media::ResolvedMedia& media);

// Whether a URL names a single media file by its extension
[[nodiscard]] bool is_direct_url(std::string_view url) noexcept;

// Full command: resolve, acquire, optionally mux. Returns an exit code.
[[nodiscard]] int run(const CliArgs& args, std::stop_token stop);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

// List renditions without downloading
[[nodiscard]] int info(const core::AcquisitionOrchestrator& orchestrator, const std::string& url);

} // namespace reel::cli
