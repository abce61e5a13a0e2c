// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/chunk_fetcher.hpp>
#include <reel/core/config.hpp>
#include <reel/core/progress.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace reel::core {

struct DirectOptions {
    std::uint32_t attempt_budget{DEFAULT_ATTEMPT_BUDGET};
    std::uint32_t connections{DEFAULT_DIRECT_CONNECTIONS};   // >1 enables byte-range splitting
    std::uint64_t min_ranged_size{MIN_RANGED_FILE_SIZE};
    std::optional<std::uint64_t> expected_size;              // Verified when set
};

struct DirectResult {
    std::filesystem::path path;
    std::uint64_t bytes{0};
    std::uint32_t attempts{0};        // Summed over every request made
    std::uint32_t ranges{1};          // 1 for a single request
};

// Whole-file acquisition sharing the segment retry machinery
class DirectFetcher {
public:
    DirectFetcher(const ChunkFetcher& fetcher, DirectOptions options) noexcept
        : fetcher_(fetcher), options_(options) {}

    // Fetch `url` into `output_path` through `<output>.partial`. With more
    // than one connection and a server that accepts ranges, the file is
    // split into byte ranges fetched in parallel; otherwise, or when the
    // probe fails, a single request is made.
    [[nodiscard]] std::expected<DirectResult, FetchError>
    fetch_direct(const std::string& url,
                 const std::filesystem::path& output_path,
                 const ProgressCallback& on_progress = {},
                 std::stop_token stop = {}) const;

    [[nodiscard]] const DirectOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::expected<DirectResult, FetchError>
    fetch_single(const std::string& url,
                 const std::filesystem::path& output_path,
                 const ProgressCallback& on_progress,
                 std::stop_token stop) const;

    [[nodiscard]] std::expected<DirectResult, FetchError>
    fetch_ranged(const std::string& url,
                 std::uint64_t size,
                 const std::filesystem::path& output_path,
                 const ProgressCallback& on_progress,
                 std::stop_token stop,
                 bool& fall_back) const;

    [[nodiscard]] std::error_code verify_size(std::uint64_t bytes) const noexcept;

    const ChunkFetcher& fetcher_;
    DirectOptions options_;
};

// Split [0, size) into `parts` contiguous ranges of near-equal length
[[nodiscard]] std::vector<ByteRange> split_ranges(std::uint64_t size, std::uint32_t parts);

} // namespace reel::core
