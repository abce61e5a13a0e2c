// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/chunk_fetcher.hpp>
#include <reel/core/progress.hpp>
#include <reel/disk/spool.hpp>
#include <reel/media/segment.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stop_token>

namespace reel::core {

enum class SegmentStatus : std::uint8_t {
    pending,
    success,
    failed
};

// Outcome of one segment fetch. The body lives in the spool file.
struct SegmentResult {
    std::uint32_t sequence_index{0};
    SegmentStatus status{SegmentStatus::pending};
    std::filesystem::path spool_path;
    std::uint64_t bytes{0};
    std::uint32_t attempts{0};
    std::optional<FetchError> error;

    [[nodiscard]] bool ok() const noexcept { return status == SegmentStatus::success; }
};

using ResultMap = std::map<std::uint32_t, SegmentResult>;

// Bounded worker pool over a segment list. Each run owns its progress
// state and results; nothing is kept between runs.
class ConcurrencyScheduler {
public:
    ConcurrencyScheduler(const ChunkFetcher& fetcher,
                         std::uint32_t attempt_budget,
                         const disk::SpoolDirectory& spool) noexcept
        : fetcher_(fetcher), attempt_budget_(attempt_budget), spool_(spool) {}

    // Fetch every segment with at most `concurrency_limit` in flight and
    // return once all workers have joined. After a stop request no new
    // segment is dispatched; segments never dispatched are absent from
    // the result. A limit of 0 records every segment as failed.
    [[nodiscard]] ResultMap run(const media::SegmentList& segments,
                                std::uint32_t concurrency_limit,
                                const ProgressCallback& on_progress = {},
                                std::stop_token stop = {}) const;

private:
    const ChunkFetcher& fetcher_;
    std::uint32_t attempt_budget_;
    const disk::SpoolDirectory& spool_;
};

// Indices in 0..expected_count-1 without a successful result, ascending
[[nodiscard]] std::vector<std::uint32_t> missing_indices(const ResultMap& results,
                                                         std::uint32_t expected_count);

} // namespace reel::core
