// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/http_session.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace reel::media {

// One independently fetchable chunk of a stream, in play order
struct SegmentDescriptor {
    std::uint32_t sequence_index{0};
    std::string url;
    std::optional<core::ByteRange> byte_range;
    std::optional<std::uint64_t> estimated_bytes;
    double duration{0.0};                  // Seconds; 0 for init segments
    bool is_init{false};                   // Initialisation section ahead of media
};

using SegmentList = std::vector<SegmentDescriptor>;

// Indices must be exactly 0..N-1 in list order.
// Returns AcquireErrc::missing_segments for a gap or duplicate.
[[nodiscard]] std::error_code validate_sequence(const SegmentList& segments) noexcept;

// Sum of declared durations, in seconds
[[nodiscard]] double total_duration(const SegmentList& segments) noexcept;

} // namespace reel::media
