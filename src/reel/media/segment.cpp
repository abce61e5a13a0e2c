// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/segment.hpp>

namespace reel::media {

std::error_code validate_sequence(const SegmentList& segments) noexcept {
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].sequence_index != i) {
            return make_error_code(core::AcquireErrc::missing_segments);
        }
    }
    return {};
}

double total_duration(const SegmentList& segments) noexcept {
    double total = 0.0;
    for (const auto& seg : segments) {
        total += seg.duration;
    }
    return total;
}

} // namespace reel::media
