// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/http_session.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reel::media {

// One addressable piece of a representation
struct DASHSegment {
    std::string url;
    std::optional<core::ByteRange> byte_range;
    double duration{0.0};               // Seconds; 0 for the initialization segment
    bool is_init{false};
};

// DASH (Dynamic Adaptive Streaming over HTTP) representation
struct DASHRepresentation {
    std::string id;
    std::uint32_t bandwidth{0};     // Bitrate in bps
    std::string mime_type;           // "video/mp4" or "audio/mp4"
    std::string codecs;
    std::uint32_t width{0};
    std::uint32_t height{0};
    double frame_rate{0.0};
    std::string base_url;            // Fully resolved BaseURL chain
    std::vector<DASHSegment> segments;  // Expanded, init first when present
};

// DASH adaptation set (group of representations)
struct DASHAdaptationSet {
    std::string id;
    std::string mime_type;
    std::string content_type;       // "video", "audio" or "text"
    std::string lang;
    std::vector<DASHRepresentation> representations;

    [[nodiscard]] bool is_video() const noexcept;
};

// DASH manifest (MPD). Only the first Period is kept.
struct DASHManifest {
    std::vector<DASHAdaptationSet> adaptation_sets;
    double duration{0.0};           // Presentation duration in seconds
    double min_buffer_time{0.0};
    bool is_live{false};

    // Representation by id, or nullptr
    [[nodiscard]] const DASHRepresentation* find(std::string_view representation_id) const noexcept;
};

// DASH MPD parser
class DASHParser {
public:
    // Parse MPD manifest content and expand every representation's segment
    // list. Fails with AcquireErrc::manifest_parse_error for malformed
    // documents and AcquireErrc::live_stream for type="dynamic".
    [[nodiscard]] static std::expected<DASHManifest, std::error_code>
    parse(std::string_view content, std::string_view base_url) noexcept;

    // Check if URL is a DASH manifest
    [[nodiscard]] static bool is_dash_url(std::string_view url) noexcept;

    // Whether the content has an MPD root element
    [[nodiscard]] static bool is_mpd(std::string_view content) noexcept;
};

// Parse an ISO 8601 duration ("PT1H2M3.5S") into seconds
[[nodiscard]] std::optional<double> parse_iso8601_duration(std::string_view value) noexcept;

// Expand a SegmentTemplate pattern ($Number$, $Time$, $RepresentationID$,
// $Bandwidth$, with optional %0Nd width)
[[nodiscard]] std::string expand_template(std::string_view pattern,
                                          std::string_view representation_id,
                                          std::uint32_t bandwidth,
                                          std::uint64_t number,
                                          std::uint64_t time);

} // namespace reel::media
