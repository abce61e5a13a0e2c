// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/http_session.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reel::media {

// HLS (HTTP Live Streaming) segment
struct HLSSegment {
    std::string url;                              // Resolved against the playlist URL
    double duration{0.0};                         // Segment duration in seconds
    std::optional<core::ByteRange> byte_range;    // EXT-X-BYTERANGE or EXT-X-MAP BYTERANGE
    bool is_init{false};                          // EXT-X-MAP initialisation section
};

// HLS variant (for adaptive bitrate)
struct HLSVariant {
    std::uint32_t bandwidth{0};     // Bitrate in bps
    std::uint32_t width{0};
    std::uint32_t height{0};
    double frame_rate{0.0};
    std::string codecs;
    std::string url;
};

// EXT-X-PLAYLIST-TYPE
enum class HLSPlaylistType {
    unknown,
    vod,          // Video on demand
    event         // Append-only event
};

// Parsed HLS playlist. A master playlist has variants and no segments.
struct HLSPlaylist {
    HLSPlaylistType type{HLSPlaylistType::unknown};
    std::vector<HLSSegment> segments;             // Init sections inline, in play order
    std::vector<HLSVariant> variants;
    double target_duration{0.0};
    std::uint64_t media_sequence{0};
    bool has_endlist{false};
    std::string encryption_method;                // Last EXT-X-KEY METHOD, if any

    [[nodiscard]] bool is_master() const noexcept { return !variants.empty(); }
    [[nodiscard]] bool is_live() const noexcept {
        return !is_master() && !has_endlist && type != HLSPlaylistType::vod;
    }
};

// HLS M3U8 parser
class HLSParser {
public:
    // Parse M3U8 playlist content. Relative URIs are resolved against
    // `base_url`. Fails with AcquireErrc::manifest_parse_error for content
    // that is not a playlist and AcquireErrc::encrypted_stream for a
    // playlist with a key method other than NONE.
    [[nodiscard]] static std::expected<HLSPlaylist, std::error_code>
    parse(std::string_view content, std::string_view base_url) noexcept;

    // Check if URL is an HLS playlist
    [[nodiscard]] static bool is_hls_url(std::string_view url) noexcept;

    // Whether the content starts with #EXTM3U
    [[nodiscard]] static bool is_playlist(std::string_view content) noexcept;
};

// Parse an attribute list (KEY=value,KEY="quoted, value")
[[nodiscard]] std::map<std::string, std::string> parse_attribute_list(std::string_view list);

} // namespace reel::media
