// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/media/hls_parser.hpp>
#include <reel/media/dash_parser.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace reel::media {

// One quality variant of a stream
struct Rendition {
    std::uint32_t bandwidth{0};
    std::uint32_t width{0};
    std::uint32_t height{0};
    double frame_rate{0.0};
    std::string codecs;
    std::string url;          // HLS: media playlist URL
    std::string id;           // DASH: representation id

    [[nodiscard]] std::string describe() const;
};

// Rendition choice
struct RenditionPolicy {
    enum class Kind : std::uint8_t {
        highest_bandwidth,
        lowest_bandwidth,
        preferred_height
    };

    Kind kind{Kind::highest_bandwidth};
    std::uint32_t height{0};              // For preferred_height

    [[nodiscard]] static RenditionPolicy highest() noexcept { return {}; }
    [[nodiscard]] static RenditionPolicy lowest() noexcept { return {Kind::lowest_bandwidth, 0}; }
    [[nodiscard]] static RenditionPolicy prefer_height(std::uint32_t h) noexcept {
        return {Kind::preferred_height, h};
    }

    [[nodiscard]] std::string describe() const;
};

// Pick one rendition. Fails with AcquireErrc::no_rendition for an empty list.
[[nodiscard]] std::expected<Rendition, std::error_code>
select_rendition(const std::vector<Rendition>& renditions, const RenditionPolicy& policy) noexcept;

// Variant listing of an HLS master playlist
[[nodiscard]] std::vector<Rendition> renditions_from(const HLSPlaylist& playlist);

// Representations of the video adaptation sets, or of every set when none is video
[[nodiscard]] std::vector<Rendition> renditions_from(const DASHManifest& manifest);

// Parse "best", "worst" or a height such as "720" / "720p"
[[nodiscard]] std::expected<RenditionPolicy, std::error_code> parse_policy(std::string_view text) noexcept;

} // namespace reel::media
