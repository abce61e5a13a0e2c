// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/media/hls_parser.hpp>
#include <reel/media/dash_parser.hpp>
#include <reel/media/rendition.hpp>
#include <reel/media/segment.hpp>
#include <cstdint>
#include <expected>
#include <string_view>
#include <variant>

namespace reel::media {

enum class ManifestFormat : std::uint8_t {
    unknown,
    hls_media,    // Segment listing
    hls_master,   // Variant listing
    dash
};

[[nodiscard]] const char* to_string(ManifestFormat format) noexcept;

// Sniff the document type from its content
[[nodiscard]] ManifestFormat detect_format(std::string_view content) noexcept;

// Closed set of supported manifest schemas
using Manifest = std::variant<HLSPlaylist, DASHManifest>;

// Parse into whichever schema the content is
[[nodiscard]] std::expected<Manifest, std::error_code>
parse_manifest(std::string_view content, std::string_view base_url) noexcept;

// Renditions offered by a manifest. Empty for an HLS media playlist.
[[nodiscard]] std::vector<Rendition> list_renditions(const Manifest& manifest);

// Flatten a parsed manifest into SegmentDescriptors in play order.
// DASH needs the id of the chosen representation; an HLS master playlist
// fails with AcquireErrc::variant_playlist.
[[nodiscard]] std::expected<SegmentList, std::error_code>
segments_from(const Manifest& manifest, std::string_view representation_id = {}) noexcept;

// Parse a segment listing in one step. DASH representations are chosen by
// `policy`. Fails with AcquireErrc::empty_manifest for zero segments.
[[nodiscard]] std::expected<SegmentList, std::error_code>
parse(std::string_view content, std::string_view base_url,
      const RenditionPolicy& policy = {}) noexcept;

} // namespace reel::media
