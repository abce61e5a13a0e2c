// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/orchestrator.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reel::media {

// Separately sourced subtitle or audio track
struct TrackSource {
    std::string url;
    std::string language;      // ISO 639 code as the muxer expects it
};

// Everything known about one title before acquisition
struct ResolvedMedia {
    std::string title;
    std::optional<std::uint32_t> season;
    std::optional<std::uint32_t> episode;
    core::StreamDescriptor stream;
    std::vector<TrackSource> subtitles;
    std::vector<TrackSource> audio;

    // "Title.S01E02" style base name, without extension
    [[nodiscard]] std::string base_name() const;
};

// Maps a source identifier to a ResolvedMedia
class MetadataResolver {
public:
    virtual ~MetadataResolver() = default;

    [[nodiscard]] virtual std::expected<ResolvedMedia, std::error_code>
    resolve(std::string_view source) = 0;
};

// Reads a JSON descriptor document from disk; `source` is its path
class JsonMetadataResolver final : public MetadataResolver {
public:
    [[nodiscard]] std::expected<ResolvedMedia, std::error_code>
    resolve(std::string_view source) override;

    // Parse a descriptor document. Fails with AcquireErrc::invalid_descriptor.
    [[nodiscard]] static std::expected<ResolvedMedia, std::error_code>
    parse(std::string_view text) noexcept;
};

// Strip characters unsafe in file names, spaces become dots
[[nodiscard]] std::string sanitize_filename(std::string_view name);

} // namespace reel::media
