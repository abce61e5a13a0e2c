// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/manifest.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <new>

namespace reel::media {

namespace {

template<typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template<typename Segment>
SegmentDescriptor to_descriptor(const Segment& seg, std::uint32_t index) {
    SegmentDescriptor desc;
    desc.sequence_index = index;
    desc.url = seg.url;
    desc.byte_range = seg.byte_range;
    if (seg.byte_range) {
        desc.estimated_bytes = seg.byte_range->length;
    }
    desc.duration = seg.duration;
    desc.is_init = seg.is_init;
    return desc;
}

template<typename Segment>
SegmentList to_list(const std::vector<Segment>& segments) {
    SegmentList out;
    out.reserve(segments.size());
    for (const auto& seg : segments) {
        out.push_back(to_descriptor(seg, static_cast<std::uint32_t>(out.size())));
    }
    return out;
}

} // namespace

const char* to_string(ManifestFormat format) noexcept {
    switch (format) {
        case ManifestFormat::hls_media:  return "HLS media playlist";
        case ManifestFormat::hls_master: return "HLS master playlist";
        case ManifestFormat::dash:       return "DASH MPD";
        case ManifestFormat::unknown:    break;
    }
    return "unknown";
}

ManifestFormat detect_format(std::string_view content) noexcept {
    if (HLSParser::is_playlist(content)) {
        return content.find("#EXT-X-STREAM-INF:") != std::string_view::npos
            ? ManifestFormat::hls_master
            : ManifestFormat::hls_media;
    }
    if (DASHParser::is_mpd(content)) {
        return ManifestFormat::dash;
    }
    return ManifestFormat::unknown;
}

std::expected<Manifest, std::error_code>
parse_manifest(std::string_view content, std::string_view base_url) noexcept {
    switch (detect_format(content)) {
        case ManifestFormat::hls_media:
        case ManifestFormat::hls_master: {
            auto playlist = HLSParser::parse(content, base_url);
            if (!playlist) return std::unexpected(playlist.error());
            return Manifest{std::move(*playlist)};
        }
        case ManifestFormat::dash: {
            auto mpd = DASHParser::parse(content, base_url);
            if (!mpd) return std::unexpected(mpd.error());
            return Manifest{std::move(*mpd)};
        }
        case ManifestFormat::unknown:
            break;
    }
    return std::unexpected(make_error_code(core::AcquireErrc::manifest_parse_error));
}

std::vector<Rendition> list_renditions(const Manifest& manifest) {
    return std::visit([](const auto& m) { return renditions_from(m); }, manifest);
}

std::expected<SegmentList, std::error_code>
segments_from(const Manifest& manifest, std::string_view representation_id) noexcept {
    try {
        auto result = std::visit(overloaded{
            [](const HLSPlaylist& playlist) -> std::expected<SegmentList, std::error_code> {
                if (playlist.is_master()) {
                    return std::unexpected(make_error_code(core::AcquireErrc::variant_playlist));
                }
                return to_list(playlist.segments);
            },
            [representation_id](const DASHManifest& mpd) -> std::expected<SegmentList, std::error_code> {
                const DASHRepresentation* rep = mpd.find(representation_id);
                if (!rep) {
                    return std::unexpected(make_error_code(core::AcquireErrc::no_rendition));
                }
                return to_list(rep->segments);
            },
        }, manifest);

        if (!result) return result;

        // Init sections alone do not make a stream
        const bool has_media = std::any_of(result->begin(), result->end(),
            [](const SegmentDescriptor& d) { return !d.is_init; });
        if (result->empty() || !has_media) {
            return std::unexpected(make_error_code(core::AcquireErrc::empty_manifest));
        }
        return result;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<SegmentList, std::error_code>
parse(std::string_view content, std::string_view base_url, const RenditionPolicy& policy) noexcept {
    auto manifest = parse_manifest(content, base_url);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }

    std::string representation_id;
    if (std::holds_alternative<DASHManifest>(*manifest)) {
        try {
            auto chosen = select_rendition(list_renditions(*manifest), policy);
            if (!chosen) return std::unexpected(chosen.error());
            spdlog::debug("Selected representation '{}': {}", chosen->id, chosen->describe());
            representation_id = chosen->id;
        } catch (const std::bad_alloc&) {
            return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
        }
    }

    return segments_from(*manifest, representation_id);
}

} // namespace reel::media
