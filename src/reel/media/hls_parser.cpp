// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/hls_parser.hpp>
#include <reel/core/url.hpp>
#include <spdlog/spdlog.h>
#include "parse_util.hpp"

namespace reel::media {

namespace {

constexpr std::string_view TAG_HEADER = "#EXTM3U";
constexpr std::string_view TAG_EXTINF = "#EXTINF:";
constexpr std::string_view TAG_STREAM_INF = "#EXT-X-STREAM-INF:";
constexpr std::string_view TAG_TARGET_DURATION = "#EXT-X-TARGETDURATION:";
constexpr std::string_view TAG_MEDIA_SEQUENCE = "#EXT-X-MEDIA-SEQUENCE:";
constexpr std::string_view TAG_PLAYLIST_TYPE = "#EXT-X-PLAYLIST-TYPE:";
constexpr std::string_view TAG_ENDLIST = "#EXT-X-ENDLIST";
constexpr std::string_view TAG_BYTERANGE = "#EXT-X-BYTERANGE:";
constexpr std::string_view TAG_KEY = "#EXT-X-KEY:";
constexpr std::string_view TAG_MAP = "#EXT-X-MAP:";

std::unexpected<std::error_code> parse_error() noexcept {
    return std::unexpected(make_error_code(core::AcquireErrc::manifest_parse_error));
}

// "n[@o]". Without an offset the range continues from `next_offset`.
std::optional<core::ByteRange> parse_byterange(std::string_view value,
                                               std::optional<std::uint64_t> next_offset) noexcept {
    core::ByteRange range;
    auto at = value.find('@');
    auto length = detail::parse_uint(value.substr(0, at));
    if (!length || *length == 0) {
        return std::nullopt;
    }
    range.length = *length;

    if (at != std::string_view::npos) {
        auto offset = detail::parse_uint(value.substr(at + 1));
        if (!offset) return std::nullopt;
        range.offset = *offset;
    } else {
        range.offset = next_offset.value_or(0);
    }
    return range;
}

// "1280x720"
void parse_resolution(std::string_view value, HLSVariant& variant) noexcept {
    auto x = value.find_first_of("xX");
    if (x == std::string_view::npos) return;
    auto w = detail::parse_uint(value.substr(0, x));
    auto h = detail::parse_uint(value.substr(x + 1));
    if (w && h) {
        variant.width = static_cast<std::uint32_t>(*w);
        variant.height = static_cast<std::uint32_t>(*h);
    }
}

struct MapSection {
    std::string url;
    std::optional<core::ByteRange> range;

    bool operator==(const MapSection&) const = default;
};

} // namespace

std::map<std::string, std::string> parse_attribute_list(std::string_view list) {
    std::map<std::string, std::string> attrs;
    std::size_t pos = 0;

    while (pos < list.size()) {
        auto eq = list.find('=', pos);
        if (eq == std::string_view::npos) break;

        std::string key(detail::trim(list.substr(pos, eq - pos)));
        std::size_t value_start = eq + 1;
        std::string value;

        if (value_start < list.size() && list[value_start] == '"') {
            auto close = list.find('"', value_start + 1);
            if (close == std::string_view::npos) {
                value = std::string(list.substr(value_start + 1));
                pos = list.size();
            } else {
                value = std::string(list.substr(value_start + 1, close - value_start - 1));
                auto comma = list.find(',', close);
                pos = comma == std::string_view::npos ? list.size() : comma + 1;
            }
        } else {
            auto comma = list.find(',', value_start);
            auto end = comma == std::string_view::npos ? list.size() : comma;
            value = std::string(detail::trim(list.substr(value_start, end - value_start)));
            pos = comma == std::string_view::npos ? list.size() : comma + 1;
        }

        if (!key.empty()) {
            attrs[std::move(key)] = std::move(value);
        }
    }
    return attrs;
}

bool HLSParser::is_hls_url(std::string_view url) noexcept {
    auto query = url.find_first_of("?#");
    auto path = detail::to_lower(url.substr(0, query));
    return path.ends_with(".m3u8") || path.ends_with(".m3u");
}

bool HLSParser::is_playlist(std::string_view content) noexcept {
    if (content.starts_with("\xEF\xBB\xBF")) {
        content.remove_prefix(3);
    }
    return detail::trim(content).starts_with(TAG_HEADER);
}

std::expected<HLSPlaylist, std::error_code>
HLSParser::parse(std::string_view content, std::string_view base_url) noexcept {
    if (!is_playlist(content)) {
        return parse_error();
    }
    if (content.starts_with("\xEF\xBB\xBF")) {
        content.remove_prefix(3);
    }

    HLSPlaylist playlist;

    double current_duration = 0.0;
    bool have_extinf = false;
    std::optional<core::ByteRange> current_range;
    std::optional<HLSVariant> pending_variant;

    // Implicit BYTERANGE offsets continue from the previous range of the same URI
    std::string last_range_url;
    std::optional<std::uint64_t> last_range_end;

    std::optional<MapSection> current_map;
    std::optional<MapSection> emitted_map;

    std::size_t pos = 0;
    while (pos < content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) end = content.size();
        auto line = detail::trim(content.substr(pos, end - pos));
        pos = end + 1;

        if (line.empty()) continue;

        if (line[0] == '#') {
            if (line.starts_with(TAG_TARGET_DURATION)) {
                auto val = detail::parse_double(line.substr(TAG_TARGET_DURATION.size()));
                if (!val) return parse_error();
                playlist.target_duration = *val;
            } else if (line.starts_with(TAG_MEDIA_SEQUENCE)) {
                auto val = detail::parse_uint(line.substr(TAG_MEDIA_SEQUENCE.size()));
                if (!val) return parse_error();
                playlist.media_sequence = *val;
            } else if (line.starts_with(TAG_PLAYLIST_TYPE)) {
                auto val = detail::trim(line.substr(TAG_PLAYLIST_TYPE.size()));
                if (val == "VOD") {
                    playlist.type = HLSPlaylistType::vod;
                } else if (val == "EVENT") {
                    playlist.type = HLSPlaylistType::event;
                }
            } else if (line.starts_with(TAG_STREAM_INF)) {
                auto attrs = parse_attribute_list(line.substr(TAG_STREAM_INF.size()));
                HLSVariant variant;
                if (auto it = attrs.find("BANDWIDTH"); it != attrs.end()) {
                    auto bw = detail::parse_uint(it->second);
                    if (!bw) return parse_error();
                    variant.bandwidth = static_cast<std::uint32_t>(*bw);
                }
                if (auto it = attrs.find("RESOLUTION"); it != attrs.end()) {
                    parse_resolution(it->second, variant);
                }
                if (auto it = attrs.find("FRAME-RATE"); it != attrs.end()) {
                    variant.frame_rate = detail::parse_double(it->second).value_or(0.0);
                }
                if (auto it = attrs.find("CODECS"); it != attrs.end()) {
                    variant.codecs = it->second;
                }
                pending_variant = std::move(variant);
            } else if (line.starts_with(TAG_EXTINF)) {
                auto val = line.substr(TAG_EXTINF.size());
                auto comma = val.find(',');
                auto duration = detail::parse_double(val.substr(0, comma));
                if (!duration || *duration < 0.0) return parse_error();
                current_duration = *duration;
                have_extinf = true;
            } else if (line.starts_with(TAG_BYTERANGE)) {
                // Offset continuation is resolved once the URI is known
                auto val = line.substr(TAG_BYTERANGE.size());
                auto range = parse_byterange(val, std::nullopt);
                if (!range) return parse_error();
                if (val.find('@') == std::string_view::npos) {
                    range->offset = UINT64_MAX;
                }
                current_range = range;
            } else if (line.starts_with(TAG_KEY)) {
                auto attrs = parse_attribute_list(line.substr(TAG_KEY.size()));
                auto it = attrs.find("METHOD");
                if (it == attrs.end() || it->second.empty()) return parse_error();
                const std::string& method = it->second;
                playlist.encryption_method = method;
                if (method != "NONE") {
                    spdlog::error("Playlist is encrypted (METHOD={})", method);
                    return std::unexpected(make_error_code(core::AcquireErrc::encrypted_stream));
                }
            } else if (line.starts_with(TAG_MAP)) {
                auto attrs = parse_attribute_list(line.substr(TAG_MAP.size()));
                auto uri = attrs.find("URI");
                if (uri == attrs.end() || uri->second.empty()) return parse_error();

                MapSection map;
                map.url = core::resolve_url(base_url, uri->second);
                if (auto br = attrs.find("BYTERANGE"); br != attrs.end()) {
                    map.range = parse_byterange(br->second, 0);
                    if (!map.range) return parse_error();
                }
                current_map = std::move(map);
            } else if (line == TAG_ENDLIST) {
                playlist.has_endlist = true;
            }
            // Other tags and comments are ignored
            continue;
        }

        // URI line
        std::string url = core::resolve_url(base_url, line);

        if (pending_variant) {
            pending_variant->url = std::move(url);
            playlist.variants.push_back(std::move(*pending_variant));
            pending_variant.reset();
            continue;
        }

        if (!have_extinf) {
            return parse_error();
        }

        if (current_map && current_map != emitted_map) {
            HLSSegment init;
            init.url = current_map->url;
            init.byte_range = current_map->range;
            init.is_init = true;
            playlist.segments.push_back(std::move(init));
            emitted_map = current_map;
        }

        HLSSegment segment;
        segment.duration = current_duration;
        if (current_range) {
            if (current_range->offset == UINT64_MAX) {
                current_range->offset = (url == last_range_url) ? last_range_end.value_or(0) : 0;
            }
            last_range_url = url;
            last_range_end = current_range->offset + current_range->length;
            segment.byte_range = current_range;
        }
        segment.url = std::move(url);
        playlist.segments.push_back(std::move(segment));

        // Reset for next segment
        current_duration = 0.0;
        have_extinf = false;
        current_range.reset();
    }

    if (!playlist.is_master() && !playlist.has_endlist && !playlist.segments.empty()) {
        spdlog::warn("Playlist has no EXT-X-ENDLIST; using the {} segments listed now",
                     playlist.segments.size());
    }

    return playlist;
}

} // namespace reel::media
