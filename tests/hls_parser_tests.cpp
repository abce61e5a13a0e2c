// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/error.hpp>
#include <reel/media/hls_parser.hpp>

using namespace reel::media;
using reel::core::AcquireErrc;
using Catch::Approx;

namespace {

constexpr const char* BASE = "https://cdn.example.com/vod/hd/index.m3u8";

} // namespace

TEST_CASE("HLSParser - media playlist", "[hls]") {
    const char* content =
        "#EXTM3U\n"
        "#EXT-X-VERSION:3\n"
        "#EXT-X-TARGETDURATION:10\n"
        "#EXT-X-MEDIA-SEQUENCE:7\n"
        "#EXT-X-PLAYLIST-TYPE:VOD\n"
        "#EXTINF:9.009,\n"
        "seg_000.ts\n"
        "#EXTINF:9.009,title\n"
        "seg_001.ts\n"
        "#EXTINF:3.5,\n"
        "https://other.example.com/seg_002.ts\n"
        "#EXT-X-ENDLIST\n";

    auto result = HLSParser::parse(content, BASE);
    REQUIRE(result.has_value());
    const auto& playlist = *result;

    CHECK_FALSE(playlist.is_master());
    CHECK_FALSE(playlist.is_live());
    CHECK(playlist.has_endlist);
    CHECK(playlist.type == HLSPlaylistType::vod);
    CHECK(playlist.target_duration == Approx(10.0));
    CHECK(playlist.media_sequence == 7);

    REQUIRE(playlist.segments.size() == 3);
    CHECK(playlist.segments[0].url == "https://cdn.example.com/vod/hd/seg_000.ts");
    CHECK(playlist.segments[0].duration == Approx(9.009));
    CHECK(playlist.segments[1].url == "https://cdn.example.com/vod/hd/seg_001.ts");
    CHECK(playlist.segments[2].url == "https://other.example.com/seg_002.ts");
    CHECK(playlist.segments[2].duration == Approx(3.5));
    CHECK_FALSE(playlist.segments[0].byte_range.has_value());
}

TEST_CASE("HLSParser - master playlist", "[hls]") {
    const char* content =
        "#EXTM3U\n"
        "#EXT-X-STREAM-INF:BANDWIDTH=800000,RESOLUTION=640x360,CODECS=\"avc1.4d401e,mp4a.40.2\"\n"
        "sd/index.m3u8\n"
        "#EXT-X-STREAM-INF:BANDWIDTH=2500000,RESOLUTION=1280x720,FRAME-RATE=29.970\n"
        "hd/index.m3u8\n";

    auto result = HLSParser::parse(content, "https://cdn.example.com/vod/master.m3u8");
    REQUIRE(result.has_value());
    CHECK(result->is_master());
    CHECK(result->segments.empty());

    REQUIRE(result->variants.size() == 2);
    const auto& sd = result->variants[0];
    CHECK(sd.bandwidth == 800000);
    CHECK(sd.width == 640);
    CHECK(sd.height == 360);
    CHECK(sd.codecs == "avc1.4d401e,mp4a.40.2");
    CHECK(sd.url == "https://cdn.example.com/vod/sd/index.m3u8");

    const auto& hd = result->variants[1];
    CHECK(hd.height == 720);
    CHECK(hd.frame_rate == Approx(29.97));
    CHECK(hd.url == "https://cdn.example.com/vod/hd/index.m3u8");
}

TEST_CASE("HLSParser - byte ranges", "[hls]") {
    const char* content =
        "#EXTM3U\n"
        "#EXT-X-TARGETDURATION:4\n"
        "#EXTINF:4,\n"
        "#EXT-X-BYTERANGE:1000@0\n"
        "main.ts\n"
        "#EXTINF:4,\n"
        "#EXT-X-BYTERANGE:500\n"
        "main.ts\n"
        "#EXTINF:4,\n"
        "#EXT-X-BYTERANGE:200\n"
        "other.ts\n"
        "#EXT-X-ENDLIST\n";

    auto result = HLSParser::parse(content, BASE);
    REQUIRE(result.has_value());
    REQUIRE(result->segments.size() == 3);

    SECTION("Explicit offset") {
        REQUIRE(result->segments[0].byte_range.has_value());
        CHECK(result->segments[0].byte_range->offset == 0);
        CHECK(result->segments[0].byte_range->length == 1000);
    }

    SECTION("Implicit offset continues the same resource") {
        REQUIRE(result->segments[1].byte_range.has_value());
        CHECK(result->segments[1].byte_range->offset == 1000);
        CHECK(result->segments[1].byte_range->length == 500);
    }

    SECTION("Implicit offset on a new resource starts at zero") {
        REQUIRE(result->segments[2].byte_range.has_value());
        CHECK(result->segments[2].byte_range->offset == 0);
    }
}

TEST_CASE("HLSParser - EXT-X-MAP initialisation section", "[hls]") {
    const char* content =
        "#EXTM3U\n"
        "#EXT-X-TARGETDURATION:6\n"
        "#EXT-X-MAP:URI=\"init.mp4\",BYTERANGE=\"720@0\"\n"
        "#EXTINF:6,\n"
        "seg1.m4s\n"
        "#EXTINF:6,\n"
        "seg2.m4s\n"
        "#EXT-X-ENDLIST\n";

    auto result = HLSParser::parse(content, BASE);
    REQUIRE(result.has_value());
    REQUIRE(result->segments.size() == 3);

    const auto& init = result->segments[0];
    CHECK(init.is_init);
    CHECK(init.url == "https://cdn.example.com/vod/hd/init.mp4");
    REQUIRE(init.byte_range.has_value());
    CHECK(init.byte_range->length == 720);
    CHECK(init.duration == 0.0);

    CHECK_FALSE(result->segments[1].is_init);
    CHECK_FALSE(result->segments[2].is_init);
}

TEST_CASE("HLSParser - rejected playlists", "[hls]") {
    SECTION("Missing header") {
        auto result = HLSParser::parse("#EXTINF:10,\nseg.ts\n", BASE);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == AcquireErrc::manifest_parse_error);
    }

    SECTION("HTML error page") {
        auto result = HLSParser::parse("<html><body>Forbidden</body></html>", BASE);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == AcquireErrc::manifest_parse_error);
    }

    SECTION("URI without EXTINF") {
        auto result = HLSParser::parse("#EXTM3U\nseg.ts\n", BASE);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == AcquireErrc::manifest_parse_error);
    }

    SECTION("Malformed duration") {
        auto result = HLSParser::parse("#EXTM3U\n#EXTINF:abc,\nseg.ts\n", BASE);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == AcquireErrc::manifest_parse_error);
    }

    SECTION("Encrypted segments") {
        auto result = HLSParser::parse(
            "#EXTM3U\n#EXT-X-KEY:METHOD=AES-128,URI=\"key.bin\"\n#EXTINF:10,\nseg.ts\n#EXT-X-ENDLIST\n", BASE);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == AcquireErrc::encrypted_stream);
    }

    SECTION("Key without a method") {
        auto result = HLSParser::parse("#EXTM3U\n#EXT-X-KEY:URI=\"key.bin\"\n#EXTINF:10,\nseg.ts\n", BASE);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == AcquireErrc::manifest_parse_error);
    }
}

TEST_CASE("HLSParser - tolerated input", "[hls]") {
    SECTION("METHOD=NONE is not encryption") {
        auto result = HLSParser::parse(
            "#EXTM3U\n#EXT-X-KEY:METHOD=NONE\n#EXTINF:10,\nseg.ts\n#EXT-X-ENDLIST\n", BASE);
        REQUIRE(result.has_value());
        CHECK(result->encryption_method == "NONE");
        CHECK(result->segments.size() == 1);
    }

    SECTION("CRLF line endings and a byte order mark") {
        auto result = HLSParser::parse(
            "\xEF\xBB\xBF#EXTM3U\r\n#EXTINF:2.0,\r\na.ts\r\n#EXT-X-ENDLIST\r\n", BASE);
        REQUIRE(result.has_value());
        REQUIRE(result->segments.size() == 1);
        CHECK(result->segments[0].url == "https://cdn.example.com/vod/hd/a.ts");
    }

    SECTION("Unknown tags are ignored") {
        auto result = HLSParser::parse(
            "#EXTM3U\n#EXT-X-INDEPENDENT-SEGMENTS\n#EXT-X-PROGRAM-DATE-TIME:2020-01-01T00:00:00Z\n"
            "#EXTINF:2,\na.ts\n#EXT-X-ENDLIST\n", BASE);
        REQUIRE(result.has_value());
        CHECK(result->segments.size() == 1);
    }

    SECTION("Playlist without ENDLIST is taken as it stands") {
        auto result = HLSParser::parse("#EXTM3U\n#EXTINF:2,\na.ts\n#EXTINF:2,\nb.ts\n", BASE);
        REQUIRE(result.has_value());
        CHECK(result->is_live());
        CHECK(result->segments.size() == 2);
    }
}

TEST_CASE("HLSParser - URL and content detection", "[hls]") {
    CHECK(HLSParser::is_hls_url("https://example.com/master.m3u8"));
    CHECK(HLSParser::is_hls_url("https://example.com/INDEX.M3U8?token=1"));
    CHECK_FALSE(HLSParser::is_hls_url("https://example.com/video.mp4"));
    CHECK_FALSE(HLSParser::is_hls_url("https://example.com/manifest.mpd"));

    CHECK(HLSParser::is_playlist("  #EXTM3U\n"));
    CHECK_FALSE(HLSParser::is_playlist("<MPD/>"));
}

TEST_CASE("parse_attribute_list", "[hls]") {
    auto attrs = parse_attribute_list("BANDWIDTH=1280000,CODECS=\"avc1.42e01e,mp4a.40.2\",RESOLUTION=640x360");
    CHECK(attrs.size() == 3);
    CHECK(attrs["BANDWIDTH"] == "1280000");
    CHECK(attrs["CODECS"] == "avc1.42e01e,mp4a.40.2");
    CHECK(attrs["RESOLUTION"] == "640x360");
}
