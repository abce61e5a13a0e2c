// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/assembler.hpp>
#include <reel/core/orchestrator.hpp>
#include "fake_transport.hpp"
#include <mutex>

using namespace reel::core;
using namespace reel::test;
using namespace std::chrono_literals;

namespace {

const RetryPolicy NO_WAIT{3, 0ms, 0ms};
const std::string BASE = "https://cdn.example.com/show/";

// Media playlist of `count` segments served by `transport`
std::string serve_playlist(FakeTransport& transport, const std::string& playlist_url,
                           std::uint32_t count, const std::string& prefix = "seg") {
    std::string playlist = "#EXTM3U\n#EXT-X-TARGETDURATION:4\n";
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::string name = prefix + std::to_string(i) + ".ts";
        playlist += "#EXTINF:4,\n" + name + "\n";
        transport.serve(BASE + name, "[" + prefix + std::to_string(i) + "]");
    }
    playlist += "#EXT-X-ENDLIST\n";
    transport.serve(playlist_url, playlist);
    return playlist;
}

AcquireOptions options_with(std::uint32_t concurrency) {
    AcquireOptions options;
    options.concurrency = concurrency;
    options.attempt_budget = 3;
    return options;
}

} // namespace

TEST_CASE("Orchestrator - segmented stream end to end", "[orchestrator]") {
    FakeTransport transport;
    TempDir dir;
    const auto output = dir / "episode.mp4";
    serve_playlist(transport, BASE + "index.m3u8", 5);

    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(3));

    std::vector<AcquisitionState> states;
    orchestrator.observer([&states](AcquisitionState, AcquisitionState to) { states.push_back(to); });

    std::vector<ProgressSnapshot> progress;
    std::mutex progress_mutex;
    auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "index.m3u8"), output,
        [&](const ProgressSnapshot& s) {
            std::lock_guard lock(progress_mutex);
            progress.push_back(s);
        });

    REQUIRE(result.success);
    CHECK(result.state == AcquisitionState::done);
    CHECK(result.path == AcquisitionPath::segmented);
    CHECK(result.segment_count == 5);
    CHECK(result.failed_segments.empty());
    CHECK(result.output_path == output);
    CHECK(read_file(output) == "[seg0][seg1][seg2][seg3][seg4]");
    CHECK(transport.peak_in_flight() <= 3);

    REQUIRE(progress.size() == 5);
    for (std::size_t i = 0; i < progress.size(); ++i) {
        CHECK(progress[i].finished() == i + 1);
        if (i > 0) {
            CHECK(progress[i].bytes_so_far >= progress[i - 1].bytes_so_far);
        }
    }

    const std::vector<AcquisitionState> expected{
        AcquisitionState::resolving, AcquisitionState::segmented_fetch,
        AcquisitionState::assembling, AcquisitionState::done};
    CHECK(states == expected);

    std::filesystem::path spool = output;
    spool += SPOOL_SUFFIX;
    CHECK_FALSE(std::filesystem::exists(spool));
    CHECK_FALSE(std::filesystem::exists(partial_path(output)));
}

TEST_CASE("Orchestrator - permanent segment failure", "[orchestrator]") {
    FakeTransport transport;
    TempDir dir;
    const auto output = dir / "episode.mp4";
    serve_playlist(transport, BASE + "index.m3u8", 5);
    transport.script(BASE + "seg1.ts", {status(403)});

    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(3));
    auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "index.m3u8"), output);

    CHECK_FALSE(result.success);
    CHECK(result.state == AcquisitionState::failed);
    CHECK(result.error == AcquireErrc::missing_segments);
    CHECK(result.failed_segments == std::set<std::uint32_t>{1});
    REQUIRE(result.fetch_error.has_value());
    CHECK(result.fetch_error->code == FetchErrc::forbidden);

    // 403 is not retried
    CHECK(transport.calls(BASE + "seg1.ts") == 1);
    CHECK_FALSE(std::filesystem::exists(output));
    CHECK_FALSE(std::filesystem::exists(partial_path(output)));
}

TEST_CASE("Orchestrator - direct file with a transient failure", "[orchestrator]") {
    FakeTransport transport;
    TempDir dir;
    const auto output = dir / "movie.mp4";
    const std::string url = "https://media.example.com/movie.mp4";
    transport.script(url, {status(503), ok("whole-movie")});

    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(3));
    auto result = orchestrator.acquire(StreamDescriptor::direct(url), output);

    REQUIRE(result.success);
    CHECK(result.state == AcquisitionState::done);
    CHECK(result.path == AcquisitionPath::direct);
    CHECK(result.attempts == 2);
    CHECK(result.bytes == 11);
    CHECK(read_file(output) == "whole-movie");
}

TEST_CASE("Orchestrator - master playlist picks a variant", "[orchestrator]") {
    FakeTransport transport;
    TempDir dir;
    const auto output = dir / "episode.mp4";

    transport.serve(BASE + "master.m3u8",
        "#EXTM3U\n"
        "#EXT-X-STREAM-INF:BANDWIDTH=400000,RESOLUTION=426x240\n"
        "low.m3u8\n"
        "#EXT-X-STREAM-INF:BANDWIDTH=2800000,RESOLUTION=1280x720\n"
        "mid.m3u8\n"
        "#EXT-X-STREAM-INF:BANDWIDTH=6000000,RESOLUTION=1920x1080\n"
        "high.m3u8\n");
    serve_playlist(transport, BASE + "low.m3u8", 2, "low");
    serve_playlist(transport, BASE + "mid.m3u8", 2, "mid");
    serve_playlist(transport, BASE + "high.m3u8", 2, "high");

    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(2));

    SECTION("Highest bandwidth by default") {
        auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "master.m3u8"), output);
        REQUIRE(result.success);
        CHECK(read_file(output) == "[high0][high1]");
        CHECK(transport.calls(BASE + "low.m3u8") == 0);
    }

    SECTION("Preferred height") {
        auto descriptor = StreamDescriptor::segmented(BASE + "master.m3u8");
        descriptor.rendition = reel::media::RenditionPolicy::prefer_height(720);
        auto result = orchestrator.acquire(descriptor, output);
        REQUIRE(result.success);
        CHECK(read_file(output) == "[mid0][mid1]");
    }

    SECTION("Lowest bandwidth") {
        auto descriptor = StreamDescriptor::segmented(BASE + "master.m3u8");
        descriptor.rendition = reel::media::RenditionPolicy::lowest();
        auto result = orchestrator.acquire(descriptor, output);
        REQUIRE(result.success);
        CHECK(read_file(output) == "[low0][low1]");
    }
}

TEST_CASE("Orchestrator - DASH manifest", "[orchestrator]") {
    FakeTransport transport;
    TempDir dir;
    const auto output = dir / "episode.mp4";

    transport.serve(BASE + "manifest.mpd", R"(<MPD type="static" mediaPresentationDuration="PT6S">
  <Period>
    <AdaptationSet mimeType="video/mp4">
      <SegmentTemplate timescale="1" duration="2" startNumber="1"
                       initialization="$RepresentationID$/init.mp4" media="$RepresentationID$/$Number$.m4s"/>
      <Representation id="v1" bandwidth="1000000" height="720"/>
    </AdaptationSet>
  </Period>
</MPD>)");
    transport.serve(BASE + "v1/init.mp4", "I");
    transport.serve(BASE + "v1/1.m4s", "1");
    transport.serve(BASE + "v1/2.m4s", "2");
    transport.serve(BASE + "v1/3.m4s", "3");

    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(4));
    auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "manifest.mpd"), output);

    REQUIRE(result.success);
    CHECK(result.segment_count == 4);
    CHECK(read_file(output) == "I123");
}

TEST_CASE("Orchestrator - fallback to a direct file", "[orchestrator]") {
    FakeTransport transport;
    TempDir dir;
    const auto output = dir / "episode.mp4";
    const std::string fallback = "https://mirror.example.com/episode.mp4";

    transport.serve(BASE + "index.m3u8", "<html><body>Geo-blocked</body></html>");
    transport.serve(fallback, "direct-copy");

    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(3));

    SECTION("Unparseable manifest uses the fallback") {
        auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "index.m3u8", fallback), output);
        REQUIRE(result.success);
        CHECK(result.used_fallback);
        CHECK(result.path == AcquisitionPath::direct);
        CHECK(read_file(output) == "direct-copy");
    }

    SECTION("Without a fallback the parse error is reported") {
        auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "index.m3u8"), output);
        CHECK_FALSE(result.success);
        CHECK(result.error == AcquireErrc::manifest_parse_error);
        CHECK_FALSE(result.used_fallback);
        CHECK_FALSE(std::filesystem::exists(output));
    }
}

TEST_CASE("Orchestrator - manifest errors", "[orchestrator]") {
    FakeTransport transport;
    TempDir dir;
    const auto output = dir / "episode.mp4";
    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(3));

    SECTION("Manifest fetch fails") {
        auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "missing.m3u8"), output);
        CHECK(result.state == AcquisitionState::failed);
        CHECK(result.error == FetchErrc::not_found);
        REQUIRE(result.fetch_error.has_value());
        CHECK(result.fetch_error->http_status == 404);
    }

    SECTION("Encrypted playlist") {
        transport.serve(BASE + "enc.m3u8",
            "#EXTM3U\n#EXT-X-KEY:METHOD=AES-128,URI=\"k\"\n#EXTINF:4,\na.ts\n#EXT-X-ENDLIST\n");
        auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "enc.m3u8"), output);
        CHECK(result.error == AcquireErrc::encrypted_stream);
    }

    SECTION("Playlist without segments") {
        transport.serve(BASE + "empty.m3u8", "#EXTM3U\n#EXT-X-ENDLIST\n");
        auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "empty.m3u8"), output);
        CHECK(result.error == AcquireErrc::empty_manifest);
    }

    SECTION("Invalid descriptor") {
        auto descriptor = StreamDescriptor::segmented("");
        auto result = orchestrator.acquire(descriptor, output);
        CHECK(result.state == AcquisitionState::failed);
        CHECK(result.error == AcquireErrc::invalid_descriptor);
    }

    SECTION("Zero concurrency in the descriptor") {
        auto descriptor = StreamDescriptor::segmented(BASE + "index.m3u8");
        descriptor.concurrency = 0;
        auto result = orchestrator.acquire(descriptor, output);
        CHECK(result.error == AcquireErrc::invalid_descriptor);
    }
}

TEST_CASE("Orchestrator - cancellation", "[orchestrator]") {
    FakeTransport transport;
    TempDir dir;
    const auto output = dir / "episode.mp4";
    serve_playlist(transport, BASE + "index.m3u8", 10);

    std::stop_source source;
    transport.on_get([&source](const std::string& url) {
        if (url.ends_with("seg2.ts")) source.request_stop();
    });

    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(1));
    auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "index.m3u8"), output,
                                       {}, source.get_token());

    CHECK_FALSE(result.success);
    CHECK(result.state == AcquisitionState::cancelled);
    CHECK(result.error == AcquireErrc::cancelled);
    CHECK(transport.calls(BASE + "seg5.ts") == 0);
    CHECK_FALSE(std::filesystem::exists(output));
    CHECK_FALSE(std::filesystem::exists(partial_path(output)));

    std::filesystem::path spool = output;
    spool += SPOOL_SUFFIX;
    CHECK_FALSE(std::filesystem::exists(spool));
}

TEST_CASE("Orchestrator - runs are independent", "[orchestrator]") {
    FakeTransport transport;
    TempDir dir;
    serve_playlist(transport, BASE + "index.m3u8", 3);
    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(2));

    auto first = orchestrator.acquire(StreamDescriptor::segmented(BASE + "index.m3u8"), dir / "a.mp4");
    auto second = orchestrator.acquire(StreamDescriptor::segmented(BASE + "index.m3u8"), dir / "b.mp4");

    REQUIRE(first.success);
    REQUIRE(second.success);
    CHECK(first.bytes == second.bytes);
    CHECK(read_file(dir / "a.mp4") == read_file(dir / "b.mp4"));
}

TEST_CASE("Orchestrator::inspect", "[orchestrator]") {
    FakeTransport transport;
    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(2));

    SECTION("Master playlist lists renditions") {
        transport.serve(BASE + "master.m3u8",
            "#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1000,RESOLUTION=640x360\nsd.m3u8\n");
        auto info = orchestrator.inspect(BASE + "master.m3u8");
        REQUIRE(info.has_value());
        CHECK(info->format == reel::media::ManifestFormat::hls_master);
        REQUIRE(info->renditions.size() == 1);
        CHECK(info->renditions[0].height == 360);
    }

    SECTION("Media playlist counts segments") {
        serve_playlist(transport, BASE + "index.m3u8", 3);
        auto info = orchestrator.inspect(BASE + "index.m3u8");
        REQUIRE(info.has_value());
        CHECK(info->format == reel::media::ManifestFormat::hls_media);
        CHECK(info->segment_count == 3);
        CHECK(info->duration == Catch::Approx(12.0));
    }
}

TEST_CASE("AcquisitionState helpers", "[orchestrator]") {
    CHECK(is_terminal(AcquisitionState::done));
    CHECK(is_terminal(AcquisitionState::failed));
    CHECK(is_terminal(AcquisitionState::cancelled));
    CHECK_FALSE(is_terminal(AcquisitionState::segmented_fetch));
    CHECK(std::string(to_string(AcquisitionState::assembling)) == "assembling");
}

TEST_CASE("Orchestrator - outcome does not depend on the concurrency limit", "[orchestrator]") {
    constexpr std::uint32_t COUNT = 6;
    const std::uint32_t limit = GENERATE(range(1u, 7u));
    const bool with_missing = GENERATE(false, true);
    CAPTURE(limit, with_missing);

    FakeTransport transport;
    TempDir dir;
    const auto output = dir / "episode.mp4";
    serve_playlist(transport, BASE + "index.m3u8", COUNT);
    transport.script(BASE + "seg2.ts", {status(503), ok("[seg2]")});
    if (with_missing) {
        transport.script(BASE + "seg4.ts", {status(404)});
    }

    AcquisitionOrchestrator orchestrator(transport, NO_WAIT, options_with(limit));
    auto result = orchestrator.acquire(StreamDescriptor::segmented(BASE + "index.m3u8"), output);

    CHECK(transport.calls(BASE + "seg2.ts") == 2);
    CHECK(transport.peak_in_flight() <= limit);
    CHECK(result.segment_count == COUNT);

    if (with_missing) {
        CHECK_FALSE(result.success);
        CHECK(result.state == AcquisitionState::failed);
        CHECK(result.error == AcquireErrc::missing_segments);
        CHECK(result.failed_segments == std::set<std::uint32_t>{4});
        CHECK(transport.calls(BASE + "seg4.ts") == 1);
        CHECK_FALSE(std::filesystem::exists(output));
    } else {
        REQUIRE(result.success);
        CHECK(result.state == AcquisitionState::done);
        CHECK(result.failed_segments.empty());
        CHECK(read_file(output) == "[seg0][seg1][seg2][seg3][seg4][seg5]");
    }
}
