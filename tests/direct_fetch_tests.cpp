// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/assembler.hpp>
#include <reel/core/direct_fetch.hpp>
#include "fake_transport.hpp"

using namespace reel::core;
using namespace reel::test;
using namespace std::chrono_literals;

namespace {

const RetryPolicy NO_WAIT{3, 0ms, 0ms};
const std::string URL = "https://media.example.com/movie.mp4";

std::string pattern(std::size_t size) {
    std::string out(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<char>('a' + i % 26);
    }
    return out;
}

} // namespace

TEST_CASE("split_ranges", "[direct]") {
    SECTION("Even split") {
        auto ranges = split_ranges(100, 4);
        REQUIRE(ranges.size() == 4);
        CHECK(ranges[0] == ByteRange{0, 25});
        CHECK(ranges[3] == ByteRange{75, 25});
    }

    SECTION("Remainder goes to the first ranges") {
        auto ranges = split_ranges(10, 3);
        REQUIRE(ranges.size() == 3);
        CHECK(ranges[0].length == 4);
        CHECK(ranges[1].length == 3);
        CHECK(ranges[2].offset == 7);
        CHECK(ranges[2].length == 3);
    }

    SECTION("More parts than bytes") {
        CHECK(split_ranges(2, 8).size() == 2);
    }

    SECTION("Nothing to split") {
        CHECK(split_ranges(0, 4).empty());
        CHECK(split_ranges(10, 0).empty());
    }
}

TEST_CASE("DirectFetcher - single request", "[direct]") {
    FakeTransport transport;
    ChunkFetcher fetcher(transport, NO_WAIT);
    TempDir dir;
    const auto output = dir / "movie.mp4";

    SECTION("Retries a transient failure") {
        transport.script(URL, {status(503), ok("movie-bytes")});
        DirectFetcher direct(fetcher, DirectOptions{});

        int updates = 0;
        auto result = direct.fetch_direct(URL, output, [&](const ProgressSnapshot& s) {
            ++updates;
            CHECK(s.total == 1);
        });
        REQUIRE(result.has_value());
        CHECK(result->attempts == 2);
        CHECK(result->bytes == 11);
        CHECK(result->ranges == 1);
        CHECK(read_file(output) == "movie-bytes");
        CHECK(updates == 1);
        CHECK(transport.head_calls() == 0);
        CHECK_FALSE(std::filesystem::exists(partial_path(output)));
    }

    SECTION("Failure leaves nothing behind") {
        transport.script(URL, {status(404)});
        DirectFetcher direct(fetcher, DirectOptions{});
        auto result = direct.fetch_direct(URL, output);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == FetchErrc::not_found);
        CHECK_FALSE(std::filesystem::exists(output));
        CHECK_FALSE(std::filesystem::exists(partial_path(output)));
    }

    SECTION("Expected size is verified") {
        transport.serve(URL, "12345");
        DirectOptions options;
        options.expected_size = 6;
        DirectFetcher direct(fetcher, options);
        auto result = direct.fetch_direct(URL, output);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == AcquireErrc::size_mismatch);
        CHECK_FALSE(std::filesystem::exists(output));
    }
}

TEST_CASE("DirectFetcher - byte-range split", "[direct]") {
    FakeTransport transport;
    ChunkFetcher fetcher(transport, NO_WAIT);
    TempDir dir;
    const auto output = dir / "movie.mp4";
    const std::string content = pattern(1000);

    DirectOptions options;
    options.connections = 4;
    options.min_ranged_size = 100;

    SECTION("Ranges are fetched and joined") {
        transport.serve(URL, content);
        DirectFetcher direct(fetcher, options);

        auto result = direct.fetch_direct(URL, output);
        REQUIRE(result.has_value());
        CHECK(result->ranges == 4);
        CHECK(result->bytes == 1000);
        CHECK(read_file(output) == content);
        CHECK(transport.head_calls() == 1);
        CHECK(transport.calls(URL) == 4);

        std::filesystem::path spool = output;
        spool += SPOOL_SUFFIX;
        CHECK_FALSE(std::filesystem::exists(spool));
    }

    SECTION("Small files use one request") {
        transport.serve(URL, content.substr(0, 50));
        DirectFetcher direct(fetcher, options);
        auto result = direct.fetch_direct(URL, output);
        REQUIRE(result.has_value());
        CHECK(result->ranges == 1);
        CHECK(transport.calls(URL) == 1);
    }

    SECTION("Server without range support is not probed further") {
        FakeReply whole = ok(content);
        whole.honor_ranges = false;
        whole.advertise_ranges = false;
        transport.script(URL, {whole});

        DirectFetcher direct(fetcher, options);
        auto result = direct.fetch_direct(URL, output);
        REQUIRE(result.has_value());
        CHECK(result->ranges == 1);
        CHECK(transport.calls(URL) == 1);
    }

    SECTION("Server that ignores ranges falls back to one request") {
        FakeReply whole = ok(content);
        whole.honor_ranges = false;
        transport.script(URL, {whole});

        DirectFetcher direct(fetcher, options);
        auto result = direct.fetch_direct(URL, output);
        REQUIRE(result.has_value());
        CHECK(result->ranges == 1);
        CHECK(read_file(output) == content);
        CHECK(transport.ranges(URL).back() == std::nullopt);
    }
}
