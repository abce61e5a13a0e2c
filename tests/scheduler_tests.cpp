// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/progress.hpp>
#include <reel/core/scheduler.hpp>
#include <reel/disk/spool.hpp>
#include "fake_transport.hpp"
#include <mutex>
#include <stdexcept>

using namespace reel::core;
using namespace reel::test;
using namespace std::chrono_literals;

namespace {

const RetryPolicy NO_WAIT{3, 0ms, 0ms};

std::string segment_url(std::uint32_t i) {
    return "https://cdn.example.com/seg_" + std::to_string(i) + ".ts";
}

reel::media::SegmentList make_segments(FakeTransport& transport, std::uint32_t count) {
    reel::media::SegmentList list;
    for (std::uint32_t i = 0; i < count; ++i) {
        reel::media::SegmentDescriptor seg;
        seg.sequence_index = i;
        seg.url = segment_url(i);
        transport.serve(seg.url, "body-" + std::to_string(i));
        list.push_back(std::move(seg));
    }
    return list;
}

} // namespace

TEST_CASE("ConcurrencyScheduler - all segments succeed", "[scheduler]") {
    FakeTransport transport;
    ChunkFetcher fetcher(transport, NO_WAIT);
    TempDir dir;
    auto spool = reel::disk::SpoolDirectory::create(dir / "out.mp4");
    REQUIRE(spool.has_value());

    auto segments = make_segments(transport, 12);
    ConcurrencyScheduler scheduler(fetcher, 3, *spool);

    std::vector<ProgressSnapshot> snapshots;
    std::mutex snapshots_mutex;
    auto results = scheduler.run(segments, 4, [&](const ProgressSnapshot& s) {
        std::lock_guard lock(snapshots_mutex);
        snapshots.push_back(s);
    });

    REQUIRE(results.size() == 12);
    for (std::uint32_t i = 0; i < 12; ++i) {
        const auto& r = results.at(i);
        CHECK(r.ok());
        CHECK(r.attempts == 1);
        CHECK(read_file(r.spool_path) == "body-" + std::to_string(i));
    }
    CHECK(missing_indices(results, 12).empty());

    SECTION("Concurrency limit is honoured") {
        CHECK(transport.peak_in_flight() <= 4);
    }

    SECTION("Progress is published once per segment, in order") {
        REQUIRE(snapshots.size() == 12);
        for (std::size_t i = 0; i < snapshots.size(); ++i) {
            CHECK(snapshots[i].completed == i + 1);
            CHECK(snapshots[i].total == 12);
        }
        CHECK(snapshots.back().percent() == Catch::Approx(100.0));
    }
}

TEST_CASE("ConcurrencyScheduler - failures are isolated", "[scheduler]") {
    FakeTransport transport;
    ChunkFetcher fetcher(transport, NO_WAIT);
    TempDir dir;
    auto spool = reel::disk::SpoolDirectory::create(dir / "out.mp4");
    REQUIRE(spool.has_value());

    auto segments = make_segments(transport, 6);
    transport.script(segment_url(2), {status(404)});
    transport.script(segment_url(4), {status(503), ok("body-4")});

    ConcurrencyScheduler scheduler(fetcher, 3, *spool);
    std::uint32_t last_failed = 0;
    auto results = scheduler.run(segments, 2, [&](const ProgressSnapshot& s) { last_failed = s.failed; });

    REQUIRE(results.size() == 6);
    CHECK_FALSE(results.at(2).ok());
    REQUIRE(results.at(2).error.has_value());
    CHECK(results.at(2).error->code == FetchErrc::not_found);
    CHECK(results.at(2).attempts == 1);
    CHECK_FALSE(std::filesystem::exists(results.at(2).spool_path));

    CHECK(results.at(4).ok());
    CHECK(results.at(4).attempts == 2);

    CHECK(missing_indices(results, 6) == std::vector<std::uint32_t>{2});
    CHECK(last_failed == 1);
}

TEST_CASE("ConcurrencyScheduler - edge cases", "[scheduler]") {
    FakeTransport transport;
    ChunkFetcher fetcher(transport, NO_WAIT);
    TempDir dir;
    auto spool = reel::disk::SpoolDirectory::create(dir / "out.mp4");
    REQUIRE(spool.has_value());
    ConcurrencyScheduler scheduler(fetcher, 3, *spool);

    SECTION("Empty list") {
        CHECK(scheduler.run({}, 4).empty());
    }

    SECTION("Zero limit records every segment as failed") {
        auto segments = make_segments(transport, 3);
        bool called = false;
        auto results = scheduler.run(segments, 0, [&](const ProgressSnapshot&) { called = true; });
        REQUIRE(results.size() == 3);
        for (const auto& [index, r] : results) {
            CHECK(r.status == SegmentStatus::failed);
            REQUIRE(r.error.has_value());
            CHECK(r.error->code == FetchErrc::invalid_argument);
        }
        CHECK_FALSE(called);
        CHECK(transport.calls(segment_url(0)) == 0);
    }

    SECTION("Limit larger than the list") {
        auto segments = make_segments(transport, 2);
        auto results = scheduler.run(segments, 64);
        CHECK(results.size() == 2);
        CHECK(missing_indices(results, 2).empty());
    }

    SECTION("Stop stops dispatch") {
        auto segments = make_segments(transport, 20);
        std::stop_source source;
        transport.on_get([&source](const std::string&) { source.request_stop(); });

        auto results = scheduler.run(segments, 1, {}, source.get_token());
        CHECK(results.size() < 20);
        CHECK(missing_indices(results, 20).size() > 0);
    }
}

TEST_CASE("ProgressState - snapshots", "[scheduler]") {
    std::vector<ProgressSnapshot> seen;
    ProgressState progress(3, [&seen](const ProgressSnapshot& s) { seen.push_back(s); });

    progress.record_success(100);
    progress.record_failure();
    progress.record_success(50);

    REQUIRE(seen.size() == 3);
    CHECK(seen[0].completed == 1);
    CHECK(seen[1].failed == 1);
    CHECK(seen[2].bytes_so_far == 150);
    CHECK(seen[2].finished() == 3);
    CHECK(progress.snapshot().completed == 2);

    SECTION("A throwing callback does not break the run") {
        ProgressState throwing(1, [](const ProgressSnapshot&) { throw std::runtime_error("observer"); });
        CHECK_NOTHROW(throwing.record_success(1));
        CHECK(throwing.snapshot().completed == 1);
    }

    SECTION("A callback throwing a non-standard type") {
        ProgressState throwing(2, [](const ProgressSnapshot&) { throw 42; });
        CHECK_NOTHROW(throwing.record_success(1));
        CHECK_NOTHROW(throwing.record_failure());
        CHECK(throwing.snapshot().finished() == 2);
    }
}

TEST_CASE("ConcurrencyScheduler - throwing progress callback on worker threads", "[scheduler]") {
    FakeTransport transport;
    ChunkFetcher fetcher(transport, NO_WAIT);
    TempDir dir;
    auto spool = reel::disk::SpoolDirectory::create(dir / "out.mp4");
    REQUIRE(spool.has_value());

    auto segments = make_segments(transport, 6);
    ConcurrencyScheduler scheduler(fetcher, 3, *spool);

    auto results = scheduler.run(segments, 3, [](const ProgressSnapshot&) { throw 7; });

    REQUIRE(results.size() == 6);
    for (const auto& [index, r] : results) {
        CHECK(r.ok());
    }
}
