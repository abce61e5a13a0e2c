// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/settings.hpp>
#include "fake_transport.hpp"

using namespace reel::core;
using namespace std::chrono_literals;
using reel::media::RenditionPolicy;

TEST_CASE("Settings - defaults", "[settings]") {
    Settings s;
    CHECK(s.concurrency == DEFAULT_CONCURRENCY);
    CHECK(s.attempt_budget == 3);
    CHECK(s.rendition.kind == RenditionPolicy::Kind::highest_bandwidth);
    CHECK(s.log_level == "info");
    CHECK_FALSE(s.validate());

    auto policy = s.retry_policy();
    CHECK(policy.max_attempts == 3);
    CHECK(policy.base_delay == DEFAULT_BASE_DELAY);
}

TEST_CASE("Settings::from_json - values", "[settings]") {
    auto s = Settings::from_json(R"({
        "concurrency": 8,
        "attempt_budget": 5,
        "base_delay_ms": 100,
        "max_delay_ms": 2000,
        "connect_timeout_sec": 10,
        "user_agent": "custom/1.0",
        "direct_connections": 4,
        "rendition": "720p",
        "output_dir": "/tmp/media",
        "log_level": "debug",
        "headers": {"Referer": "https://example.com/", "Cookie": "a=b"},
        "unknown_key": true
    })");
    REQUIRE(s.has_value());
    CHECK(s->concurrency == 8);
    CHECK(s->attempt_budget == 5);
    CHECK(s->base_delay == 100ms);
    CHECK(s->max_delay == 2000ms);
    CHECK(s->connect_timeout_sec == 10);
    CHECK(s->user_agent == "custom/1.0");
    CHECK(s->direct_connections == 4);
    CHECK(s->rendition.kind == RenditionPolicy::Kind::preferred_height);
    CHECK(s->rendition.height == 720);
    CHECK(s->output_dir == std::filesystem::path("/tmp/media"));
    CHECK(s->log_level == "debug");
    CHECK(s->headers.size() == 2);

    auto http = s->http_options();
    CHECK(http.user_agent == "custom/1.0");
    CHECK(http.headers.size() == 2);

    auto acquire = s->acquire_options();
    CHECK(acquire.concurrency == 8);
    CHECK(acquire.direct_connections == 4);
}

TEST_CASE("Settings::from_json - preferred_height overrides rendition", "[settings]") {
    auto s = Settings::from_json(R"({"rendition": "worst", "preferred_height": 1080})");
    REQUIRE(s.has_value());
    CHECK(s->rendition.kind == RenditionPolicy::Kind::preferred_height);
    CHECK(s->rendition.height == 1080);
}

TEST_CASE("Settings::from_json - rejected documents", "[settings]") {
    SECTION("Not JSON") {
        auto s = Settings::from_json("concurrency = 4");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == SettingsErrc::parse_error);
    }

    SECTION("Not an object") {
        auto s = Settings::from_json("[1, 2]");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == SettingsErrc::parse_error);
    }

    SECTION("Wrong type") {
        auto s = Settings::from_json(R"({"concurrency": "eight"})");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == SettingsErrc::invalid_value);
    }

    SECTION("Negative number") {
        auto s = Settings::from_json(R"({"attempt_budget": -1})");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == SettingsErrc::invalid_value);
    }

    SECTION("Out of range") {
        CHECK(Settings::from_json(R"({"concurrency": 0})").error() == SettingsErrc::invalid_value);
        CHECK(Settings::from_json(R"({"concurrency": 10000})").error() == SettingsErrc::invalid_value);
        CHECK(Settings::from_json(R"({"direct_connections": 0})").error() == SettingsErrc::invalid_value);
    }

    SECTION("Max delay below base delay") {
        auto s = Settings::from_json(R"({"base_delay_ms": 500, "max_delay_ms": 100})");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == SettingsErrc::invalid_value);
    }

    SECTION("Unknown log level") {
        auto s = Settings::from_json(R"({"log_level": "chatty"})");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == SettingsErrc::invalid_value);
    }

    SECTION("Unknown rendition") {
        auto s = Settings::from_json(R"({"rendition": "hd"})");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == SettingsErrc::invalid_value);
    }

    SECTION("Header values must be strings") {
        auto s = Settings::from_json(R"({"headers": {"X-Count": 3}})");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == SettingsErrc::invalid_value);
    }
}

TEST_CASE("Settings::load", "[settings]") {
    reel::test::TempDir dir;

    SECTION("Missing file") {
        auto s = Settings::load(dir / "absent.json");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == SettingsErrc::file_not_found);
    }

    SECTION("File on disk") {
        reel::test::write_file(dir / "reel.json", R"({"concurrency": 2})");
        auto s = Settings::load(dir / "reel.json");
        REQUIRE(s.has_value());
        CHECK(s->concurrency == 2);
    }
}
