// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/error.hpp>
#include <reel/core/retry.hpp>
#include <chrono>
#include <thread>

using namespace reel::core;
using namespace std::chrono_literals;

TEST_CASE("RetryPolicy::delay_for - exponential backoff", "[retry]") {
    RetryPolicy policy{5, 100ms, 1000ms};

    CHECK(policy.delay_for(0) == 0ms);
    CHECK(policy.delay_for(1) == 100ms);
    CHECK(policy.delay_for(2) == 200ms);
    CHECK(policy.delay_for(3) == 400ms);
    CHECK(policy.delay_for(4) == 800ms);

    SECTION("Capped at max_delay") {
        CHECK(policy.delay_for(5) == 1000ms);
        CHECK(policy.delay_for(60) == 1000ms);
    }

    SECTION("Zero base delay never waits") {
        RetryPolicy immediate{3, 0ms, 0ms};
        CHECK(immediate.delay_for(3) == 0ms);
    }
}

TEST_CASE("RetryPolicy::can_retry", "[retry]") {
    RetryPolicy policy{3, 0ms, 0ms};
    CHECK(policy.can_retry(1));
    CHECK(policy.can_retry(2));
    CHECK_FALSE(policy.can_retry(3));
}

TEST_CASE("wait_for - stop token", "[retry]") {
    SECTION("Zero delay returns at once") {
        CHECK(wait_for(0ms, {}));
    }

    SECTION("Already stopped") {
        std::stop_source source;
        source.request_stop();
        CHECK_FALSE(wait_for(10ms, source.get_token()));
    }

    SECTION("Stop interrupts a long wait") {
        std::stop_source source;
        std::jthread stopper([&source] {
            std::this_thread::sleep_for(20ms);
            source.request_stop();
        });

        const auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(wait_for(10s, source.get_token()));
        CHECK(std::chrono::steady_clock::now() - start < 5s);
    }

    SECTION("Short wait completes") {
        std::stop_source source;
        CHECK(wait_for(5ms, source.get_token()));
    }
}

TEST_CASE("Error classification", "[retry]") {
    SECTION("Transient") {
        CHECK(classify(FetchErrc::timeout) == FetchErrorKind::transient);
        CHECK(classify(FetchErrc::connection_lost) == FetchErrorKind::transient);
        CHECK(classify(FetchErrc::server_error) == FetchErrorKind::transient);
        CHECK(classify(FetchErrc::rate_limited) == FetchErrorKind::transient);
        CHECK(classify(FetchErrc::short_read) == FetchErrorKind::transient);
    }

    SECTION("Permanent") {
        CHECK(classify(FetchErrc::forbidden) == FetchErrorKind::permanent);
        CHECK(classify(FetchErrc::not_found) == FetchErrorKind::permanent);
        CHECK(classify(FetchErrc::invalid_url) == FetchErrorKind::permanent);
        CHECK(classify(FetchErrc::cancelled) == FetchErrorKind::permanent);
        CHECK(classify(std::make_error_code(std::errc::io_error)) == FetchErrorKind::permanent);
    }

    SECTION("HTTP statuses") {
        CHECK_FALSE(status_to_error(200));
        CHECK_FALSE(status_to_error(206));
        CHECK(status_to_error(403) == FetchErrc::forbidden);
        CHECK(status_to_error(404) == FetchErrc::not_found);
        CHECK(status_to_error(408) == FetchErrc::timeout);
        CHECK(status_to_error(416) == FetchErrc::range_not_satisfiable);
        CHECK(status_to_error(429) == FetchErrc::rate_limited);
        CHECK(status_to_error(418) == FetchErrc::client_error);
        CHECK(status_to_error(503) == FetchErrc::server_error);
    }
}

TEST_CASE("FetchError::message", "[retry]") {
    FetchError err{make_error_code(FetchErrc::server_error), FetchErrorKind::permanent, 503, 3};
    CHECK(err.message() == "Server error (5xx) [HTTP 503] after 3 attempts");
}
