// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/http_session.hpp>

using namespace reel::core;

TEST_CASE("ByteRange::header_value", "[http]") {
    CHECK(ByteRange{0, 100}.header_value() == "0-99");
    CHECK(ByteRange{4096, 1}.header_value() == "4096-4096");
}

TEST_CASE("parse_content_length", "[http]") {
    CHECK(parse_content_length("1234") == 1234u);
    CHECK(parse_content_length(" 0") == 0u);
    CHECK_FALSE(parse_content_length("").has_value());
    CHECK_FALSE(parse_content_length("12a").has_value());
    CHECK_FALSE(parse_content_length("-5").has_value());
}

TEST_CASE("range_ignored_by - 200 answers to ranged requests", "[http]") {
    const ByteRange head{0, 1000};
    const ByteRange middle{1000, 1000};

    SECTION("Partial content is never treated as ignored") {
        CHECK_FALSE(range_ignored_by(206, head, 1000, 1000));
        CHECK_FALSE(range_ignored_by(206, middle, 1000, 500));
    }

    SECTION("A range past offset 0 answered with the whole file") {
        CHECK(range_ignored_by(200, middle, 5000, 0));
        CHECK(range_ignored_by(200, middle, std::nullopt, 0));
    }

    SECTION("An offset 0 range whose declared length is the whole file") {
        CHECK(range_ignored_by(200, head, 5000, 16));
    }

    SECTION("An offset 0 range that overruns without a declared length") {
        CHECK_FALSE(range_ignored_by(200, head, std::nullopt, 1000));
        CHECK(range_ignored_by(200, head, std::nullopt, 1001));
    }

    SECTION("A 200 carrying exactly the range is accepted") {
        CHECK_FALSE(range_ignored_by(200, head, 1000, 1000));
    }
}
