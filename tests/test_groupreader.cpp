/**
 * @file test_groupreader.cpp
 * @brief Unit tests for GroupReader class.
 */

#include <catch2/catch_test_macros.hpp>
#include <palraw/groupreader.hpp>

using namespace palraw;

TEST_CASE("GroupReader walks complete groups", "[groupreader]") {
    const std::uint8_t data[] = {1, 2, 3, 4, 5, 6, 7};
    GroupReader reader(data, sizeof(data));

    REQUIRE(reader.position() == 0);
    REQUIRE(reader.remaining() == 7);
    REQUIRE(reader.has_group());
    REQUIRE(reader.group()[0] == 1);

    reader.advance();
    REQUIRE(reader.position() == 3);
    REQUIRE(reader.has_group());
    REQUIRE(reader.group()[2] == 6);

    reader.advance();
    REQUIRE(reader.remaining() == 1);
    REQUIRE_FALSE(reader.has_group());
}

TEST_CASE("GroupReader look-ahead", "[groupreader]") {
    const std::uint8_t data[] = {10, 20, 30, 40, 50};
    GroupReader reader(data, sizeof(data));

    SECTION("within buffer") {
        REQUIRE(reader.peek(0) == 10);
        REQUIRE(reader.peek(3) == 40);
        REQUIRE(reader.peek(4) == 50);
    }

    SECTION("past end") {
        REQUIRE(reader.peek(5) == -1);
        REQUIRE(reader.peek(100) == -1);
    }

    SECTION("relative to current group") {
        reader.advance();
        REQUIRE(reader.peek(0) == 40);
        REQUIRE(reader.peek(1) == 50);
        REQUIRE(reader.peek(2) == -1);
    }
}

TEST_CASE("GroupReader empty buffer", "[groupreader]") {
    GroupReader reader(nullptr, 0);
    REQUIRE_FALSE(reader.has_group());
    REQUIRE(reader.remaining() == 0);
    REQUIRE(reader.peek(0) == -1);
}
