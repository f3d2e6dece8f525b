/**
 * @file test_header.cpp
 * @brief Unit tests for header metadata extraction.
 */

#include <catch2/catch_test_macros.hpp>
#include <palraw/header.hpp>

#include "fixtures.hpp"

using namespace palraw;
using namespace std::chrono;

namespace {

Metadata extract(const std::vector<std::uint8_t>& header) {
    Metadata meta;
    REQUIRE(extract_metadata(header.data(), header.size(), meta) == Error::Ok);
    return meta;
}

} // namespace

TEST_CASE("Header fields", "[header]") {
    const auto meta = extract(fixtures::make_header());

    REQUIRE(meta.firmware == 220);
    REQUIRE(meta.bitdepth == 8);
    REQUIRE(meta.resolution == 2);
    REQUIRE(meta.hz == 20);
    REQUIRE(meta.axes == 3);
    REQUIRE(meta.start_datetime == sys_days{year{2016} / 12 / 6} + hours{10});
    REQUIRE(meta.stop_datetime == sys_days{year{2016} / 12 / 13} + hours{10});
    REQUIRE(meta.duration == days{7});
    REQUIRE(meta.start_condition == StartCondition::Immediately);
    REQUIRE(meta.stop_condition == StopCondition::Usb);
    REQUIRE(meta.file_code == "AB12");
    REQUIRE(meta.device_id == fixtures::HEADER_DEVICE_ID);
}

TEST_CASE("Header extraction is deterministic", "[header]") {
    const auto header = fixtures::make_header();
    REQUIRE(extract(header) == extract(header));
}

TEST_CASE("Firmware weights the high byte by 255", "[header]") {
    auto header = fixtures::make_header();
    header[39] = 1;
    header[17] = 2;
    REQUIRE(extract(header).firmware == 257);
}

TEST_CASE("Bit depth and resolution", "[header]") {
    auto header = fixtures::make_header();

    SECTION("8-bit codes") {
        header[38] = 1;
        auto meta = extract(header);
        REQUIRE(meta.bitdepth == 8);
        REQUIRE(meta.resolution == 4);

        header[38] = 2;
        REQUIRE(extract(header).resolution == 8);
    }

    SECTION("10-bit codes") {
        header[38] = 128 + 2;
        auto meta = extract(header);
        REQUIRE(meta.bitdepth == 10);
        REQUIRE(meta.resolution == 8);
    }

    SECTION("unmapped code is empty") {
        header[38] = 128 + 5;
        auto meta = extract(header);
        REQUIRE(meta.bitdepth == 10);
        REQUIRE_FALSE(meta.resolution.has_value());
    }
}

TEST_CASE("Lookup fields are lenient", "[header]") {
    auto header = fixtures::make_header();

    SECTION("axes") {
        header[280] = 1;
        REQUIRE(extract(header).axes == 1);
        header[280] = 7;
        REQUIRE_FALSE(extract(header).axes.has_value());
    }

    SECTION("start condition") {
        header[268] = 0;
        REQUIRE(extract(header).start_condition == StartCondition::Trigger);
        header[268] = 2;
        REQUIRE(extract(header).start_condition == StartCondition::SetTime);
        header[268] = 3;
        REQUIRE_FALSE(extract(header).start_condition.has_value());
    }

    SECTION("stop condition") {
        header[275] = 0;
        REQUIRE(extract(header).stop_condition == StopCondition::MemoryFull);
        header[275] = 3;
        REQUIRE(extract(header).stop_condition == StopCondition::LowBattery);
        header[275] = 128;
        REQUIRE(extract(header).stop_condition == StopCondition::ProgrammedTime);
        header[275] = 1;
        REQUIRE_FALSE(extract(header).stop_condition.has_value());
    }
}

TEST_CASE("Condition names", "[header]") {
    REQUIRE(std::string(to_string(StartCondition::Trigger)) == "Trigger");
    REQUIRE(std::string(to_string(StartCondition::Immediately)) == "Immediately");
    REQUIRE(std::string(to_string(StartCondition::SetTime)) == "Set Time");
    REQUIRE(std::string(to_string(StopCondition::MemoryFull)) == "Memory Full");
    REQUIRE(std::string(to_string(StopCondition::LowBattery)) == "Low Battery");
    REQUIRE(std::string(to_string(StopCondition::Usb)) == "USB");
    REQUIRE(std::string(to_string(StopCondition::ProgrammedTime)) == "Programmed Time");
}

TEST_CASE("Sample rate is the raw byte", "[header]") {
    auto header = fixtures::make_header();
    header[35] = 100;
    REQUIRE(extract(header).hz == 100);
}

TEST_CASE("Start and stop dates", "[header]") {
    auto header = fixtures::make_header();

    SECTION("time of day") {
        header[256] = 23;
        header[257] = 59;
        header[258] = 58;
        REQUIRE(extract(header).start_datetime ==
                sys_days{year{2016} / 12 / 6} + hours{23} + minutes{59} + seconds{58});
    }

    SECTION("negative duration passes through") {
        header[265] = 5; // stop one day before start
        auto meta = extract(header);
        REQUIRE(meta.duration == -days{1});
    }

    SECTION("leap day") {
        header[259] = 29;
        header[260] = 2;
        header[261] = 16;
        REQUIRE(extract(header).start_datetime == sys_days{year{2016} / 2 / 29} + hours{10});
    }

    SECTION("invalid month") {
        header[260] = 13;
        Metadata meta;
        REQUIRE(extract_metadata(header.data(), header.size(), meta) == Error::InvalidDate);
    }

    SECTION("invalid day") {
        header[265] = 0;
        Metadata meta;
        REQUIRE(extract_metadata(header.data(), header.size(), meta) == Error::InvalidDate);
    }

    SECTION("non-leap February 29") {
        header[259] = 29;
        header[260] = 2;
        header[261] = 17;
        Metadata meta;
        REQUIRE(extract_metadata(header.data(), header.size(), meta) == Error::InvalidDate);
    }

    SECTION("invalid time") {
        header[263] = 60;
        Metadata meta;
        REQUIRE(extract_metadata(header.data(), header.size(), meta) == Error::InvalidDate);
    }
}

TEST_CASE("File code drops every zero byte", "[header]") {
    auto header = fixtures::make_header();

    SECTION("full width") {
        const char code[] = "ABCDEFGH";
        for (std::size_t i = 0; i < 8; ++i) {
            header[512 + i] = static_cast<std::uint8_t>(code[i]);
        }
        REQUIRE(extract(header).file_code == "ABCDEFGH");
    }

    SECTION("embedded zeros") {
        header[514] = 0;
        header[517] = 'Z';
        REQUIRE(extract(header).file_code == "AB2Z");
    }

    SECTION("empty") {
        for (std::size_t i = 512; i < 520; ++i) {
            header[i] = 0;
        }
        REQUIRE(extract(header).file_code.empty());
    }

    SECTION("byte 520 is not part of the code") {
        header[520] = 'X';
        REQUIRE(extract(header).file_code == "AB12");
    }
}

TEST_CASE("Device id composite", "[header]") {
    auto header = fixtures::make_header();
    header[10] = 12;
    header[11] = 255;
    header[12] = 15;
    header[13] = 9;
    header[14] = 3;
    header[40] = 2;

    const int expected = 2 * 100000 + 3 * 10000 + 2 * 4096 + 255 * 256 + 15 * 16 + 9;
    REQUIRE(extract(header).device_id == expected);
}

TEST_CASE("Header too short", "[header]") {
    const auto header = fixtures::make_header();
    Metadata meta;

    REQUIRE(extract_metadata(header.data(), MIN_HEADER_LENGTH - 1, meta) ==
            Error::HeaderTooShort);
    REQUIRE(extract_metadata(nullptr, 0, meta) == Error::HeaderTooShort);
    REQUIRE(extract_metadata(header.data(), DAT_HEADER_LENGTH, meta) == Error::Ok);
}

TEST_CASE("Failed extraction leaves output untouched", "[header]") {
    auto header = fixtures::make_header();
    header[260] = 0;

    Metadata meta;
    meta.firmware = 42;
    REQUIRE(extract_metadata(header.data(), header.size(), meta) == Error::InvalidDate);
    REQUIRE(meta.firmware == 42);
}

TEST_CASE("Header from file", "[header]") {
    SECTION("reads the first 1024 bytes") {
        const auto path = fixtures::temp_path("header_from_file.datx");
        fixtures::write_file(path, fixtures::make_file(fixtures::make_header(), {1, 2, 3}));

        Metadata meta;
        REQUIRE(extract_metadata_from_file(path, meta) == Error::Ok);
        REQUIRE(meta.device_id == fixtures::HEADER_DEVICE_ID);
    }

    SECTION("short file") {
        const auto path = fixtures::temp_path("header_short.datx");
        fixtures::write_file(path, std::vector<std::uint8_t>(600, 0));

        Metadata meta;
        REQUIRE(extract_metadata_from_file(path, meta) == Error::HeaderTooShort);
    }

    SECTION("missing file") {
        Metadata meta;
        REQUIRE(extract_metadata_from_file(fixtures::temp_path("missing.datx"), meta) ==
                Error::NotFound);
    }
}
