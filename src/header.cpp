/**
 * @file header.cpp
 * @brief activPAL header decoding.
 */

#include <palraw/header.hpp>

#include <fstream>
#include <utility>
#include <vector>

namespace palraw {

namespace {

// Header field offsets
constexpr std::size_t OFF_DEVICE_YEAR = 10;
constexpr std::size_t OFF_DEVICE_1 = 11;
constexpr std::size_t OFF_DEVICE_2 = 12;
constexpr std::size_t OFF_DEVICE_3 = 13;
constexpr std::size_t OFF_DEVICE_4 = 14;
constexpr std::size_t OFF_FIRMWARE_LOW = 17;
constexpr std::size_t OFF_HZ = 35;
constexpr std::size_t OFF_RESOLUTION = 38;
constexpr std::size_t OFF_FIRMWARE_HIGH = 39;
constexpr std::size_t OFF_DEVICE_HIGH = 40;
constexpr std::size_t OFF_START = 256; // h, m, s, day, mon, yr
constexpr std::size_t OFF_STOP = 262;  // h, m, s, day, mon, yr
constexpr std::size_t OFF_START_CONDITION = 268;
constexpr std::size_t OFF_STOP_CONDITION = 275;
constexpr std::size_t OFF_AXES = 280;

/**
 * @brief Build a date-time from six header bytes starting at offset.
 *
 * Layout is hour, minute, second, day, month, two-digit year.
 */
Error read_datetime(const std::uint8_t* header, std::size_t offset, DateTime& out) noexcept {
    using namespace std::chrono;

    const int hh = header[offset];
    const int mi = header[offset + 1];
    const int ss = header[offset + 2];
    const unsigned dd = header[offset + 3];
    const unsigned mo = header[offset + 4];
    const int yr = header[offset + 5] + 2000;

    const year_month_day ymd{year{yr}, month{mo}, day{dd}};
    if (!ymd.ok() || hh > 23 || mi > 59 || ss > 59) {
        return Error::InvalidDate;
    }

    out = sys_days{ymd} + hours{hh} + minutes{mi} + seconds{ss};
    return Error::Ok;
}

std::optional<int> lookup_resolution(int code) noexcept {
    switch (code) {
    case 0:
        return 2;
    case 1:
        return 4;
    case 2:
        return 8;
    default:
        return std::nullopt;
    }
}

std::optional<int> lookup_axes(int code) noexcept {
    switch (code) {
    case 0:
        return 3;
    case 1:
        return 1;
    default:
        return std::nullopt;
    }
}

std::optional<StartCondition> lookup_start_condition(int code) noexcept {
    switch (code) {
    case 0:
        return StartCondition::Trigger;
    case 1:
        return StartCondition::Immediately;
    case 2:
        return StartCondition::SetTime;
    default:
        return std::nullopt;
    }
}

std::optional<StopCondition> lookup_stop_condition(int code) noexcept {
    switch (code) {
    case 0:
        return StopCondition::MemoryFull;
    case 3:
        return StopCondition::LowBattery;
    case 64:
        return StopCondition::Usb;
    case 128:
        return StopCondition::ProgrammedTime;
    default:
        return std::nullopt;
    }
}

} // namespace

const char* to_string(StartCondition condition) noexcept {
    switch (condition) {
    case StartCondition::Trigger:
        return "Trigger";
    case StartCondition::Immediately:
        return "Immediately";
    case StartCondition::SetTime:
        return "Set Time";
    default:
        return "Unknown";
    }
}

const char* to_string(StopCondition condition) noexcept {
    switch (condition) {
    case StopCondition::MemoryFull:
        return "Memory Full";
    case StopCondition::LowBattery:
        return "Low Battery";
    case StopCondition::Usb:
        return "USB";
    case StopCondition::ProgrammedTime:
        return "Programmed Time";
    default:
        return "Unknown";
    }
}

Error extract_metadata(const std::uint8_t* header, std::size_t size, Metadata& meta) {
    if (header == nullptr || size < MIN_HEADER_LENGTH) {
        return Error::HeaderTooShort;
    }

    Metadata m;

    // High byte weighted by 255, not 256, to match existing tooling
    m.firmware = header[OFF_FIRMWARE_HIGH] * 255 + header[OFF_FIRMWARE_LOW];

    int resolution_code = header[OFF_RESOLUTION];
    if (resolution_code < 128) {
        m.bitdepth = 8;
    } else {
        m.bitdepth = 10;
        resolution_code -= 128;
    }
    m.resolution = lookup_resolution(resolution_code);

    m.hz = header[OFF_HZ];
    m.axes = lookup_axes(header[OFF_AXES]);

    auto status = read_datetime(header, OFF_START, m.start_datetime);
    if (status != Error::Ok) {
        return status;
    }
    status = read_datetime(header, OFF_STOP, m.stop_datetime);
    if (status != Error::Ok) {
        return status;
    }
    m.duration = m.stop_datetime - m.start_datetime;

    m.start_condition = lookup_start_condition(header[OFF_START_CONDITION]);
    m.stop_condition = lookup_stop_condition(header[OFF_STOP_CONDITION]);

    // Every zero byte is dropped, not just trailing padding
    for (std::size_t i = 0; i < FILE_CODE_LENGTH; ++i) {
        const std::uint8_t c = header[FILE_CODE_OFFSET + i];
        if (c != 0) {
            m.file_code.push_back(static_cast<char>(c));
        }
    }

    // First digit is the last digit of the manufacture year code
    m.device_id = (header[OFF_DEVICE_YEAR] % 10) * 100000 + header[OFF_DEVICE_4] * 10000 +
                  header[OFF_DEVICE_HIGH] * 4096 + header[OFF_DEVICE_1] * 256 +
                  header[OFF_DEVICE_2] * 16 + header[OFF_DEVICE_3];

    meta = std::move(m);
    return Error::Ok;
}

Error extract_metadata_from_file(const std::string& path, Metadata& meta) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::NotFound;
    }

    std::vector<std::uint8_t> header(DATX_HEADER_LENGTH);
    file.read(reinterpret_cast<char*>(header.data()),
              static_cast<std::streamsize>(header.size()));
    if (file.bad()) {
        return Error::IoError;
    }
    if (static_cast<std::size_t>(file.gcount()) < header.size()) {
        return Error::HeaderTooShort;
    }

    return extract_metadata(header.data(), header.size(), meta);
}

} // namespace palraw
