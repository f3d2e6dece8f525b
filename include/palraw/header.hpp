/**
 * @file header.hpp
 * @brief activPAL header decoding.
 *
 * The header is a fixed block at the start of every raw data file
 * (1023 bytes for .dat, 1024 for .datx). Every field lives at a fixed
 * byte offset; see extract_metadata() for the table.
 */

#ifndef PALRAW_HEADER_HPP
#define PALRAW_HEADER_HPP

#include <optional>
#include <string>

#include "config.hpp"
#include "error.hpp"
#include "timestamp.hpp"

namespace palraw {

/**
 * @brief Reason logging started.
 */
enum class StartCondition { Trigger, Immediately, SetTime };

/**
 * @brief Reason logging stopped.
 */
enum class StopCondition { MemoryFull, LowBattery, Usb, ProgrammedTime };

const char* to_string(StartCondition condition) noexcept;
const char* to_string(StopCondition condition) noexcept;

/**
 * @brief Metadata extracted from a raw data file header.
 *
 * Lookup fields are empty when the header holds an unmapped code.
 */
struct Metadata {
    int firmware = 0;
    int bitdepth = 0;                 ///< 8 or 10
    std::optional<int> resolution;    ///< Range in g: 2, 4 or 8
    int hz = 0;                       ///< Sample rate, raw header byte
    std::optional<int> axes;          ///< 1 or 3
    DateTime start_datetime{};
    DateTime stop_datetime{};
    std::chrono::seconds duration{};  ///< stop - start, may be negative
    std::optional<StartCondition> start_condition;
    std::optional<StopCondition> stop_condition;
    std::string file_code;            ///< Up to 8 ASCII characters
    int device_id = 0;

    bool operator==(const Metadata&) const = default;
};

/**
 * @brief Decode a header block.
 *
 * | Field           | Offset(s)                                 |
 * |-----------------|-------------------------------------------|
 * | firmware        | 39 (high), 17 (low): h*255 + l            |
 * | bitdepth/range  | 38: <128 is 8-bit, else 10-bit; low bits  |
 * | hz              | 35                                        |
 * | axes            | 280                                       |
 * | start           | 261 yr, 260 mon, 259 day, 256 h, 257 m, 258 s |
 * | stop            | 267 yr, 266 mon, 265 day, 262 h, 263 m, 264 s |
 * | start condition | 268                                       |
 * | stop condition  | 275                                       |
 * | file code       | 512..519, zero bytes dropped              |
 * | device id       | 10, 11, 12, 13, 14, 40                    |
 *
 * @param header Header bytes
 * @param size Number of header bytes (at least MIN_HEADER_LENGTH)
 * @param[out] meta Decoded metadata
 * @return Error::Ok on success, Error::HeaderTooShort, Error::InvalidDate
 */
Error extract_metadata(const std::uint8_t* header, std::size_t size, Metadata& meta);

/**
 * @brief Decode the header of a file without reading its body.
 *
 * Reads the first DATX_HEADER_LENGTH bytes, regardless of extension.
 *
 * @param path File path
 * @param[out] meta Decoded metadata
 * @return Error::Ok on success, Error::NotFound, Error::HeaderTooShort,
 *         Error::InvalidDate
 */
Error extract_metadata_from_file(const std::string& path, Metadata& meta);

} // namespace palraw

#endif // PALRAW_HEADER_HPP
