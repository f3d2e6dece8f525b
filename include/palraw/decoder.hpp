/**
 * @file decoder.hpp
 * @brief activPAL body decompression.
 *
 * The body is a stream of 3-byte (x, y, z) groups. Each group is one of:
 * - tail marker: end of valid data, scanning stops
 * - invalid sentinel (255, 255, 255): repeat the previous sample once
 * - run-length group (0, 0, n): repeat the previous sample n times
 *   (n + 1 times for firmware older than 218)
 * - anything else: a literal sample
 *
 * Decoding is a single forward pass; each repeat depends on the row
 * produced immediately before it.
 */

#ifndef PALRAW_DECODER_HPP
#define PALRAW_DECODER_HPP

#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "groupreader.hpp"
#include "layout.hpp"

namespace palraw {

/**
 * @brief One raw accelerometer sample, one byte per axis.
 */
struct RawSample {
    std::uint8_t x;
    std::uint8_t y;
    std::uint8_t z;

    bool operator==(const RawSample&) const = default;
};

/**
 * @brief Upper bound on decoded rows for a body of the given size.
 *
 * @param body_size Body size in bytes
 * @return floor(body_size / 3) * 255
 */
constexpr std::size_t max_decoded_rows(std::size_t body_size) noexcept {
    return (body_size / GROUP_BYTES) * MAX_ROWS_PER_GROUP;
}

namespace detail {

/**
 * @brief Check for the end-of-data marker at the reader's position.
 *
 * .datx: "t", "a", "i" as the group followed by "l".
 * .dat:  0, 0, >0, 0, 0, >0, >0, 0 starting at the group.
 * Look-ahead bytes past the end of the body never match.
 */
inline bool is_tail(const GroupReader& reader, Layout layout) noexcept {
    const std::uint8_t* g = reader.group();
    if (layout == Layout::Datx) {
        return g[0] == DATX_TAIL[0] && g[1] == DATX_TAIL[1] && g[2] == DATX_TAIL[2] &&
               reader.peek(3) == DATX_TAIL[3];
    }
    return g[0] == 0 && g[1] == 0 && g[2] > 0 && reader.peek(3) == 0 && reader.peek(4) == 0 &&
           reader.peek(5) > 0 && reader.peek(6) > 0 && reader.peek(7) == 0;
}

} // namespace detail

/**
 * @brief Decode a body into a caller-supplied buffer.
 *
 * @param body Encoded body bytes (everything after the header)
 * @param body_size Body size in bytes
 * @param firmware Firmware version from the header
 * @param layout File layout (selects the tail marker)
 * @param output Output buffer
 * @param output_capacity Output buffer size in samples
 * @param[out] output_rows Number of decoded samples
 * @return Error::Ok on success,
 *         Error::MissingPriorSample if a repeat group precedes every sample,
 *         Error::Overflow if the decoded rows exceed output_capacity
 */
inline Error decode_body(const std::uint8_t* body, std::size_t body_size, int firmware,
                         Layout layout, RawSample* output, std::size_t output_capacity,
                         std::size_t& output_rows) noexcept {
    const std::size_t extra_repeat = (firmware < RUN_LENGTH_FIRMWARE) ? 1U : 0U;

    GroupReader reader(body, body_size);
    std::size_t row = 0;

    for (; reader.has_group(); reader.advance()) {
        const std::uint8_t* g = reader.group();
        const std::uint8_t x = g[0];
        const std::uint8_t y = g[1];
        const std::uint8_t z = g[2];

        // Tail groups always start with 0 in .dat or 't' in .datx
        if ((x == 0 || x == DATX_TAIL[0]) && detail::is_tail(reader, layout)) {
            break;
        }

        std::size_t repeats;
        if (x == 255 && y == 255 && z == 255) {
            repeats = 1;
        } else if (x == 0 && y == 0) {
            repeats = static_cast<std::size_t>(z) + extra_repeat;
        } else {
            if (row >= output_capacity) [[unlikely]] {
                return Error::Overflow;
            }
            output[row].x = x;
            output[row].y = y;
            output[row].z = z;
            ++row;
            continue;
        }

        if (row == 0) [[unlikely]] {
            return Error::MissingPriorSample;
        }
        if (repeats > output_capacity - row) [[unlikely]] {
            return Error::Overflow;
        }

        const RawSample prev = output[row - 1];
        for (std::size_t r = 0; r < repeats; ++r) {
            output[row + r] = prev;
        }
        row += repeats;
    }

    output_rows = row;
    return Error::Ok;
}

/**
 * @brief Decode a body into a vector.
 *
 * The vector starts at one row per group and grows only when run-length
 * groups expand past that. The max_decoded_rows(body_size) bound is
 * enforced on the row count. On error the vector is left empty.
 *
 * @param body Encoded body bytes
 * @param body_size Body size in bytes
 * @param firmware Firmware version from the header
 * @param layout File layout
 * @param[out] samples Decoded samples
 * @return Error::Ok on success (see the buffer overload for failures)
 */
inline Error decode_body(const std::uint8_t* body, std::size_t body_size, int firmware,
                         Layout layout, std::vector<RawSample>& samples) {
    samples.clear();

    const std::size_t bound = max_decoded_rows(body_size);
    const std::size_t extra_repeat = (firmware < RUN_LENGTH_FIRMWARE) ? 1U : 0U;
    samples.reserve(body_size / GROUP_BYTES);

    for (GroupReader reader(body, body_size); reader.has_group(); reader.advance()) {
        const std::uint8_t* g = reader.group();
        const std::uint8_t x = g[0];
        const std::uint8_t y = g[1];
        const std::uint8_t z = g[2];

        if ((x == 0 || x == DATX_TAIL[0]) && detail::is_tail(reader, layout)) {
            break;
        }

        std::size_t repeats;
        if (x == 255 && y == 255 && z == 255) {
            repeats = 1;
        } else if (x == 0 && y == 0) {
            repeats = static_cast<std::size_t>(z) + extra_repeat;
        } else {
            if (samples.size() >= bound) [[unlikely]] {
                samples.clear();
                return Error::Overflow;
            }
            samples.push_back(RawSample{x, y, z});
            continue;
        }

        if (samples.empty()) [[unlikely]] {
            return Error::MissingPriorSample;
        }
        if (repeats > bound - samples.size()) [[unlikely]] {
            samples.clear();
            return Error::Overflow;
        }
        const RawSample prev = samples.back();
        samples.insert(samples.end(), repeats, prev);
    }

    return Error::Ok;
}

} // namespace palraw

#endif // PALRAW_DECODER_HPP
