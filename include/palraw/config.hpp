/**
 * @file config.hpp
 * @brief palraw compile-time configuration.
 *
 * Byte offsets, layout constants and scaling factors for activPAL raw
 * data files (.dat and .datx).
 */

#ifndef PALRAW_CONFIG_HPP
#define PALRAW_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace palraw {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 2;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup layout File Layout Constants
 * @{
 */

/// Header length of a .datx file in bytes
inline constexpr std::size_t DATX_HEADER_LENGTH = 1024U;

/// Header length of a .dat file in bytes
inline constexpr std::size_t DAT_HEADER_LENGTH = 1023U;

/// Bytes the header extractor needs (highest field offset is 519)
inline constexpr std::size_t MIN_HEADER_LENGTH = 520U;

/// Offset and width of the ASCII file code field
inline constexpr std::size_t FILE_CODE_OFFSET = 512U;
inline constexpr std::size_t FILE_CODE_LENGTH = 8U;

/// Bytes per encoded body group (x, y, z)
inline constexpr std::size_t GROUP_BYTES = 3U;

/// Maximum rows a single group can expand to, used to pre-size output
inline constexpr std::size_t MAX_ROWS_PER_GROUP = 255U;

/// Firmware below this repeats a compressed sample z + 1 times instead of z
inline constexpr int RUN_LENGTH_FIRMWARE = 218;

/// .datx tail marker "tail"
inline constexpr std::uint8_t DATX_TAIL[4] = {116U, 97U, 105U, 108U};

/** @} */

/**
 * @defgroup units Unit Conversion
 *
 * g = (raw - RAW_OFFSET) / RAW_PER_G
 * @{
 */
inline constexpr double RAW_OFFSET = 127.0;
inline constexpr double RAW_PER_G = 63.0;
/** @} */

/**
 * @defgroup marks Mark Placement
 * @{
 */

/// Half-width (samples) of the window searched for a magnitude peak
inline constexpr std::size_t PEAK_SEARCH_HALF_WIDTH = 1200U;

/// Neighbours on each side a local maximum must exceed
inline constexpr std::size_t PEAK_ORDER = 3U;

/// Minimum peak-to-trough swing (g) for a window to count as active
inline constexpr double PEAK_MIN_SWING = 0.25;

inline constexpr int MIN_CONFIDENCE = 1;
inline constexpr int MAX_CONFIDENCE = 10;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define PALRAW_NO_EXCEPTIONS=1 to build the error-code API only.
 * @{
 */
#ifndef PALRAW_NO_EXCEPTIONS
#define PALRAW_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace palraw

#endif // PALRAW_CONFIG_HPP
