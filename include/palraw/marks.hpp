/**
 * @file marks.hpp
 * @brief Event marks placed on a recording.
 *
 * A mark snaps to the nearest magnitude peak around a chosen sample and
 * is persisted as one row of a CSV log shared across files.
 */

#ifndef PALRAW_MARKS_HPP
#define PALRAW_MARKS_HPP

#include <optional>
#include <string>

#include "config.hpp"
#include "error.hpp"
#include "timestamp.hpp"

namespace palraw {

/**
 * @brief One marked sample.
 */
struct Mark {
    std::string file;              ///< Source recording path
    std::size_t sample = 0;        ///< Row index
    Timestamp timestamp{};         ///< Timestamp of the row
    std::optional<int> confidence; ///< 1-10, empty if not rated
};

/// Header row of the marks CSV
inline constexpr const char* MARKS_CSV_HEADER = "File,Sample,DateTime,Confidence";

/**
 * @brief Find the local magnitude peak closest to a sample.
 *
 * Searches [sample - 1200, sample + 1200) clipped to the series. A local
 * maximum is strictly greater than its PEAK_ORDER neighbours on each side
 * (neighbours clipped to the window). If the window holds a maximum and its
 * peak-to-trough swing exceeds PEAK_MIN_SWING, the closest maximum wins
 * (the earlier one on a tie); otherwise the sample itself is returned.
 *
 * @param values Magnitude channel
 * @param size Number of values
 * @param sample Starting row
 * @param[out] peak Selected row
 * @return Error::Ok, or Error::InvalidArg if sample is out of range
 */
Error nearest_peak(const double* values, std::size_t size, std::size_t sample,
                   std::size_t& peak) noexcept;

/**
 * @brief Append a mark to a CSV file.
 *
 * Writes MARKS_CSV_HEADER first if the file does not exist yet. A missing
 * confidence is written as NaN.
 *
 * @param csv_path Marks file
 * @param mark Mark to append
 * @return Error::Ok, Error::InvalidArg for confidence outside 1-10,
 *         Error::IoError
 */
Error append_mark(const std::string& csv_path, const Mark& mark);

} // namespace palraw

#endif // PALRAW_MARKS_HPP
