/**
 * @file marks.cpp
 * @brief Event marks placed on a recording.
 */

#include <palraw/marks.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace palraw {

namespace {

/**
 * @brief Whether window[j] exceeds its PEAK_ORDER neighbours on each side.
 *
 * Neighbour indices are clipped to [0, n), so the first and last entries
 * compare against themselves and never qualify.
 */
bool is_local_max(const double* window, std::size_t n, std::size_t j) noexcept {
    for (std::size_t k = 1; k <= PEAK_ORDER; ++k) {
        const std::size_t left = (j >= k) ? j - k : 0;
        const std::size_t right = std::min(j + k, n - 1);
        if (!(window[j] > window[left]) || !(window[j] > window[right])) {
            return false;
        }
    }
    return true;
}

} // namespace

Error nearest_peak(const double* values, std::size_t size, std::size_t sample,
                   std::size_t& peak) noexcept {
    if (values == nullptr || sample >= size) {
        return Error::InvalidArg;
    }

    const std::size_t start = (sample > PEAK_SEARCH_HALF_WIDTH) ? sample - PEAK_SEARCH_HALF_WIDTH
                                                                 : 0;
    const std::size_t end = std::min(size, sample + PEAK_SEARCH_HALF_WIDTH);
    const double* window = values + start;
    const std::size_t n = end - start;

    const auto [lo, hi] = std::minmax_element(window, window + n);
    const double swing = *hi - *lo;

    bool found = false;
    std::size_t best = sample;
    std::size_t best_distance = 0;
    for (std::size_t j = 0; j < n; ++j) {
        if (!is_local_max(window, n, j)) {
            continue;
        }
        const std::size_t candidate = start + j;
        const std::size_t distance = (candidate > sample) ? candidate - sample
                                                          : sample - candidate;
        if (!found || distance < best_distance) {
            found = true;
            best = candidate;
            best_distance = distance;
        }
    }

    peak = (found && swing > PEAK_MIN_SWING) ? best : sample;
    return Error::Ok;
}

Error append_mark(const std::string& csv_path, const Mark& mark) {
    if (mark.confidence &&
        (*mark.confidence < MIN_CONFIDENCE || *mark.confidence > MAX_CONFIDENCE)) {
        return Error::InvalidArg;
    }

    std::error_code ec;
    const bool exists = std::filesystem::exists(csv_path, ec);

    std::ofstream file(csv_path, std::ios::app);
    if (!file) {
        return Error::IoError;
    }

    if (!exists) {
        file << MARKS_CSV_HEADER << '\n';
    }

    file << mark.file << ',' << mark.sample << ',' << format_timestamp(mark.timestamp) << ',';
    if (mark.confidence) {
        file << *mark.confidence;
    } else {
        file << "NaN";
    }
    file << '\n';

    file.flush();
    if (!file) {
        return Error::IoError;
    }
    return Error::Ok;
}

} // namespace palraw
