/**
 * @file recording.hpp
 * @brief Loading activPAL raw data files.
 *
 * load_raw() reads a file, splits header and body by layout and decodes
 * both. Recording wraps the result in g-units with synthesized timestamps
 * and a cached magnitude channel.
 */

#ifndef PALRAW_RECORDING_HPP
#define PALRAW_RECORDING_HPP

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "header.hpp"
#include "layout.hpp"
#include "timestamp.hpp"

namespace palraw {

/**
 * @brief Read and decode a raw data file.
 *
 * @param path Path to a .dat or .datx file
 * @param[out] meta Header metadata
 * @param[out] samples Decoded raw samples
 * @return Error::Ok on success, Error::UnsupportedFormat, Error::NotFound,
 *         Error::IoError, Error::HeaderTooShort, Error::InvalidDate,
 *         Error::MissingPriorSample, Error::Overflow
 */
Error load_raw(const std::string& path, Metadata& meta, std::vector<RawSample>& samples);

/**
 * @brief Convert a raw axis byte to g.
 */
constexpr double raw_to_g(std::uint8_t raw) noexcept {
    return (static_cast<double>(raw) - RAW_OFFSET) / RAW_PER_G;
}

/**
 * @brief Interval between samples at a sample rate.
 *
 * @param hz Sample rate (must be non-zero)
 * @return 1e9 / hz nanoseconds, truncated
 */
constexpr std::chrono::nanoseconds sample_interval(int hz) noexcept {
    return std::chrono::nanoseconds{1'000'000'000LL / hz};
}

/**
 * @brief A decoded recording: metadata plus tri-axial signals in g.
 *
 * Sample i is timestamped start_datetime + i * sample_interval(hz); the
 * series is not reconciled against stop_datetime. All accessors return
 * copies. The magnitude channel is computed on first access and cached.
 */
class Recording {
public:
    /**
     * @brief Empty recording; fill it with create() or load().
     */
    Recording() = default;

    /**
     * @brief Build a recording from already decoded data.
     *
     * @param meta Header metadata
     * @param samples Raw samples
     * @param[out] rec Recording, untouched on error
     * @return Error::Ok on success, Error::InvalidSampleRate if meta.hz is zero
     */
    static Error create(Metadata meta, const std::vector<RawSample>& samples, Recording& rec);

    /**
     * @brief Load a recording from file.
     *
     * @param path Path to a .dat or .datx file
     * @param[out] rec Recording, untouched on error
     * @return Error::Ok on success, any load_raw() error, Error::InvalidSampleRate
     */
    static Error load(const std::string& path, Recording& rec);

#if !PALRAW_NO_EXCEPTIONS
    /**
     * @brief Load a recording from file.
     *
     * @param path Path to a .dat or .datx file
     * @throws PalException subclass matching the load_raw() error
     */
    static Recording load(const std::string& path);

    /**
     * @brief Build a recording from already decoded data.
     *
     * @param meta Header metadata
     * @param samples Raw samples
     * @throws InvalidDataException if meta.hz is zero
     */
    Recording(Metadata meta, const std::vector<RawSample>& samples);
#endif

    Metadata metadata() const {
        return meta_;
    }

    std::size_t size() const noexcept {
        return x_.size();
    }

    std::vector<double> x() const {
        return x_;
    }

    std::vector<double> y() const {
        return y_;
    }

    std::vector<double> z() const {
        return z_;
    }

    /**
     * @brief Root sum of squares of the three axes, per sample.
     */
    std::vector<double> rss() const;

    /**
     * @brief Whether rss() has already been computed.
     */
    bool magnitude_cached() const noexcept {
        return rss_.has_value();
    }

    /**
     * @brief Number of times the magnitude channel has been computed.
     */
    std::size_t magnitude_computations() const noexcept {
        return rss_computations_;
    }

    std::vector<Timestamp> timestamps() const;

    /**
     * @brief Timestamp of a single sample.
     */
    Timestamp timestamp(std::size_t row) const noexcept {
        return Timestamp{meta_.start_datetime} +
               interval_ * static_cast<std::chrono::nanoseconds::rep>(row);
    }

    std::chrono::nanoseconds sample_interval() const noexcept {
        return interval_;
    }

private:
    void assign(Metadata meta, const std::vector<RawSample>& samples);

    Metadata meta_{};
    std::chrono::nanoseconds interval_{0};
    std::vector<double> x_;
    std::vector<double> y_;
    std::vector<double> z_;
    mutable std::optional<std::vector<double>> rss_;
    mutable std::size_t rss_computations_ = 0;
};

} // namespace palraw

#endif // PALRAW_RECORDING_HPP
