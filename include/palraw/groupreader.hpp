/**
 * @file groupreader.hpp
 * @brief Sequential reading of 3-byte sample groups from a body buffer.
 *
 * The group reader walks the encoded body one (x, y, z) group at a time and
 * offers bounded look-ahead for the tail marker checks, which inspect bytes
 * past the current group.
 */

#ifndef PALRAW_GROUPREADER_HPP
#define PALRAW_GROUPREADER_HPP

#include "config.hpp"

namespace palraw {

/**
 * @brief Sequential group reader for an encoded body.
 *
 * Tracks position within a byte buffer. A trailing partial group (fewer
 * than GROUP_BYTES bytes) is never returned.
 */
class GroupReader {
public:
    /**
     * @brief Construct a group reader.
     *
     * @param data Pointer to body data
     * @param size Number of valid bytes in buffer
     */
    GroupReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Whether a complete group is available at the current position.
     */
    [[nodiscard]] bool has_group() const noexcept {
        return size_ - pos_ >= GROUP_BYTES;
    }

    /**
     * @brief Byte at an offset from the start of the current group.
     *
     * @param offset Offset from current position
     * @return Byte value (0-255), or -1 past the end of the buffer
     */
    [[nodiscard]] inline int peek(std::size_t offset) const noexcept {
        if (offset >= size_ - pos_) [[unlikely]] {
            return -1;
        }
        return data_[pos_ + offset];
    }

    /**
     * @brief Pointer to the current group.
     *
     * Only valid while has_group() is true.
     */
    [[nodiscard]] const std::uint8_t* group() const noexcept {
        return data_ + pos_;
    }

    /**
     * @brief Advance to the next group.
     */
    void advance() noexcept {
        pos_ += GROUP_BYTES;
    }

    /**
     * @brief Get current byte position.
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes, including any trailing partial group.
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return size_ - pos_;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace palraw

#endif // PALRAW_GROUPREADER_HPP
