/**
 * @file layout.hpp
 * @brief The two on-disk layouts of activPAL raw data files.
 *
 * The layouts differ only in header length and in the shape of the tail
 * marker that ends the body, so they are modelled as a closed enumeration
 * and selected from the file extension.
 */

#ifndef PALRAW_LAYOUT_HPP
#define PALRAW_LAYOUT_HPP

#include <string>

#include "config.hpp"
#include "error.hpp"

namespace palraw {

/**
 * @brief File layout variant.
 */
enum class Layout {
    Dat, ///< 1023-byte header, 8-byte zero/positive tail pattern
    Datx ///< 1024-byte header, ASCII "tail" marker
};

/**
 * @brief Header length for a layout.
 */
constexpr std::size_t header_length(Layout layout) noexcept {
    return layout == Layout::Datx ? DATX_HEADER_LENGTH : DAT_HEADER_LENGTH;
}

/**
 * @brief Select the layout from a file path's extension.
 *
 * The comparison is case-sensitive: only ".dat" and ".datx" are accepted.
 *
 * @param path File path
 * @param[out] layout Selected layout
 * @return Error::Ok, or Error::UnsupportedFormat for any other extension
 */
inline Error layout_from_path(const std::string& path, Layout& layout) noexcept {
    const std::size_t slash = path.find_last_of("/\\");
    const std::size_t dot = path.find_last_of('.');

    // A leading dot names a hidden file, not an extension
    const std::size_t name_start = (slash == std::string::npos) ? 0 : slash + 1;
    if (dot == std::string::npos || dot <= name_start) {
        return Error::UnsupportedFormat;
    }

    if (path.compare(dot, std::string::npos, ".datx") == 0) {
        layout = Layout::Datx;
        return Error::Ok;
    }
    if (path.compare(dot, std::string::npos, ".dat") == 0) {
        layout = Layout::Dat;
        return Error::Ok;
    }
    return Error::UnsupportedFormat;
}

} // namespace palraw

#endif // PALRAW_LAYOUT_HPP
