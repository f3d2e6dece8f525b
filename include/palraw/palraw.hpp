/**
 * @file palraw.hpp
 * @brief High-level palraw API.
 *
 * Includes every public header. Typical use:
 *
 * @code
 * auto rec = palraw::Recording::load("subject01.datx");
 * auto magnitude = rec.rss();
 * @endcode
 */

#ifndef PALRAW_HPP
#define PALRAW_HPP

#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "file_code.hpp"
#include "groupreader.hpp"
#include "header.hpp"
#include "layout.hpp"
#include "marks.hpp"
#include "recording.hpp"
#include "timestamp.hpp"

namespace palraw {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "0.2.0";
}

} // namespace palraw

#endif // PALRAW_HPP
