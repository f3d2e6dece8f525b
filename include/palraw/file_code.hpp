/**
 * @file file_code.hpp
 * @brief In-place rewrite of the file code header field.
 */

#ifndef PALRAW_FILE_CODE_HPP
#define PALRAW_FILE_CODE_HPP

#include <string>

#include "config.hpp"
#include "error.hpp"

namespace palraw {

/**
 * @brief Overwrite the 8-byte file code at offset 512 of a raw data file.
 *
 * The code is null-padded to 8 bytes and written in place. Nothing is
 * backed up: an I/O failure part way through can leave the field partially
 * written. Concurrent writers to the same file must be serialized by the
 * caller.
 *
 * @param path Existing raw data file
 * @param code Up to 8 ASCII characters
 * @return Error::Ok on success, Error::NotFound, Error::InvalidCodeLength,
 *         Error::InvalidArg for non-ASCII characters, Error::IoError
 */
Error set_file_code(const std::string& path, const std::string& code);

} // namespace palraw

#endif // PALRAW_FILE_CODE_HPP
