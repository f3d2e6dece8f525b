/**
 * @file error.hpp
 * @brief palraw error handling.
 *
 * Provides both exception-based and error-code-based error handling.
 * The leaf decoders return Error codes; Recording offers both forms.
 */

#ifndef PALRAW_ERROR_HPP
#define PALRAW_ERROR_HPP

#include "config.hpp"

#if !PALRAW_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace palraw {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                   ///< Success
    InvalidArg = -1,          ///< Invalid argument
    UnsupportedFormat = -2,   ///< File extension is neither .dat nor .datx
    HeaderTooShort = -3,      ///< Fewer header bytes than the layout requires
    InvalidDate = -4,         ///< Calendar field out of range
    NotFound = -5,            ///< Path does not reference an existing file
    InvalidCodeLength = -6,   ///< File code longer than 8 characters
    IoError = -7,             ///< Read or write failed
    MissingPriorSample = -8,  ///< Repeat group with no previous sample
    Overflow = -9,            ///< Decoded rows exceed the output bound
    InvalidSampleRate = -10   ///< Sample rate of zero
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::UnsupportedFormat:
        return "Unsupported file format";
    case Error::HeaderTooShort:
        return "Header too short";
    case Error::InvalidDate:
        return "Invalid date in header";
    case Error::NotFound:
        return "File not found";
    case Error::InvalidCodeLength:
        return "File code longer than 8 characters";
    case Error::IoError:
        return "I/O error";
    case Error::MissingPriorSample:
        return "Repeat group with no prior sample";
    case Error::Overflow:
        return "Decoded data exceeds output bound";
    case Error::InvalidSampleRate:
        return "Invalid sample rate";
    default:
        return "Unknown error";
    }
}

#if !PALRAW_NO_EXCEPTIONS

/**
 * @brief Base exception for palraw errors.
 */
class PalException : public std::runtime_error {
public:
    explicit PalException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for files with an unknown extension.
 */
class UnsupportedFormatException : public PalException {
public:
    explicit UnsupportedFormatException(const std::string& message)
        : PalException(message, Error::UnsupportedFormat) {}
};

/**
 * @brief Exception for truncated headers.
 */
class HeaderTooShortException : public PalException {
public:
    explicit HeaderTooShortException(const std::string& message)
        : PalException(message, Error::HeaderTooShort) {}
};

/**
 * @brief Exception for out-of-range start/stop dates.
 */
class InvalidDateException : public PalException {
public:
    explicit InvalidDateException(const std::string& message)
        : PalException(message, Error::InvalidDate) {}
};

/**
 * @brief Exception for missing files.
 */
class NotFoundException : public PalException {
public:
    explicit NotFoundException(const std::string& message)
        : PalException(message, Error::NotFound) {}
};

/**
 * @brief Exception for file codes longer than 8 characters.
 */
class InvalidCodeLengthException : public PalException {
public:
    explicit InvalidCodeLengthException(const std::string& message)
        : PalException(message, Error::InvalidCodeLength) {}
};

/**
 * @brief Exception for failed reads and writes.
 */
class IoException : public PalException {
public:
    explicit IoException(const std::string& message)
        : PalException(message, Error::IoError) {}
};

/**
 * @brief Exception for bodies or headers that cannot be decoded.
 */
class InvalidDataException : public PalException {
public:
    explicit InvalidDataException(const std::string& message, Error code)
        : PalException(message, code) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * @param error Error code (must not be Error::Ok)
 * @param context Path or operation the error refers to
 */
[[noreturn]] void throw_error(Error error, const std::string& context);

#endif // !PALRAW_NO_EXCEPTIONS

} // namespace palraw

#endif // PALRAW_ERROR_HPP
