/**
 * @file error.cpp
 * @brief Mapping of error codes to exceptions.
 */

#include <palraw/error.hpp>

namespace palraw {

#if !PALRAW_NO_EXCEPTIONS

void throw_error(Error error, const std::string& context) {
    const std::string message = std::string(error_string(error)) + ": " + context;

    switch (error) {
    case Error::UnsupportedFormat:
        throw UnsupportedFormatException(message);
    case Error::HeaderTooShort:
        throw HeaderTooShortException(message);
    case Error::InvalidDate:
        throw InvalidDateException(message);
    case Error::NotFound:
        throw NotFoundException(message);
    case Error::InvalidCodeLength:
        throw InvalidCodeLengthException(message);
    case Error::IoError:
        throw IoException(message);
    case Error::MissingPriorSample:
    case Error::Overflow:
    case Error::InvalidSampleRate:
        throw InvalidDataException(message, error);
    default:
        throw PalException(message, error);
    }
}

#endif // !PALRAW_NO_EXCEPTIONS

} // namespace palraw
