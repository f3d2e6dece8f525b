/**
 * @file file_code.cpp
 * @brief In-place rewrite of the file code header field.
 */

#include <palraw/file_code.hpp>

#include <array>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace palraw {

Error set_file_code(const std::string& path, const std::string& code) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error::NotFound;
    }
    if (code.size() > FILE_CODE_LENGTH) {
        return Error::InvalidCodeLength;
    }

    std::array<char, FILE_CODE_LENGTH> field{};
    for (std::size_t i = 0; i < code.size(); ++i) {
        if (static_cast<unsigned char>(code[i]) > 0x7F) {
            return Error::InvalidArg;
        }
        field[i] = code[i];
    }

    std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        return Error::IoError;
    }

    file.seekp(static_cast<std::streamoff>(FILE_CODE_OFFSET), std::ios::beg);
    file.write(field.data(), static_cast<std::streamsize>(field.size()));
    file.flush();
    if (!file) {
        return Error::IoError;
    }

    return Error::Ok;
}

} // namespace palraw
