/**
 * @file fixtures.hpp
 * @brief Synthetic headers, bodies and temporary files for the tests.
 */

#ifndef PALRAW_TEST_FIXTURES_HPP
#define PALRAW_TEST_FIXTURES_HPP

#include <palraw/config.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <string>
#include <vector>

namespace fixtures {

/**
 * @brief A header with every field set to a known value.
 *
 * firmware 220, 8-bit, +-2 g, 20 Hz, 3 axes,
 * start 2016-12-06 10:00:00, stop 2016-12-13 10:00:00,
 * start "Immediately", stop "USB", file code "AB12", device id 450291.
 */
inline std::vector<std::uint8_t> make_header(std::size_t length = palraw::DATX_HEADER_LENGTH) {
    std::vector<std::uint8_t> h(length, 0);

    h[17] = 220; // firmware low
    h[39] = 0;   // firmware high
    h[35] = 20;  // hz
    h[38] = 0;   // 8-bit, resolution code 0
    h[280] = 0;  // 3 axes

    // start: h, m, s, day, month, year - 2000
    h[256] = 10;
    h[257] = 0;
    h[258] = 0;
    h[259] = 6;
    h[260] = 12;
    h[261] = 16;

    // stop
    h[262] = 10;
    h[263] = 0;
    h[264] = 0;
    h[265] = 13;
    h[266] = 12;
    h[267] = 16;

    h[268] = 1;  // Immediately
    h[275] = 64; // USB

    h[512] = 'A';
    h[513] = 'B';
    h[514] = '1';
    h[515] = '2';

    // device id: 4 * 100000 + 5 * 10000 + 0 * 4096 + 1 * 256 + 2 * 16 + 3
    h[10] = 14;
    h[11] = 1;
    h[12] = 2;
    h[13] = 3;
    h[14] = 5;
    h[40] = 0;

    return h;
}

/// Device id of make_header()
inline constexpr int HEADER_DEVICE_ID = 450291;

/**
 * @brief Concatenate a header and body bytes.
 */
inline std::vector<std::uint8_t> make_file(const std::vector<std::uint8_t>& header,
                                           std::initializer_list<std::uint8_t> body) {
    std::vector<std::uint8_t> content(header);
    content.insert(content.end(), body.begin(), body.end());
    return content;
}

inline std::vector<std::uint8_t> make_file(const std::vector<std::uint8_t>& header,
                                           const std::vector<std::uint8_t>& body) {
    std::vector<std::uint8_t> content(header);
    content.insert(content.end(), body.begin(), body.end());
    return content;
}

/**
 * @brief Path under the system temp directory, removed if it exists.
 */
inline std::string temp_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("palraw_test_" + name);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return path.string();
}

inline void write_file(const std::string& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
}

inline std::vector<std::uint8_t> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(file)),
                                     std::istreambuf_iterator<char>());
}

inline std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace fixtures

#endif // PALRAW_TEST_FIXTURES_HPP
