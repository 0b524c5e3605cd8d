#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::string trim(std::string_view value);

/// ASCII-only lowercase; multibyte UTF-8 sequences pass through unchanged.
std::string to_lower(std::string_view value);

bool contains_ci(std::string_view haystack, std::string_view needle);

std::string strip_trailing_slashes(std::string value);

std::string base64_encode(std::string_view data);

/**
 * @brief Reads a whole file into memory.
 * @throws std::runtime_error when the file cannot be opened.
 */
std::string read_file(const std::string& path);

std::string format_megabytes(unsigned long long bytes);

}

#endif
