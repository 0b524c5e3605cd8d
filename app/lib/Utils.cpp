#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>


std::string Utils::trim(std::string_view value)
{
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(begin, end - begin + 1));
}


std::string Utils::to_lower(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return ch < 0x80 ? static_cast<char>(std::tolower(ch)) : static_cast<char>(ch);
    });
    return result;
}


bool Utils::contains_ci(std::string_view haystack, std::string_view needle)
{
    if (needle.empty()) {
        return true;
    }
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}


std::string Utils::strip_trailing_slashes(std::string value)
{
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}


std::string Utils::base64_encode(std::string_view data)
{
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const unsigned int chunk = (static_cast<unsigned char>(data[i]) << 16)
                                 | (static_cast<unsigned char>(data[i + 1]) << 8)
                                 | static_cast<unsigned char>(data[i + 2]);
        encoded.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        encoded.push_back(kAlphabet[chunk & 0x3F]);
    }

    const std::size_t remaining = data.size() - i;
    if (remaining == 1) {
        const unsigned int chunk = static_cast<unsigned char>(data[i]) << 16;
        encoded.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        encoded.append("==");
    } else if (remaining == 2) {
        const unsigned int chunk = (static_cast<unsigned char>(data[i]) << 16)
                                 | (static_cast<unsigned char>(data[i + 1]) << 8);
        encoded.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        encoded.push_back('=');
    }
    return encoded;
}


std::string Utils::read_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}


std::string Utils::format_megabytes(unsigned long long bytes)
{
    return fmt::format("{:.1f} MB", static_cast<double>(bytes) / 1048576.0);
}
