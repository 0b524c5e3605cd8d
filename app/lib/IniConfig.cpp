#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <utility>
#include <spdlog/spdlog.h>

namespace {

bool is_comment_or_blank(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

std::optional<std::string> section_name(const std::string& line)
{
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        return Utils::trim(line.substr(1, line.size() - 2));
    }
    return std::nullopt;
}

std::string unquote(std::string value)
{
    if (value.size() >= 2) {
        const char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

std::optional<std::pair<std::string, std::string>> key_value(const std::string& line)
{
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = Utils::trim(line.substr(0, delimiter));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), unquote(Utils::trim(line.substr(delimiter + 1))));
}

}

bool IniConfig::load(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Failed to open config file: {}", filename);
        } else {
            std::fprintf(stderr, "Failed to open config file: %s\n", filename.c_str());
        }
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    parse(content.str());
    return true;
}

void IniConfig::parse(const std::string& content)
{
    std::istringstream stream(content);
    std::string raw_line;
    std::string section;
    while (std::getline(stream, raw_line)) {
        const std::string line = Utils::trim(raw_line);
        if (is_comment_or_blank(line)) {
            continue;
        }
        if (auto name = section_name(line)) {
            section = *name;
            continue;
        }
        if (auto entry = key_value(line)) {
            data_[section][entry->first] = entry->second;
        }
    }
}

std::optional<std::string> IniConfig::get_value(const std::string& section, const std::string& key) const
{
    const auto sec_it = data_.find(section);
    if (sec_it == data_.end()) {
        return std::nullopt;
    }
    const auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) {
        return std::nullopt;
    }
    return key_it->second;
}

std::string IniConfig::get_value_or(const std::string& section, const std::string& key, const std::string& default_value) const
{
    return get_value(section, key).value_or(default_value);
}

bool IniConfig::has_value(const std::string& section, const std::string& key) const
{
    return get_value(section, key).has_value();
}

void IniConfig::set_value(const std::string& section, const std::string& key, const std::string& value)
{
    data_[section][key] = value;
}

std::vector<std::string> IniConfig::sections() const
{
    std::vector<std::string> names;
    names.reserve(data_.size());
    for (const auto& entry : data_) {
        names.push_back(entry.first);
    }
    return names;
}
