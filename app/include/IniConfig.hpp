#ifndef INI_CONFIG_HPP
#define INI_CONFIG_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Minimal INI reader: [section] headers, key = value pairs, ';' or '#' comments.
 */
class IniConfig {
public:
    bool load(const std::string& filename);
    void parse(const std::string& content);

    std::optional<std::string> get_value(const std::string& section, const std::string& key) const;
    std::string get_value_or(const std::string& section, const std::string& key, const std::string& default_value) const;
    bool has_value(const std::string& section, const std::string& key) const;
    void set_value(const std::string& section, const std::string& key, const std::string& value);

    std::vector<std::string> sections() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data_;
};

#endif // INI_CONFIG_HPP
