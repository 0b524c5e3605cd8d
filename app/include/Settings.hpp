#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <optional>
#include <string>


/**
 * @brief Gateway configuration: defaults, then an optional INI file, then environment.
 *
 * The INI file is named by LLM_GATEWAY_CONFIG and uses the [ollama] and
 * [gateway] sections. Invalid values raise std::invalid_argument naming the key.
 */
class Settings
{
public:
    static constexpr const char* kConfigEnv = "LLM_GATEWAY_CONFIG";
    static constexpr int kMinTimeoutSeconds = 5;

    Settings();

    /// Reads LLM_GATEWAY_CONFIG (if set) and the process environment.
    void load();

    void apply_ini(const IniConfig& config);
    void apply_environment();
    void validate() const;

    const std::string& get_base_url() const { return base_url; }
    const std::string& get_cloud_url() const { return cloud_url; }
    const std::optional<std::string>& get_api_key() const { return api_key; }
    const std::string& get_auth_scheme() const { return auth_scheme; }
    const std::string& get_default_model() const { return default_model; }
    bool get_use_chat_api() const { return use_chat_api; }
    const std::string& get_keep_alive() const { return keep_alive; }
    int get_request_timeout_seconds() const { return request_timeout_seconds; }
    int get_retries() const { return retries; }
    const std::string& get_catalog_url() const { return catalog_url; }
    const std::string& get_log_level() const { return log_level; }
    const std::string& get_config_path() const { return config_path; }

    static bool parse_bool(const std::string& key, const std::string& value);
    static int parse_int(const std::string& key, const std::string& value);

private:
    void set_field(const std::string& key, const std::string& value);

    std::string base_url;
    std::string cloud_url;
    std::optional<std::string> api_key;
    std::string auth_scheme;
    std::string default_model;
    bool use_chat_api;
    std::string keep_alive;
    int request_timeout_seconds;
    int retries;
    std::string catalog_url;
    std::string log_level;
    std::string config_path;
};

#endif
