#include "Settings.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdlib>
#include <stdexcept>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>


namespace {

struct SettingKey {
    const char* env;
    const char* section;
    const char* ini_key;
};

const std::vector<SettingKey>& setting_keys()
{
    static const std::vector<SettingKey> keys{
        {"OLLAMA_BASE_URL", "ollama", "base_url"},
        {"OLLAMA_CLOUD_URL", "ollama", "cloud_url"},
        {"OLLAMA_API_KEY", "ollama", "api_key"},
        {"OLLAMA_AUTH_SCHEME", "ollama", "auth_scheme"},
        {"OLLAMA_DEFAULT_MODEL", "ollama", "default_model"},
        {"OLLAMA_USE_CHAT_API", "ollama", "use_chat_api"},
        {"OLLAMA_KEEP_ALIVE", "ollama", "keep_alive"},
        {"OLLAMA_RETRIES", "ollama", "retries"},
        {"OLLAMA_CATALOG_URL", "ollama", "catalog_url"},
        {"REQUEST_TIMEOUT_SECONDS", "gateway", "request_timeout_seconds"},
        {"LOG_LEVEL", "gateway", "log_level"},
    };
    return keys;
}

std::optional<std::string> env_value(const char* name)
{
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

void require_non_empty(const char* key, const std::string& value)
{
    if (Utils::trim(value).empty()) {
        throw std::invalid_argument(std::string(key) + " must not be empty");
    }
}

}


Settings::Settings()
    : base_url("http://localhost:11434"),
      cloud_url("https://ollama.com"),
      auth_scheme("Bearer"),
      default_model("llama3"),
      use_chat_api(true),
      keep_alive("5m"),
      request_timeout_seconds(60),
      retries(2),
      catalog_url("https://ollama.com/library"),
      log_level("info")
{
}


void Settings::load()
{
    if (auto path = env_value(kConfigEnv); path && !Utils::trim(*path).empty()) {
        IniConfig config;
        if (!config.load(*path)) {
            throw std::invalid_argument(std::string(kConfigEnv) + ": cannot read " + *path);
        }
        config_path = *path;
        apply_ini(config);
    }
    apply_environment();
    validate();

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("settings_loaded base_url={} cloud_url={} credential={} model={} retries={} timeout={}",
                      base_url, cloud_url, api_key ? "yes" : "no", default_model, retries, request_timeout_seconds);
    }
}


void Settings::apply_ini(const IniConfig& config)
{
    for (const auto& key : setting_keys()) {
        if (auto value = config.get_value(key.section, key.ini_key)) {
            set_field(key.env, *value);
        }
    }
}


void Settings::apply_environment()
{
    for (const auto& key : setting_keys()) {
        if (auto value = env_value(key.env)) {
            set_field(key.env, *value);
        }
    }
}


void Settings::set_field(const std::string& key, const std::string& value)
{
    const std::string trimmed = Utils::trim(value);
    if (key == "OLLAMA_BASE_URL") {
        base_url = Utils::strip_trailing_slashes(trimmed);
    } else if (key == "OLLAMA_CLOUD_URL") {
        cloud_url = Utils::strip_trailing_slashes(trimmed);
    } else if (key == "OLLAMA_API_KEY") {
        api_key = trimmed.empty() ? std::nullopt : std::optional<std::string>(trimmed);
    } else if (key == "OLLAMA_AUTH_SCHEME") {
        auth_scheme = trimmed;
    } else if (key == "OLLAMA_DEFAULT_MODEL") {
        default_model = trimmed;
    } else if (key == "OLLAMA_USE_CHAT_API") {
        use_chat_api = parse_bool(key, trimmed);
    } else if (key == "OLLAMA_KEEP_ALIVE") {
        keep_alive = trimmed;
    } else if (key == "OLLAMA_RETRIES") {
        retries = parse_int(key, trimmed);
    } else if (key == "OLLAMA_CATALOG_URL") {
        catalog_url = trimmed;
    } else if (key == "REQUEST_TIMEOUT_SECONDS") {
        request_timeout_seconds = parse_int(key, trimmed);
    } else if (key == "LOG_LEVEL") {
        log_level = Utils::to_lower(trimmed);
    }
}


void Settings::validate() const
{
    require_non_empty("OLLAMA_BASE_URL", base_url);
    require_non_empty("OLLAMA_AUTH_SCHEME", auth_scheme);
    require_non_empty("OLLAMA_DEFAULT_MODEL", default_model);
    require_non_empty("OLLAMA_KEEP_ALIVE", keep_alive);
    if (request_timeout_seconds < kMinTimeoutSeconds) {
        throw std::invalid_argument("REQUEST_TIMEOUT_SECONDS must be at least " + std::to_string(kMinTimeoutSeconds));
    }
    if (retries < 0) {
        throw std::invalid_argument("OLLAMA_RETRIES must not be negative");
    }
}


bool Settings::parse_bool(const std::string& key, const std::string& value)
{
    const std::string lowered = Utils::to_lower(Utils::trim(value));
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw std::invalid_argument(key + " must be a boolean, got '" + value + "'");
}


int Settings::parse_int(const std::string& key, const std::string& value)
{
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(key + " must be an integer, got '" + value + "'");
    }
    return parsed;
}
