#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
const char* kLoggerNames[] = {"core_logger", "net_logger"};

spdlog::level::level_enum parse_level(const std::string& level)
{
    const auto parsed = spdlog::level::from_str(level);
    // from_str() maps unknown names to "off"; keep logging enabled unless asked otherwise.
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}
}


std::string Logger::get_log_directory()
{
    namespace fs = std::filesystem;
    if (const char* state_home = std::getenv("XDG_STATE_HOME"); state_home && *state_home) {
        return (fs::path(state_home) / "llm-gateway").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / ".local" / "state" / "llm-gateway").string();
    }
    return (fs::temp_directory_path() / "llm-gateway").string();
}


std::string Logger::get_log_file_path()
{
    return (std::filesystem::path(get_log_directory()) / "gateway.log").string();
}


void Logger::setup_loggers(const std::string& level)
{
    std::filesystem::create_directories(get_log_directory());

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        get_log_file_path(), kMaxLogFileBytes, kMaxLogFiles);
    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};

    const auto resolved_level = parse_level(level);
    for (const char* name : kLoggerNames) {
        if (spdlog::get(name)) {
            spdlog::drop(name);
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_pattern("%Y-%m-%dT%H:%M:%S.%eZ | %l | %n | %v", spdlog::pattern_time_type::utc);
        logger->set_level(resolved_level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}

