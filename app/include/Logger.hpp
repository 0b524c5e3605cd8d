#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>


class Logger
{
public:
    /**
     * @brief Creates core_logger and net_logger with a shared console and rotating file sink.
     * @param level spdlog level name ("trace" .. "critical"); unknown names fall back to info.
     */
    static void setup_loggers(const std::string& level = "info");

    /**
     * @brief Returns a registered logger.
     * @param name Logger name.
     * @return Logger, or nullptr when setup_loggers() has not run.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string get_log_directory();

private:
    static std::string get_log_file_path();
};

#endif
