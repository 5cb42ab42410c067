#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

/**
 * @brief Process-wide logging facade over a single spdlog logger
 *
 * Every component of the transcode server logs through these static
 * helpers so the level can be changed at runtime from configuration.
 */
class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    static void init(const std::string &log_level = "INFO")
    {
        bool valid = true;
        getLogger()->set_level(toSpdlogLevel(log_level, valid));
        getLogger()->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    }

    static void setLevel(const std::string &log_level)
    {
        bool valid = true;
        spdlog::level::level_enum level = toSpdlogLevel(log_level, valid);
        if (!valid)
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }

        getLogger()->set_level(level);
        info("Log level changed to: " + (valid ? log_level : std::string("INFO")));
    }

    static bool isEnabled(Level level)
    {
        return getLogger()->should_log(toSpdlogLevel(level));
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stdout_color_mt("transcode_server");
        return logger;
    }

    static spdlog::level::level_enum toSpdlogLevel(const std::string &log_level, bool &valid)
    {
        valid = true;
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "INFO")
            return spdlog::level::info;
        if (log_level == "WARN")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;

        valid = false;
        return spdlog::level::info;
    }

    static spdlog::level::level_enum toSpdlogLevel(Level level)
    {
        switch (level)
        {
        case Level::TRACE:
            return spdlog::level::trace;
        case Level::DEBUG:
            return spdlog::level::debug;
        case Level::INFO:
            return spdlog::level::info;
        case Level::WARN:
            return spdlog::level::warn;
        case Level::ERROR:
            return spdlog::level::err;
        }
        return spdlog::level::info;
    }

    static void log(Level level, const std::string &message)
    {
        getLogger()->log(toSpdlogLevel(level), message);
    }
};
