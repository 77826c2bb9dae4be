#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace dreamgroup {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

// Parse "debug", "info", "warn", ... ; unknown names map to INFO
LogLevel parse_log_level(const std::string& name);

/**
 * Process-wide logger. spdlog does the formatting and the sinks (console + optional file);
 * this facade keeps it out of every other header.
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Adds (or replaces) the append-mode file sink. Empty name removes it.
    void set_output_file(const std::string& filename);

    void write(LogLevel level, const char* file, int line, const char* func, const std::string& message);

    template<typename... Args>
    void log(LogLevel lvl, const char* file, int line, const char* func, Args&&... args) {
        if (lvl < level()) return;
        std::ostringstream msg;
        (msg << ... << std::forward<Args>(args));
        write(lvl, file, line, func, msg.str());
    }

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Convenience macros
#define LOG_TRACE(...) dreamgroup::Logger::instance().log(dreamgroup::LogLevel::TRACE, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_DEBUG(...) dreamgroup::Logger::instance().log(dreamgroup::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  dreamgroup::Logger::instance().log(dreamgroup::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  dreamgroup::Logger::instance().log(dreamgroup::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) dreamgroup::Logger::instance().log(dreamgroup::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)

} // namespace dreamgroup
