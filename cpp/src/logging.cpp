#include "dreamgroup/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <vector>

namespace dreamgroup {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

const char* base_name(const char* path) {
    const char* slash = std::strrchr(path, '/');
    if (!slash) slash = std::strrchr(path, '\\');
    return slash ? slash + 1 : path;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical" || lower == "fatal") return LogLevel::CRITICAL;
    if (lower == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink;
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    LogLevel level = LogLevel::INFO;
    mutable std::mutex mutex;

    Impl() {
        // Console goes to stderr so stdout stays clean for command output
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        logger = std::make_shared<spdlog::logger>("dreamgroup", console_sink);
        logger->set_level(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
    }

    void rebuild() {
        std::vector<spdlog::sink_ptr> sinks{console_sink};
        if (file_sink) sinks.push_back(file_sink);
        auto next = std::make_shared<spdlog::logger>("dreamgroup", sinks.begin(), sinks.end());
        next->set_level(to_spdlog(level));
        next->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        next->flush_on(spdlog::level::warn);
        logger = std::move(next);
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->level = level;
    pImpl->logger->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->level;
}

void Logger::set_output_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (filename.empty()) {
        pImpl->file_sink.reset();
    } else {
        pImpl->file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
        pImpl->file_sink->set_level(spdlog::level::trace);
    }
    pImpl->rebuild();
}

void Logger::write(LogLevel level, const char* file, int line, const char* func, const std::string& message) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        logger = pImpl->logger;
    }
    logger->log(to_spdlog(level), "{}:{} {}() - {}", base_name(file), line, func, message);
}

} // namespace dreamgroup
