/*
 * pvfworker C++ - Logger
 *
 * Process-wide printf-style logger writing to stderr. Worker processes and
 * host-side probes share it, so every line carries a timestamp and level.
 */
#ifndef pvfworker_CORE_LOGGER_HPP
#define pvfworker_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace pvfworker {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error". Unknown names yield `fallback`.
LogLevel parse_log_level(const std::string& name, LogLevel fallback);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void debug(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void info(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void warn(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void error(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
};

// Convenience macros
#define LOG_DEBUG(...) pvfworker::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  pvfworker::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  pvfworker::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) pvfworker::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace pvfworker

#endif // pvfworker_CORE_LOGGER_HPP
