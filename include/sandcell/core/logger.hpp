#ifndef sandcell_CORE_LOGGER_HPP
#define sandcell_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>

namespace sandcell {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Unknown names yield fallback.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Mirror log lines into an append-mode file. Empty path closes the file.
    bool set_output_file(const std::string& path);

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    ~Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    bool use_color_;
    FILE* file_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) sandcell::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  sandcell::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  sandcell::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) sandcell::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace sandcell

#endif // sandcell_CORE_LOGGER_HPP
