/*
 * sandcell - Logger Implementation
 *
 * Log lines go to stderr (stdout carries protocol responses) and,
 * optionally, to an append-mode log file.
 */
#include <sandcell/core/logger.hpp>
#include <sandcell/core/utils.hpp>

#include <unistd.h>

namespace sandcell {

static const char* get_color_code(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        default: return "\033[0m";
    }
}

static const char* get_level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

static std::pair<std::string, std::string> extract_class_and_function(const char* pretty_function) {
    std::string pf = pretty_function;

    size_t paren_pos = pf.find('(');
    if (paren_pos == std::string::npos) {
        return {"", ""};
    }
    std::string signature = pf.substr(0, paren_pos);

    size_t last_colon = signature.rfind("::");
    if (last_colon == std::string::npos) {
        size_t space_pos = signature.rfind(' ');
        std::string func_name = (space_pos != std::string::npos) ? signature.substr(space_pos + 1) : signature;
        return {"", func_name};
    }

    std::string func_name = signature.substr(last_colon + 2);
    std::string before_last_colon = signature.substr(0, last_colon);
    size_t space_pos = before_last_colon.rfind(' ');
    std::string class_name = (space_pos != std::string::npos)
        ? before_last_colon.substr(space_pos + 1) : before_last_colon;

    size_t template_pos = class_name.find('<');
    if (template_pos != std::string::npos) {
        class_name = class_name.substr(0, template_pos);
    }
    if (!class_name.empty() && class_name[0] == '*') {
        class_name = class_name.substr(1);
    }
    if (class_name.find("sandcell::") == 0) {
        class_name = class_name.substr(10);
    }
    return {class_name, func_name};
}

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string n = to_lower(trim(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return fallback;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , use_color_(isatty(STDERR_FILENO) == 1)
    , file_(nullptr)
{}

Logger::~Logger() {
    if (file_) {
        fclose(file_);
    }
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

bool Logger::set_output_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
    if (path.empty()) {
        return true;
    }
    file_ = fopen(path.c_str(), "a");
    return file_ != nullptr;
}

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    char message[4096];
    vsnprintf(message, sizeof(message), fmt, args);

    const char* level_str = get_level_str(level);
    const char* color = use_color_ ? get_color_code(level) : "";
    const char* reset = use_color_ ? "\033[0m" : "";

    std::string prefix;
    if (level_ == LogLevel::DEBUG) {
        auto parts = extract_class_and_function(func);
        std::string where = parts.first.empty() ? parts.second : parts.first + "::" + parts.second;
        char buf[512];
        snprintf(buf, sizeof(buf), " (%s) at %s:%d", where.c_str(), file, line);
        prefix = buf;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(stderr, "[%s] %s[%s]%s%s %s\n", timestamp, color, level_str, reset, prefix.c_str(), message);
    fflush(stderr);
    if (file_) {
        fprintf(file_, "[%s] [%s]%s %s\n", timestamp, level_str, prefix.c_str(), message);
        fflush(file_);
    }
}

} // namespace sandcell
