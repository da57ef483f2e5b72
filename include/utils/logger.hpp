#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <memory>
#include <ctime>

namespace SpecOpt {
namespace Utils {

// Log levels
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// Parses "debug", "info", "warning", "error", "critical" (case-insensitive).
// Throws std::invalid_argument for anything else.
LogLevel parse_log_level(const std::string& name);

// Logger with daily rotation and console output.
// Files are written as <log_dir>/specopt_YYYY-MM-DD.log
class Logger {
public:
    static Logger& instance();

    void log(LogLevel level, const std::string& module, const std::string& message);
    void set_log_directory(const std::string& dir);
    void set_min_level(LogLevel level);
    void set_console_output(bool enabled);

    LogLevel min_level() const { return min_level_; }

    // Convenience methods
    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warning(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);
    void critical(const std::string& module, const std::string& message);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void open_log_for_today();
    std::string get_current_date();
    std::string get_timestamp();
    std::string level_to_string(LogLevel level);
    std::string get_color_code(LogLevel level);

    std::string log_dir_;
    std::string current_date_;
    std::ofstream log_file_;
    std::mutex log_mutex_;
    LogLevel min_level_;
    bool console_output_;
};

// Per-component logger, tags every line with the component name
class ModuleLogger {
public:
    explicit ModuleLogger(const std::string& module_name);

    void debug(const std::string& message) const;
    void info(const std::string& message) const;
    void warning(const std::string& message) const;
    void error(const std::string& message) const;
    void critical(const std::string& message) const;

    const std::string& name() const { return module_name_; }

private:
    std::string module_name_;
};

#define LOG_DEBUG(module, msg) SpecOpt::Utils::Logger::instance().debug(module, msg)
#define LOG_INFO(module, msg) SpecOpt::Utils::Logger::instance().info(module, msg)
#define LOG_WARNING(module, msg) SpecOpt::Utils::Logger::instance().warning(module, msg)
#define LOG_ERROR(module, msg) SpecOpt::Utils::Logger::instance().error(module, msg)
#define LOG_CRITICAL(module, msg) SpecOpt::Utils::Logger::instance().critical(module, msg)

} // namespace Utils
} // namespace SpecOpt
