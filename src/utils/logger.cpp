#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>

namespace SpecOpt {
namespace Utils {

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;

    throw std::invalid_argument("Unknown log level: " + name);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : log_dir_("logs"), min_level_(LogLevel::INFO), console_output_(true) {
    mkdir(log_dir_.c_str(), 0755);
    open_log_for_today();
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::set_log_directory(const std::string& dir) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (dir == log_dir_) {
        return;
    }
    log_dir_ = dir;
    mkdir(log_dir_.c_str(), 0755);

    // Force the file to reopen under the new directory
    current_date_.clear();
    open_log_for_today();
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_level_ = level;
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_output_ = enabled;
}

void Logger::open_log_for_today() {
    std::string current_date = get_current_date();

    if (current_date != current_date_) {
        if (log_file_.is_open()) {
            log_file_.close();
        }

        current_date_ = current_date;
        std::string log_filename = log_dir_ + "/specopt_" + current_date_ + ".log";
        log_file_.open(log_filename, std::ios::app);

        if (!log_file_.is_open()) {
            std::cerr << "Failed to open log file: " << log_filename << std::endl;
        }
    }
}

std::string Logger::get_current_date() {
    time_t now = time(nullptr);
    struct tm timeinfo;
    localtime_r(&now, &timeinfo);
    char buffer[11];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d", &timeinfo);
    return std::string(buffer);
}

std::string Logger::get_timestamp() {
    time_t now = time(nullptr);
    struct tm timeinfo;
    localtime_r(&now, &timeinfo);
    char buffer[20];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
    return std::string(buffer);
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_color_code(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO: return "\033[32m";     // Green
        case LogLevel::WARNING: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::CRITICAL: return "\033[1;31m"; // Bold Red
        default: return "\033[0m";
    }
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (level < min_level_) {
        return;
    }

    open_log_for_today();

    std::ostringstream line;
    line << "[" << get_timestamp() << "] "
         << "[" << std::setw(8) << std::left << level_to_string(level) << "] "
         << "[" << module << "] "
         << message;

    if (console_output_) {
        std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
        out << get_color_code(level) << line.str() << "\033[0m" << std::endl;
    }

    // File output without colors
    if (log_file_.is_open()) {
        log_file_ << line.str() << std::endl;
        log_file_.flush();
    }
}

void Logger::debug(const std::string& module, const std::string& message) {
    log(LogLevel::DEBUG, module, message);
}

void Logger::info(const std::string& module, const std::string& message) {
    log(LogLevel::INFO, module, message);
}

void Logger::warning(const std::string& module, const std::string& message) {
    log(LogLevel::WARNING, module, message);
}

void Logger::error(const std::string& module, const std::string& message) {
    log(LogLevel::ERROR, module, message);
}

void Logger::critical(const std::string& module, const std::string& message) {
    log(LogLevel::CRITICAL, module, message);
}

ModuleLogger::ModuleLogger(const std::string& module_name) : module_name_(module_name) {}

void ModuleLogger::debug(const std::string& message) const {
    Logger::instance().debug(module_name_, message);
}

void ModuleLogger::info(const std::string& message) const {
    Logger::instance().info(module_name_, message);
}

void ModuleLogger::warning(const std::string& message) const {
    Logger::instance().warning(module_name_, message);
}

void ModuleLogger::error(const std::string& message) const {
    Logger::instance().error(module_name_, message);
}

void ModuleLogger::critical(const std::string& message) const {
    Logger::instance().critical(module_name_, message);
}

} // namespace Utils
} // namespace SpecOpt
