#pragma once

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fcl {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

protected:
    LogLevel min_level_ = LogLevel::INFO;
};

// Writes to stderr
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(bool use_colors = false) : use_colors_(use_colors) {}

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;

        const char* prefix = "";
        const char* color = "";
        switch (level) {
            case LogLevel::DEBUG:   prefix = "[DEBUG] "; color = "\033[2m"; break;
            case LogLevel::INFO:    prefix = "[INFO] "; color = "\033[32m"; break;
            case LogLevel::WARNING: prefix = "[WARN] "; color = "\033[33m"; break;
            case LogLevel::ERROR:   prefix = "[ERROR] "; color = "\033[31m"; break;
        }

        if (use_colors_) {
            std::clog << color << prefix << "\033[0m" << message << std::endl;
            return;
        }

        std::clog << prefix << message << std::endl;
    }

private:
    bool use_colors_;
};

/**
 * Appends timestamped lines to a log file:
 *   2024-05-01 12:00:00 - INFO - message
 */
class FileLogger : public Logger {
public:
    explicit FileLogger(const std::filesystem::path& path) {
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        out_.open(path, std::ios::out | std::ios::app);
    }

    bool is_open() const { return out_.is_open(); }

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_ || !out_.is_open()) return;

        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

        out_ << stamp << " - " << log_level_name(level) << " - " << message << '\n';
        out_.flush();
    }

private:
    std::ofstream out_;
};

// Fans a message out to several sinks, each applying its own level filter
class TeeLogger : public Logger {
public:
    void add(std::shared_ptr<Logger> sink) { sinks_.push_back(std::move(sink)); }

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        for (auto& sink : sinks_) {
            sink->log(level, message);
        }
    }

private:
    std::vector<std::shared_ptr<Logger>> sinks_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

}  // namespace fcl
