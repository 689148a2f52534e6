#pragma once
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <system_error>

namespace cortex::core::logging {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

inline const char* level_name(const LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

struct FileRotation {
    std::uintmax_t max_bytes = 5 * 1024 * 1024;
    int backups = 3;  // debug.log.1 .. debug.log.N
};

// Tag stamped on every record of one invocation, e.g. "orc-3fa9c01b".
inline std::string make_invocation_tag() {
    std::random_device rd;
    std::uniform_int_distribution<std::uint32_t> dist;
    std::ostringstream out;
    out << "orc-" << std::hex << std::setw(8) << std::setfill('0') << dist(rd);
    return out.str();
}

// Process-wide sink. Console records go to stderr so stdout carries only
// agent output; the file mirror keeps everything, DEBUG included.
class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    std::string begin_invocation() {
        const std::string tag = make_invocation_tag();
        std::lock_guard<std::mutex> lock(mutex_);
        tag_ = tag;
        return tag;
    }

    void set_min_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    bool open_file(const std::filesystem::path& path, FileRotation rotation = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_path_ = path;
        rotation_ = rotation;
        return reopen();
    }

    void close_file() {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.close();
        file_path_.clear();
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);  // workers log from pool threads

        const std::string tagged = (tag_.empty() ? "" : "[" + tag_ + "] ") + message;
        if (file_.is_open()) {
            const std::string record =
                timestamp() + " [" + level_name(level) + "] cortex: " + tagged + "\n";
            file_ << record << std::flush;
            written_ += record.size();
            if (written_ >= rotation_.max_bytes) {
                rotate();
            }
        }
        if (level >= min_level_) {
            std::clog << "[" << level_name(level) << "] " << tagged << std::endl;
        }
    }

private:
    Logger() = default;

    bool reopen() {
        file_.close();
        file_.clear();
        file_.open(file_path_, std::ios::app);
        std::error_code ec;
        const auto size = std::filesystem::file_size(file_path_, ec);
        written_ = ec ? 0 : size;
        return file_.is_open();
    }

    // debug.log -> debug.log.1 -> ... -> debug.log.N, oldest dropped.
    void rotate() {
        file_.close();
        std::error_code ec;
        if (rotation_.backups > 0) {
            const std::string base = file_path_.string();
            std::filesystem::remove(base + "." + std::to_string(rotation_.backups), ec);
            for (int i = rotation_.backups - 1; i >= 1; --i) {
                std::filesystem::rename(base + "." + std::to_string(i),
                                        base + "." + std::to_string(i + 1), ec);
            }
            std::filesystem::rename(file_path_, base + ".1", ec);
        } else {
            std::filesystem::resize_file(file_path_, 0, ec);
        }
        reopen();
    }

    static std::string timestamp() {
        const std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        std::ostringstream out;
        out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return out.str();
    }

    std::mutex mutex_;
    std::string tag_;
    LogLevel min_level_ = LogLevel::INFO;
    std::filesystem::path file_path_;
    FileRotation rotation_;
    std::ofstream file_;
    std::uintmax_t written_ = 0;
};

#define LOG_DEBUG(msg) cortex::core::logging::Logger::get().log(cortex::core::logging::LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  cortex::core::logging::Logger::get().log(cortex::core::logging::LogLevel::INFO, msg)
#define LOG_WARN(msg)  cortex::core::logging::Logger::get().log(cortex::core::logging::LogLevel::WARN, msg)
#define LOG_ERROR(msg) cortex::core::logging::Logger::get().log(cortex::core::logging::LogLevel::ERROR, msg)

}  // namespace cortex::core::logging
