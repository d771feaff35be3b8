/**
 * passgram Logger
 *
 * File-based logging for long training runs and generation batches.
 * Logs to <log_dir>/passgram.log (default ~/.passgram) with timestamps and rotation.
 * Until init() succeeds every call is a no-op, so library code can log freely.
 */

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <mutex>
#include <cstdint>
#include <cstdlib>
#include <ctime>

namespace passgram {

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERR,
        FATAL
    };

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    bool init(const std::string& log_dir = "", Level min_level = Level::INFO) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string dir = log_dir;
        if (dir.empty()) {
            const char* home = std::getenv("HOME");
            dir = home ? std::string(home) + "/.passgram" : ".";
        }

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return false;
        }

        log_path_ = dir + "/passgram.log";

        // Rotate log if too large (> 10MB)
        if (std::filesystem::exists(log_path_, ec)) {
            auto size = std::filesystem::file_size(log_path_, ec);
            if (!ec && size > 10 * 1024 * 1024) {
                std::string backup = log_path_ + ".old";
                std::filesystem::remove(backup, ec);
                std::filesystem::rename(log_path_, backup, ec);
            }
        }

        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            return false;
        }

        min_level_ = min_level;
        initialized_ = true;

        // Already holding the mutex, so write directly
        log_file_ << timestamp() << " [INFO ] === passgram logger started ===\n";
        log_file_.flush();

        return true;
    }

    void log(Level level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || level < min_level_) return;

        log_file_ << timestamp() << " [" << level_str(level) << "] " << message << "\n";
        log_file_.flush();
    }

    void log_training_progress(uint64_t lines_read, uint64_t processed, uint64_t skipped) {
        std::stringstream ss;
        ss << "TRAIN_PROGRESS: Read=" << lines_read
           << ", Processed=" << processed
           << ", Skipped=" << skipped;
        log(Level::INFO, ss.str());
    }

    void log_training_complete(uint64_t processed, uint64_t skipped, uint64_t filtered,
                               size_t unique_templates, double elapsed_sec) {
        std::stringstream ss;
        ss << "TRAIN_COMPLETE: Processed=" << processed
           << ", Skipped=" << skipped
           << ", Filtered=" << filtered
           << ", UniqueTemplates=" << unique_templates
           << ", ElapsedSec=" << std::fixed << std::setprecision(1) << elapsed_sec;
        log(Level::INFO, ss.str());
    }

    void log_snapshot(const std::string& op, const std::string& path, uint64_t total_examples) {
        std::stringstream ss;
        ss << "SNAPSHOT_" << op << ": Path=" << path
           << ", Examples=" << total_examples;
        log(Level::INFO, ss.str());
    }

    void log_generation(const std::string& strategy, size_t produced, double elapsed_sec) {
        std::stringstream ss;
        ss << "GENERATE: Strategy=" << strategy
           << ", Candidates=" << produced
           << ", ElapsedSec=" << std::fixed << std::setprecision(2) << elapsed_sec;
        log(Level::INFO, ss.str());
    }

    void log_error(const std::string& error_msg) {
        log(Level::ERR, "ERROR: " + error_msg);
    }

    std::string get_log_path() const { return log_path_; }

    ~Logger() {
        if (initialized_) {
            log(Level::INFO, "=== passgram logger stopped ===");
            log_file_.close();
        }
    }

private:
    Logger() : initialized_(false), min_level_(Level::INFO) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* level_str(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
            case Level::FATAL: return "FATAL";
            default: return "?????";
        }
    }

    bool initialized_;
    Level min_level_;
    std::string log_path_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Convenience macros
#define PASSGRAM_LOG_INFO(msg)  passgram::Logger::instance().log(passgram::Logger::Level::INFO, msg)
#define PASSGRAM_LOG_WARN(msg)  passgram::Logger::instance().log(passgram::Logger::Level::WARN, msg)
#define PASSGRAM_LOG_ERROR(msg) passgram::Logger::instance().log(passgram::Logger::Level::ERR, msg)
#define PASSGRAM_LOG_DEBUG(msg) passgram::Logger::instance().log(passgram::Logger::Level::DEBUG, msg)

}  // namespace passgram
