// include/folio/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "folio/core/config_base.hpp"

namespace folio {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Degraded but continuing (stale prices, gaps)
    ERR,      // Errors that affect a request but don't stop the process
    FATAL     // Critical errors
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
LogLevel level_from_string(const std::string& level, LogLevel fallback);
std::string log_destination_to_string(LogDestination dest);
LogDestination log_destination_from_string(const std::string& dest, LogDestination fallback);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"folio"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};  // 10MB per file
    size_t max_files{5};                     // Files kept in log_directory

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe process logger
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from this thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open_log_file_unsafe();
    void prune_old_logs_unsafe(const std::filesystem::path& log_dir);
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS of initialize()
    int part_number_{1};             // Rotation counter within the session
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                       \
    do {                                                          \
        if (level >= ::folio::Logger::instance().get_min_level()) { \
            std::ostringstream os;                                \
            os << message;                                        \
            ::folio::Logger::instance().log(level, os.str());     \
        }                                                         \
    } while (0)

#define TRACE(message) LOG(::folio::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::folio::LogLevel::DEBUG, message)
#define INFO(message) LOG(::folio::LogLevel::INFO, message)
#define WARN(message) LOG(::folio::LogLevel::WARNING, message)
#define ERROR(message) LOG(::folio::LogLevel::ERR, message)
#define FATAL(message) LOG(::folio::LogLevel::FATAL, message)

}  // namespace folio
