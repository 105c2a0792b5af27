// include/rebalance_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "rebalance_ngin/core/config_base.hpp"

namespace rebalance_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Pass-by-pass allocation details
    DEBUG,    // Clamps, dust snaps, debt movements
    INFO,     // Run summaries
    WARNING,  // Suspicious input that does not stop the run
    ERR,      // Failed runs
    FATAL     // Unrecoverable errors
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard error
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
std::optional<LogLevel> level_from_string(const std::string& level);

std::string log_destination_to_string(LogDestination dest);
std::optional<LogDestination> log_destination_from_string(const std::string& dest);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"rebalance_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};  // Rotate after 10MB
    size_t max_files{5};                     // Files kept in log_directory

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe logging singleton
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    /**
     * @brief Log a message with specified level
     * @param level Log level
     * @param message Message to log
     */
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

    void open_log_file();
    void enforce_retention();
    void rotate_log_file();
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
    static thread_local std::string current_component_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                     \
    do {                                                                        \
        if (::rebalance_ngin::Logger::instance().is_initialized() &&            \
            level >= ::rebalance_ngin::Logger::instance().get_min_level()) {    \
            std::ostringstream os;                                              \
            os << message;                                                      \
            ::rebalance_ngin::Logger::instance().log(level, os.str());          \
        }                                                                       \
    } while (0)

#define TRACE(message) LOG(::rebalance_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::rebalance_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::rebalance_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::rebalance_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::rebalance_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::rebalance_ngin::LogLevel::FATAL, message)

}  // namespace rebalance_ngin
