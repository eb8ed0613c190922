// include/allocsim/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "allocsim/core/config_base.hpp"

namespace allocsim {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Warnings that don't affect the run
    ERR,      // Errors that abort a run
    FATAL     // Errors that abort the process
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
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Parse a level name ("TRACE" ... "FATAL"); unknown names yield INFO
 */
LogLevel level_from_string(const std::string& name);

/**
 * @brief Parse a destination name; unknown names yield CONSOLE
 */
LogDestination log_destination_from_string(const std::string& name);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"allocsim"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};  // Rotate after 10MB
    size_t max_files{5};                     // Log files kept in log_directory

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Messages logged before initialize() are reported on stderr and dropped.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Close the log file and return to the uninitialized state
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
        min_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag every message logged from the calling thread
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
    void prune_old_files();
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::string session_timestamp_;
    int part_number_{1};
    static thread_local std::string current_component_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                      \
    do {                                                                         \
        if ((level) >= ::allocsim::Logger::instance().get_min_level()) {         \
            std::ostringstream allocsim_log_os_;                                 \
            allocsim_log_os_ << message;                                         \
            ::allocsim::Logger::instance().log((level), allocsim_log_os_.str()); \
        }                                                                        \
    } while (0)

#define TRACE(message) LOG(::allocsim::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::allocsim::LogLevel::DEBUG, message)
#define INFO(message) LOG(::allocsim::LogLevel::INFO, message)
#define WARN(message) LOG(::allocsim::LogLevel::WARNING, message)
#define ERROR(message) LOG(::allocsim::LogLevel::ERR, message)
#define FATAL(message) LOG(::allocsim::LogLevel::FATAL, message)

}  // namespace allocsim
