// include/riskgate/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "riskgate/core/config_base.hpp"

namespace riskgate {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Warnings that don't affect operation
    ERR,      // Errors and trading halts
    FATAL     // Critical errors that require system shutdown
};

enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
LogLevel level_from_string(const std::string& name);
std::string log_destination_to_string(LogDestination dest);
LogDestination log_destination_from_string(const std::string& name);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"riskgate"};
    bool include_timestamp{true};
    bool include_level{true};
    bool use_utc{true};                      // Timestamps in UTC rather than local time
    size_t max_file_size{50 * 1024 * 1024};  // Rotate after 50MB
    size_t max_files{10};                    // Files kept in log_directory

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Process-wide, mutex-guarded logger
 *
 * The only shared object in the library; risk and regime components are
 * plain caller-owned instances that write through it.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief (Re)initialize the logger, opening a fresh file when the
     * destination includes FILE
     * @throws std::runtime_error if the log directory or file can't be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Close any open file and return to the uninitialized state
     */
    static void reset_for_tests();

    /**
     * @brief Log a message; silently dropped before initialize()
     */
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

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void open_next_file_unsafe();
    void enforce_retention_unsafe();
    void write_to_file_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::string session_timestamp_;  // YYYYMMDD_HHMMSS of the last initialize()
    int part_number_{0};
};

/**
 * @brief Stream-style logging macro
 * Usage: LOG(LogLevel::INFO, "RiskManager: equity " << equity)
 */
#define LOG(level, message)                                                  \
    do {                                                                     \
        if (level >= ::riskgate::Logger::instance().get_min_level()) {       \
            std::ostringstream os_;                                          \
            os_ << message;                                                  \
            ::riskgate::Logger::instance().log(level, os_.str());            \
        }                                                                    \
    } while (0)

#define TRACE(message) LOG(::riskgate::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::riskgate::LogLevel::DEBUG, message)
#define INFO(message) LOG(::riskgate::LogLevel::INFO, message)
#define WARN(message) LOG(::riskgate::LogLevel::WARNING, message)
#define ERROR(message) LOG(::riskgate::LogLevel::ERR, message)
#define FATAL(message) LOG(::riskgate::LogLevel::FATAL, message)

}  // namespace riskgate
