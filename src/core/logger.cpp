// src/core/logger.cpp

#include "riskgate/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <vector>
#include "riskgate/core/time_utils.hpp"

namespace riskgate {

namespace {

const char* const kLevelNames[] = {"TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "FATAL"};

std::vector<std::filesystem::path> list_files_oldest_first(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (std::filesystem::is_regular_file(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });
    return files;
}

}  // namespace

std::string level_to_string(LogLevel level) {
    auto idx = static_cast<size_t>(level);
    return idx < std::size(kLevelNames) ? kLevelNames[idx] : "UNKNOWN";
}

LogLevel level_from_string(const std::string& name) {
    for (size_t i = 0; i < std::size(kLevelNames); ++i) {
        if (name == kLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    throw RiskGateError(ErrorCode::CONFIG_ERROR, "Unknown log level: " + name, "LoggerConfig");
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
    }
    return "UNKNOWN";
}

LogDestination log_destination_from_string(const std::string& name) {
    if (name == "CONSOLE")
        return LogDestination::CONSOLE;
    if (name == "FILE")
        return LogDestination::FILE;
    if (name == "BOTH")
        return LogDestination::BOTH;
    throw RiskGateError(ErrorCode::CONFIG_ERROR, "Unknown log destination: " + name,
                        "LoggerConfig");
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["use_utc"] = use_utc;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level"))
        min_level = level_from_string(j.at("min_level").get<std::string>());
    if (j.contains("destination"))
        destination = log_destination_from_string(j.at("destination").get<std::string>());
    if (j.contains("log_directory"))
        log_directory = j.at("log_directory").get<std::string>();
    if (j.contains("filename_prefix"))
        filename_prefix = j.at("filename_prefix").get<std::string>();
    if (j.contains("include_timestamp"))
        include_timestamp = j.at("include_timestamp").get<bool>();
    if (j.contains("include_level"))
        include_level = j.at("include_level").get<bool>();
    if (j.contains("use_utc"))
        use_utc = j.at("use_utc").get<bool>();
    if (j.contains("max_file_size"))
        max_file_size = j.at("max_file_size").get<size_t>();
    if (j.contains("max_files"))
        max_files = j.at("max_files").get<size_t>();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    config_ = config;
    min_level_.store(config_.min_level, std::memory_order_relaxed);

    if (config_.destination != LogDestination::CONSOLE) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        session_timestamp_ =
            core::format_time(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S", !config_.use_utc);
        part_number_ = 0;
        open_next_file_unsafe();
        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file in " + log_dir.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.min_level_.store(logger.config_.min_level, std::memory_order_relaxed);
    logger.session_timestamp_.clear();
    logger.part_number_ = 0;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string formatted = format_message(level, message);

    if (config_.destination != LogDestination::FILE) {
        std::cout << formatted << std::endl;
    }
    if (config_.destination != LogDestination::CONSOLE) {
        write_to_file_unsafe(formatted);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;
    if (config_.include_timestamp) {
        ss << core::format_time(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S",
                                !config_.use_utc)
           << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    ss << message;
    return ss.str();
}

void Logger::write_to_file_unsafe(const std::string& message) {
    if (!log_file_.is_open()) {
        return;
    }
    log_file_ << message << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        log_file_.close();
        open_next_file_unsafe();
    }
}

void Logger::enforce_retention_unsafe() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    auto files = list_files_oldest_first(log_dir);
    size_t excess = files.size() >= config_.max_files ? files.size() - config_.max_files + 1 : 0;
    for (size_t i = 0; i < excess && i < files.size(); ++i) {
        std::error_code ec;
        std::filesystem::remove(files[i], ec);
    }
}

void Logger::open_next_file_unsafe() {
    // Retention runs before the open so the directory never exceeds max_files
    enforce_retention_unsafe();

    ++part_number_;
    std::filesystem::path path = std::filesystem::absolute(config_.log_directory) /
                                 (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                                  std::to_string(part_number_) + ".log");
    log_file_.open(path, std::ios::app);
}

}  // namespace riskgate
