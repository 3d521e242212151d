/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging
 */

#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace locus {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::shared_ptr<std::ofstream> Logger::shared_file_stream_;
std::mutex Logger::registry_mutex_;

namespace {

std::string trim_copy(std::string value) {
    value.erase(0, value.find_first_not_of(" \t\n\r"));
    value.erase(value.find_last_not_of(" \t\n\r") + 1);
    return value;
}

LogLevel level_from_int(int value) {
    return static_cast<LogLevel>(std::clamp(value, 1, 6));
}

} // namespace

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "INFO";
}

Logger::Logger() : current_level_(LogLevel::WARNING),
                   last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::WARNING), component_name_(component_name),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), log_file_path_(log_file),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
    if (log_file.has_value()) {
        file_stream_ = openLogFile(*log_file);
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
    std::clog.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (static_cast<int>(level) > static_cast<int>(getEffectiveLevel())) {
        return;
    }

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
    }

    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    log_file_path_ = log_file;
    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (log_file.has_value()) {
        file_stream_ = openLogFile(*log_file);
    }
}

std::shared_ptr<std::ofstream> Logger::openLogFile(const std::string& path) {
    try {
        std::filesystem::path log_path(path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        auto stream = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!stream->is_open()) {
            // Not routed through outputMessage to avoid recursion
            std::cerr << "Warning: Failed to open log file: " << path << std::endl;
            return nullptr;
        }
        return stream;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        return nullptr;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] " << to_string(level) << " ";
    if (!component_name_.empty()) {
        line << "[" << component_name_ << "] ";
    }
    line << message;

    std::clog << line.str() << std::endl;

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line.str() << std::endl;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (shared_file_stream_ && shared_file_stream_->is_open()) {
        *shared_file_stream_ << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::clog.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ============================================================================
// Facility registry
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }
    return default_level_;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim_copy(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        if (equals_pos == std::string::npos) {
            try {
                default_level_ = level_from_int(std::stoi(token));
            } catch (const std::exception&) {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
            }
            continue;
        }

        std::string facility = trim_copy(token.substr(0, equals_pos));
        std::string level_str = trim_copy(token.substr(equals_pos + 1));

        try {
            LogLevel level = level_from_int(std::stoi(level_str));
            if (facility == "default") {
                default_level_ = level;
            } else {
                facility_levels_[facility] = level;
            }
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
        }
    }
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

void Logger::setSharedLogFile(const std::optional<std::string>& log_file) {
    auto stream = log_file ? openLogFile(*log_file) : nullptr;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    shared_file_stream_ = stream;
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    if (current_level_ != LogLevel::WARNING) {
        return current_level_;
    }

    return default_level_;
}

} // namespace locus
