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

namespace xdi {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::WARNING;
std::mutex Logger::registry_mutex_;
std::shared_ptr<std::ofstream> Logger::default_file_stream_;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

std::optional<LogLevel> parse_level(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return static_cast<LogLevel>(std::clamp(value, 1, 6));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?";
}

Logger::Logger(const std::string& component_name)
    : component_name_(component_name),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitPendingRepeats();
    std::cerr.flush();
    std::lock_guard<std::mutex> registry(registry_mutex_);
    if (default_file_stream_ && default_file_stream_->is_open()) {
        default_file_stream_->flush();
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

    emitPendingRepeats();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    has_last_message_ = true;
}

void Logger::emitPendingRepeats() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] " << to_string(level) << " ";
    if (!component_name_.empty()) {
        line << component_name_ << ": ";
    }
    line << message;

    std::cerr << line.str() << std::endl;

    std::shared_ptr<std::ofstream> file;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        file = default_file_stream_;
    }
    if (file && file->is_open()) {
        *file << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitPendingRepeats();
    std::cerr.flush();
    std::lock_guard<std::mutex> registry(registry_mutex_);
    if (default_file_stream_ && default_file_stream_->is_open()) {
        default_file_stream_->flush();
    }
}

// ============================================================================
// Facility-based logging
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

bool Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return true;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    bool all_valid = true;
    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        if (equals_pos == std::string::npos) {
            auto level = parse_level(token);
            if (level) {
                default_level_ = *level;
            } else {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
                all_valid = false;
            }
            continue;
        }

        std::string facility = trim(token.substr(0, equals_pos));
        std::string level_str = trim(token.substr(equals_pos + 1));
        auto level = parse_level(level_str);
        if (!level) {
            std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
            all_valid = false;
            continue;
        }

        if (facility == "default") {
            default_level_ = *level;
        } else {
            facility_levels_[facility] = *level;
        }
    }

    return all_valid;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

bool Logger::setDefaultLogFile(const std::optional<std::string>& log_file) {
    std::shared_ptr<std::ofstream> stream;
    if (log_file.has_value()) {
        std::filesystem::path log_path(log_file.value());
        std::error_code ec;
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path(), ec);
        }
        stream = std::make_shared<std::ofstream>(log_path, std::ios::app);
        if (!stream->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << log_path.string() << std::endl;
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_file_stream_ = std::move(stream);
    return true;
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    return default_level_;
}

} // namespace xdi
