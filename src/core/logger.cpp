// src/core/logger.cpp

#include "tax_ngin/core/logger.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>
#include "tax_ngin/core/time_utils.hpp"

namespace tax_ngin {

thread_local std::string Logger::current_component_;

namespace {

std::filesystem::path part_path(const std::filesystem::path& log_dir, const std::string& prefix,
                                const std::string& session, int part) {
    return log_dir / (prefix + "_" + session + "_part" + std::to_string(part) + ".log");
}

}  // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }
    current_log_path_.clear();

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        // Retention runs before the new file so the total never exceeds max_files
        prune_old_logs_unsafe(log_dir);

        current_session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        current_part_number_ = 1;
        open_log_file_unsafe();

        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file: " + current_log_path_.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.current_log_path_.clear();
    logger.current_session_timestamp_.clear();
    logger.current_part_number_ = 1;
    current_component_.clear();
    logger.initialized_.store(false, std::memory_order_release);
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string formatted_message = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        write_to_console_unsafe(formatted_message);
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        write_to_file_unsafe(formatted_message);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }

    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }

    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }

    ss << message;
    return ss.str();
}

void Logger::write_to_console_unsafe(const std::string& message) {
    std::cout << message << std::endl;
}

void Logger::write_to_file_unsafe(const std::string& message) {
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << message << std::endl;
    log_file_.flush();

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files_unsafe();
    }
}

void Logger::open_log_file_unsafe() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    current_log_path_ = part_path(log_dir, config_.filename_prefix, current_session_timestamp_,
                                  current_part_number_);
    log_file_.open(current_log_path_, std::ios::app);
}

void Logger::prune_old_logs_unsafe(const std::filesystem::path& log_dir) {
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log" &&
            entry.path().filename().string().rfind(config_.filename_prefix + "_", 0) == 0) {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    size_t keep = config_.max_files > 0 ? config_.max_files - 1 : 0;
    while (log_files.size() > keep) {
        std::error_code ec;
        std::filesystem::remove(log_files.front(), ec);
        if (ec) {
            std::cerr << "WARNING: Failed to remove old log file " << log_files.front() << ": "
                      << ec.message() << std::endl;
        }
        log_files.erase(log_files.begin());
    }
}

void Logger::rotate_log_files_unsafe() {
    log_file_.close();

    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    prune_old_logs_unsafe(log_dir);

    ++current_part_number_;
    open_log_file_unsafe();
}

}  // namespace tax_ngin
