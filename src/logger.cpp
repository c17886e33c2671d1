#include "logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace voice_relay {

namespace {

thread_local std::string t_thread_name = "main";

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file)
        : min_level_(min_level) {
        if (!output_file.empty()) {
            file_.open(output_file, std::ios::app);
        }
    }

    bool file_ok(const std::string& output_file) const {
        return output_file.empty() || file_.is_open();
    }

    void write(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << line << '\n';
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

    std::atomic<LogLevel> min_level_;

private:
    std::mutex mutex_;
    std::ofstream file_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

bool Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (impl_) return true;
    impl_ = std::make_unique<Impl>(min_level, output_file);
    if (!impl_->file_ok(output_file)) {
        std::cerr << "Warning: Failed to open log file: " << output_file << std::endl;
        return false;
    }
    return true;
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!impl_) {
        // Not initialized: unfiltered, unformatted
        std::cerr << level_string(level) << " " << message << std::endl;
        return;
    }
    if (level < impl_->min_level_.load()) return;

    std::string line;
    line.reserve(message.size() + 48);
    line += "[";
    line += level_string(level);
    line += "] ";
    line += timestamp();
    line += " [";
    line += t_thread_name;
    line += "]: ";
    line += message;
    impl_->write(line);
}

const char* Logger::level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::set_level(LogLevel level) {
    if (impl_) impl_->min_level_ = level;
}

LogLevel Logger::get_level() {
    return impl_ ? impl_->min_level_.load() : LogLevel::DEBUG;
}

bool Logger::enabled(LogLevel level) {
    return level >= get_level();
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::set_thread_name(const std::string& name) {
    t_thread_name = name;
}

} // namespace voice_relay
