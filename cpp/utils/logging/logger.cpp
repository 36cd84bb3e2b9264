#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace logging {

namespace {
    std::mutex g_init_mutex;
    std::shared_ptr<LogManager> g_log_manager;
}

const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

void ConsoleSink::write(LogLevel /*level*/, const std::string& line) {
    out_ << line << std::endl;
}

FileSink::FileSink(const std::string& path) {
    file_stream_.open(path, std::ios::app);
}

void FileSink::write(LogLevel /*level*/, const std::string& line) {
    if (!file_stream_.is_open()) {
        return;
    }
    file_stream_ << line << '\n';
    file_stream_.flush();
}

void MemorySink::write(LogLevel level, const std::string& line) {
    lines_.push_back(line);
    levels_.push_back(level);
}

bool MemorySink::contains(const std::string& text) const {
    return std::any_of(lines_.begin(), lines_.end(),
                       [&text](const std::string& line) { return line.find(text) != std::string::npos; });
}

void MemorySink::clear() {
    lines_.clear();
    levels_.clear();
}

void LogManager::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void LogManager::log(const LogEntry& entry) {
    if (entry.level < min_level_) {
        return;
    }

    const std::string formatted = format_log_entry(entry);

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry.level, formatted);
    }
}

std::string LogManager::format_log_entry(const LogEntry& entry) {
    std::stringstream ss;

    // Timestamp
    auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");

    // Level
    ss << " [" << level_to_string(entry.level) << "]";

    // Component
    if (!entry.component.empty()) {
        ss << " [" << entry.component << "]";
    }

    // Message
    ss << " " << entry.message;

    return ss.str();
}

void Logger::log(LogLevel level, const std::string& message) const {
    if (!manager_) {
        return;
    }
    manager_->log(LogEntry(level, message, component_));
}

std::shared_ptr<LogManager> initialize_logging(const std::string& log_file, LogLevel min_level,
                                               std::ostream& console) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_log_manager) {
        return g_log_manager;
    }

    auto manager = std::make_shared<LogManager>(min_level);
    manager->add_sink(std::make_shared<ConsoleSink>(console));

    if (!log_file.empty()) {
        auto file_sink = std::make_shared<FileSink>(log_file);
        if (file_sink->is_open()) {
            manager->add_sink(file_sink);
        } else {
            console << "[LOG_MANAGER] Failed to open log file: " << log_file << std::endl;
        }
    }

    g_log_manager = manager;
    return g_log_manager;
}

} // namespace logging
