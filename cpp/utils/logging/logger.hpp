#pragma once
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace logging {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* level_to_string(LogLevel level);
std::optional<LogLevel> parse_level(const std::string& name);

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string component;
    std::chrono::system_clock::time_point timestamp;

    LogEntry(LogLevel lvl, const std::string& msg, const std::string& comp = "")
        : level(lvl), message(msg), component(comp), timestamp(std::chrono::system_clock::now()) {}
};

// Destination for formatted log lines
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(LogLevel level, const std::string& line) = 0;
};

class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr) : out_(out) {}
    void write(LogLevel level, const std::string& line) override;

private:
    std::ostream& out_;
};

// Append-only log file, flushed after every line
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    void write(LogLevel level, const std::string& line) override;

    bool is_open() const { return file_stream_.is_open(); }

private:
    std::ofstream file_stream_;
};

// Keeps lines in memory; used by tests
class MemorySink : public ILogSink {
public:
    void write(LogLevel level, const std::string& line) override;

    const std::vector<std::string>& lines() const { return lines_; }
    const std::vector<LogLevel>& levels() const { return levels_; }
    bool contains(const std::string& text) const;
    void clear();

private:
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

/**
 * LogManager
 *
 * Formats entries and fans them out to every registered sink, in
 * registration order. Writes are synchronous: when log() returns the line
 * has reached every sink.
 */
class LogManager {
public:
    explicit LogManager(LogLevel min_level = LogLevel::INFO) : min_level_(min_level) {}

    void add_sink(std::shared_ptr<ILogSink> sink);
    void log(const LogEntry& entry);

    static std::string format_log_entry(const LogEntry& entry);

private:
    LogLevel min_level_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::mutex sinks_mutex_;
};

// Named handle onto a LogManager; cheap to copy and pass into components
class Logger {
public:
    Logger(std::shared_ptr<LogManager> manager, const std::string& component)
        : manager_(std::move(manager)), component_(component) {}

    void debug(const std::string& message) const { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) const { log(LogLevel::INFO, message); }
    void warn(const std::string& message) const { log(LogLevel::WARN, message); }
    void error(const std::string& message) const { log(LogLevel::ERROR, message); }

    void log(LogLevel level, const std::string& message) const;

private:
    std::shared_ptr<LogManager> manager_;
    std::string component_;
};

/**
 * Create the process-wide log manager with a console sink and, when
 * log_file is non-empty, an append-only file sink. Only the first call
 * configures anything; later calls return the existing manager unchanged.
 */
std::shared_ptr<LogManager> initialize_logging(const std::string& log_file = "",
                                               LogLevel min_level = LogLevel::INFO,
                                               std::ostream& console = std::cerr);

} // namespace logging
