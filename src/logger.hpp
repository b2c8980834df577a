// logger.hpp

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "clock.hpp"

enum class LogLevel { Info, Warning, Error };

const char* log_level_name(LogLevel level);

// Destination for finished log lines.
class LogSink {
public:
    virtual ~LogSink() {}
    virtual void write(LogLevel level, const std::string& line) = 0;
};

// stdout, with warnings and errors on stderr
class ConsoleSink : public LogSink {
public:
    void write(LogLevel level, const std::string& line) override;
};

// Backup log file. Opened in append mode for every line so the file can be
// rotated or deleted underneath a running process.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);
    void write(LogLevel level, const std::string& line) override;

private:
    std::string path;
};

// Timestamps come from the same Clock the capture loop sleeps on.
class Logger {
public:
    explicit Logger(const Clock& clock) : clock(clock) {}

    void add_sink(std::shared_ptr<LogSink> sink);

    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warning(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }

    // Formats "[YYYYMMDD_HHMMSS] LEVEL message" and hands it to every sink.
    void log(LogLevel level, const std::string& message);

private:
    const Clock& clock;
    std::mutex mutex;
    std::vector<std::shared_ptr<LogSink>> sinks;
};
