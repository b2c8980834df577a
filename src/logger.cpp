// logger.cpp

#include "logger.hpp"

#include <fstream>
#include <iostream>

#include "utils.hpp"

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

void ConsoleSink::write(LogLevel level, const std::string& line) {
    if (level == LogLevel::Info) {
        std::cout << line << std::endl;
    } else {
        std::cerr << line << std::endl;
    }
}

FileSink::FileSink(const std::string& path) : path(path) {}

void FileSink::write(LogLevel, const std::string& line) {
    std::ofstream logfile(path, std::ios::app);
    if (logfile.is_open()) {
        logfile << line << std::endl;
    }
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex);
    sinks.push_back(sink);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::string line = "[" + format_timestamp(clock.now()) + "] " +
                       log_level_name(level) + " " + message;

    // The browser's websocket thread may log while the main loop does
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& sink : sinks) {
        sink->write(level, line);
    }
}
