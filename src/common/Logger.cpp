#include "common/Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

LogLevel Logger::currentLevel = LogLevel::Info;
std::ofstream Logger::fileSink;
std::mutex Logger::sinkMutex;

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(sinkMutex);
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(sinkMutex);
    return currentLevel;
}

bool Logger::setOutputFile(const std::string& path) {
    std::ofstream candidate(path, std::ios::app);
    if (!candidate) {
        return false;
    }
    std::lock_guard<std::mutex> lock(sinkMutex);
    if (fileSink.is_open()) {
        fileSink.close();
    }
    fileSink = std::move(candidate);
    return true;
}

void Logger::resetOutput() {
    std::lock_guard<std::mutex> lock(sinkMutex);
    if (fileSink.is_open()) {
        fileSink.close();
    }
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(sinkMutex);
    if (level < currentLevel) {
        return;
    }

    std::ostream& out = fileSink.is_open() ? static_cast<std::ostream&>(fileSink) : std::cerr;
    out << timestamp() << " [" << levelName(level) << "] " << message << '\n';
    out.flush();
}
