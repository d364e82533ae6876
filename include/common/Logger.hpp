#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Process-wide diagnostic log. Lines look like
//   2025-01-31 12:00:00.123 [INFO] message
// and go to stderr until setOutputFile() succeeds.
class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Appends to `path`. Returns false and keeps the current sink if the
    // file cannot be opened.
    static bool setOutputFile(const std::string& path);
    static void resetOutput();

    static void log(LogLevel level, const std::string& message);

    static void debug(const std::string& message) { log(LogLevel::Debug, message); }
    static void info(const std::string& message) { log(LogLevel::Info, message); }
    static void warning(const std::string& message) { log(LogLevel::Warning, message); }
    static void error(const std::string& message) { log(LogLevel::Error, message); }

    static const char* levelName(LogLevel level);

private:
    static std::string timestamp();

    static LogLevel currentLevel;
    static std::ofstream fileSink;
    static std::mutex sinkMutex;
};

#endif // LOGGER_HPP
