#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "common/Logger.hpp"
#include <string>

struct Config {
    std::string dataFile = "data.db";
    std::string logFile = "kvstore.log";
    LogLevel logLevel = LogLevel::Info;
    bool prompt = true;
    bool showHelp = false;
};

// Parses command-line flags. Throws std::invalid_argument on an unknown
// flag, a flag missing its value, or an unrecognised log level.
Config parseArgs(int argc, const char* const argv[]);

// "debug", "info", "warning"/"warn", "error", any case.
LogLevel parseLogLevel(const std::string& text);

std::string usage(const std::string& program);

#endif // CONFIG_HPP
