#include "common/Config.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* requireValue(int argc, const char* const argv[], int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

} // namespace

LogLevel parseLogLevel(const std::string& text) {
    std::string level = toLower(text);
    if (level == "debug") return LogLevel::Debug;
    if (level == "info") return LogLevel::Info;
    if (level == "warning" || level == "warn") return LogLevel::Warning;
    if (level == "error") return LogLevel::Error;
    throw std::invalid_argument("Unknown log level: " + text);
}

Config parseArgs(int argc, const char* const argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--data" || arg == "-d") {
            cfg.dataFile = requireValue(argc, argv, i);
        } else if (arg == "--log" || arg == "-l") {
            cfg.logFile = requireValue(argc, argv, i);
        } else if (arg == "--log-level") {
            cfg.logLevel = parseLogLevel(requireValue(argc, argv, i));
        } else if (arg == "--no-prompt") {
            cfg.prompt = false;
        } else if (arg == "--help" || arg == "-h") {
            cfg.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (cfg.dataFile.empty()) {
        throw std::invalid_argument("Data file path must not be empty");
    }
    return cfg;
}

std::string usage(const std::string& program) {
    return "Usage: " + program +
           " [--data PATH] [--log PATH] [--log-level debug|info|warning|error] [--no-prompt]\n"
           "Commands: SET <key> <value>, GET <key>, EXIT\n";
}
