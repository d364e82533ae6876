#include "cli/Shell.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "kvstore/KVStore.hpp"
#include "kvstore/StoreErrors.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

int main(int argc, char** argv) {
    Config cfg;
    try {
        cfg = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << usage(argv[0]);
        return 2;
    }

    if (cfg.showHelp) {
        std::cout << usage(argv[0]);
        return 0;
    }

    Logger::setLevel(cfg.logLevel);
    if (!cfg.logFile.empty() && !Logger::setOutputFile(cfg.logFile)) {
        std::cerr << "Warning: cannot write log file " << cfg.logFile
                  << ", logging to stderr" << std::endl;
    }

    std::unique_ptr<KVStore> store;
    try {
        store = std::make_unique<KVStore>(cfg.dataFile);
    } catch (const IOFailure& e) {
        Logger::error(std::string("Cannot open store: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    Logger::info("KVStore started on " + cfg.dataFile);

    Shell shell(*store, std::cin, std::cout, cfg.prompt);
    shell.run();

    Logger::info("KVStore stopped");
    return 0;
}
