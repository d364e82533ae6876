#include "cli/Shell.hpp"
#include "kvstore/KVStore.hpp"
#include "kvstore/StoreErrors.hpp"
#include "kvstore/Entry.hpp"
#include "storage/Utf8.hpp"
#include "common/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>

Shell::Shell(KVStore& store, std::istream& in, std::ostream& out, bool prompt)
    : store(store), in(in), out(out), prompt(prompt) {}

void Shell::reply(const std::string& text) {
    out << text << '\n';
    out.flush();
}

bool Shell::handleLine(const std::string& line) {
    std::vector<std::string> parts = splitTokens(decodeLossy(line));
    if (parts.empty()) {
        return true;
    }

    std::string cmd = parts[0];
    std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    try {
        if (cmd == "SET") {
            if (parts.size() != 3) {
                reply("ERR: Usage SET <key> <value>");
                return true;
            }
            store.Set(parts[1], parts[2]);
            reply("OK");
        } else if (cmd == "GET") {
            if (parts.size() != 2) {
                reply("ERR: Usage GET <key>");
                return true;
            }
            std::optional<std::string> value = store.Get(parts[1]);
            reply(value ? *value : "NULL");
        } else if (cmd == "EXIT") {
            reply("BYE");
            return false;
        } else {
            Logger::warning("Unknown command entered: " + cmd);
            reply("ERR: Unknown command '" + cmd + "'");
        }
    } catch (const InvalidArgument& e) {
        reply(std::string("ERR: ") + e.what());
    } catch (const IOFailure& e) {
        reply(std::string("ERR: ") + e.what());
    }
    return true;
}

void Shell::run() {
    std::string line;
    while (true) {
        if (prompt) {
            out << "> ";
            out.flush();
        }
        if (!std::getline(in, line)) {
            break;
        }
        if (!handleLine(line)) {
            break;
        }
    }
}
