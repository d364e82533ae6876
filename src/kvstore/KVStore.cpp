#include "kvstore/KVStore.hpp"
#include "kvstore/StoreErrors.hpp"
#include "storage/Utf8.hpp"
#include "common/Logger.hpp"
#include <algorithm>

namespace {

// Normalises `text` to valid UTF-8 and checks it can be stored as a record
// token. `field` names the argument in the error message.
std::string validateToken(const std::string& text, const char* field) {
    std::string token = decodeLossy(text);

    if (token.empty()) {
        throw InvalidArgument(std::string(field) + " must not be empty");
    }
    if (token.find('\n') != std::string::npos) {
        throw InvalidArgument(std::string(field) + " must not contain a newline");
    }
    if (std::any_of(token.begin(), token.end(), isRecordSpace)) {
        throw InvalidArgument(std::string(field) + " must not contain whitespace");
    }
    return token;
}

} // namespace

KVStore::KVStore(const std::string& logPath)
    : log_(logPath), skippedOnOpen_(0) {
    index_.rebuildFrom(log_.replay());
    skippedOnOpen_ = log_.lastReplaySkipped();

    Logger::info("Opened " + logPath + ": replayed " + std::to_string(index_.size()) +
                 " records, skipped " + std::to_string(skippedOnOpen_));
}

void KVStore::Set(const std::string& key, const std::string& value) {
    Entry entry;
    entry.key = validateToken(key, "key");
    entry.value = validateToken(value, "value");

    try {
        log_.append(entry);
    } catch (const IOFailure& e) {
        Logger::error("SET " + entry.key + " failed: " + e.what());
        throw;
    }
    index_.record(entry);

    Logger::debug("SET " + entry.key);
}

std::optional<std::string> KVStore::Get(const std::string& key) const {
    std::optional<std::string> value = index_.lookup(decodeLossy(key));
    Logger::debug(std::string(value ? "GET hit: " : "GET miss: ") + key);
    return value;
}
