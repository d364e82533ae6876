#include "kvstore/Entry.hpp"
#include <utility>

const char* const kSetKeyword = "SET";

namespace {

constexpr size_t kRecordTokens = 3;

} // namespace

bool operator==(const Entry& lhs, const Entry& rhs) {
    return lhs.key == rhs.key && lhs.value == rhs.value;
}

bool operator!=(const Entry& lhs, const Entry& rhs) {
    return !(lhs == rhs);
}

bool isRecordSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

std::vector<std::string> splitTokens(const std::string& line) {
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && isRecordSpace(line[pos])) {
            ++pos;
        }
        size_t start = pos;
        while (pos < line.size() && !isRecordSpace(line[pos])) {
            ++pos;
        }
        if (pos > start) {
            tokens.emplace_back(line, start, pos - start);
        }
    }
    return tokens;
}

// Serialization Logic

std::string serializeRecord(const Entry& entry) {
    std::string record;
    record.reserve(entry.key.size() + entry.value.size() + 6);
    record += kSetKeyword;
    record += ' ';
    record += entry.key;
    record += ' ';
    record += entry.value;
    record += '\n';
    return record;
}

// Parsing Logic

std::optional<Entry> parseRecord(const std::string& line) {
    std::vector<std::string> tokens = splitTokens(line);

    if (tokens.size() != kRecordTokens) {
        return std::nullopt;
    }
    if (tokens[0] != kSetKeyword) {
        return std::nullopt;
    }

    Entry entry;
    entry.key = std::move(tokens[1]);
    entry.value = std::move(tokens[2]);
    return entry;
}
