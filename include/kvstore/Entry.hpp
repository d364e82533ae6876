#ifndef ENTRY_HPP
#define ENTRY_HPP

#include <optional>
#include <string>
#include <vector>

// Command keyword of the only record type. Matched case-sensitively on replay.
extern const char* const kSetKeyword;

// One SET at a point in time.
struct Entry {
  std::string key;
  std::string value;
};

bool operator==(const Entry& lhs, const Entry& rhs);
bool operator!=(const Entry& lhs, const Entry& rhs);

// Record Methods

// "SET <key> <value>\n"
std::string serializeRecord(const Entry& entry);

// Parses one log line (with or without its trailing newline). Returns
// nullopt for anything that is not exactly `SET <key> <value>`.
std::optional<Entry> parseRecord(const std::string& line);

// Splits on runs of ASCII whitespace, dropping empty tokens.
std::vector<std::string> splitTokens(const std::string& line);

bool isRecordSpace(char c);

#endif // ENTRY_HPP
