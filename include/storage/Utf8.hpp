#ifndef UTF8_HPP
#define UTF8_HPP

#include <string>

// U+FFFD encoded as UTF-8.
extern const char* const kReplacementChar;

// Returns a copy of `bytes` that is valid UTF-8. Each maximal invalid
// subsequence is replaced by one U+FFFD. Never throws on malformed input.
std::string decodeLossy(const std::string& bytes);

bool isValidUtf8(const std::string& bytes);

#endif // UTF8_HPP
