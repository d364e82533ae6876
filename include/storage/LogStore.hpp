#ifndef LOG_STORE_HPP
#define LOG_STORE_HPP

#include "kvstore/Entry.hpp"
#include <cstddef>
#include <string>
#include <vector>

// Append-only record file. The write descriptor is opened (and the file
// created) on construction and closed on destruction. Single writer only:
// nothing guards against another process appending to the same file.
class LogStore {
public:
    explicit LogStore(const std::string& logPath);
    ~LogStore();

    LogStore(const LogStore&) = delete;
    LogStore& operator=(const LogStore&) = delete;

    // Writes "SET <key> <value>\n" at the end of the file and fsyncs it.
    // Throws IOFailure if the record could not be made durable; no rollback
    // is attempted for a partial write.
    void append(const Entry& entry);
    void append(const std::string& key, const std::string& value);

    // Reads every well-formed record in file order. Malformed or torn lines
    // are skipped. A missing file yields no entries.
    std::vector<Entry> replay();

    // Malformed lines seen by the most recent replay().
    size_t lastReplaySkipped() const { return skippedLines; }

    const std::string& path() const { return logPath; }

private:
    void openForAppend();
    void writeAll(const std::string& data);
    void syncParentDirectory();
    void replayLine(const std::string& raw, size_t lineNumber, std::vector<Entry>& entries);

    std::string logPath;
    int fd;
    // Set when the file ends in a line without '\n' (torn write); the next
    // append terminates that line first so the new record stays separate.
    bool pendingNewline;
    size_t skippedLines;
};

#endif // LOG_STORE_HPP
