#include "storage/LogStore.hpp"
#include "storage/Utf8.hpp"
#include "kvstore/StoreErrors.hpp"
#include "common/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <optional>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string describeErrno(const std::string& action, const std::string& path, int err) {
    return action + " " + path + ": " + std::strerror(err);
}

constexpr size_t kReadChunk = 64 * 1024;

struct ScopedFd {
    explicit ScopedFd(int fd) : fd(fd) {}
    ~ScopedFd() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int fd;
};

} // namespace

LogStore::LogStore(const std::string& logPath)
    : logPath(logPath), fd(-1), pendingNewline(false), skippedLines(0) {
    if (logPath.empty()) {
        throw IOFailure("Log path must not be empty", 0);
    }
    openForAppend();
}

LogStore::~LogStore() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void LogStore::openForAppend() {
    std::error_code ec;
    bool existed = fs::exists(logPath, ec);

    fd = ::open(logPath.c_str(), O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        int err = errno;
        throw IOFailure(describeErrno("Failed to open log file", logPath, err), err);
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        fd = -1;
        throw IOFailure(describeErrno("Failed to stat log file", logPath, err), err);
    }

    if (st.st_size > 0) {
        char last = '\n';
        ssize_t n = ::pread(fd, &last, 1, st.st_size - 1);
        if (n == 1 && last != '\n') {
            Logger::warning("Log file " + logPath + " ends in a torn record");
            pendingNewline = true;
        }
    }

    if (!existed) {
        // Make the new directory entry itself durable.
        syncParentDirectory();
    }
}

void LogStore::syncParentDirectory() {
    fs::path parent = fs::path(logPath).parent_path();
    if (parent.empty()) {
        parent = ".";
    }

    int dirFd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd < 0) {
        Logger::warning(describeErrno("Could not open directory", parent.string(), errno));
        return;
    }
    if (::fsync(dirFd) != 0) {
        Logger::warning(describeErrno("Could not sync directory", parent.string(), errno));
    }
    ::close(dirFd);
}

void LogStore::writeAll(const std::string& data) {
    const char* cursor = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = ::write(fd, cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            if (remaining != data.size()) {
                // Part of the record reached the file.
                pendingNewline = true;
            }
            throw IOFailure(describeErrno("Failed to append to", logPath, err), err);
        }
        if (written == 0) {
            if (remaining != data.size()) {
                pendingNewline = true;
            }
            throw IOFailure("Failed to append to " + logPath + ": write made no progress", EIO);
        }
        cursor += written;
        remaining -= static_cast<size_t>(written);
    }
}

void LogStore::append(const Entry& entry) {
    if (fd < 0) {
        throw IOFailure("Log file " + logPath + " is not open", EBADF);
    }

    std::string record = serializeRecord(entry);
    if (pendingNewline) {
        record.insert(record.begin(), '\n');
    }

    writeAll(record);
    pendingNewline = false;

    if (::fsync(fd) != 0) {
        int err = errno;
        throw IOFailure(describeErrno("Failed to sync", logPath, err), err);
    }
}

void LogStore::append(const std::string& key, const std::string& value) {
    append(Entry{key, value});
}

void LogStore::replayLine(const std::string& raw, size_t lineNumber, std::vector<Entry>& entries) {
    std::string line = decodeLossy(raw);

    std::optional<Entry> entry = parseRecord(line);
    if (entry) {
        entries.push_back(std::move(*entry));
        return;
    }
    if (splitTokens(line).empty()) {
        return; // blank
    }

    ++skippedLines;
    Logger::debug("Skipping malformed record at " + logPath + ":" +
                  std::to_string(lineNumber));
}

std::vector<Entry> LogStore::replay() {
    std::vector<Entry> entries;
    skippedLines = 0;

    ScopedFd in(::open(logPath.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.fd < 0) {
        int err = errno;
        if (err == ENOENT) {
            Logger::info("No log file at " + logPath + ", starting fresh");
            return entries;
        }
        throw IOFailure(describeErrno("Failed to open log file for replay", logPath, err), err);
    }

    struct stat st;
    if (::fstat(in.fd, &st) != 0) {
        int err = errno;
        throw IOFailure(describeErrno("Failed to stat log file", logPath, err), err);
    }
    if (S_ISDIR(st.st_mode)) {
        throw IOFailure(describeErrno("Cannot replay", logPath, EISDIR), EISDIR);
    }

    std::vector<char> buffer(kReadChunk);
    std::string pending;
    size_t lineNumber = 0;

    while (true) {
        ssize_t n = ::read(in.fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::error(describeErrno("Read error while replaying", logPath, errno) +
                          " after line " + std::to_string(lineNumber) +
                          "; keeping records read so far");
            return entries;
        }
        if (n == 0) {
            break;
        }

        const char* begin = buffer.data();
        const char* end = begin + n;
        for (const char* nl = std::find(begin, end, '\n'); nl != end; nl = std::find(begin, end, '\n')) {
            pending.append(begin, nl);
            replayLine(pending, ++lineNumber, entries);
            pending.clear();
            begin = nl + 1;
        }
        pending.append(begin, end);
    }

    // Final line without '\n'.
    if (!pending.empty()) {
        replayLine(pending, ++lineNumber, entries);
    }

    return entries;
}
