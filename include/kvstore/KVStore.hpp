#ifndef KVSTORE_HPP
#define KVSTORE_HPP

#include "kvstore/Index.hpp"
#include "storage/LogStore.hpp"
#include <cstddef>
#include <optional>
#include <string>

// Replay-then-serve store. Construction opens the log at `logPath` and
// replays it into the index; that is the only replay. Writes go to the log
// (fsynced) before the index sees them. Not safe for concurrent use.
class KVStore {
  public:
    explicit KVStore(const std::string& logPath);

    // Throws InvalidArgument for an empty key/value or one containing
    // whitespace (newlines included), IOFailure if the record is not durable.
    void Set(const std::string& key, const std::string& value);
    // Keys are normalised the same way Set normalises them.
    std::optional<std::string> Get(const std::string& key) const;

    // Number of recorded writes, shadowed ones included.
    size_t size() const { return index_.size(); }
    const std::string& path() const { return log_.path(); }
    const std::vector<Entry>& history() const { return index_.entries(); }
    size_t skippedOnOpen() const { return skippedOnOpen_; }

  private:
    LogStore log_;
    Index index_;
    size_t skippedOnOpen_;
};

#endif // !KVSTORE_HPP
