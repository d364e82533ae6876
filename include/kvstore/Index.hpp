#ifndef INDEX_HPP
#define INDEX_HPP

#include "kvstore/Entry.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Full write history in write order. Lookups scan newest to oldest, so the
// last entry for a key shadows the earlier ones. Entries are never removed
// or rewritten during a session.
class Index {
public:
    Index() = default;

    void record(const Entry& entry);
    std::optional<std::string> lookup(const std::string& key) const;

    // Startup only: drops current state and records `entries` in order.
    void rebuildFrom(const std::vector<Entry>& entries);

    size_t size() const { return Entries.size(); }
    bool empty() const { return Entries.empty(); }
    const std::vector<Entry>& entries() const { return Entries; }

private:
    std::vector<Entry> Entries;
};

#endif // INDEX_HPP
