#include "kvstore/Index.hpp"

// Methods

void Index::record(const Entry& entry) {
    Entries.push_back(entry);
}

std::optional<std::string> Index::lookup(const std::string& key) const {
    // Linear scan from the most recent write backwards.
    for (auto it = Entries.rbegin(); it != Entries.rend(); ++it) {
        if (it->key == key) {
            return it->value;
        }
    }
    return std::nullopt;
}

void Index::rebuildFrom(const std::vector<Entry>& entries) {
    Entries.clear();
    Entries.reserve(entries.size());
    for (const Entry& entry : entries) {
        record(entry);
    }
}
