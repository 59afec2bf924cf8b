#ifndef VFSKIT_ENTRY_STORE_H
#define VFSKIT_ENTRY_STORE_H

#include <map>
#include <string>
#include <vector>

#include "entry.h"
#include "path.h"

namespace vfskit {

// Canonical inner path -> Entry. The root directory is always present and
// every other key has its parent present as a directory.
class EntryStore {
public:
    using Map = std::map<std::string, Entry, PathLess>;

    EntryStore();

    bool contains(const std::string& inner) const;
    const Entry* find(const std::string& inner) const;
    Entry* find(const std::string& inner);

    // Inserts or replaces. The caller keeps the parent invariant.
    void insert(const std::string& inner, Entry entry);

    // Removes `inner` and everything below it. The root is never removed;
    // returns the number of erased keys.
    size_t erase_subtree(const std::string& inner);

    // Direct children, or the path itself when it names a file.
    std::vector<std::string> children(const std::string& inner) const;
    // Every path strictly below `inner`, or the path itself for a file.
    std::vector<std::string> descendants(const std::string& inner) const;
    bool has_descendants(const std::string& inner) const;

    // Deepest-first order over every non-root key.
    std::vector<std::string> removal_order() const;

    // Closest tracked ancestor of `inner` (the root at worst).
    std::string nearest_existing(const std::string& inner) const;

    // Back to just the root marker.
    void reset();

    size_t size() const { return entries_.size(); }
    Map::const_iterator begin() const { return entries_.begin(); }
    Map::const_iterator end() const { return entries_.end(); }

private:
    Map entries_;
};

}

#endif
