#include "entry_store.h"

namespace vfskit {

EntryStore::EntryStore() {
    reset();
}

bool EntryStore::contains(const std::string& inner) const {
    return entries_.count(inner) != 0;
}

const Entry* EntryStore::find(const std::string& inner) const {
    auto it = entries_.find(inner);
    return it == entries_.end() ? nullptr : &it->second;
}

Entry* EntryStore::find(const std::string& inner) {
    auto it = entries_.find(inner);
    return it == entries_.end() ? nullptr : &it->second;
}

void EntryStore::insert(const std::string& inner, Entry entry) {
    entries_[inner] = std::move(entry);
}

size_t EntryStore::erase_subtree(const std::string& inner) {
    if (is_root(inner)) return 0;
    auto first = entries_.find(inner);
    if (first == entries_.end()) return 0;
    // Descendants sort contiguously right after their ancestor.
    auto last = first;
    size_t n = 0;
    while (last != entries_.end() && is_within(last->first, inner)) {
        ++last;
        ++n;
    }
    entries_.erase(first, last);
    return n;
}

std::vector<std::string> EntryStore::children(const std::string& inner) const {
    std::vector<std::string> out;
    auto it = entries_.find(inner);
    if (it == entries_.end()) return out;
    if (it->second.is_file()) {
        out.push_back(it->first);
        return out;
    }
    size_t depth = path_depth(inner) + 1;
    for (++it; it != entries_.end() && is_within(it->first, inner); ++it) {
        if (path_depth(it->first) == depth) out.push_back(it->first);
    }
    return out;
}

std::vector<std::string> EntryStore::descendants(const std::string& inner) const {
    std::vector<std::string> out;
    auto it = entries_.find(inner);
    if (it == entries_.end()) return out;
    if (it->second.is_file()) {
        out.push_back(it->first);
        return out;
    }
    for (++it; it != entries_.end() && is_within(it->first, inner); ++it)
        out.push_back(it->first);
    return out;
}

bool EntryStore::has_descendants(const std::string& inner) const {
    auto it = entries_.find(inner);
    if (it == entries_.end()) return false;
    ++it;
    return it != entries_.end() && is_within(it->first, inner);
}

std::vector<std::string> EntryStore::removal_order() const {
    std::vector<std::string> out;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (!is_root(it->first)) out.push_back(it->first);
    }
    return out;
}

std::string EntryStore::nearest_existing(const std::string& inner) const {
    std::string p = inner;
    while (!is_root(p) && !contains(p))
        p = parent_path(p);
    return p;
}

void EntryStore::reset() {
    entries_.clear();
    entries_.emplace("/", Entry::directory());
}

}
